// Copyright 2020-2025 Francesco Biscani (bluescarni@gmail.com), Dario Izzo (dario.izzo@gmail.com)
//
// This file is part of the nutcore library.
//
// This Source Code Form is subject to the terms of the Mozilla
// Public License v. 2.0. If a copy of the MPL was not distributed
// with this file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef NUTCORE_S11N_HPP
#define NUTCORE_S11N_HPP

// Boost.Serialization support for the nutcore classes. Only binary
// archives are supported.

// NOTE: GCC >= 7 fails to compile the Boost.Serialization shared_ptr helpers
// unless an unrelated type named U is visible in the boost::serialization
// namespace (https://gcc.gnu.org/bugzilla/show_bug.cgi?id=84075).
#if defined(__GNUC__) && __GNUC__ >= 7

namespace boost::serialization
{

struct U {
};

} // namespace boost::serialization

#endif

#include <boost/archive/binary_iarchive.hpp>
#include <boost/archive/binary_oarchive.hpp>

// NOTE: eop_data stores its table behind a shared_ptr, and
// the rows in a std::vector.
#include <boost/serialization/access.hpp>
#include <boost/serialization/shared_ptr.hpp>
#include <boost/serialization/split_member.hpp>
#include <boost/serialization/string.hpp>
#include <boost/serialization/vector.hpp>

#endif
