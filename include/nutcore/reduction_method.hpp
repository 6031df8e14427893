// Copyright 2020-2025 Francesco Biscani (bluescarni@gmail.com), Dario Izzo (dario.izzo@gmail.com)
//
// This file is part of the nutcore library.
//
// This Source Code Form is subject to the terms of the Mozilla
// Public License v. 2.0. If a copy of the MPL was not distributed
// with this file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef NUTCORE_REDUCTION_METHOD_HPP
#define NUTCORE_REDUCTION_METHOD_HPP

#include <ostream>
#include <string>

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <nutcore/config.hpp>
#include <nutcore/detail/visibility.hpp>

NUTCORE_BEGIN_NAMESPACE

// The set of precession/nutation/obliquity theories available for the
// reduction of coordinates.
//
// NOTE: the numerical values are part of the public interface (they are used, e.g.,
// as cache keys and in the EOP values returned by the providers). New methods must be
// appended at the end.
enum class reduction_method : int {
    IAU_2000,
    IAU_2006,
    IAU_2009,
    JPL_DE4xx,
    WILLIAMS_1994,
    SIMON_1994,
    LASKAR_1986,
    IAU_1976
};

// Check if a reduction method uses the IAU 1980 nutation series
// (as opposed to the IAU 2000A series).
[[nodiscard]] NUTCORE_DLL_PUBLIC bool uses_iau1980_nutation(reduction_method);

[[nodiscard]] NUTCORE_DLL_PUBLIC std::string to_string(reduction_method);

NUTCORE_DLL_PUBLIC std::ostream &operator<<(std::ostream &, reduction_method);

namespace detail
{

[[noreturn]] NUTCORE_DLL_PUBLIC void throw_unsupported_reduction_method(reduction_method, const char *);

} // namespace detail

NUTCORE_END_NAMESPACE

// fmt formatter for reduction_method, implemented on top of the streaming operator.
namespace fmt
{

template <>
struct formatter<nutcore::reduction_method> : fmt::ostream_formatter {
};

} // namespace fmt

#endif
