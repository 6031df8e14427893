// Copyright 2020-2025 Francesco Biscani (bluescarni@gmail.com), Dario Izzo (dario.izzo@gmail.com)
//
// This file is part of the nutcore library.
//
// This Source Code Form is subject to the terms of the Mozilla
// Public License v. 2.0. If a copy of the MPL was not distributed
// with this file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef NUTCORE_MODEL_OBLIQUITY_HPP
#define NUTCORE_MODEL_OBLIQUITY_HPP

#include <nutcore/config.hpp>
#include <nutcore/detail/visibility.hpp>
#include <nutcore/ephemeris_config.hpp>

NUTCORE_BEGIN_NAMESPACE

class nutation_evaluator;

namespace model
{

// Mean obliquity of the ecliptic (radians) at the input time in Julian centuries (TT) since J2000.
//
// The theory is selected by the reduction method of the configuration. Beyond 10000 years
// from J2000, the long-term model by Vondrak et al. (2011) is always used.
[[nodiscard]] NUTCORE_DLL_PUBLIC double mean_obliquity(double, const ephemeris_config &);

// True obliquity of the ecliptic (radians), that is, the mean obliquity plus the nutation
// in obliquity computed by the input evaluator.
[[nodiscard]] NUTCORE_DLL_PUBLIC double true_obliquity(double, const ephemeris_config &, nutation_evaluator &);

} // namespace model

NUTCORE_END_NAMESPACE

#endif
