// Copyright 2020-2025 Francesco Biscani (bluescarni@gmail.com), Dario Izzo (dario.izzo@gmail.com)
//
// This file is part of the nutcore library.
//
// This Source Code Form is subject to the terms of the Mozilla
// Public License v. 2.0. If a copy of the MPL was not distributed
// with this file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef NUTCORE_MODEL_TIME_CONVERSIONS_HPP
#define NUTCORE_MODEL_TIME_CONVERSIONS_HPP

#include <nutcore/config.hpp>
#include <nutcore/detail/visibility.hpp>

NUTCORE_BEGIN_NAMESPACE

namespace model
{

// Julian date of the J2000.0 epoch.
inline constexpr double jd_j2000 = 2451545.0;

// Number of days in a Julian century.
inline constexpr double days_per_julian_century = 36525.0;

// Number of seconds in a day.
inline constexpr double seconds_per_day = 86400.0;

// Offset between Julian dates and modified Julian dates.
inline constexpr double jd_mjd_offset = 2400000.5;

// Conversion between Julian dates and Julian centuries since J2000.0.
[[nodiscard]] NUTCORE_DLL_PUBLIC double jd_to_centuries(double);
[[nodiscard]] NUTCORE_DLL_PUBLIC double centuries_to_jd(double);

// Estimate of TT - UT1 (in seconds) at the input Julian date.
[[nodiscard]] NUTCORE_DLL_PUBLIC double delta_t(double);

// Estimate of TT - UT1 (in seconds) at the input TT Julian date.
[[nodiscard]] NUTCORE_DLL_PUBLIC double tt_minus_ut1(double);

} // namespace model

NUTCORE_END_NAMESPACE

#endif
