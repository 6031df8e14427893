// Copyright 2020-2025 Francesco Biscani (bluescarni@gmail.com), Dario Izzo (dario.izzo@gmail.com)
//
// This file is part of the nutcore library.
//
// This Source Code Form is subject to the terms of the Mozilla
// Public License v. 2.0. If a copy of the MPL was not distributed
// with this file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef NUTCORE_MODEL_FUNDAMENTAL_ARGUMENTS_HPP
#define NUTCORE_MODEL_FUNDAMENTAL_ARGUMENTS_HPP

#include <array>

#include <nutcore/config.hpp>
#include <nutcore/detail/visibility.hpp>

NUTCORE_BEGIN_NAMESPACE

namespace model
{

// Fundamental arguments of the nutation theories, in radians, as functions of
// the time in Julian centuries (TT) since J2000.
//
// The luni-solar (Delaunay) arguments are ordered as (l, l', F, D, Omega):
//
// - l: mean anomaly of the Moon,
// - l': mean anomaly of the Sun,
// - F: mean argument of latitude of the Moon,
// - D: mean elongation of the Moon from the Sun,
// - Omega: mean longitude of the ascending node of the Moon.

// Arguments of the IAU 1980 series (Seidelmann 1982). The linear parts of the polynomials
// are reduced to [0, 360) degrees before the quadratic corrections are added.
[[nodiscard]] NUTCORE_DLL_PUBLIC std::array<double, 5> fund_args_iau1980(double);

// Luni-solar arguments of the IAU 2000A series (Simon et al. 1994).
// No explicit reduction to the [0, 360) range is performed.
[[nodiscard]] NUTCORE_DLL_PUBLIC std::array<double, 5> fund_args_iau2000a_ls(double);

// Arguments of the planetary part of the IAU 2000A series, ordered as
// (l, l', F, D, Omega, L_Me, L_Ve, L_E, L_Ma, L_J, L_Sa, L_U, L_Ne, p_A). The
// luni-solar arguments here are the linear approximations from the MHB2000 model, L_*
// are the mean longitudes of the planets and p_A is the general accumulated
// precession in longitude.
[[nodiscard]] NUTCORE_DLL_PUBLIC std::array<double, 14> fund_args_iau2000a_pl(double);

} // namespace model

NUTCORE_END_NAMESPACE

#endif
