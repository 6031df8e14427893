// Copyright 2020-2025 Francesco Biscani (bluescarni@gmail.com), Dario Izzo (dario.izzo@gmail.com)
//
// This file is part of the nutcore library.
//
// This Source Code Form is subject to the terms of the Mozilla
// Public License v. 2.0. If a copy of the MPL was not distributed
// with this file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef NUTCORE_MODEL_NUTATION_HPP
#define NUTCORE_MODEL_NUTATION_HPP

#include <compare>

#include <nutcore/config.hpp>
#include <nutcore/detail/visibility.hpp>
#include <nutcore/reduction_method.hpp>

NUTCORE_BEGIN_NAMESPACE

// Nutation in longitude and obliquity (radians).
struct nutation_result {
    double longitude = 0;
    double obliquity = 0;

    // NOTE: used in testing.
    auto operator<=>(const nutation_result &) const = default;
};

namespace model
{

// IAU 1980 nutation series (Seidelmann 1982).
[[nodiscard]] NUTCORE_DLL_PUBLIC nutation_result nutation_iau1980(double);

// IAU 2000A nutation series (Mathews, Herring & Buffett 2002), without
// the free core nutation.
[[nodiscard]] NUTCORE_DLL_PUBLIC nutation_result nutation_iau2000a(double);

// Nutation angles for a reduction method, as given by the series of the
// method's nutation theory. For the IAU 2006 and 2009 methods, the IAU 2000A series is
// rescaled for consistency with the P03 precession (Wallace & Capitaine 2006, eq. 5).
//
// NOTE: the celestial pole offsets are not included.
[[nodiscard]] NUTCORE_DLL_PUBLIC nutation_result nutation_series(double, reduction_method);

} // namespace model

NUTCORE_END_NAMESPACE

#endif
