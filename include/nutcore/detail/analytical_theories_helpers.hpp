// Copyright 2020-2025 Francesco Biscani (bluescarni@gmail.com), Dario Izzo (dario.izzo@gmail.com)
//
// This file is part of the nutcore library.
//
// This Source Code Form is subject to the terms of the Mozilla
// Public License v. 2.0. If a copy of the MPL was not distributed
// with this file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef NUTCORE_DETAIL_ANALYTICAL_THEORIES_HELPERS_HPP
#define NUTCORE_DETAIL_ANALYTICAL_THEORIES_HELPERS_HPP

#include <concepts>
#include <ranges>
#include <type_traits>

#include <boost/math/constants/constants.hpp>

#include <nutcore/config.hpp>

// NOTE: this header contains utilities for the implementation of analytical theories
// of celestial mechanics.

NUTCORE_BEGIN_NAMESPACE

namespace detail
{

// Evaluate the polynomial with coefficients stored (in dense form, lowest
// degree first) in cfs according to Horner's scheme.
template <typename R>
    requires std::ranges::contiguous_range<R> && std::ranges::sized_range<R>
             && std::same_as<double, std::remove_cvref_t<std::ranges::range_reference_t<R>>>
// NOLINTNEXTLINE(cppcoreguidelines-missing-std-forward)
constexpr double horner_eval(R &&cfs, double x) noexcept
{
    const auto sz = std::ranges::size(cfs);
    if (sz == 0u) {
        return 0.;
    }

    const auto *ptr = std::ranges::data(cfs);
    auto ret = ptr[sz - 1u];
    for (std::ranges::range_size_t<R> i = 1; i < sz; ++i) {
        ret = ptr[sz - i - 1u] + ret * x;
    }

    return ret;
}

// Conversion factor from arcseconds to radians.
inline constexpr double arcsec2rad = boost::math::constants::pi<double>() / (180 * 3600.);

} // namespace detail

NUTCORE_END_NAMESPACE

#endif
