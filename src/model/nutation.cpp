// Copyright 2020-2025 Francesco Biscani (bluescarni@gmail.com), Dario Izzo (dario.izzo@gmail.com)
//
// This file is part of the nutcore library.
//
// This Source Code Form is subject to the terms of the Mozilla
// Public License v. 2.0. If a copy of the MPL was not distributed
// with this file, You can obtain one at http://mozilla.org/MPL/2.0/.

#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <stdexcept>

#include <fmt/core.h>

#include <nutcore/config.hpp>
#include <nutcore/detail/analytical_theories_helpers.hpp>
#include <nutcore/detail/nutation/iau1980.hpp>
#include <nutcore/detail/nutation/iau2000a.hpp>
#include <nutcore/model/fundamental_arguments.hpp>
#include <nutcore/model/nutation.hpp>
#include <nutcore/reduction_method.hpp>

NUTCORE_BEGIN_NAMESPACE

namespace model
{

namespace detail
{

namespace
{

// Maximum multiple of each fundamental argument appearing
// in the IAU 1980 series, in the (l, l', F, D, Omega) order.
constexpr std::array<int, 5> iau1980_max_mult = {3, 2, 4, 4, 2};

// Sines and cosines of the multiples 1, 2, ... of the fundamental arguments
// of the IAU 1980 series. Element [i][k] refers to (k + 1) times the i-th argument.
struct iau1980_trig_table {
    std::array<std::array<double, 4>, 5> s{};
    std::array<std::array<double, 4>, 5> c{};
};

// Fill in the sines and cosines of the multiples of the i-th argument,
// via the double-angle formula and then the angle-addition formula.
void iau1980_fill_multiples(iau1980_trig_table &tab, std::size_t i, double arg)
{
    auto &s = tab.s[i];
    auto &c = tab.c[i];

    const auto su = std::sin(arg);
    const auto cu = std::cos(arg);
    s[0] = su;
    c[0] = cu;

    auto sv = 2. * su * cu;
    auto cv = cu * cu - su * su;
    s[1] = sv;
    c[1] = cv;

    for (auto k = 2; k < iau1980_max_mult[i]; ++k) {
        const auto sw = su * cv + cu * sv;
        cv = cu * cv - su * sv;
        sv = sw;
        s[static_cast<std::size_t>(k)] = sv;
        c[static_cast<std::size_t>(k)] = cv;
    }
}

// Amplitudes of the 18.6-year term in Omega, in units of 1e-4 arcsec.
// NOTE: these do not fit in the integral encoding of the table.
constexpr double iau1980_om_dpsi = -171996.;
constexpr double iau1980_om_dpsi_t = -1742.;
constexpr double iau1980_om_deps = 92025.;
constexpr double iau1980_om_deps_t = 89.;

// The IAU 2006 adjustments to the IAU 2000A nutation (Wallace & Capitaine 2006, eq. 5).
constexpr double iau2006_dpsi_j2 = 0.4697e-6;
constexpr double iau2006_fj2 = -2.7774e-6;

} // namespace

} // namespace detail

nutation_result nutation_iau1980(double T)
{
    using namespace detail;

    const auto T10 = T / 10.;

    // Evaluate the fundamental arguments and the sines/cosines of their multiples.
    const auto args = fund_args_iau1980(T);
    iau1980_trig_table tab;
    for (std::size_t i = 0; i < 5u; ++i) {
        iau1980_fill_multiples(tab, i, args[i]);
    }

    double dpsi = 0, deps = 0;

    for (std::size_t i = 0; i < 105u; ++i) {
        // Build the sine and cosine of the argument of the current term
        // by combining the multiples of the fundamental arguments.
        double sv = 0, cv = 0;
        bool first = true;
        for (std::size_t j = 0; j < 5u; ++j) {
            const auto mult = iau1980_args_idxs[i][j];
            if (mult == 0) {
                continue;
            }

            const auto k = static_cast<std::size_t>(mult < 0 ? -mult : mult);
            // NOTE: sin(-x) = -sin(x), cos(-x) = cos(x).
            const auto su = mult < 0 ? -tab.s[j][k - 1u] : tab.s[j][k - 1u];
            const auto cu = tab.c[j][k - 1u];

            if (first) {
                sv = su;
                cv = cu;
                first = false;
            } else {
                const auto sw = su * cv + cu * sv;
                cv = cu * cv - su * sv;
                sv = sw;
            }
        }

        // Amplitudes, with the secular corrections.
        const auto &cfs = iau1980_cfs[i];
        auto f = static_cast<double>(cfs[0]);
        if (cfs[1] != 0) {
            f += T10 * cfs[1];
        }
        auto g = static_cast<double>(cfs[2]);
        if (cfs[3] != 0) {
            g += T10 * cfs[3];
        }

        dpsi += f * sv;
        deps += g * cv;
    }

    // Add the dominant term in Omega.
    dpsi += (iau1980_om_dpsi_t * T10 + iau1980_om_dpsi) * tab.s[4][0];
    deps += (iau1980_om_deps_t * T10 + iau1980_om_deps) * tab.c[4][0];

    return {.longitude = 1e-4 * nutcore::detail::arcsec2rad * dpsi,
            .obliquity = 1e-4 * nutcore::detail::arcsec2rad * deps};
}

nutation_result nutation_iau2000a(double T)
{
    using namespace detail;
    using nutcore::detail::arcsec2rad;

    // NOTE: the series are summed in reverse order, so that
    // the smallest terms are accumulated first.

    // Luni-solar part.
    const auto ls_args = fund_args_iau2000a_ls(T);

    double dp = 0, de = 0;
    for (auto i = static_cast<std::ptrdiff_t>(677); i >= 0; --i) {
        const auto &idxs = iau2000a_ls_args_idxs[i];

        double arg = 0;
        for (std::size_t j = 0; j < 5u; ++j) {
            arg += idxs[j] * ls_args[j];
        }
        const auto sarg = std::sin(arg);
        const auto carg = std::cos(arg);

        const auto &cfs = iau2000a_ls_cfs[i];
        dp += (cfs[0] + cfs[1] * T) * sarg + cfs[2] * carg;
        de += (cfs[3] + cfs[4] * T) * carg + cfs[5] * sarg;
    }

    // NOTE: the amplitudes are in units of 1e-7 arcsec.
    auto dpsi = dp * arcsec2rad / 1e7;
    auto deps = de * arcsec2rad / 1e7;

    // Planetary part.
    const auto pl_args = fund_args_iau2000a_pl(T);

    dp = 0;
    de = 0;
    for (auto i = static_cast<std::ptrdiff_t>(686); i >= 0; --i) {
        const auto &idxs = iau2000a_pl_args_idxs[i];

        double arg = 0;
        for (std::size_t j = 0; j < 14u; ++j) {
            arg += idxs[j] * pl_args[j];
        }
        const auto sarg = std::sin(arg);
        const auto carg = std::cos(arg);

        const auto &cfs = iau2000a_pl_cfs[i];
        dp += cfs[0] * sarg + cfs[1] * carg;
        de += cfs[2] * sarg + cfs[3] * carg;
    }

    dpsi += dp * arcsec2rad / 1e7;
    deps += de * arcsec2rad / 1e7;

    return {.longitude = dpsi, .obliquity = deps};
}

nutation_result nutation_series(double T, reduction_method method)
{
    if (!std::isfinite(T)) [[unlikely]] {
        throw std::invalid_argument(
            fmt::format("Cannot compute the nutation at the non-finite time {}", T));
    }

    switch (method) {
        case reduction_method::IAU_1976:
        case reduction_method::LASKAR_1986:
        case reduction_method::SIMON_1994:
        case reduction_method::WILLIAMS_1994:
        case reduction_method::JPL_DE4xx:
            // NOTE: these methods differ in the precession and obliquity
            // theories, but they all use the IAU 1980 nutation.
            return nutation_iau1980(T);
        case reduction_method::IAU_2000:
            return nutation_iau2000a(T);
        case reduction_method::IAU_2006:
        case reduction_method::IAU_2009: {
            auto ret = nutation_iau2000a(T);

            ret.longitude += ret.longitude * (detail::iau2006_dpsi_j2 + detail::iau2006_fj2 * T);
            ret.obliquity += ret.obliquity * (detail::iau2006_fj2 * T);

            return ret;
        }
    }

    nutcore::detail::throw_unsupported_reduction_method(method, "nutation_series()");
}

} // namespace model

NUTCORE_END_NAMESPACE
