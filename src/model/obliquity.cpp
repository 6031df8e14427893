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
#include <mutex>
#include <stdexcept>

#include <boost/math/constants/constants.hpp>

#include <fmt/core.h>

#include <nutcore/config.hpp>
#include <nutcore/detail/analytical_theories_helpers.hpp>
#include <nutcore/detail/logging_impl.hpp>
#include <nutcore/ephemeris_config.hpp>
#include <nutcore/model/obliquity.hpp>
#include <nutcore/nutation.hpp>
#include <nutcore/reduction_method.hpp>

NUTCORE_BEGIN_NAMESPACE

namespace model
{

namespace detail
{

namespace
{

// Polynomial models of the mean obliquity. The obliquity at J2000 is
// 23deg 26' + eps0 arcseconds, and the polynomial is in units of 0.01 arcsec,
// as a function of the time in units of 10000 Julian years.
struct obliquity_poly {
    double eps0;
    std::array<double, 10> cfs;
};

// Capitaine et al. (2003), Hilton et al. (2006).
constexpr obliquity_poly obl_capitaine
    = {21.406, {-468367.69, -183.1, 200340., -5760., -43400., 0., 0., 0., 0., 0.}};

// Williams (1994), JPL DE403.
constexpr obliquity_poly obl_williams
    = {21.406173, {-468339.6, -175., 199890., -5138., -24967., -3905., 712., 2787., 579., 245.}};

// Simon et al. (1994).
constexpr obliquity_poly obl_simon
    = {21.412, {-468092.7, -152., 199890., -5138., -24967., -3905., 712., 2787., 579., 245.}};

// Laskar (1986).
constexpr obliquity_poly obl_laskar
    = {21.448, {-468093., -155., 199925., -5138., -24967., -3905., 712., 2787., 579., 245.}};

// IAU 1976 (Lieske et al. 1977).
constexpr obliquity_poly obl_iau1976 = {21.448, {-468150., -590., 181300., 0., 0., 0., 0., 0., 0., 0.}};

const obliquity_poly &select_obliquity_poly(reduction_method method)
{
    switch (method) {
        case reduction_method::IAU_2000:
        case reduction_method::IAU_2006:
        case reduction_method::IAU_2009:
            return obl_capitaine;
        case reduction_method::WILLIAMS_1994:
        case reduction_method::JPL_DE4xx:
            return obl_williams;
        case reduction_method::SIMON_1994:
            return obl_simon;
        case reduction_method::LASKAR_1986:
            return obl_laskar;
        case reduction_method::IAU_1976:
            return obl_iau1976;
    }

    nutcore::detail::throw_unsupported_reduction_method(method, "mean_obliquity()");
}

double eval_obliquity_poly(const obliquity_poly &poly, double T)
{
    const auto u0 = T / 100.;

    auto u = u0;
    auto ret = 23. * 3600. + 26. * 60. + poly.eps0;
    for (const auto c : poly.cfs) {
        ret += u * c / 100.;
        u *= u0;
    }

    return ret * nutcore::detail::arcsec2rad;
}

// Long-term model by Vondrak et al. (2011), valid over +-200000 years from J2000.
// Periodic terms, as (period [Julian centuries], cosine amplitude, sine amplitude) in arcseconds.
constexpr std::array<std::array<double, 3>, 10> vondrak_per = {{{409.90, 753.872780, -1704.720302},
                                                                 {396.15, -247.805823, -862.308358},
                                                                 {537.22, 379.471484, 447.832178},
                                                                 {402.90, -53.880558, -889.571909},
                                                                 {417.15, -90.109153, 190.402846},
                                                                 {288.92, -353.600190, -56.564991},
                                                                 {4043.00, -63.115353, -296.222622},
                                                                 {306.00, -28.248187, -75.859952},
                                                                 {277.00, 17.703387, 67.473503},
                                                                 {203.00, 38.911307, 3.014055}}};

// Polynomial part.
constexpr std::array vondrak_pol = {84028.206305, 0.3624445, -0.00004039, -110e-9};

double vondrak_2011_obliquity(double T)
{
    const auto w = 2 * boost::math::constants::pi<double>() * T;

    double y = 0;
    for (const auto &[period, c_amp, s_amp] : vondrak_per) {
        const auto a = w / period;
        y += std::cos(a) * c_amp + std::sin(a) * s_amp;
    }

    auto tn = 1.;
    for (const auto c : vondrak_pol) {
        y += c * tn;
        tn *= T;
    }

    return y * nutcore::detail::arcsec2rad;
}

// Flag for the warning about the use of the long-term model far from J2000.
constinit std::once_flag far_from_j2000_warned;

} // namespace

} // namespace detail

double mean_obliquity(double T, const ephemeris_config &cfg)
{
    if (!std::isfinite(T)) [[unlikely]] {
        throw std::invalid_argument(
            fmt::format("Cannot compute the mean obliquity at the non-finite time {}", T));
    }

    const auto &poly = detail::select_obliquity_poly(cfg.method);

    const auto far_from_j2000 = std::abs(T) > 100.;
    const auto iau2006 = cfg.method == reduction_method::IAU_2006 || cfg.method == reduction_method::IAU_2009;

    if (far_from_j2000 || (iau2006 && cfg.use_vondrak_2011_obliquity)) {
        if (far_from_j2000) {
            // NOTE: the warning is issued only once per process, the following
            // occurrences are logged at the debug level.
            bool warned = false;
            std::call_once(detail::far_from_j2000_warned, [&]() {
                nutcore::detail::get_logger()->warn(
                    "The time {} is more than 10000 years away from J2000, the mean obliquity of the {} method "
                    "is replaced by the long-term model by Vondrak et al. (2011)",
                    T, cfg.method);
                warned = true;
            });

            if (!warned) {
                SPDLOG_LOGGER_DEBUG(nutcore::detail::get_logger(),
                                    "Using the long-term obliquity model at the time {} for the {} method", T,
                                    cfg.method);
            }
        }

        return detail::vondrak_2011_obliquity(T);
    }

    return detail::eval_obliquity_poly(poly, T);
}

double true_obliquity(double T, const ephemeris_config &cfg, nutation_evaluator &ev)
{
    return mean_obliquity(T, cfg) + ev.calc_nutation(T, cfg).obliquity;
}

} // namespace model

NUTCORE_END_NAMESPACE
