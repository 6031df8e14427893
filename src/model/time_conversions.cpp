// Copyright 2020-2025 Francesco Biscani (bluescarni@gmail.com), Dario Izzo (dario.izzo@gmail.com)
//
// This file is part of the nutcore library.
//
// This Source Code Form is subject to the terms of the Mozilla
// Public License v. 2.0. If a copy of the MPL was not distributed
// with this file, You can obtain one at http://mozilla.org/MPL/2.0/.

#include <array>
#include <cmath>
#include <stdexcept>

#include <fmt/core.h>

#include <nutcore/config.hpp>
#include <nutcore/detail/analytical_theories_helpers.hpp>
#include <nutcore/model/time_conversions.hpp>

// NOTE: the TT - UT1 estimate is the set of piecewise polynomials by Espenak & Meeus
// (Five Millennium Canon of Solar Eclipses, NASA/TP-2006-214141), see also:
//
// https://eclipse.gsfc.nasa.gov/SEhelp/deltatpoly2004.html
//
// Outside the [-500, 2150] range of years, the long-term parabola by Morrison & Stephenson
// is used.

NUTCORE_BEGIN_NAMESPACE

namespace model
{

namespace detail
{

namespace
{

// Polynomial coefficients for the various ranges of years. Each polynomial is
// evaluated in (y - y0) / scale, where y0 and scale are given in the comments.

// -500 -> 500, u = y / 100.
constexpr std::array dt_m500_500
    = {10583.6, -1014.41, 33.78311, -5.952053, -0.1798452, 0.022174192, 0.0090316521};
// 500 -> 1600, u = (y - 1000) / 100.
constexpr std::array dt_500_1600 = {1574.2, -556.01, 71.23472, 0.319781, -0.8503463, -0.005050998, 0.0083572073};
// 1600 -> 1700, t = y - 1600.
constexpr std::array dt_1600_1700 = {120., -0.9808, -0.01532, 1 / 7129.};
// 1700 -> 1800, t = y - 1700.
constexpr std::array dt_1700_1800 = {8.83, 0.1603, -0.0059285, 0.00013336, -1 / 1174000.};
// 1800 -> 1860, t = y - 1800.
constexpr std::array dt_1800_1860
    = {13.72, -0.332447, 0.0068612, 0.0041116, -0.00037436, 0.0000121272, -0.0000001699, 0.000000000875};
// 1860 -> 1900, t = y - 1860.
constexpr std::array dt_1860_1900 = {7.62, 0.5737, -0.251754, 0.01680668, -0.0004473624, 1 / 233174.};
// 1900 -> 1920, t = y - 1900.
constexpr std::array dt_1900_1920 = {-2.79, 1.494119, -0.0598939, 0.0061966, -0.000197};
// 1920 -> 1941, t = y - 1920.
constexpr std::array dt_1920_1941 = {21.20, 0.84493, -0.076100, 0.0020936};
// 1941 -> 1961, t = y - 1950.
constexpr std::array dt_1941_1961 = {29.07, 0.407, -1 / 233., 1 / 2547.};
// 1961 -> 1986, t = y - 1975.
constexpr std::array dt_1961_1986 = {45.45, 1.067, -1 / 260., -1 / 718.};
// 1986 -> 2005, t = y - 2000.
constexpr std::array dt_1986_2005 = {63.86, 0.3345, -0.060374, 0.0017275, 0.000651814, 0.00002373599};
// 2005 -> 2050, t = y - 2000.
constexpr std::array dt_2005_2050 = {62.92, 0.32217, 0.005589};

// Long-term parabola, u = (y - 1820) / 100.
double delta_t_long_term(double y)
{
    const auto u = (y - 1820.) / 100.;

    return -20. + 32. * u * u;
}

// Piecewise estimate of TT - UT1 as a function of the (fractional) year.
double delta_t_year(double y)
{
    using nutcore::detail::horner_eval;

    if (y < -500.) {
        return delta_t_long_term(y);
    }
    if (y < 500.) {
        return horner_eval(dt_m500_500, y / 100.);
    }
    if (y < 1600.) {
        return horner_eval(dt_500_1600, (y - 1000.) / 100.);
    }
    if (y < 1700.) {
        return horner_eval(dt_1600_1700, y - 1600.);
    }
    if (y < 1800.) {
        return horner_eval(dt_1700_1800, y - 1700.);
    }
    if (y < 1860.) {
        return horner_eval(dt_1800_1860, y - 1800.);
    }
    if (y < 1900.) {
        return horner_eval(dt_1860_1900, y - 1860.);
    }
    if (y < 1920.) {
        return horner_eval(dt_1900_1920, y - 1900.);
    }
    if (y < 1941.) {
        return horner_eval(dt_1920_1941, y - 1920.);
    }
    if (y < 1961.) {
        return horner_eval(dt_1941_1961, y - 1950.);
    }
    if (y < 1986.) {
        return horner_eval(dt_1961_1986, y - 1975.);
    }
    if (y < 2005.) {
        return horner_eval(dt_1986_2005, y - 2000.);
    }
    if (y < 2050.) {
        return horner_eval(dt_2005_2050, y - 2000.);
    }
    if (y < 2150.) {
        // NOTE: this term connects smoothly the 2005-2050 polynomial
        // to the long-term parabola.
        return delta_t_long_term(y) - 0.5628 * (2150. - y);
    }

    return delta_t_long_term(y);
}

void check_finite_jd(double jd, const char *fname)
{
    if (!std::isfinite(jd)) [[unlikely]] {
        throw std::invalid_argument(
            fmt::format("A non-finite Julian date ({}) was passed to the function {}()", jd, fname));
    }
}

} // namespace

} // namespace detail

double jd_to_centuries(double jd)
{
    return (jd - jd_j2000) / days_per_julian_century;
}

double centuries_to_jd(double T)
{
    return T * days_per_julian_century + jd_j2000;
}

double delta_t(double jd)
{
    detail::check_finite_jd(jd, "delta_t");

    // NOTE: the polynomials are expressed in terms of the decimal year,
    // which we approximate via the length of the Julian year.
    return detail::delta_t_year(2000. + (jd - jd_j2000) / 365.25);
}

double tt_minus_ut1(double jd_tt)
{
    detail::check_finite_jd(jd_tt, "tt_minus_ut1");

    // NOTE: the estimate varies by a small fraction of a second over a few minutes,
    // thus a single refinement step from TT to UT1 is sufficient.
    return delta_t(jd_tt - delta_t(jd_tt) / seconds_per_day);
}

} // namespace model

NUTCORE_END_NAMESPACE
