// Copyright 2020-2025 Francesco Biscani (bluescarni@gmail.com), Dario Izzo (dario.izzo@gmail.com)
//
// This file is part of the nutcore library.
//
// This Source Code Form is subject to the terms of the Mozilla
// Public License v. 2.0. If a copy of the MPL was not distributed
// with this file, You can obtain one at http://mozilla.org/MPL/2.0/.

#include <array>
#include <cmath>

#include <nutcore/config.hpp>
#include <nutcore/detail/analytical_theories_helpers.hpp>
#include <nutcore/model/fundamental_arguments.hpp>

NUTCORE_BEGIN_NAMESPACE

namespace model
{

namespace detail
{

namespace
{

// Coefficients of the IAU 1980 arguments, in arcseconds. Each argument is
// mod(c0 + c1*T, 1296000) + (c2 + c3*T)*T**2.
constexpr std::array iau1980_arg_l = {485866.733, 1717915922.633, 31.310, 0.064};
constexpr std::array iau1980_arg_lp = {1287099.804, 129596581.224, -0.577, -0.012};
constexpr std::array iau1980_arg_F = {335778.877, 1739527263.137, -13.257, 0.011};
constexpr std::array iau1980_arg_D = {1072261.307, 1602961601.328, -6.891, 0.019};
constexpr std::array iau1980_arg_Om = {450160.280, -6962890.539, 7.455, 0.008};

// Number of arcseconds in a full turn.
constexpr double arcsec_turn = 1296000.;

// Reduce an angle in arcseconds to the [0, 1296000) range.
double mod_turn(double x)
{
    return x - arcsec_turn * std::floor(x / arcsec_turn);
}

double iau1980_arg(const std::array<double, 4> &cfs, double T)
{
    return (mod_turn(cfs[1] * T + cfs[0]) + (cfs[3] * T + cfs[2]) * T * T) * nutcore::detail::arcsec2rad;
}

// Polynomial coefficients of the IAU 2000A luni-solar arguments, in arcseconds.
constexpr std::array iau2000a_arg_l = {485868.249036, 1717915923.2178, 31.8792, 0.051635, -0.00024470};
constexpr std::array iau2000a_arg_lp = {1287104.79305, 129596581.0481, -0.5532, 0.000136, -0.00001149};
constexpr std::array iau2000a_arg_F = {335779.526232, 1739527262.8478, -12.7512, -0.001037, 0.00000417};
constexpr std::array iau2000a_arg_D = {1072260.70369, 1602961601.2090, -6.3706, 0.006593, -0.00003169};
constexpr std::array iau2000a_arg_Om = {450160.398036, -6962890.5431, 7.4722, 0.007702, -0.00005939};

// Polynomial coefficients of the arguments of the planetary part of the IAU 2000A series.
// NOTE: these values are in *radians* (different from the luni-solar arguments).
constexpr std::array iau2000a_pl_arg_l = {2.35555598, 8328.6914269554};
constexpr std::array iau2000a_pl_arg_lp = {6.24006013, 628.301955};
constexpr std::array iau2000a_pl_arg_F = {1.627905234, 8433.466158131};
constexpr std::array iau2000a_pl_arg_D = {5.198466741, 7771.3771468121};
constexpr std::array iau2000a_pl_arg_Om = {2.18243920, -33.757045};
constexpr std::array iau2000a_pl_arg_L_Me = {4.402608842, 2608.7903141574};
constexpr std::array iau2000a_pl_arg_L_Ve = {3.176146697, 1021.3285546211};
constexpr std::array iau2000a_pl_arg_L_E = {1.753470314, 628.3075849991};
constexpr std::array iau2000a_pl_arg_L_Ma = {6.203480913, 334.0612426700};
constexpr std::array iau2000a_pl_arg_L_J = {0.599546497, 52.9690962641};
constexpr std::array iau2000a_pl_arg_L_Sa = {0.874016757, 21.3299104960};
constexpr std::array iau2000a_pl_arg_L_U = {5.481293871, 7.4781598567};
constexpr std::array iau2000a_pl_arg_L_Ne = {5.321159000, 3.8127774000};
// NOTE: this is the general precession in longitude, the only one among
// these arguments with an order-2 polynomial expression.
constexpr std::array iau2000a_pl_arg_p_A = {0., 0.02438175, 0.00000538691};

} // namespace

} // namespace detail

std::array<double, 5> fund_args_iau1980(double T)
{
    using detail::iau1980_arg;

    return {iau1980_arg(detail::iau1980_arg_l, T), iau1980_arg(detail::iau1980_arg_lp, T),
            iau1980_arg(detail::iau1980_arg_F, T), iau1980_arg(detail::iau1980_arg_D, T),
            iau1980_arg(detail::iau1980_arg_Om, T)};
}

std::array<double, 5> fund_args_iau2000a_ls(double T)
{
    using nutcore::detail::arcsec2rad;
    using nutcore::detail::horner_eval;

    return {horner_eval(detail::iau2000a_arg_l, T) * arcsec2rad, horner_eval(detail::iau2000a_arg_lp, T) * arcsec2rad,
            horner_eval(detail::iau2000a_arg_F, T) * arcsec2rad, horner_eval(detail::iau2000a_arg_D, T) * arcsec2rad,
            horner_eval(detail::iau2000a_arg_Om, T) * arcsec2rad};
}

std::array<double, 14> fund_args_iau2000a_pl(double T)
{
    using nutcore::detail::horner_eval;

    return {horner_eval(detail::iau2000a_pl_arg_l, T),    horner_eval(detail::iau2000a_pl_arg_lp, T),
            horner_eval(detail::iau2000a_pl_arg_F, T),    horner_eval(detail::iau2000a_pl_arg_D, T),
            horner_eval(detail::iau2000a_pl_arg_Om, T),   horner_eval(detail::iau2000a_pl_arg_L_Me, T),
            horner_eval(detail::iau2000a_pl_arg_L_Ve, T), horner_eval(detail::iau2000a_pl_arg_L_E, T),
            horner_eval(detail::iau2000a_pl_arg_L_Ma, T), horner_eval(detail::iau2000a_pl_arg_L_J, T),
            horner_eval(detail::iau2000a_pl_arg_L_Sa, T), horner_eval(detail::iau2000a_pl_arg_L_U, T),
            horner_eval(detail::iau2000a_pl_arg_L_Ne, T), horner_eval(detail::iau2000a_pl_arg_p_A, T)};
}

} // namespace model

NUTCORE_END_NAMESPACE
