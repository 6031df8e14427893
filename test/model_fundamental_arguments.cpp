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

#include <boost/math/constants/constants.hpp>

#include <nutcore/model/fundamental_arguments.hpp>

#include <catch2/catch.hpp>

#include "test_utils.hpp"

using namespace nutcore;
using namespace nutcore_test;

namespace
{

constexpr auto twopi = 2 * boost::math::constants::pi<double>();

// Difference between two angles, reduced to [-pi, pi).
double angle_diff(double a, double b)
{
    return std::remainder(a - b, twopi);
}

} // namespace

TEST_CASE("values at J2000")
{
    const auto a80 = model::fund_args_iau1980(0.);
    REQUIRE(a80[0] == approximately(485866.733 / rad2arcsec));
    REQUIRE(a80[1] == approximately(1287099.804 / rad2arcsec));
    REQUIRE(a80[2] == approximately(335778.877 / rad2arcsec));
    REQUIRE(a80[3] == approximately(1072261.307 / rad2arcsec));
    REQUIRE(a80[4] == approximately(450160.280 / rad2arcsec));

    const auto a00 = model::fund_args_iau2000a_ls(0.);
    REQUIRE(a00[0] == approximately(485868.249036 / rad2arcsec));
    REQUIRE(a00[1] == approximately(1287104.79305 / rad2arcsec));
    REQUIRE(a00[2] == approximately(335779.526232 / rad2arcsec));
    REQUIRE(a00[3] == approximately(1072260.70369 / rad2arcsec));
    REQUIRE(a00[4] == approximately(450160.398036 / rad2arcsec));

    const auto apl = model::fund_args_iau2000a_pl(0.);
    REQUIRE(apl[0] == 2.35555598);
    REQUIRE(apl[4] == 2.18243920);
    REQUIRE(apl[7] == 1.753470314);
    REQUIRE(apl[12] == 5.321159000);
    REQUIRE(apl[13] == 0.);
}

TEST_CASE("range reduction")
{
    // The IAU 1980 arguments are reduced, the IAU 2000A ones are not.
    for (const auto T : {-1.5, -0.3, 0.094962, 0.7, 2.}) {
        const auto a80 = model::fund_args_iau1980(T);
        const auto a00 = model::fund_args_iau2000a_ls(T);

        for (std::size_t i = 0; i < 5u; ++i) {
            // NOTE: the quadratic terms can push the arguments slightly
            // outside the [0, 2pi) range.
            REQUIRE(a80[i] > -1e-3);
            REQUIRE(a80[i] < twopi + 1e-3);
        }

        if (std::abs(T) > 0.5) {
            REQUIRE(std::abs(a00[0]) > twopi);
        }
    }
}

TEST_CASE("consistency between theories")
{
    // The three sets of luni-solar arguments describe the same angles, up to
    // the refinements of the newer theories.
    for (const auto T : {-1., -0.25, 0., 0.094962, 0.5, 1.}) {
        const auto a80 = model::fund_args_iau1980(T);
        const auto a00 = model::fund_args_iau2000a_ls(T);
        const auto apl = model::fund_args_iau2000a_pl(T);

        for (std::size_t i = 0; i < 5u; ++i) {
            REQUIRE(std::abs(angle_diff(a80[i], a00[i])) < 5e-4);
            REQUIRE(std::abs(angle_diff(apl[i], a00[i])) < 5e-4);
        }
    }

    // The mean longitude of the Earth advances by one turn per year.
    const auto a0 = model::fund_args_iau2000a_pl(0.);
    const auto a1 = model::fund_args_iau2000a_pl(0.01);
    REQUIRE(std::abs(angle_diff(a1[7], a0[7])) < 1e-2);
}
