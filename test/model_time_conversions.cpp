// Copyright 2020-2025 Francesco Biscani (bluescarni@gmail.com), Dario Izzo (dario.izzo@gmail.com)
//
// This file is part of the nutcore library.
//
// This Source Code Form is subject to the terms of the Mozilla
// Public License v. 2.0. If a copy of the MPL was not distributed
// with this file, You can obtain one at http://mozilla.org/MPL/2.0/.

#include <cmath>
#include <initializer_list>
#include <limits>
#include <stdexcept>

#include <nutcore/model/time_conversions.hpp>

#include <catch2/catch.hpp>

#include "test_utils.hpp"

using namespace nutcore;
using namespace nutcore_test;

// Julian date at the beginning of the input (Julian) year.
static double year_to_jd(double y)
{
    return model::jd_j2000 + (y - 2000.) * 365.25;
}

TEST_CASE("julian centuries")
{
    REQUIRE(model::jd_to_centuries(model::jd_j2000) == 0.);
    REQUIRE(model::jd_to_centuries(model::jd_j2000 + 36525.) == 1.);
    REQUIRE(model::jd_to_centuries(2415020.) == -1.);
    REQUIRE(model::centuries_to_jd(0.) == model::jd_j2000);
    REQUIRE(model::centuries_to_jd(-1.) == 2415020.);

    for (const auto jd : {2455013.5, 2400000.5, 2488069.5, 1721424.5}) {
        REQUIRE(model::centuries_to_jd(model::jd_to_centuries(jd)) == approximately(jd));
    }
}

TEST_CASE("delta_t")
{
    using Catch::Matchers::Message;

    // Nodes of the polynomials.
    REQUIRE(model::delta_t(model::jd_j2000) == approximately(63.86));
    REQUIRE(model::delta_t(year_to_jd(1900.)) == approximately(-2.79));
    REQUIRE(model::delta_t(year_to_jd(1975.)) == approximately(45.45));
    REQUIRE(model::delta_t(year_to_jd(1700.)) == approximately(8.83));

    // Modern values are around one minute.
    const auto dt_2009 = model::delta_t(2455013.5);
    REQUIRE(dt_2009 > 60.);
    REQUIRE(dt_2009 < 70.);

    // The polynomials join continuously (within a few tenths of a second)
    // at the boundaries of their ranges.
    for (const auto y : {-500., 500., 1600., 1700., 1800., 1860., 1900., 1920., 1941., 1961., 1986., 2005., 2050., 2150.}) {
        const auto left = model::delta_t(year_to_jd(y) - 1e-6);
        const auto right = model::delta_t(year_to_jd(y));

        REQUIRE(std::abs(left - right) < 0.5);
    }

    // Long-term behaviour.
    REQUIRE(model::delta_t(year_to_jd(-1000.)) == approximately(-20. + 32. * 28.2 * 28.2, 1000.));
    REQUIRE(model::delta_t(year_to_jd(3000.)) == approximately(-20. + 32. * 11.8 * 11.8, 1000.));

    REQUIRE_THROWS_MATCHES(model::delta_t(std::numeric_limits<double>::quiet_NaN()), std::invalid_argument,
                           Message("A non-finite Julian date (nan) was passed to the function delta_t()"));
    REQUIRE_THROWS_MATCHES(model::tt_minus_ut1(-std::numeric_limits<double>::infinity()), std::invalid_argument,
                           Message("A non-finite Julian date (-inf) was passed to the function tt_minus_ut1()"));
}

TEST_CASE("tt_minus_ut1")
{
    // The refinement from TT to UT1 changes the estimate very little.
    for (const auto jd : {2451545., 2455013.5, 2415020., 2488069.5}) {
        REQUIRE(std::abs(model::tt_minus_ut1(jd) - model::delta_t(jd)) < 1e-3);
    }

    // Far from the present, the difference between the two time scales
    // is several hours, and the refinement matters.
    const auto jd_old = year_to_jd(-2000.);
    REQUIRE(model::tt_minus_ut1(jd_old) == approximately(model::delta_t(jd_old - model::delta_t(jd_old) / 86400.)));
}
