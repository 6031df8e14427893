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

#include <nutcore/exceptions.hpp>
#include <nutcore/model/nutation.hpp>
#include <nutcore/model/time_conversions.hpp>
#include <nutcore/reduction_method.hpp>

#include <catch2/catch.hpp>

#include "test_utils.hpp"

using namespace nutcore;
using namespace nutcore_test;

// 2009 July 1, 0h TT.
constexpr double jd_ref = 2455013.5;

TEST_CASE("iau1980 reference")
{
    const auto res = model::nutation_iau1980(model::jd_to_centuries(jd_ref));

    REQUIRE(std::abs(res.longitude * rad2arcsec - 14.7774) < 1e-3);
    REQUIRE(std::abs(res.obliquity * rad2arcsec - 4.3386) < 1e-3);
}

TEST_CASE("iau2000a reference")
{
    const auto res = model::nutation_iau2000a(model::jd_to_centuries(jd_ref));

    REQUIRE(std::abs(res.longitude * rad2arcsec - 14.7823) < 1e-3);
    REQUIRE(std::abs(res.obliquity * rad2arcsec - 4.3391) < 1e-3);

    // The two theories agree at the level of a few tens of mas.
    const auto res80 = model::nutation_iau1980(model::jd_to_centuries(jd_ref));
    REQUIRE(std::abs(res.longitude - res80.longitude) * rad2arcsec < 0.05);
    REQUIRE(std::abs(res.obliquity - res80.obliquity) * rad2arcsec < 0.05);
}

TEST_CASE("nutation bounds")
{
    // The nutation in longitude never exceeds ~19 arcsec, the nutation
    // in obliquity ~10 arcsec.
    for (auto T = -2.; T <= 2.; T += 0.0137) {
        const auto r80 = model::nutation_iau1980(T);
        const auto r00 = model::nutation_iau2000a(T);

        REQUIRE(std::abs(r80.longitude) * rad2arcsec < 21.);
        REQUIRE(std::abs(r80.obliquity) * rad2arcsec < 11.);
        REQUIRE(std::abs(r00.longitude) * rad2arcsec < 21.);
        REQUIRE(std::abs(r00.obliquity) * rad2arcsec < 11.);
    }
}

TEST_CASE("nutation_series dispatch")
{
    using Catch::Matchers::Message;

    for (const auto T : {0., model::jd_to_centuries(jd_ref), -1.3, 4.5}) {
        const auto ref80 = model::nutation_iau1980(T);

        // All the methods based on the IAU 1980 nutation give the same result.
        for (const auto m : {reduction_method::IAU_1976, reduction_method::LASKAR_1986, reduction_method::SIMON_1994,
                             reduction_method::WILLIAMS_1994, reduction_method::JPL_DE4xx}) {
            REQUIRE(model::nutation_series(T, m) == ref80);
        }

        const auto ref00 = model::nutation_iau2000a(T);
        REQUIRE(model::nutation_series(T, reduction_method::IAU_2000) == ref00);

        // The IAU 2006 adjustments.
        const auto r06 = model::nutation_series(T, reduction_method::IAU_2006);
        const auto r09 = model::nutation_series(T, reduction_method::IAU_2009);
        REQUIRE(r06 == r09);

        REQUIRE(r06.longitude == approximately(ref00.longitude + ref00.longitude * (0.4697e-6 - 2.7774e-6 * T)));
        REQUIRE(r06.obliquity == approximately(ref00.obliquity + ref00.obliquity * (-2.7774e-6 * T)));
    }

    // At J2000, only the longitude is rescaled.
    const auto r00 = model::nutation_iau2000a(0.);
    const auto r06 = model::nutation_series(0., reduction_method::IAU_2006);
    REQUIRE(r06.obliquity == r00.obliquity);
    REQUIRE(r06.longitude != r00.longitude);

    // Error handling.
    REQUIRE_THROWS_MATCHES(model::nutation_series(std::numeric_limits<double>::infinity(), reduction_method::IAU_2000),
                           std::invalid_argument, Message("Cannot compute the nutation at the non-finite time inf"));
    REQUIRE_THROWS_AS(model::nutation_series(std::nan(""), reduction_method::IAU_1976), std::invalid_argument);
    REQUIRE_THROWS_MATCHES(model::nutation_series(0., static_cast<reduction_method>(42)),
                           unsupported_reduction_method_error,
                           Message("The reduction method with numerical value 42 is not supported by "
                                   "nutation_series()"));
}
