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
#include <string>

#include <spdlog/common.h>

#include <nutcore/ephemeris_config.hpp>
#include <nutcore/exceptions.hpp>
#include <nutcore/model/obliquity.hpp>
#include <nutcore/nutation.hpp>
#include <nutcore/reduction_method.hpp>

#include <catch2/catch.hpp>

#include "log_capture.hpp"
#include "test_utils.hpp"

using namespace nutcore;
using namespace nutcore_test;

static double mean_obl_arcsec(double T, reduction_method m, bool vondrak = false)
{
    ephemeris_config cfg;
    cfg.method = m;
    cfg.use_vondrak_2011_obliquity = vondrak;

    return model::mean_obliquity(T, cfg) * rad2arcsec;
}

TEST_CASE("mean obliquity at J2000")
{
    REQUIRE(mean_obl_arcsec(0., reduction_method::IAU_2000) == approximately(84381.406));
    REQUIRE(mean_obl_arcsec(0., reduction_method::IAU_2006) == approximately(84381.406));
    REQUIRE(mean_obl_arcsec(0., reduction_method::IAU_2009) == approximately(84381.406));
    REQUIRE(mean_obl_arcsec(0., reduction_method::WILLIAMS_1994) == approximately(84381.406173));
    REQUIRE(mean_obl_arcsec(0., reduction_method::JPL_DE4xx) == approximately(84381.406173));
    REQUIRE(mean_obl_arcsec(0., reduction_method::SIMON_1994) == approximately(84381.412));
    REQUIRE(mean_obl_arcsec(0., reduction_method::LASKAR_1986) == approximately(84381.448));
    REQUIRE(mean_obl_arcsec(0., reduction_method::IAU_1976) == approximately(84381.448));
}

TEST_CASE("mean obliquity rate")
{
    // The obliquity decreases by about 46.8 arcsec per century.
    for (const auto m : {reduction_method::IAU_2000, reduction_method::IAU_2006, reduction_method::WILLIAMS_1994,
                         reduction_method::SIMON_1994, reduction_method::LASKAR_1986, reduction_method::IAU_1976}) {
        const auto rate = mean_obl_arcsec(1., m) - mean_obl_arcsec(0., m);

        REQUIRE(rate < -46.8);
        REQUIRE(rate > -46.9);
    }

    // Capitaine et al. (2003) at T = 1.
    REQUIRE(std::abs(mean_obl_arcsec(1., reduction_method::IAU_2006) - (84381.406 - 46.836769 - 0.0001831 + 0.00200340))
            < 1e-6);
}

TEST_CASE("vondrak")
{
    // The long-term model is selected via the flag only for the IAU 2006/2009 methods.
    REQUIRE(std::abs(mean_obl_arcsec(0., reduction_method::IAU_2006, true) - 84381.406) < 1e-3);
    REQUIRE(std::abs(mean_obl_arcsec(0., reduction_method::IAU_2009, true) - 84381.406) < 1e-3);
    REQUIRE(mean_obl_arcsec(0., reduction_method::IAU_2006, true) != mean_obl_arcsec(0., reduction_method::IAU_2006));
    REQUIRE(mean_obl_arcsec(0.5, reduction_method::IAU_2000, true) == mean_obl_arcsec(0.5, reduction_method::IAU_2000));
    REQUIRE(mean_obl_arcsec(0.5, reduction_method::IAU_1976, true) == mean_obl_arcsec(0.5, reduction_method::IAU_1976));

    // Agreement with the polynomial model near J2000.
    for (const auto T : {-2., -1., 1., 2.}) {
        REQUIRE(std::abs(mean_obl_arcsec(T, reduction_method::IAU_2006, true)
                         - mean_obl_arcsec(T, reduction_method::IAU_2006))
                < 0.01);
    }

    // Far from J2000, the long-term model is always used.
    log_capture lc(spdlog::level::warn);

    const auto far = mean_obl_arcsec(150., reduction_method::IAU_1976);
    REQUIRE(far == mean_obl_arcsec(150., reduction_method::IAU_2006, true));
    REQUIRE(far == mean_obl_arcsec(150., reduction_method::LASKAR_1986));
    REQUIRE(mean_obl_arcsec(-101., reduction_method::IAU_2000) == mean_obl_arcsec(-101., reduction_method::IAU_2009, true));

    // The long-term model stays within the physical range of the obliquity.
    REQUIRE(far > 22. * 3600.);
    REQUIRE(far < 25. * 3600.);

    // The warning is issued only once.
    for (auto T = 100.5; T < 1000.; T += 10.) {
        REQUIRE(std::isfinite(mean_obl_arcsec(T, reduction_method::IAU_2000)));
        REQUIRE(std::isfinite(mean_obl_arcsec(-T, reduction_method::IAU_1976)));
    }

    const auto out = lc.str();
    const auto pos = out.find("more than 10000 years away from J2000");
    REQUIRE(pos != std::string::npos);
    REQUIRE(out.find("more than 10000 years away from J2000", pos + 1u) == std::string::npos);
}

TEST_CASE("mean obliquity errors")
{
    using Catch::Matchers::Message;

    ephemeris_config cfg;

    REQUIRE_THROWS_MATCHES(model::mean_obliquity(std::numeric_limits<double>::infinity(), cfg), std::invalid_argument,
                           Message("Cannot compute the mean obliquity at the non-finite time inf"));

    cfg.method = static_cast<reduction_method>(-3);
    REQUIRE_THROWS_MATCHES(model::mean_obliquity(0., cfg), unsupported_reduction_method_error,
                           Message("The reduction method with numerical value -3 is not supported by "
                                   "mean_obliquity()"));
}

TEST_CASE("true obliquity")
{
    nutation_evaluator ev;

    for (const auto m : {reduction_method::IAU_1976, reduction_method::IAU_2000, reduction_method::IAU_2006}) {
        ephemeris_config cfg;
        cfg.method = m;

        for (const auto T : {0., 0.09496235455167694, -0.7}) {
            const auto eps = model::true_obliquity(T, cfg, ev);

            REQUIRE(eps == model::mean_obliquity(T, cfg) + ev.calc_nutation(T, cfg).obliquity);
            REQUIRE(ev.true_obliquity(T, cfg) == eps);
            REQUIRE(std::abs(eps - model::mean_obliquity(T, cfg)) * rad2arcsec < 11.);
        }
    }
}
