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
#include <initializer_list>
#include <memory>
#include <stdexcept>
#include <vector>

#include <nutcore/ephemeris_config.hpp>
#include <nutcore/eop_provider.hpp>
#include <nutcore/exceptions.hpp>
#include <nutcore/model/nutation.hpp>
#include <nutcore/model/nutation_matrix.hpp>
#include <nutcore/model/obliquity.hpp>
#include <nutcore/model/time_conversions.hpp>
#include <nutcore/nutation.hpp>
#include <nutcore/reduction_method.hpp>

#include <catch2/catch.hpp>

#include "test_utils.hpp"

using namespace nutcore;
using namespace nutcore_test;

// 2009 July 1, 0h TT.
constexpr double jd_ref = 2455013.5;

TEST_CASE("reference scenario")
{
    nutation_evaluator ev;

    ephemeris_config cfg;
    cfg.correct_for_eop = true;
    cfg.eop = std::make_shared<constant_eop_provider>();

    const auto T = model::jd_to_centuries(jd_ref);

    cfg.method = reduction_method::IAU_1976;
    auto res = ev.calc_nutation(T, cfg);
    REQUIRE(std::abs(res.longitude * rad2arcsec - 14.7774) < 1e-3);
    REQUIRE(std::abs(res.obliquity * rad2arcsec - 4.3386) < 1e-3);

    cfg.method = reduction_method::IAU_2000;
    res = ev.calc_nutation(T, cfg);
    REQUIRE(std::abs(res.longitude * rad2arcsec - 14.7823) < 1e-3);
    REQUIRE(std::abs(res.obliquity * rad2arcsec - 4.3391) < 1e-3);
}

TEST_CASE("cache")
{
    nutation_evaluator ev;
    REQUIRE(ev.get_use_cache());
    REQUIRE(!ev.get_last_result());
    REQUIRE(ev.get_n_hits() == 0u);
    REQUIRE(ev.get_n_misses() == 0u);

    ephemeris_config cfg;
    cfg.method = reduction_method::IAU_2006;

    const auto T = model::jd_to_centuries(jd_ref);

    const auto r0 = ev.calc_nutation(T, cfg);
    REQUIRE(r0 == model::nutation_series(T, reduction_method::IAU_2006));
    REQUIRE(ev.get_n_misses() == 1u);
    REQUIRE(ev.get_last_result() == r0);

    // Repeated queries are served from the cache, with bit-identical results.
    for (auto i = 0; i < 10; ++i) {
        REQUIRE(ev.calc_nutation(T, cfg) == r0);
    }
    REQUIRE(ev.get_n_hits() == 10u);
    REQUIRE(ev.get_n_misses() == 1u);

    // Changing the time or the method invalidates the cache.
    const auto r1 = ev.calc_nutation(T + 1e-9, cfg);
    REQUIRE(r1 != r0);
    REQUIRE(ev.get_n_misses() == 2u);
    REQUIRE(ev.get_last_result() == r1);

    cfg.method = reduction_method::IAU_2009;
    const auto r2 = ev.calc_nutation(T + 1e-9, cfg);
    REQUIRE(r2 == r1);
    REQUIRE(ev.get_n_misses() == 3u);

    cfg.method = reduction_method::IAU_1976;
    const auto r3 = ev.calc_nutation(T + 1e-9, cfg);
    REQUIRE(r3 == model::nutation_series(T + 1e-9, reduction_method::IAU_1976));
    REQUIRE(ev.get_n_misses() == 4u);

    // Interleaved queries.
    cfg.method = reduction_method::IAU_2006;
    for (auto i = 0; i < 5; ++i) {
        REQUIRE(ev.calc_nutation(T, cfg) == r0);
        REQUIRE(ev.calc_nutation(T + 1e-9, cfg) == r1);
    }
    REQUIRE(ev.get_n_hits() == 10u);
    REQUIRE(ev.get_n_misses() == 14u);

    // Clearing forces a recomputation, with the same result.
    REQUIRE(ev.calc_nutation(T, cfg) == r0);
    ev.clear_previous_calculation();
    REQUIRE(ev.calc_nutation(T, cfg) == r0);
    REQUIRE(ev.get_n_misses() == 16u);
    REQUIRE(ev.calc_nutation(T, cfg) == r0);
    REQUIRE(ev.get_n_hits() == 11u);

    // A failed computation does not touch the cache.
    REQUIRE_THROWS_AS(ev.calc_nutation(std::nan(""), cfg), std::invalid_argument);
    REQUIRE(ev.get_last_result() == r0);
    REQUIRE(ev.calc_nutation(T, cfg) == r0);
    REQUIRE(ev.get_n_hits() == 12u);
}

TEST_CASE("no cache")
{
    nutation_evaluator ev(false), ev_cache;
    REQUIRE(!ev.get_use_cache());

    ephemeris_config cfg;

    for (const auto m : {reduction_method::IAU_1976, reduction_method::IAU_2000, reduction_method::IAU_2006}) {
        cfg.method = m;

        for (const auto T : {0., 0.1, 0.1, -0.5, -0.5, 3.}) {
            REQUIRE(ev.calc_nutation(T, cfg) == ev_cache.calc_nutation(T, cfg));
        }
    }

    REQUIRE(ev.get_n_hits() == 0u);
    REQUIRE(ev.get_n_misses() == 18u);
    REQUIRE(ev_cache.get_n_hits() == 6u);
    REQUIRE(ev_cache.get_n_misses() == 12u);
}

TEST_CASE("eop")
{
    using Catch::Matchers::Message;

    nutation_evaluator ev;

    ephemeris_config cfg;
    cfg.method = reduction_method::IAU_2000;
    cfg.correct_for_eop = true;

    const auto T = model::jd_to_centuries(jd_ref);

    // No provider.
    REQUIRE_THROWS_MATCHES(ev.calc_nutation(T, cfg), eop_data_unavailable_error,
                           Message("The correction for the Earth orientation parameters was requested, but no "
                                   "EOP provider was set in the configuration"));
    REQUIRE(!ev.get_last_result());
    REQUIRE(ev.get_n_misses() == 0u);

    // The offsets are added to the series.
    cfg.eop = std::make_shared<constant_eop_provider>(0.01, -0.02);
    const auto series = model::nutation_series(T, cfg.method);
    const auto res = ev.calc_nutation(T, cfg);
    REQUIRE(res.longitude == approximately(series.longitude + 0.01 / rad2arcsec));
    REQUIRE(res.obliquity == approximately(series.obliquity - 0.02 / rad2arcsec));

    // Toggling the flag never returns a stale result.
    cfg.correct_for_eop = false;
    REQUIRE(ev.calc_nutation(T, cfg) == series);
    cfg.correct_for_eop = true;
    REQUIRE(ev.calc_nutation(T, cfg) == res);
    REQUIRE(ev.get_n_hits() == 0u);
    REQUIRE(ev.get_n_misses() == 3u);

    // Same for a change of provider.
    cfg.eop = std::make_shared<constant_eop_provider>(0.03, 0.04);
    const auto res2 = ev.calc_nutation(T, cfg);
    REQUIRE(res2.longitude == approximately(series.longitude + 0.03 / rad2arcsec));
    REQUIRE(res2.obliquity == approximately(series.obliquity + 0.04 / rad2arcsec));
    REQUIRE(ev.get_n_misses() == 4u);

    // The provider is ignored when the correction is off.
    cfg.correct_for_eop = false;
    REQUIRE(ev.calc_nutation(T, cfg) == series);
    cfg.eop = std::make_shared<constant_eop_provider>(1., 1.);
    REQUIRE(ev.calc_nutation(T, cfg) == series);
    REQUIRE(ev.get_n_hits() == 1u);

    // Errors from the provider are propagated.
    cfg.correct_for_eop = true;
    cfg.eop = std::make_shared<iers_eop_provider>();
    REQUIRE_THROWS_AS(ev.calc_nutation(T, cfg), eop_data_unavailable_error);
}

namespace
{

// Provider returning zero offsets and remembering the
// arguments of the last lookup.
class recording_eop_provider final : public eop_provider
{
public:
    mutable double m_jd = 0;
    mutable reduction_method m_method = reduction_method::IAU_2006;
    mutable unsigned m_n_calls = 0;

    eop_values obtain(double jd, reduction_method method) const override
    {
        m_jd = jd;
        m_method = method;
        ++m_n_calls;

        eop_values ret;
        ret.jd = jd;
        ret.method = method;

        return ret;
    }
};

} // namespace

TEST_CASE("eop lookup instant")
{
    for (const auto method : {reduction_method::IAU_1976, reduction_method::LASKAR_1986, reduction_method::IAU_2000,
                              reduction_method::IAU_2009}) {
        nutation_evaluator ev;

        auto prov = std::make_shared<recording_eop_provider>();

        ephemeris_config cfg;
        cfg.method = method;
        cfg.correct_for_eop = true;
        cfg.eop = prov;

        for (const auto jd_tt : {jd_ref, 2451545.0, 2415020.5}) {
            const auto T = model::jd_to_centuries(jd_tt);

            const auto res = ev.calc_nutation(T, cfg);
            REQUIRE(res == model::nutation_series(T, method));

            // The lookup happens at the UT instant corresponding to T,
            // with the configured reduction method.
            const auto jd_tt_T = model::centuries_to_jd(T);
            const auto expected = jd_tt_T - model::tt_minus_ut1(jd_tt_T) / model::seconds_per_day;
            REQUIRE(prov->m_jd == approximately(expected, 1.));
            REQUIRE(prov->m_method == method);

            // UT is behind TT by TT-UT1 seconds.
            REQUIRE(prov->m_jd < jd_tt_T);
            REQUIRE(std::abs((jd_tt_T - prov->m_jd) * model::seconds_per_day - model::tt_minus_ut1(jd_tt_T)) < 1e-3);
        }

        REQUIRE(prov->m_n_calls == 3u);

        // Cache hits do not query the provider again.
        static_cast<void>(ev.calc_nutation(model::jd_to_centuries(2415020.5), cfg));
        REQUIRE(prov->m_n_calls == 3u);
    }
}

TEST_CASE("nutate_in_equatorial_coordinates")
{
    using Catch::Matchers::Message;

    nutation_evaluator ev;

    for (const auto m : {reduction_method::IAU_1976, reduction_method::JPL_DE4xx, reduction_method::IAU_2000,
                         reduction_method::IAU_2006}) {
        ephemeris_config cfg;
        cfg.method = m;

        for (const auto jd : {jd_ref, 2451545., 2415020.5, 2488069.5}) {
            const std::array v3 = {1.5e8, -2.3e7, 4.4e6};
            const std::array v6 = {1.5e8, -2.3e7, 4.4e6, 3.1, 29.5, -12.7};

            // Round trip.
            const auto t3 = ev.nutate_in_equatorial_coordinates(jd, cfg, v3, true);
            const auto b3 = ev.nutate_in_equatorial_coordinates(jd, cfg, t3, false);
            for (std::size_t i = 0; i < 3u; ++i) {
                REQUIRE(std::abs(b3[i] - v3[i]) < 1e-10 * 1.5e8);
            }

            const auto t6 = ev.nutate_in_equatorial_coordinates(jd, cfg, v6, true);
            const auto b6 = ev.nutate_in_equatorial_coordinates(jd, cfg, t6, false);
            for (std::size_t i = 0; i < 3u; ++i) {
                REQUIRE(std::abs(b6[i] - v6[i]) < 1e-10 * 1.5e8);
                REQUIRE(std::abs(b6[i + 3u] - v6[i + 3u]) < 1e-10 * 30.);
            }

            // Consistency with the matrix.
            const auto T = model::jd_to_centuries(jd);
            const auto eps_mean = model::mean_obliquity(T, cfg);
            const auto nut = model::nutation_series(T, m);
            const auto mat = model::nutation_matrix(eps_mean, eps_mean + nut.obliquity, nut.longitude);
            REQUIRE(t3 == model::rotate(mat, v3, false));
            REQUIRE(t6 == model::rotate(mat, v6, false));

            // The vector overload.
            const auto tv = ev.nutate_in_equatorial_coordinates(jd, cfg, std::vector(v6.begin(), v6.end()), true);
            REQUIRE(tv == std::vector(t6.begin(), t6.end()));
            const auto tv3 = ev.nutate_in_equatorial_coordinates(jd, cfg, std::vector(v3.begin(), v3.end()), true);
            REQUIRE(tv3 == std::vector(t3.begin(), t3.end()));
        }
    }

    REQUIRE_THROWS_MATCHES(ev.nutate_in_equatorial_coordinates(jd_ref, ephemeris_config{}, std::vector{1., 2.}, true),
                           std::invalid_argument,
                           Message("Invalid vector passed to nutate_in_equatorial_coordinates(): the size of the "
                                   "vector must be either 3 or 6, but it is 2 instead"));
    REQUIRE_THROWS_AS(ev.nutate_in_equatorial_coordinates(jd_ref, ephemeris_config{}, std::vector<double>{}, false),
                      std::invalid_argument);
}

TEST_CASE("default evaluator")
{
    auto &ev = default_nutation_evaluator();
    REQUIRE(&ev == &default_nutation_evaluator());
    REQUIRE(ev.get_use_cache());

    ephemeris_config cfg;
    const auto T = model::jd_to_centuries(jd_ref);

    clear_previous_calculation();
    const auto hits = ev.get_n_hits(), misses = ev.get_n_misses();

    const auto r0 = calc_nutation(T, cfg);
    REQUIRE(r0 == model::nutation_series(T, cfg.method));
    REQUIRE(calc_nutation(T, cfg) == r0);
    REQUIRE(ev.get_n_misses() == misses + 1u);
    REQUIRE(ev.get_n_hits() == hits + 1u);

    clear_previous_calculation();
    REQUIRE(calc_nutation(T, cfg) == r0);
    REQUIRE(ev.get_n_misses() == misses + 2u);

    REQUIRE(true_obliquity(T, cfg) == model::mean_obliquity(T, cfg) + r0.obliquity);

    const std::array v3 = {1., 2., 3.};
    const std::array v6 = {1., 2., 3., 4., 5., 6.};
    REQUIRE(nutate_in_equatorial_coordinates(jd_ref, cfg, v3, true)
            == nutation_evaluator{}.nutate_in_equatorial_coordinates(jd_ref, cfg, v3, true));
    REQUIRE(nutate_in_equatorial_coordinates(jd_ref, cfg, v6, false)
            == nutation_evaluator{}.nutate_in_equatorial_coordinates(jd_ref, cfg, v6, false));
    REQUIRE(nutate_in_equatorial_coordinates(jd_ref, cfg, std::vector{1., 2., 3.}, true)
            == nutation_evaluator{}.nutate_in_equatorial_coordinates(jd_ref, cfg, std::vector{1., 2., 3.}, true));
}
