// Copyright 2020-2025 Francesco Biscani (bluescarni@gmail.com), Dario Izzo (dario.izzo@gmail.com)
//
// This file is part of the nutcore library.
//
// This Source Code Form is subject to the terms of the Mozilla
// Public License v. 2.0. If a copy of the MPL was not distributed
// with this file, You can obtain one at http://mozilla.org/MPL/2.0/.

#include <cmath>
#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>

#include <nutcore/eop_data.hpp>
#include <nutcore/eop_provider.hpp>
#include <nutcore/exceptions.hpp>
#include <nutcore/reduction_method.hpp>

#include <catch2/catch.hpp>

#include "test_utils.hpp"

using namespace nutcore;
using namespace nutcore_test;

namespace
{

// Small tables around J2000 (MJD 51544.5 is JD 2451545.0).
eop_data make_iau1980_table()
{
    return eop_data({{.mjd = 51544, .delta_ut1_utc = 0.355, .dpsi_or_dx = -50., .deps_or_dy = -5.},
                     {.mjd = 51545, .delta_ut1_utc = 0.354, .dpsi_or_dx = -52., .deps_or_dy = -4.}},
                    eop_nutation_convention::dpsi_deps, "", "test_iau1980");
}

eop_data make_iau2000_table()
{
    return eop_data({{.mjd = 51544, .delta_ut1_utc = 0.355, .dpsi_or_dx = 0.1, .deps_or_dy = -0.2},
                     {.mjd = 51545, .delta_ut1_utc = 0.354, .dpsi_or_dx = 0.3, .deps_or_dy = -0.4}},
                    eop_nutation_convention::dx_dy, "", "test_iau2000");
}

} // namespace

TEST_CASE("constant provider")
{
    using Catch::Matchers::Message;

    const constant_eop_provider zero;
    auto v = zero.obtain(2451545., reduction_method::IAU_1976);
    REQUIRE(v.dpsi == 0.);
    REQUIRE(v.deps == 0.);
    REQUIRE(v.delta_ut1_utc == 0.);
    REQUIRE(v.jd == 2451545.);
    REQUIRE(v.method == reduction_method::IAU_1976);

    const constant_eop_provider cst(0.01, -0.02, 0.3);
    v = cst.obtain(2455000.5, reduction_method::IAU_2009);
    REQUIRE(v.dpsi == 0.01);
    REQUIRE(v.deps == -0.02);
    REQUIRE(v.delta_ut1_utc == 0.3);
    REQUIRE(v.jd == 2455000.5);
    REQUIRE(v.method == reduction_method::IAU_2009);

    REQUIRE_THROWS_MATCHES(constant_eop_provider(std::nan(""), 0.), std::invalid_argument,
                           Message("The values passed to the constructor of a constant EOP provider must all be "
                                   "finite, but they are [nan, 0, 0] instead"));
}

TEST_CASE("dxdy_to_dpsideps")
{
    // At J2000, the conversion reduces to dpsi = dX / sin(eps0), deps = dY.
    const auto [dpsi, deps] = detail::dxdy_to_dpsideps(0.3, -0.1, 0.);
    REQUIRE(dpsi == Approx(0.3 / 0.3977771559319137).epsilon(1e-14));
    REQUIRE(deps == Approx(-0.1).epsilon(1e-14));

    // Away from J2000 the precession angles enter, but the effect is small.
    const auto [dpsi1, deps1] = detail::dxdy_to_dpsideps(0.3, -0.1, 0.2);
    REQUIRE(dpsi1 != dpsi);
    REQUIRE(std::abs(dpsi1 - dpsi) < 1e-2 * std::abs(dpsi));
    REQUIRE(std::abs(deps1 - deps) < 1e-2);
}

TEST_CASE("iers provider in memory")
{
    using Catch::Matchers::Message;

    const iers_eop_provider prov(make_iau1980_table(), make_iau2000_table());

    // IAU 1980 methods use the dpsi/deps table directly (mas -> arcsec).
    auto v = prov.obtain(2451545., reduction_method::IAU_1976);
    REQUIRE(v.dpsi == Approx(-0.051));
    REQUIRE(v.deps == Approx(-0.0045));
    REQUIRE(v.delta_ut1_utc == Approx(0.3545));
    REQUIRE(v.jd == 2451545.);
    REQUIRE(v.method == reduction_method::IAU_1976);

    v = prov.obtain(2451545., reduction_method::JPL_DE4xx);
    REQUIRE(v.dpsi == Approx(-0.051));

    // IAU 2000 methods use the dX/dY table.
    v = prov.obtain(2451545., reduction_method::IAU_2006);
    const auto [dpsi, deps] = detail::dxdy_to_dpsideps(0.2e-3, -0.3e-3, 0.);
    REQUIRE(v.dpsi == Approx(dpsi).epsilon(1e-12));
    REQUIRE(v.deps == Approx(deps).epsilon(1e-12));
    REQUIRE(v.method == reduction_method::IAU_2006);

    // Outside the tables.
    REQUIRE_THROWS_AS(prov.obtain(2451600., reduction_method::IAU_2000), eop_data_unavailable_error);
    REQUIRE_THROWS_AS(prov.obtain(2451500., reduction_method::IAU_1976), eop_data_unavailable_error);
    REQUIRE_THROWS_AS(prov.obtain(std::nan(""), reduction_method::IAU_1976), std::invalid_argument);

    // Missing tables.
    const iers_eop_provider prov1980(make_iau1980_table());
    REQUIRE_NOTHROW(prov1980.obtain(2451545., reduction_method::LASKAR_1986));
    REQUIRE_THROWS_MATCHES(prov1980.obtain(2451545., reduction_method::IAU_2000), eop_data_unavailable_error,
                           Message("No IAU 2000 (finals2000A.all) EOP data table was configured in the IERS EOP "
                                   "provider"));

    const iers_eop_provider empty_prov;
    REQUIRE_THROWS_MATCHES(empty_prov.obtain(2451545., reduction_method::IAU_1976), eop_data_unavailable_error,
                           Message("No IAU 1980 (finals.all) EOP data table was configured in the IERS EOP provider"));

    // Mismatched conventions.
    REQUIRE_THROWS_MATCHES(iers_eop_provider(make_iau2000_table()), std::invalid_argument,
                           Message("Invalid IAU 1980 table passed to the constructor of an IERS EOP provider: the "
                                   "expected nutation convention is 'dpsi_deps', but the table uses the 'dx_dy' "
                                   "convention instead"));
    REQUIRE_THROWS_AS(iers_eop_provider(std::monostate{}, make_iau1980_table()), std::invalid_argument);
}

TEST_CASE("iers provider from file")
{
    const auto path = std::filesystem::temp_directory_path() / "nutcore_test_provider_finals.all";
    {
        std::ofstream ofs(path, std::ios::out | std::ios::binary | std::ios::trunc);
        ofs << make_iers_rapid_line(51544, "0.355", "-50.000", "-5.000") << '\n'
            << make_iers_rapid_line(51545, "0.354", "-52.000", "-4.000") << '\n';
    }

    const iers_eop_provider prov(path.string());

    // NOTE: the file is loaded on first use.
    const auto v = prov.obtain(2451545., reduction_method::IAU_1976);
    REQUIRE(v.dpsi == Approx(-0.051));
    REQUIRE(v.deps == Approx(-0.0045));

    // Once loaded, the file is not needed anymore.
    std::filesystem::remove(path);
    const auto v2 = prov.obtain(2451545., reduction_method::IAU_1976);
    REQUIRE(v2.dpsi == v.dpsi);
    REQUIRE(v2.deps == v.deps);

    // A missing file is reported at the first use.
    const iers_eop_provider bad_prov(path.string());
    REQUIRE_THROWS_AS(bad_prov.obtain(2451545., reduction_method::IAU_1976), eop_data_unavailable_error);
}
