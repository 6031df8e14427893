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
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>

#include <fmt/core.h>

#include <nutcore/eop_data.hpp>
#include <nutcore/exceptions.hpp>
#include <nutcore/s11n.hpp>

#include <catch2/catch.hpp>

#include "test_utils.hpp"

using namespace nutcore;
using namespace nutcore_test;

TEST_CASE("basic")
{
    eop_data idata;

    REQUIRE(idata.get_table().empty());
    REQUIRE(idata.get_timestamp().empty());
    REQUIRE(idata.get_identifier() == "empty");
    REQUIRE(idata.get_convention() == eop_nutation_convention::dx_dy);

    REQUIRE(fmt::format("{}", eop_nutation_convention::dpsi_deps) == "dpsi_deps");
    REQUIRE(fmt::format("{}", eop_nutation_convention::dx_dy) == "dx_dy");
}

TEST_CASE("parse_eop_data_iers_rapid test")
{
    using Catch::Matchers::Message;

    // Successful parses.
    {
        const std::string str
            = "73 1 2 41684.00 I  0.120733 0.009786  0.136966 0.015902  I 0.8084178 0.0002710  0.0000 0.1916  P    "
              "-0.766    0.199    -0.720    0.300   .143000   .137000   .8075000   -18.637    -3.667  \n73 1 3 "
              "41685.00 I  0.118980 0.011039  0.135656 0.013616  I 0.8056163 0.0002710  3.5563 0.1916  P    -0.751    "
              "0.199    -0.701    0.300   .141000   .134000   .8044000   -18.636    -3.571  ";

        const auto data = detail::parse_eop_data_iers_rapid(str);

        REQUIRE(data.size() == 2u);

        REQUIRE(data[0].mjd == 41684);
        REQUIRE(data[0].delta_ut1_utc == .8075000);
        REQUIRE(data[0].dpsi_or_dx == -18.637);
        REQUIRE(data[0].deps_or_dy == -3.667);

        REQUIRE(data[1].mjd == 41685);
        REQUIRE(data[1].delta_ut1_utc == .8044000);
        REQUIRE(data[1].dpsi_or_dx == -18.636);
        REQUIRE(data[1].deps_or_dy == -3.571);
    }

    // Bulletin A data only.
    {
        const std::string str
            = "25 2 3 60709.00 I  0.099700 0.000012  0.309126 0.000014  I 0.0461909 0.0000082  0.5842 0.0078  I     "
              "0.383    0.375    -0.034    0.114                                                     \n25 2 4 60710.00 "
              "I  0.097391 0.000008  0.309488 0.000011  I 0.0456841 0.0000132  0.4075 0.0064  I     0.391    0.319    "
              "-0.022    0.109                                                     ";

        const auto data = detail::parse_eop_data_iers_rapid(str);

        REQUIRE(data.size() == 2u);

        REQUIRE(data[0].mjd == 60709);
        REQUIRE(data[0].delta_ut1_utc == 0.0461909);
        REQUIRE(data[0].dpsi_or_dx == 0.383);
        REQUIRE(data[0].deps_or_dy == -0.034);

        REQUIRE(data[1].mjd == 60710);
        REQUIRE(data[1].delta_ut1_utc == 0.0456841);
        REQUIRE(data[1].dpsi_or_dx == 0.391);
        REQUIRE(data[1].deps_or_dy == -0.022);
    }

    // NOTE: newline at the end.
    {
        const std::string str
            = "25 2 3 60709.00 I  0.099700 0.000012  0.309126 0.000014  I 0.0461909 0.0000082  0.5842 0.0078  I     "
              "0.383    0.375    -0.034    0.114                                                     \n";

        const auto data = detail::parse_eop_data_iers_rapid(str);

        REQUIRE(data.size() == 1u);
        REQUIRE(data[0].mjd == 60709);
    }

    // NOTE: missing both bulletin A and bulletin B data.
    {
        const std::string str
            = "26 315 61114.00                                                                                         "
              "                                                                                   \n26 316 61115.00    "
              "                                                                                                        "
              "                                                                ";

        const auto data = detail::parse_eop_data_iers_rapid(str);

        REQUIRE(data.empty());
    }

    // NOTE: on the second line there's UT1-UTC data but no celestial pole offsets.
    {
        const std::string str
            = "25 6 2 60828.00 P  0.122981 0.007056  0.425970 0.010837  P 0.0350338 0.0072179                 P    "
              "-0.045    0.128     0.070    0.160                                                     \n"
              "25 6 3 60829.00 P  0.124395 0.007110  0.426240 0.010942  P 0.0351650 0.0072970                          "
              "                                                                                   ";

        const auto data = detail::parse_eop_data_iers_rapid(str);

        REQUIRE(data.size() == 1u);
        REQUIRE(data[0].dpsi_or_dx == -0.045);
        REQUIRE(data[0].deps_or_dy == 0.070);
    }

    // Parse errors.

    // Wrong line length.
    {
        const std::string str
            = "25 2 3 60709.00 I  0.099700 0.000012  0.309126 0.000014  I 0.0461909 0.0000082  0.5842 0.0078  I     "
              "0.383    0.375    -0.034    0.114                                                     \n ";

        REQUIRE_THROWS_MATCHES(
            detail::parse_eop_data_iers_rapid(str), std::invalid_argument,
            Message("Invalid line detected in a IERS rapid EOP data file: the expected number of "
                    "characters in the line is at least 185, but a line with 1 character(s) was detected instead"));
    }

    // Invalid MJD.
    {
        const std::string str
            = "73 1 2 4a684.00 I  0.120733 0.009786  0.136966 0.015902  I 0.8084178 0.0002710  0.0000 0.1916  P    "
              "-0.766    0.199    -0.720    0.300   .143000   .137000   .8075000   -18.637    -3.667  ";

        REQUIRE_THROWS_MATCHES(detail::parse_eop_data_iers_rapid(str), std::invalid_argument,
                               Message("Error parsing a IERS rapid EOP data file: the string '4a684.00' could "
                                       "not be parsed as a valid MJD"));
    }

    // Invalid bulletin B field.
    {
        const std::string str
            = "73 1 2 41684.00 I  0.120733 0.009786  0.136966 0.015902  I 0.8084178 0.0002710  0.0000 0.1916  P    "
              "-0.766    0.199    -0.720    0.300   .143000   .137000   .8075000   -18.6x7    -3.667  ";

        REQUIRE_THROWS_MATCHES(detail::parse_eop_data_iers_rapid(str), std::invalid_argument,
                               Message("Error parsing a IERS rapid EOP data file: the bulletin B string for the "
                                       "dpsi/dX field '-18.6x7' could not be parsed as a floating-point value"));
    }

    // Invalid bulletin A field.
    {
        const std::string str
            = "25 2 3 60709.00 I  0.099700 0.000012  0.309126 0.000014  I 0.04a1909 0.0000082  0.5842 0.0078  I     "
              "0.383    0.375    -0.034    0.114                                                     ";

        REQUIRE_THROWS_MATCHES(detail::parse_eop_data_iers_rapid(str), std::invalid_argument,
                               Message("Error parsing a IERS rapid EOP data file: the bulletin A string for the "
                                       "UT1-UTC difference field '0.04a1909' could not be parsed as a "
                                       "floating-point value"));
    }

    // Non-monotonic dates.
    {
        const auto str = make_iers_rapid_line(51545, "0.3", "-50.1", "-5.2") + "\n"
                         + make_iers_rapid_line(51544, "0.3", "-50.1", "-5.2");

        REQUIRE_THROWS_MATCHES(detail::parse_eop_data_iers_rapid(str), std::invalid_argument,
                               Message("Invalid EOP data table detected: the MJD value 51545 on line 0 is not less "
                                       "than the MJD value in the next line (51544)"));
    }
}

TEST_CASE("validate_eop_data_table")
{
    using Catch::Matchers::Message;

    REQUIRE_NOTHROW(detail::validate_eop_data_table({}));
    REQUIRE_NOTHROW(detail::validate_eop_data_table({{.mjd = 1, .delta_ut1_utc = 0.1}, {.mjd = 2}}));

    REQUIRE_THROWS_MATCHES(
        detail::validate_eop_data_table({{.mjd = std::numeric_limits<double>::quiet_NaN()}}), std::invalid_argument,
        Message("Invalid EOP data table detected: the MJD value nan on line 0 is not finite"));
    REQUIRE_THROWS_MATCHES(detail::validate_eop_data_table({{.mjd = 1}, {.mjd = 1}}), std::invalid_argument,
                           Message("Invalid EOP data table detected: the MJD value 1 on line 0 is not less than the "
                                   "MJD value in the next line (1)"));
    REQUIRE_THROWS_MATCHES(
        detail::validate_eop_data_table({{.mjd = 1, .delta_ut1_utc = std::numeric_limits<double>::infinity()}}),
        std::invalid_argument, Message("Invalid EOP data table detected: the UT1-UTC value inf on line 0 is not finite"));
    REQUIRE_THROWS_MATCHES(
        detail::validate_eop_data_table({{.mjd = 1}, {.mjd = 2, .dpsi_or_dx = -std::numeric_limits<double>::infinity()}}),
        std::invalid_argument,
        Message("Invalid EOP data table detected: the dpsi/dX value -inf on line 1 is not finite"));
    REQUIRE_THROWS_MATCHES(
        detail::validate_eop_data_table({{.mjd = 1, .deps_or_dy = std::numeric_limits<double>::quiet_NaN()}}),
        std::invalid_argument, Message("Invalid EOP data table detected: the deps/dY value nan on line 0 is not finite"));

    // The constructor validates the table too.
    REQUIRE_THROWS_AS(eop_data({{.mjd = 2}, {.mjd = 1}}, eop_nutation_convention::dx_dy, "", "test"),
                      std::invalid_argument);
    REQUIRE_THROWS_MATCHES(eop_data({}, static_cast<eop_nutation_convention>(10), "", "test"), std::invalid_argument,
                           Message("Invalid EOP nutation convention 10 specified"));
}

TEST_CASE("interpolate")
{
    using Catch::Matchers::Message;

    const eop_data data({{.mjd = 51544, .delta_ut1_utc = 0.35, .dpsi_or_dx = -50., .deps_or_dy = -5.},
                         {.mjd = 51545, .delta_ut1_utc = 0.34, .dpsi_or_dx = -52., .deps_or_dy = -4.},
                         {.mjd = 51546, .delta_ut1_utc = 0.33, .dpsi_or_dx = -51., .deps_or_dy = -6.}},
                        eop_nutation_convention::dpsi_deps, "2000-01-01", "test_table");

    REQUIRE(data.get_table().size() == 3u);
    REQUIRE(data.get_convention() == eop_nutation_convention::dpsi_deps);
    REQUIRE(data.get_timestamp() == "2000-01-01");
    REQUIRE(data.get_identifier() == "test_table");

    // Exact nodes.
    auto v = data.interpolate(51544);
    REQUIRE(v.delta_ut1_utc == 0.35);
    REQUIRE(v.dpsi_or_dx == -50.);
    REQUIRE(v.deps_or_dy == -5.);

    v = data.interpolate(51545);
    REQUIRE(v.dpsi_or_dx == -52.);

    v = data.interpolate(51546);
    REQUIRE(v.delta_ut1_utc == 0.33);
    REQUIRE(v.dpsi_or_dx == -51.);
    REQUIRE(v.deps_or_dy == -6.);

    // Midpoints.
    v = data.interpolate(51544.5);
    REQUIRE(v.delta_ut1_utc == Approx(0.345));
    REQUIRE(v.dpsi_or_dx == Approx(-51.));
    REQUIRE(v.deps_or_dy == Approx(-4.5));

    v = data.interpolate(51545.25);
    REQUIRE(v.dpsi_or_dx == Approx(-51.75));
    REQUIRE(v.deps_or_dy == Approx(-4.5));

    // Out of range.
    REQUIRE_THROWS_MATCHES(data.interpolate(51543.9), eop_data_unavailable_error,
                           Message("Cannot interpolate the EOP data 'test_table' at the MJD 51543.9: the date is "
                                   "outside the range of the table [51544, 51546]"));
    REQUIRE_THROWS_AS(data.interpolate(51546.1), eop_data_unavailable_error);
    REQUIRE_THROWS_AS(data.interpolate(std::numeric_limits<double>::quiet_NaN()), std::invalid_argument);

    // Empty table.
    REQUIRE_THROWS_MATCHES(eop_data{}.interpolate(51544), eop_data_unavailable_error,
                           Message("Cannot interpolate the EOP data 'empty' at the MJD 51544: the table is empty"));
}

TEST_CASE("from_string from_file")
{
    using Catch::Matchers::Message;

    const auto str = make_iers_rapid_line(51544, "0.3554", "-50.123", "-5.321") + "\n"
                     + make_iers_rapid_line(51545, "0.3543", "-50.456", "-5.654") + "\n";

    const auto data = eop_data::from_string(str, eop_nutation_convention::dpsi_deps);
    REQUIRE(data.get_identifier() == "custom");
    REQUIRE(data.get_table().size() == 2u);
    REQUIRE(data.get_table()[0].delta_ut1_utc == 0.3554);
    REQUIRE(data.get_table()[1].dpsi_or_dx == -50.456);
    REQUIRE(data.get_table()[1].deps_or_dy == -5.654);

    // Write the data into a file.
    const auto path = std::filesystem::temp_directory_path() / "nutcore_test_finals.all";
    {
        std::ofstream ofs(path, std::ios::out | std::ios::binary | std::ios::trunc);
        ofs << str;
    }

    const auto fdata = eop_data::from_file(path.string(), eop_nutation_convention::dpsi_deps);
    REQUIRE(fdata.get_table() == data.get_table());
    REQUIRE(fdata.get_convention() == eop_nutation_convention::dpsi_deps);
    REQUIRE(fdata.get_identifier() == "iers_rapid_nutcore_test_finals_all");
    REQUIRE(!fdata.get_timestamp().empty());

    std::filesystem::remove(path);

    // Missing file.
    REQUIRE_THROWS_MATCHES(
        eop_data::from_file(path.string(), eop_nutation_convention::dx_dy), eop_data_unavailable_error,
        Message(fmt::format("Unable to open the EOP data file '{}'", path.string())));
}

TEST_CASE("s11n")
{
    const eop_data data({{.mjd = 51544, .delta_ut1_utc = 0.35, .dpsi_or_dx = -50., .deps_or_dy = -5.},
                         {.mjd = 51545, .delta_ut1_utc = 0.34, .dpsi_or_dx = -52., .deps_or_dy = -4.}},
                        eop_nutation_convention::dpsi_deps, "2000-01-01", "test_table");

    std::stringstream ss;

    {
        boost::archive::binary_oarchive oa(ss);
        oa << data;
    }

    eop_data data2;

    {
        boost::archive::binary_iarchive ia(ss);
        ia >> data2;
    }

    REQUIRE(data2.get_table() == data.get_table());
    REQUIRE(data2.get_convention() == eop_nutation_convention::dpsi_deps);
    REQUIRE(data2.get_timestamp() == "2000-01-01");
    REQUIRE(data2.get_identifier() == "test_table");
}
