// Copyright 2020-2025 Francesco Biscani (bluescarni@gmail.com), Dario Izzo (dario.izzo@gmail.com)
//
// This file is part of the nutcore library.
//
// This Source Code Form is subject to the terms of the Mozilla
// Public License v. 2.0. If a copy of the MPL was not distributed
// with this file, You can obtain one at http://mozilla.org/MPL/2.0/.

#include <initializer_list>
#include <sstream>
#include <stdexcept>
#include <string>

#include <fmt/core.h>

#include <spdlog/common.h>
#include <spdlog/spdlog.h>

#include <nutcore/ephemeris_config.hpp>
#include <nutcore/logging.hpp>
#include <nutcore/model/obliquity.hpp>
#include <nutcore/nutation.hpp>

#include <catch2/catch.hpp>

#include "log_capture.hpp"

using namespace nutcore;
using namespace nutcore_test;

TEST_CASE("basic")
{
    REQUIRE(create_logger() != nullptr);
    REQUIRE(spdlog::get("nutcore") != nullptr);

    const auto logger = spdlog::get("nutcore");

    set_logger_level_trace();
    REQUIRE(logger->level() == spdlog::level::trace);
    set_logger_level_debug();
    REQUIRE(logger->level() == spdlog::level::debug);
    set_logger_level_info();
    REQUIRE(logger->level() == spdlog::level::info);
    set_logger_level_warn();
    REQUIRE(logger->level() == spdlog::level::warn);
    set_logger_level_err();
    REQUIRE(logger->level() == spdlog::level::err);
    set_logger_level_critical();
    REQUIRE(logger->level() == spdlog::level::critical);
    REQUIRE(get_logger_level() == log_level::critical);

    for (const auto l : {log_level::trace, log_level::debug, log_level::info, log_level::warn, log_level::err,
                         log_level::critical, log_level::off}) {
        set_logger_level(l);
        REQUIRE(get_logger_level() == l);
    }

    REQUIRE_THROWS_MATCHES(set_logger_level(static_cast<log_level>(42)), std::invalid_argument,
                           Catch::Matchers::Message("Invalid log level with numerical value 42 specified"));

    REQUIRE(fmt::format("{}", log_level::warn) == "warn");
    std::ostringstream oss;
    oss << log_level::err;
    REQUIRE(oss.str() == "err");

    set_logger_level_info();
}

TEST_CASE("warnings")
{
    log_capture lc(spdlog::level::warn);

    // No warning near J2000.
    ephemeris_config cfg;
    (void)model::mean_obliquity(0.5, cfg);
    REQUIRE(lc.str().empty());

    (void)model::mean_obliquity(-250., cfg);
    const auto out = lc.str();
    REQUIRE(out.find("more than 10000 years away from J2000") != std::string::npos);
    REQUIRE(out.find("IAU_2006") != std::string::npos);
}

TEST_CASE("silenced")
{
    log_capture lc(spdlog::level::err);

    ephemeris_config cfg;
    (void)model::mean_obliquity(-250., cfg);
    REQUIRE(lc.str().empty());
}
