// Copyright 2020-2025 Francesco Biscani (bluescarni@gmail.com), Dario Izzo (dario.izzo@gmail.com)
//
// This file is part of the nutcore library.
//
// This Source Code Form is subject to the terms of the Mozilla
// Public License v. 2.0. If a copy of the MPL was not distributed
// with this file, You can obtain one at http://mozilla.org/MPL/2.0/.

// NOTE: this needs to go first because of the
// SPDLOG_ACTIVE_LEVEL definition.
#include <nutcore/detail/logging_impl.hpp>

#include <memory>

#include <spdlog/sinks/stdout_color_sinks.h>

#include <nutcore/config.hpp>

NUTCORE_BEGIN_NAMESPACE

namespace detail
{

namespace
{

// Name of the logger in the spdlog registry.
constexpr auto logger_name = "nutcore";

std::shared_ptr<spdlog::logger> make_logger()
{
    // NOTE: another component of the process may have already
    // registered the logger (e.g., after a reload of the library).
    if (auto existing = spdlog::get(logger_name)) {
        return existing;
    }

    auto ret = spdlog::stdout_color_mt(logger_name);
    ret->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");

    SPDLOG_LOGGER_DEBUG(ret, "nutcore {} logger initialised", NUTCORE_VERSION_STRING);

    return ret;
}

} // namespace

spdlog::logger *get_logger()
{
    static const auto ret = make_logger();

    return ret.get();
}

} // namespace detail

NUTCORE_END_NAMESPACE
