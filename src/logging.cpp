// Copyright 2020-2025 Francesco Biscani (bluescarni@gmail.com), Dario Izzo (dario.izzo@gmail.com)
//
// This file is part of the nutcore library.
//
// This Source Code Form is subject to the terms of the Mozilla
// Public License v. 2.0. If a copy of the MPL was not distributed
// with this file, You can obtain one at http://mozilla.org/MPL/2.0/.

#include <ostream>
#include <stdexcept>
#include <type_traits>

#include <fmt/core.h>

#include <nutcore/config.hpp>
#include <nutcore/detail/logging_impl.hpp>
#include <nutcore/logging.hpp>

NUTCORE_BEGIN_NAMESPACE

namespace detail
{

namespace
{

spdlog::level::level_enum to_spdlog_level(log_level l)
{
    switch (l) {
        case log_level::trace:
            return spdlog::level::trace;
        case log_level::debug:
            return spdlog::level::debug;
        case log_level::info:
            return spdlog::level::info;
        case log_level::warn:
            return spdlog::level::warn;
        case log_level::err:
            return spdlog::level::err;
        case log_level::critical:
            return spdlog::level::critical;
        case log_level::off:
            return spdlog::level::off;
    }

    throw std::invalid_argument(fmt::format("Invalid log level with numerical value {} specified",
                                            static_cast<std::underlying_type_t<log_level>>(l)));
}

log_level from_spdlog_level(spdlog::level::level_enum l)
{
    switch (l) {
        case spdlog::level::trace:
            return log_level::trace;
        case spdlog::level::debug:
            return log_level::debug;
        case spdlog::level::info:
            return log_level::info;
        case spdlog::level::warn:
            return log_level::warn;
        case spdlog::level::err:
            return log_level::err;
        case spdlog::level::critical:
            return log_level::critical;
        case spdlog::level::off:
        case spdlog::level::n_levels:
            return log_level::off;
    }

    // NOTE: the level of a logger is always one of the enumerators.
    return log_level::off;
}

} // namespace

} // namespace detail

std::ostream &operator<<(std::ostream &os, log_level l)
{
    switch (l) {
        case log_level::trace:
            return os << "trace";
        case log_level::debug:
            return os << "debug";
        case log_level::info:
            return os << "info";
        case log_level::warn:
            return os << "warn";
        case log_level::err:
            return os << "err";
        case log_level::critical:
            return os << "critical";
        case log_level::off:
            return os << "off";
    }

    return os << "invalid";
}

void *create_logger()
{
    return detail::get_logger();
}

void set_logger_level(log_level l)
{
    detail::get_logger()->set_level(detail::to_spdlog_level(l));
}

log_level get_logger_level()
{
    return detail::from_spdlog_level(detail::get_logger()->level());
}

void set_logger_level_trace()
{
    set_logger_level(log_level::trace);
}

void set_logger_level_debug()
{
    set_logger_level(log_level::debug);
}

void set_logger_level_info()
{
    set_logger_level(log_level::info);
}

void set_logger_level_warn()
{
    set_logger_level(log_level::warn);
}

void set_logger_level_err()
{
    set_logger_level(log_level::err);
}

void set_logger_level_critical()
{
    set_logger_level(log_level::critical);
}

NUTCORE_END_NAMESPACE
