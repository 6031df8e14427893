// Copyright 2020-2025 Francesco Biscani (bluescarni@gmail.com), Dario Izzo (dario.izzo@gmail.com)
//
// This file is part of the nutcore library.
//
// This Source Code Form is subject to the terms of the Mozilla
// Public License v. 2.0. If a copy of the MPL was not distributed
// with this file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef NUTCORE_LOGGING_HPP
#define NUTCORE_LOGGING_HPP

#include <ostream>

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <nutcore/config.hpp>
#include <nutcore/detail/visibility.hpp>

NUTCORE_BEGIN_NAMESPACE

// Severity levels of the nutcore logger, from the most to the least verbose.
enum class log_level : int { trace, debug, info, warn, err, critical, off };

NUTCORE_DLL_PUBLIC std::ostream &operator<<(std::ostream &, log_level);

// Make sure the nutcore logger exists, and return an opaque pointer to it.
NUTCORE_DLL_PUBLIC void *create_logger();

NUTCORE_DLL_PUBLIC void set_logger_level(log_level);
[[nodiscard]] NUTCORE_DLL_PUBLIC log_level get_logger_level();

NUTCORE_DLL_PUBLIC void set_logger_level_trace();
NUTCORE_DLL_PUBLIC void set_logger_level_debug();
NUTCORE_DLL_PUBLIC void set_logger_level_info();
NUTCORE_DLL_PUBLIC void set_logger_level_warn();
NUTCORE_DLL_PUBLIC void set_logger_level_err();
NUTCORE_DLL_PUBLIC void set_logger_level_critical();

NUTCORE_END_NAMESPACE

namespace fmt
{

template <>
struct formatter<nutcore::log_level> : fmt::ostream_formatter {
};

} // namespace fmt

#endif
