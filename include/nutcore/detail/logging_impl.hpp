// Copyright 2020-2025 Francesco Biscani (bluescarni@gmail.com), Dario Izzo (dario.izzo@gmail.com)
//
// This file is part of the nutcore library.
//
// This Source Code Form is subject to the terms of the Mozilla
// Public License v. 2.0. If a copy of the MPL was not distributed
// with this file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef NUTCORE_DETAIL_LOGGING_IMPL_HPP
#define NUTCORE_DETAIL_LOGGING_IMPL_HPP

// NOTE: the compile-time level must be set before including spdlog. In release
// builds, the SPDLOG_LOGGER_TRACE() and SPDLOG_LOGGER_DEBUG() calls on hot paths
// (e.g., the nutation cache lookups) compile to nothing.
#if defined(NDEBUG)

#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_INFO

#else

#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE

#endif

#include <chrono>

#include <spdlog/spdlog.h>
#include <spdlog/stopwatch.h>

#include <nutcore/config.hpp>

NUTCORE_BEGIN_NAMESPACE

namespace detail
{

// The nutcore logger, created on first use.
spdlog::logger *get_logger();

} // namespace detail

NUTCORE_END_NAMESPACE

#endif
