// Copyright 2020-2025 Francesco Biscani (bluescarni@gmail.com), Dario Izzo (dario.izzo@gmail.com)
//
// This file is part of the nutcore library.
//
// This Source Code Form is subject to the terms of the Mozilla
// Public License v. 2.0. If a copy of the MPL was not distributed
// with this file, You can obtain one at http://mozilla.org/MPL/2.0/.

#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include <nutcore/logging.hpp>

#include "log_capture.hpp"

namespace nutcore_test
{

log_capture::log_capture(spdlog::level::level_enum lvl)
{
    // NOTE: make sure the logger exists.
    nutcore::create_logger();

    m_logger = spdlog::get("nutcore");
    if (!m_logger) {
        throw std::runtime_error("The nutcore logger could not be found in the spdlog registry");
    }

    m_orig_sinks = std::move(m_logger->sinks());
    m_logger->sinks().clear();
    m_logger->sinks().push_back(std::make_shared<spdlog::sinks::ostream_sink_mt>(m_oss));

    m_orig_level = m_logger->level();
    m_logger->set_level(lvl);
}

log_capture::~log_capture()
{
    m_logger->sinks() = std::move(m_orig_sinks);
    m_logger->set_level(m_orig_level);
}

std::string log_capture::str()
{
    m_logger->flush();

    return m_oss.str();
}

} // namespace nutcore_test
