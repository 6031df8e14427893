// Copyright 2020-2025 Francesco Biscani (bluescarni@gmail.com), Dario Izzo (dario.izzo@gmail.com)
//
// This file is part of the nutcore library.
//
// This Source Code Form is subject to the terms of the Mozilla
// Public License v. 2.0. If a copy of the MPL was not distributed
// with this file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef NUTCORE_TEST_LOG_CAPTURE_HPP
#define NUTCORE_TEST_LOG_CAPTURE_HPP

#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <spdlog/common.h>
#include <spdlog/spdlog.h>

namespace nutcore_test
{

// Redirect the output of the nutcore logger into a string stream
// for the lifetime of the object. The original sinks and log level are
// restored on destruction.
class log_capture
{
    std::shared_ptr<spdlog::logger> m_logger;
    std::vector<spdlog::sink_ptr> m_orig_sinks;
    spdlog::level::level_enum m_orig_level;
    std::ostringstream m_oss;

public:
    explicit log_capture(spdlog::level::level_enum);
    log_capture(const log_capture &) = delete;
    log_capture &operator=(const log_capture &) = delete;
    ~log_capture();

    std::string str();
};

} // namespace nutcore_test

#endif
