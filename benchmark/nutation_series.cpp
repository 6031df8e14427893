// Copyright 2020-2025 Francesco Biscani (bluescarni@gmail.com), Dario Izzo (dario.izzo@gmail.com)
//
// This file is part of the nutcore library.
//
// This Source Code Form is subject to the terms of the Mozilla
// Public License v. 2.0. If a copy of the MPL was not distributed
// with this file, You can obtain one at http://mozilla.org/MPL/2.0/.

#include <cstddef>
#include <initializer_list>
#include <iostream>

#include <boost/program_options.hpp>

#include <fmt/core.h>

#include <spdlog/spdlog.h>
#include <spdlog/stopwatch.h>

#include <nutcore/ephemeris_config.hpp>
#include <nutcore/logging.hpp>
#include <nutcore/model/nutation.hpp>
#include <nutcore/model/time_conversions.hpp>
#include <nutcore/nutation.hpp>
#include <nutcore/reduction_method.hpp>

using namespace nutcore;

int main(int argc, char *argv[])
{
    namespace po = boost::program_options;

    std::size_t n_evals{};

    po::options_description desc("Options");

    desc.add_options()("help", "produce help message")(
        "n_evals", po::value<std::size_t>(&n_evals)->default_value(1000u), "number of evaluations");

    po::variables_map vm;
    po::store(po::parse_command_line(argc, argv, desc), vm);
    po::notify(vm);

    if (vm.count("help") != 0u) {
        std::cout << desc << "\n";
        return 0;
    }

    // Fetch the logger.
    create_logger();
    set_logger_level_trace();
    auto logger = spdlog::get("nutcore");

    // Raw series.
    double acc = 0;
    spdlog::stopwatch sw;
    for (std::size_t i = 0; i < n_evals; ++i) {
        acc += model::nutation_iau1980(static_cast<double>(i) * 1e-4).longitude;
    }
    logger->trace("{} evaluations of the IAU 1980 series took: {}", n_evals, sw);

    sw.reset();
    for (std::size_t i = 0; i < n_evals; ++i) {
        acc += model::nutation_iau2000a(static_cast<double>(i) * 1e-4).longitude;
    }
    logger->trace("{} evaluations of the IAU 2000A series took: {}", n_evals, sw);

    // Cold and warm evaluations via the evaluator.
    set_logger_level_info();

    for (const auto method : {reduction_method::IAU_1976, reduction_method::IAU_2006}) {
        ephemeris_config cfg;
        cfg.method = method;

        nutation_evaluator ev;
        const auto T = model::jd_to_centuries(2455013.5);

        sw.reset();
        acc += ev.calc_nutation(T, cfg).obliquity;
        const auto cold = sw.elapsed();

        sw.reset();
        for (std::size_t i = 0; i < n_evals; ++i) {
            acc += ev.calc_nutation(T, cfg).obliquity;
        }
        const auto warm = sw.elapsed();

        logger->info("Method {}: cold evaluation took {}s, {} cached evaluations took {}s", method, cold.count(),
                     n_evals, warm.count());
    }

    // NOTE: print the accumulator so that the computations are not optimised out.
    fmt::print("{}\n", acc);
}
