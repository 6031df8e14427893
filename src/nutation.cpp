// Copyright 2020-2025 Francesco Biscani (bluescarni@gmail.com), Dario Izzo (dario.izzo@gmail.com)
//
// This file is part of the nutcore library.
//
// This Source Code Form is subject to the terms of the Mozilla
// Public License v. 2.0. If a copy of the MPL was not distributed
// with this file, You can obtain one at http://mozilla.org/MPL/2.0/.

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <vector>

#include <fmt/core.h>

#include <nutcore/config.hpp>
#include <nutcore/detail/analytical_theories_helpers.hpp>
#include <nutcore/detail/logging_impl.hpp>
#include <nutcore/ephemeris_config.hpp>
#include <nutcore/eop_provider.hpp>
#include <nutcore/exceptions.hpp>
#include <nutcore/model/nutation.hpp>
#include <nutcore/model/nutation_matrix.hpp>
#include <nutcore/model/obliquity.hpp>
#include <nutcore/model/time_conversions.hpp>
#include <nutcore/nutation.hpp>
#include <nutcore/reduction_method.hpp>

NUTCORE_BEGIN_NAMESPACE

namespace detail
{

namespace
{

void check_finite_time(double T)
{
    if (!std::isfinite(T)) [[unlikely]] {
        throw std::invalid_argument(
            fmt::format("Cannot compute the nutation at the non-finite time {}", T));
    }
}

// Add the celestial pole offsets to the nutation angles.
void add_eop_offsets(nutation_result &res, double T, const ephemeris_config &cfg)
{
    if (!cfg.eop) [[unlikely]] {
        throw eop_data_unavailable_error("The correction for the Earth orientation parameters was requested, but no "
                                         "EOP provider was set in the configuration");
    }

    // Approximate UT Julian date.
    // NOTE: UT1 and UTC are treated as interchangeable.
    const auto jd_tt = model::centuries_to_jd(T);
    const auto jd_ut = jd_tt - model::tt_minus_ut1(jd_tt) / model::seconds_per_day;

    const auto vals = cfg.eop->obtain(jd_ut, cfg.method);

    res.longitude += vals.dpsi * arcsec2rad;
    res.obliquity += vals.deps * arcsec2rad;
}

} // namespace

} // namespace detail

nutation_evaluator::nutation_evaluator(bool use_cache) : m_use_cache(use_cache) {}

bool nutation_evaluator::cache_hit(double T, const ephemeris_config &cfg) const
{
    // NOTE: exact comparison on the time.
    return m_use_cache && m_cache.T == T
           && m_cache.method == static_cast<std::underlying_type_t<reduction_method>>(cfg.method)
           && m_cache.eop == cfg.correct_for_eop && (!cfg.correct_for_eop || m_cache.eop_prov == cfg.eop);
}

nutation_result nutation_evaluator::calc_nutation(double T, const ephemeris_config &cfg)
{
    detail::check_finite_time(T);

    if (cache_hit(T, cfg)) {
        SPDLOG_LOGGER_TRACE(detail::get_logger(), "Nutation cache hit at T={}, method {}", T, cfg.method);

        ++m_n_hits;
        return m_cache.res;
    }

    SPDLOG_LOGGER_DEBUG(detail::get_logger(), "Computing the nutation at T={}, method {}, EOP correction: {}", T,
                        cfg.method, cfg.correct_for_eop);

    auto res = model::nutation_series(T, cfg.method);
    if (cfg.correct_for_eop) {
        detail::add_eop_offsets(res, T, cfg);
    }

    ++m_n_misses;
    m_last = res;

    if (m_use_cache) {
        m_cache = {.res = res,
                   .T = T,
                   .method = static_cast<std::underlying_type_t<reduction_method>>(cfg.method),
                   .eop = cfg.correct_for_eop,
                   .eop_prov = cfg.correct_for_eop ? cfg.eop : nullptr};
    }

    return res;
}

void nutation_evaluator::clear_previous_calculation() noexcept
{
    m_cache.T = -1e100;
    m_cache.method = -1;
    m_cache.eop_prov.reset();
}

double nutation_evaluator::true_obliquity(double T, const ephemeris_config &cfg)
{
    return model::true_obliquity(T, cfg, *this);
}

namespace detail
{

namespace
{

// Build the nutation matrix at the input TT Julian date.
model::rot_matrix eval_nutation_matrix(nutation_evaluator &ev, double jd_tt, const ephemeris_config &cfg)
{
    const auto T = model::jd_to_centuries(jd_tt);

    const auto eps_mean = model::mean_obliquity(T, cfg);
    const auto nut = ev.calc_nutation(T, cfg);

    return model::nutation_matrix(eps_mean, eps_mean + nut.obliquity, nut.longitude);
}

} // namespace

} // namespace detail

std::array<double, 3> nutation_evaluator::nutate_in_equatorial_coordinates(double jd_tt, const ephemeris_config &cfg,
                                                                           const std::array<double, 3> &v,
                                                                           bool mean_to_true)
{
    return model::rotate(detail::eval_nutation_matrix(*this, jd_tt, cfg), v, !mean_to_true);
}

std::array<double, 6> nutation_evaluator::nutate_in_equatorial_coordinates(double jd_tt, const ephemeris_config &cfg,
                                                                           const std::array<double, 6> &v,
                                                                           bool mean_to_true)
{
    return model::rotate(detail::eval_nutation_matrix(*this, jd_tt, cfg), v, !mean_to_true);
}

std::vector<double> nutation_evaluator::nutate_in_equatorial_coordinates(double jd_tt, const ephemeris_config &cfg,
                                                                         const std::vector<double> &v,
                                                                         bool mean_to_true)
{
    if (v.size() == 3u) {
        std::array<double, 3> tmp{};
        std::ranges::copy(v, tmp.begin());
        const auto ret = nutate_in_equatorial_coordinates(jd_tt, cfg, tmp, mean_to_true);

        return {ret.begin(), ret.end()};
    }

    if (v.size() == 6u) {
        std::array<double, 6> tmp{};
        std::ranges::copy(v, tmp.begin());
        const auto ret = nutate_in_equatorial_coordinates(jd_tt, cfg, tmp, mean_to_true);

        return {ret.begin(), ret.end()};
    }

    throw std::invalid_argument(fmt::format("Invalid vector passed to nutate_in_equatorial_coordinates(): the size "
                                            "of the vector must be either 3 or 6, but it is {} instead",
                                            v.size()));
}

bool nutation_evaluator::get_use_cache() const noexcept
{
    return m_use_cache;
}

const std::optional<nutation_result> &nutation_evaluator::get_last_result() const noexcept
{
    return m_last;
}

std::uint64_t nutation_evaluator::get_n_hits() const noexcept
{
    return m_n_hits;
}

std::uint64_t nutation_evaluator::get_n_misses() const noexcept
{
    return m_n_misses;
}

nutation_evaluator &default_nutation_evaluator()
{
    thread_local nutation_evaluator ev;

    return ev;
}

nutation_result calc_nutation(double T, const ephemeris_config &cfg)
{
    return default_nutation_evaluator().calc_nutation(T, cfg);
}

void clear_previous_calculation() noexcept
{
    default_nutation_evaluator().clear_previous_calculation();
}

double true_obliquity(double T, const ephemeris_config &cfg)
{
    return default_nutation_evaluator().true_obliquity(T, cfg);
}

std::array<double, 3> nutate_in_equatorial_coordinates(double jd_tt, const ephemeris_config &cfg,
                                                       const std::array<double, 3> &v, bool mean_to_true)
{
    return default_nutation_evaluator().nutate_in_equatorial_coordinates(jd_tt, cfg, v, mean_to_true);
}

std::array<double, 6> nutate_in_equatorial_coordinates(double jd_tt, const ephemeris_config &cfg,
                                                       const std::array<double, 6> &v, bool mean_to_true)
{
    return default_nutation_evaluator().nutate_in_equatorial_coordinates(jd_tt, cfg, v, mean_to_true);
}

std::vector<double> nutate_in_equatorial_coordinates(double jd_tt, const ephemeris_config &cfg,
                                                     const std::vector<double> &v, bool mean_to_true)
{
    return default_nutation_evaluator().nutate_in_equatorial_coordinates(jd_tt, cfg, v, mean_to_true);
}

NUTCORE_END_NAMESPACE
