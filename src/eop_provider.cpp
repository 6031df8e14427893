// Copyright 2020-2025 Francesco Biscani (bluescarni@gmail.com), Dario Izzo (dario.izzo@gmail.com)
//
// This file is part of the nutcore library.
//
// This Source Code Form is subject to the terms of the Mozilla
// Public License v. 2.0. If a copy of the MPL was not distributed
// with this file, You can obtain one at http://mozilla.org/MPL/2.0/.

#include <array>
#include <cmath>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <tuple>
#include <utility>
#include <variant>

#include <fmt/core.h>

#include <nutcore/config.hpp>
#include <nutcore/detail/analytical_theories_helpers.hpp>
#include <nutcore/detail/logging_impl.hpp>
#include <nutcore/eop_data.hpp>
#include <nutcore/eop_provider.hpp>
#include <nutcore/exceptions.hpp>
#include <nutcore/model/time_conversions.hpp>
#include <nutcore/reduction_method.hpp>

NUTCORE_BEGIN_NAMESPACE

namespace detail
{

namespace
{

// Luni-solar and planetary precession angles (arcseconds) as polynomials
// in Julian centuries since J2000.
constexpr std::array psi_A_cfs = {0., 5038.47875, -1.07259, -0.001147};
constexpr std::array chi_A_cfs = {0., 10.5526, -2.38064, -0.001125};

// Sine and cosine of the mean obliquity at J2000 (84381.406 arcseconds).
constexpr double sin_eps0 = 0.3977771559319137;
constexpr double cos_eps0 = 0.9174820620691818;

// Check that the convention of a table supplied in memory is
// the one expected by the provider.
void check_source_convention(const iers_eop_provider::source &src, eop_nutation_convention conv, const char *name)
{
    if (const auto *data = std::get_if<eop_data>(&src)) {
        if (data->get_convention() != conv) [[unlikely]] {
            throw std::invalid_argument(
                fmt::format("Invalid {} table passed to the constructor of an IERS EOP provider: the expected "
                            "nutation convention is '{}', but the table uses the '{}' convention instead",
                            name, conv, data->get_convention()));
        }
    }
}

} // namespace

// Conversion of the celestial pole offsets dX/dY into offsets in longitude
// and obliquity dpsi/deps at the input time (in Julian centuries since J2000).
// The output has the same units as the input.
//
// NOTE: this is the algorithm by Ch. Bizouard (2006), see the DPSIDEPS2000_DXDY2000
// subroutine in ftp://hpiers.obspm.fr/iers/models/uai2000.package.
std::pair<double, double> dxdy_to_dpsideps(double dX, double dY, double T)
{
    const auto psi_A = horner_eval(psi_A_cfs, T) * arcsec2rad;
    const auto chi_A = horner_eval(chi_A_cfs, T) * arcsec2rad;

    const auto a = psi_A * cos_eps0 - chi_A;
    const auto den = -a * a * sin_eps0 - sin_eps0;

    const auto dpsi = (-dX + a * dY) / den;
    const auto deps = (-a * sin_eps0 * dX - sin_eps0 * dY) / den;

    return {dpsi, deps};
}

} // namespace detail

eop_provider::eop_provider() = default;

eop_provider::~eop_provider() = default;

constant_eop_provider::constant_eop_provider() = default;

constant_eop_provider::constant_eop_provider(double dpsi, double deps, double delta_ut1_utc)
    : m_dpsi(dpsi), m_deps(deps), m_delta_ut1_utc(delta_ut1_utc)
{
    if (!std::isfinite(m_dpsi) || !std::isfinite(m_deps) || !std::isfinite(m_delta_ut1_utc)) [[unlikely]] {
        throw std::invalid_argument(fmt::format("The values passed to the constructor of a constant EOP provider "
                                                "must all be finite, but they are [{}, {}, {}] instead",
                                                m_dpsi, m_deps, m_delta_ut1_utc));
    }
}

constant_eop_provider::~constant_eop_provider() = default;

eop_values constant_eop_provider::obtain(double jd, reduction_method method) const
{
    return {.dpsi = m_dpsi, .deps = m_deps, .delta_ut1_utc = m_delta_ut1_utc, .jd = jd, .method = method};
}

iers_eop_provider::iers_eop_provider(source iau1980_src, source iau2000_src)
    : m_iau1980_src(std::move(iau1980_src)), m_iau2000_src(std::move(iau2000_src))
{
    detail::check_source_convention(m_iau1980_src, eop_nutation_convention::dpsi_deps, "IAU 1980");
    detail::check_source_convention(m_iau2000_src, eop_nutation_convention::dx_dy, "IAU 2000");
}

iers_eop_provider::~iers_eop_provider() = default;

// Fetch the IAU 1980 (if iau1980 is true) or IAU 2000 table, loading it
// from file if necessary.
const eop_data &iers_eop_provider::get_table(bool iau1980) const
{
    std::lock_guard lock(m_mutex);

    auto &table = iau1980 ? m_iau1980 : m_iau2000;
    if (table) {
        return *table;
    }

    const auto &src = iau1980 ? m_iau1980_src : m_iau2000_src;
    const auto conv = iau1980 ? eop_nutation_convention::dpsi_deps : eop_nutation_convention::dx_dy;

    if (const auto *data = std::get_if<eop_data>(&src)) {
        table.emplace(*data);
    } else if (const auto *path = std::get_if<std::string>(&src)) {
        detail::get_logger()->info("Loading the {} EOP data from the file '{}'", iau1980 ? "IAU 1980" : "IAU 2000",
                                   *path);
        table.emplace(eop_data::from_file(*path, conv));
    } else {
        throw eop_data_unavailable_error(
            fmt::format("No {} EOP data table was configured in the IERS EOP provider",
                        iau1980 ? "IAU 1980 (finals.all)" : "IAU 2000 (finals2000A.all)"));
    }

    return *table;
}

eop_values iers_eop_provider::obtain(double jd, reduction_method method) const
{
    if (!std::isfinite(jd)) [[unlikely]] {
        throw std::invalid_argument(
            fmt::format("Cannot fetch the EOP values at the non-finite Julian date {}", jd));
    }

    const auto iau1980 = uses_iau1980_nutation(method);
    const auto &table = get_table(iau1980);

    // NOTE: the tables are indexed by UTC MJD. We are treating
    // UT1 and UTC as interchangeable here.
    const auto vals = table.interpolate(jd - model::jd_mjd_offset);

    SPDLOG_LOGGER_TRACE(detail::get_logger(), "EOP values interpolated at JD {} from the table '{}'", jd,
                        table.get_identifier());

    // NOTE: the tables store the offsets in milliarcseconds.
    auto dpsi = vals.dpsi_or_dx / 1000.;
    auto deps = vals.deps_or_dy / 1000.;

    if (!iau1980) {
        std::tie(dpsi, deps) = detail::dxdy_to_dpsideps(dpsi, deps, model::jd_to_centuries(jd));
    }

    return {.dpsi = dpsi, .deps = deps, .delta_ut1_utc = vals.delta_ut1_utc, .jd = jd, .method = method};
}

NUTCORE_END_NAMESPACE
