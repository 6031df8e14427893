// Copyright 2020-2025 Francesco Biscani (bluescarni@gmail.com), Dario Izzo (dario.izzo@gmail.com)
//
// This file is part of the nutcore library.
//
// This Source Code Form is subject to the terms of the Mozilla
// Public License v. 2.0. If a copy of the MPL was not distributed
// with this file, You can obtain one at http://mozilla.org/MPL/2.0/.

#include <algorithm>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

#include <fmt/chrono.h>
#include <fmt/core.h>

#include <nutcore/config.hpp>
#include <nutcore/detail/logging_impl.hpp>
#include <nutcore/eop_data.hpp>
#include <nutcore/exceptions.hpp>
#include <nutcore/s11n.hpp>

NUTCORE_BEGIN_NAMESPACE

void eop_data_row::save(boost::archive::binary_oarchive &oa, unsigned) const
{
    oa << mjd;
    oa << delta_ut1_utc;
    oa << dpsi_or_dx;
    oa << deps_or_dy;
}

void eop_data_row::load(boost::archive::binary_iarchive &ia, unsigned)
{
    ia >> mjd;
    ia >> delta_ut1_utc;
    ia >> dpsi_or_dx;
    ia >> deps_or_dy;
}

std::ostream &operator<<(std::ostream &os, eop_nutation_convention c)
{
    switch (c) {
        case eop_nutation_convention::dpsi_deps:
            return os << "dpsi_deps";
        case eop_nutation_convention::dx_dy:
            return os << "dx_dy";
    }

    return os << "invalid";
}

namespace detail
{

// Helper to validate a EOP data table.
// NOTE: this must be called by every factory function before passing the table to the eop_data constructor.
void validate_eop_data_table(const eop_data_table &data)
{
    const auto n_entries = data.size();

    for (decltype(data.size()) i = 0; i < n_entries; ++i) {
        // All mjd values must be finite and ordered in strictly ascending order.
        const auto cur_mjd = data[i].mjd;
        if (!std::isfinite(cur_mjd)) [[unlikely]] {
            throw std::invalid_argument(
                fmt::format("Invalid EOP data table detected: the MJD value {} on line {} is not finite", cur_mjd, i));
        }
        // NOTE: if data[i + 1u].mjd is NaN, then cur_mjd >= data[i + 1u].mjd evaluates
        // to false and we will throw on the next iteration when we detect a non-finite
        // value for the mjd.
        if (i + 1u != n_entries && cur_mjd >= data[i + 1u].mjd) [[unlikely]] {
            throw std::invalid_argument(fmt::format("Invalid EOP data table detected: the MJD value {} "
                                                    "on line {} is not less than the MJD value in the next line ({})",
                                                    cur_mjd, i, data[i + 1u].mjd));
        }

        // UT1-UTC values must be finite.
        const auto cur_delta_ut1_utc = data[i].delta_ut1_utc;
        if (!std::isfinite(cur_delta_ut1_utc)) [[unlikely]] {
            throw std::invalid_argument(
                fmt::format("Invalid EOP data table detected: the UT1-UTC value {} on line {} is not finite",
                            cur_delta_ut1_utc, i));
        }

        // The celestial pole offsets must be finite.
        const auto dpsi_or_dx = data[i].dpsi_or_dx;
        if (!std::isfinite(dpsi_or_dx)) [[unlikely]] {
            throw std::invalid_argument(fmt::format(
                "Invalid EOP data table detected: the dpsi/dX value {} on line {} is not finite", dpsi_or_dx, i));
        }
        const auto deps_or_dy = data[i].deps_or_dy;
        if (!std::isfinite(deps_or_dy)) [[unlikely]] {
            throw std::invalid_argument(fmt::format(
                "Invalid EOP data table detected: the deps/dY value {} on line {} is not finite", deps_or_dy, i));
        }
    }
}

} // namespace detail

namespace detail
{

namespace
{

bool is_valid_convention(eop_nutation_convention conv)
{
    switch (conv) {
        case eop_nutation_convention::dpsi_deps:
        case eop_nutation_convention::dx_dy:
            return true;
    }

    return false;
}

} // namespace

} // namespace detail

struct eop_data::impl {
    eop_data_table m_data;
    eop_nutation_convention m_conv = eop_nutation_convention::dx_dy;
    // NOTE: timestamp and identifier are meant to uniquely identify
    // the data. The identifier indicates the data source, while the
    // timestamp is used to identify the version of the data. For data
    // loaded from a file, the timestamp is built from the last modification
    // time of the file.
    std::string m_timestamp;
    std::string m_identifier;

    // Serialization.
    template <typename Archive>
    void serialize(Archive &ar, unsigned)
    {
        ar & m_data;
        ar & m_conv;
        ar & m_timestamp;
        ar & m_identifier;
    }
};

void eop_data::save(boost::archive::binary_oarchive &oa, unsigned) const
{
    oa << m_impl;
}

void eop_data::load(boost::archive::binary_iarchive &ia, unsigned)
{
    ia >> m_impl;
}

// NOTE: the default-constructed object contains an empty table.
eop_data::eop_data() : m_impl(std::make_shared<const impl>(eop_data_table{}, eop_nutation_convention::dx_dy, "", "empty"))
{
}

// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
eop_data::eop_data(eop_data_table data, eop_nutation_convention conv, std::string timestamp, std::string identifier)
{
    if (!detail::is_valid_convention(conv)) [[unlikely]] {
        throw std::invalid_argument(
            fmt::format("Invalid EOP nutation convention {} specified", static_cast<int>(conv)));
    }

    detail::validate_eop_data_table(data);

    m_impl = std::make_shared<const impl>(std::move(data), conv, std::move(timestamp), std::move(identifier));
}

const eop_data_table &eop_data::get_table() const noexcept
{
    return m_impl->m_data;
}

eop_nutation_convention eop_data::get_convention() const noexcept
{
    return m_impl->m_conv;
}

const std::string &eop_data::get_timestamp() const noexcept
{
    return m_impl->m_timestamp;
}

const std::string &eop_data::get_identifier() const noexcept
{
    return m_impl->m_identifier;
}

// Linear interpolation of the EOP data at the input UTC MJD.
eop_interpolation eop_data::interpolate(double mjd) const
{
    const auto &data = get_table();

    if (!std::isfinite(mjd)) [[unlikely]] {
        throw std::invalid_argument(
            fmt::format("Cannot interpolate the EOP data at the non-finite MJD {}", mjd));
    }

    if (data.empty() || mjd < data.front().mjd || mjd > data.back().mjd) [[unlikely]] {
        if (data.empty()) {
            throw eop_data_unavailable_error(
                fmt::format("Cannot interpolate the EOP data '{}' at the MJD {}: the table is empty",
                            get_identifier(), mjd));
        }

        throw eop_data_unavailable_error(fmt::format(
            "Cannot interpolate the EOP data '{}' at the MJD {}: the date is outside the range of the table [{}, {}]",
            get_identifier(), mjd, data.front().mjd, data.back().mjd));
    }

    // Locate the first row whose date is greater than mjd.
    const auto it
        = std::ranges::upper_bound(data, mjd, std::ranges::less{}, [](const eop_data_row &r) { return r.mjd; });

    // NOTE: it == end() only if mjd is exactly the last date
    // in the table.
    if (it == data.end()) {
        const auto &last = data.back();
        return {.delta_ut1_utc = last.delta_ut1_utc, .dpsi_or_dx = last.dpsi_or_dx, .deps_or_dy = last.deps_or_dy};
    }

    // NOTE: the checks above ensure that it != begin().
    const auto &r1 = *it;
    const auto &r0 = *std::prev(it);

    const auto h = (mjd - r0.mjd) / (r1.mjd - r0.mjd);
    const auto lerp = [h](double a, double b) { return a + h * (b - a); };

    return {.delta_ut1_utc = lerp(r0.delta_ut1_utc, r1.delta_ut1_utc),
            .dpsi_or_dx = lerp(r0.dpsi_or_dx, r1.dpsi_or_dx),
            .deps_or_dy = lerp(r0.deps_or_dy, r1.deps_or_dy)};
}

// Construct from the text content of a IERS rapid EOP data file.
// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
eop_data eop_data::from_string(const std::string &text, eop_nutation_convention conv, std::string timestamp,
                               std::string identifier)
{
    return eop_data(detail::parse_eop_data_iers_rapid(text), conv, std::move(timestamp), std::move(identifier));
}

// Load the EOP data from a IERS rapid EOP data file.
eop_data eop_data::from_file(const std::string &path, eop_nutation_convention conv)
{
    auto *logger = detail::get_logger();

    spdlog::stopwatch sw;

    std::ifstream ifs(path, std::ios::in | std::ios::binary);
    if (!ifs) [[unlikely]] {
        throw eop_data_unavailable_error(fmt::format("Unable to open the EOP data file '{}'", path));
    }

    std::ostringstream oss;
    oss << ifs.rdbuf();
    if (ifs.bad()) [[unlikely]] {
        // LCOV_EXCL_START
        throw eop_data_unavailable_error(fmt::format("Error reading the EOP data file '{}'", path));
        // LCOV_EXCL_STOP
    }

    const std::filesystem::path fpath(path);

    // Build the timestamp from the last modification time of the file.
    std::string timestamp;
    std::error_code ec;
    const auto ftime = std::filesystem::last_write_time(fpath, ec);
    if (!ec) {
        timestamp = fmt::format(
            "{:%Y-%m-%d %H:%M:%S}",
            std::chrono::time_point_cast<std::chrono::seconds>(std::chrono::file_clock::to_sys(ftime)));
    }

    // Build the identifier string.
    // NOTE: we transform '.' into '_', as in the identifiers of the IERS data
    // that can be downloaded from the USNO servers.
    auto identifier = fmt::format("iers_rapid_{}", fpath.filename().string());
    std::ranges::replace(identifier, '.', '_');

    auto ret = from_string(oss.str(), conv, std::move(timestamp), std::move(identifier));

    logger->debug("EOP data file '{}' loaded in {}s ({} rows, convention: {})", path, sw, ret.get_table().size(),
                  conv);

    return ret;
}

NUTCORE_END_NAMESPACE
