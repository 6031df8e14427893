// Copyright 2020-2025 Francesco Biscani (bluescarni@gmail.com), Dario Izzo (dario.izzo@gmail.com)
//
// This file is part of the nutcore library.
//
// This Source Code Form is subject to the terms of the Mozilla
// Public License v. 2.0. If a copy of the MPL was not distributed
// with this file, You can obtain one at http://mozilla.org/MPL/2.0/.

#include <cassert>
#include <charconv>
#include <optional>
#include <ranges>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

// NOTE: clang implements std::from_chars() for floating-point types
// only in very recent versions.
#if defined(__clang__)

#include <boost/charconv.hpp>

#endif

#include <fmt/core.h>

#include <nutcore/config.hpp>
#include <nutcore/eop_data.hpp>

NUTCORE_BEGIN_NAMESPACE

namespace detail
{

namespace
{

// The expected line length in a IERS rapid EOP data file.
constexpr auto eop_data_iers_rapid_expected_line_length = 185u;

// NOTE: small wrapper to workaround the lack of std::from_chars for floating-point
// values on clang.
auto from_chars(const char *first, const char *last, double &value)
{
#if defined(__clang__)

    return boost::charconv::from_chars(first, last, value);

#else

    return std::from_chars(first, last, value);

#endif
}

// Helper to parse the MJD from a line in a IERS rapid EOP data file.
double parse_eop_data_iers_rapid_mjd(const std::ranges::contiguous_range auto &cur_line)
{
    assert(std::ranges::size(cur_line) >= eop_data_iers_rapid_expected_line_length);

    // Fetch the range of mjd data.
    const auto *mjd_begin = std::ranges::data(cur_line) + 7;
    const auto *const mjd_end = mjd_begin + 8;

    // Ignore leading whitespaces.
    for (; mjd_begin != mjd_end && *mjd_begin == ' '; ++mjd_begin) {
    }

    // Try to parse.
    double mjd{};
    const auto mjd_parse_res = detail::from_chars(mjd_begin, mjd_end, mjd);
    if (mjd_parse_res.ec != std::errc{} || mjd_parse_res.ptr != mjd_end) [[unlikely]] {
        throw std::invalid_argument(
            fmt::format("Error parsing a IERS rapid EOP data file: the string '{}' could not be parsed as a valid MJD",
                        std::string_view(mjd_begin, mjd_end)));
    }

    return mjd;
}

// Helper to parse the [begin, begin + size) column range of a line, ignoring leading
// whitespaces. An empty optional is returned if the field is blank.
std::optional<double> parse_eop_data_iers_rapid_column(const char *begin, int size, const char *bulletin,
                                                       const char *name)
{
    const auto *const end = begin + size;

    // Ignore leading whitespaces.
    for (; begin != end && *begin == ' '; ++begin) {
    }

    if (begin == end) {
        return {};
    }

    double retval{};
    const auto parse_res = detail::from_chars(begin, end, retval);
    if (parse_res.ec != std::errc{} || parse_res.ptr != end) [[unlikely]] {
        throw std::invalid_argument(fmt::format("Error parsing a IERS rapid EOP data file: the bulletin {} string for "
                                                "the {} field '{}' could not be parsed as a floating-point value",
                                                bulletin, name, std::string_view(begin, end)));
    }

    return retval;
}

// Helper to parse a field from a line in a IERS rapid EOP data file.
//
// In the rapid datasets, there may be both bulletin A and bulletin B data available. We first try to parse
// the B data as it is supposed to be more accurate, and we fall back to A data if B data is not available.
// If neither A nor B data is available, we will return an empty optional.
//
// The beginA/B and sizeA/B indicate the [begin, begin + size) column range for the bulletin A/B data.
std::optional<double> parse_eop_data_iers_rapid_field(const std::ranges::contiguous_range auto &cur_line,
                                                      // NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
                                                      int beginB, int sizeB, int beginA, int sizeA, const char *name)
{
    assert(std::ranges::size(cur_line) >= eop_data_iers_rapid_expected_line_length);

    const auto *const data = std::ranges::data(cur_line);

    // NOTE: the bulletin B data is the post-processed most accurate data, usually lagging
    // behind the present time.
    if (const auto bullB = parse_eop_data_iers_rapid_column(data + beginB, sizeB, "B", name)) {
        return bullB;
    }

    return parse_eop_data_iers_rapid_column(data + beginA, sizeA, "A", name);
}

} // namespace

// NOTE: the expected format for the data in str is described here:
//
// https://maia.usno.navy.mil/ser7/readme.finals2000A
// https://maia.usno.navy.mil/ser7/readme.finals
//
// The two formats differ only in the meaning of the celestial pole offsets
// columns (dX/dY versus dpsi/deps).
eop_data_table parse_eop_data_iers_rapid(const std::string &str)
{
    // Parse line by line, splitting on newlines.
    eop_data_table retval;
    for (const auto cur_line : str | std::views::split('\n')) {
        // NOTE: IERS rapid EOP data files may have a newline at the end. When we encounter it, just break out.
        if (std::ranges::empty(cur_line)) {
            break;
        }

        // Check the line length.
        if (std::ranges::size(cur_line) < eop_data_iers_rapid_expected_line_length) [[unlikely]] {
            throw std::invalid_argument(fmt::format(
                "Invalid line detected in a IERS rapid EOP data file: the expected number of "
                "characters in the line is at least {}, but a line with {} character(s) was detected instead",
                eop_data_iers_rapid_expected_line_length, std::ranges::size(cur_line)));
        }

        // Parse the mjd.
        const auto mjd = parse_eop_data_iers_rapid_mjd(cur_line);

        // Parse the UT1-UTC difference.
        const auto delta_ut1_utc = parse_eop_data_iers_rapid_field(cur_line, 154, 11, 58, 10, "UT1-UTC difference");
        if (!delta_ut1_utc) {
            // No data available on this line, break out.
            break;
        }

        // Parse the celestial pole offsets.
        const auto dpsi_or_dx = parse_eop_data_iers_rapid_field(cur_line, 165, 10, 97, 9, "dpsi/dX");
        if (!dpsi_or_dx) {
            // No data available on this line, break out.
            break;
        }
        const auto deps_or_dy = parse_eop_data_iers_rapid_field(cur_line, 175, 10, 116, 9, "deps/dY");
        if (!deps_or_dy) {
            // No data available on this line, break out.
            break;
        }

        // Add the line to retval.
        retval.push_back(
            {.mjd = mjd, .delta_ut1_utc = *delta_ut1_utc, .dpsi_or_dx = *dpsi_or_dx, .deps_or_dy = *deps_or_dy});
    }

    // Validate the output.
    validate_eop_data_table(retval);

    return retval;
}

} // namespace detail

NUTCORE_END_NAMESPACE
