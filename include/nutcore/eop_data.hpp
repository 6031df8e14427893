// Copyright 2020-2025 Francesco Biscani (bluescarni@gmail.com), Dario Izzo (dario.izzo@gmail.com)
//
// This file is part of the nutcore library.
//
// This Source Code Form is subject to the terms of the Mozilla
// Public License v. 2.0. If a copy of the MPL was not distributed
// with this file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef NUTCORE_EOP_DATA_HPP
#define NUTCORE_EOP_DATA_HPP

#include <compare>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <nutcore/config.hpp>
#include <nutcore/detail/visibility.hpp>
#include <nutcore/s11n.hpp>

NUTCORE_BEGIN_NAMESPACE

// Single row in a EOP data table.
struct NUTCORE_DLL_PUBLIC eop_data_row {
    // UTC modified Julian date.
    double mjd = 0;
    // UT1-UTC (seconds).
    double delta_ut1_utc = 0;
    // Celestial pole offsets (milliarcseconds). Depending on the
    // convention of the data source, these are either the offsets
    // dpsi/deps with respect to the IAU 1980 nutation theory, or the
    // offsets dX/dY with respect to the IAU 2000A precession-nutation model.
    double dpsi_or_dx = 0;
    double deps_or_dy = 0;

    // NOTE: used in testing.
    auto operator<=>(const eop_data_row &) const = default;

private:
    // Serialization.
    friend class boost::serialization::access;
    void save(boost::archive::binary_oarchive &, unsigned) const;
    void load(boost::archive::binary_iarchive &, unsigned);
    BOOST_SERIALIZATION_SPLIT_MEMBER()
};

// The EOP data table.
using eop_data_table = std::vector<eop_data_row>;

// The convention for the celestial pole offsets in a EOP data table.
enum class eop_nutation_convention : int {
    // dpsi/deps, IERS finals.all files.
    dpsi_deps,
    // dX/dY, IERS finals2000A.all files.
    dx_dy
};

NUTCORE_DLL_PUBLIC std::ostream &operator<<(std::ostream &, eop_nutation_convention);

// Celestial pole offsets and UT1-UTC difference at a given date.
struct eop_interpolation {
    // UT1-UTC (seconds).
    double delta_ut1_utc = 0;
    // Celestial pole offsets (milliarcseconds).
    double dpsi_or_dx = 0;
    double deps_or_dy = 0;
};

// The EOP data class.
//
// This data class stores internally an immutable table of EOP data, shared among copies.
// The table is built from the IERS rapid data files (finals.all and finals2000A.all).
class NUTCORE_DLL_PUBLIC eop_data
{
    struct impl;
    std::shared_ptr<const impl> m_impl;

    // Serialization.
    friend class boost::serialization::access;
    void save(boost::archive::binary_oarchive &, unsigned) const;
    void load(boost::archive::binary_iarchive &, unsigned);
    BOOST_SERIALIZATION_SPLIT_MEMBER()

public:
    eop_data();
    explicit eop_data(eop_data_table, eop_nutation_convention, std::string, std::string);

    [[nodiscard]] const eop_data_table &get_table() const noexcept;
    [[nodiscard]] eop_nutation_convention get_convention() const noexcept;
    [[nodiscard]] const std::string &get_timestamp() const noexcept;
    [[nodiscard]] const std::string &get_identifier() const noexcept;

    [[nodiscard]] eop_interpolation interpolate(double) const;

    static eop_data from_string(const std::string &, eop_nutation_convention, std::string = "",
                                std::string = "custom");
    static eop_data from_file(const std::string &, eop_nutation_convention);
};

namespace detail
{

NUTCORE_DLL_PUBLIC void validate_eop_data_table(const eop_data_table &);

[[nodiscard]] NUTCORE_DLL_PUBLIC eop_data_table parse_eop_data_iers_rapid(const std::string &);

} // namespace detail

NUTCORE_END_NAMESPACE

// fmt formatter for eop_nutation_convention, implemented on top of the streaming operator.
namespace fmt
{

template <>
struct formatter<nutcore::eop_nutation_convention> : fmt::ostream_formatter {
};

} // namespace fmt

#endif
