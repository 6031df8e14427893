// Copyright 2020-2025 Francesco Biscani (bluescarni@gmail.com), Dario Izzo (dario.izzo@gmail.com)
//
// This file is part of the nutcore library.
//
// This Source Code Form is subject to the terms of the Mozilla
// Public License v. 2.0. If a copy of the MPL was not distributed
// with this file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef NUTCORE_EOP_PROVIDER_HPP
#define NUTCORE_EOP_PROVIDER_HPP

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <variant>

#include <nutcore/config.hpp>
#include <nutcore/detail/visibility.hpp>
#include <nutcore/eop_data.hpp>
#include <nutcore/reduction_method.hpp>

NUTCORE_BEGIN_NAMESPACE

// The Earth orientation parameters relevant for the reduction
// of coordinates at a given date.
struct eop_values {
    // Celestial pole offsets with respect to the nutation theory
    // of the reduction method (arcseconds).
    double dpsi = 0;
    double deps = 0;
    // UT1-UTC (seconds).
    double delta_ut1_utc = 0;
    // The UT Julian date and the reduction method
    // these values were computed for.
    double jd = 0;
    reduction_method method = reduction_method::IAU_2006;
};

// Base class for the sources of EOP data.
//
// NOTE: implementations are expected to be safe for concurrent use,
// as a single provider can be shared among several evaluation contexts.
class NUTCORE_DLL_PUBLIC eop_provider
{
public:
    eop_provider();
    eop_provider(const eop_provider &) = delete;
    eop_provider &operator=(const eop_provider &) = delete;
    virtual ~eop_provider();

    // Fetch the EOP values at the input UT Julian date for the input reduction method.
    //
    // NOTE: an eop_data_unavailable_error is thrown if no data is available.
    [[nodiscard]] virtual eop_values obtain(double, reduction_method) const = 0;
};

// EOP provider returning fixed values at all dates.
class NUTCORE_DLL_PUBLIC constant_eop_provider final : public eop_provider
{
    double m_dpsi = 0;
    double m_deps = 0;
    double m_delta_ut1_utc = 0;

public:
    constant_eop_provider();
    explicit constant_eop_provider(double, double, double = 0);
    ~constant_eop_provider() override;

    [[nodiscard]] eop_values obtain(double, reduction_method) const override;
};

// EOP provider backed by the IERS rapid EOP data files.
//
// Two tables are managed: a finals.all table (dpsi/deps offsets with respect to the
// IAU 1980 nutation theory), used with the reduction methods based on the IAU 1980
// nutation series, and a finals2000A.all table (dX/dY offsets with respect to the
// IAU 2000A precession-nutation model) for the other reduction methods.
// Each table can be supplied either in memory or as a path to a file. In the
// latter case, the file is loaded on first use.
class NUTCORE_DLL_PUBLIC iers_eop_provider final : public eop_provider
{
public:
    // The source of a table: none, a path to a file or an already-loaded table.
    using source = std::variant<std::monostate, std::string, eop_data>;

private:
    source m_iau1980_src;
    source m_iau2000_src;

    // NOTE: the tables are loaded lazily, and access to them
    // is protected by a mutex.
    mutable std::mutex m_mutex;
    mutable std::optional<eop_data> m_iau1980;
    mutable std::optional<eop_data> m_iau2000;

    const eop_data &get_table(bool) const;

public:
    explicit iers_eop_provider(source = std::monostate{}, source = std::monostate{});
    ~iers_eop_provider() override;

    [[nodiscard]] eop_values obtain(double, reduction_method) const override;
};

namespace detail
{

[[nodiscard]] NUTCORE_DLL_PUBLIC std::pair<double, double> dxdy_to_dpsideps(double, double, double);

} // namespace detail

NUTCORE_END_NAMESPACE

#endif
