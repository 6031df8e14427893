// Copyright 2020-2025 Francesco Biscani (bluescarni@gmail.com), Dario Izzo (dario.izzo@gmail.com)
//
// This file is part of the nutcore library.
//
// This Source Code Form is subject to the terms of the Mozilla
// Public License v. 2.0. If a copy of the MPL was not distributed
// with this file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef NUTCORE_NUTATION_HPP
#define NUTCORE_NUTATION_HPP

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include <nutcore/config.hpp>
#include <nutcore/detail/visibility.hpp>
#include <nutcore/ephemeris_config.hpp>
#include <nutcore/eop_provider.hpp>
#include <nutcore/model/nutation.hpp>

NUTCORE_BEGIN_NAMESPACE

// Evaluation context for the nutation.
//
// The evaluator remembers the result of the last computation, which is returned
// without recomputation if the next query has exactly the same time, reduction method
// and EOP settings. An evaluator must not be used concurrently from multiple threads,
// but distinct evaluators are fully independent of each other.
class NUTCORE_DLL_PUBLIC nutation_evaluator
{
    // The memoised result.
    struct cache_entry {
        nutation_result res;
        double T = -1e100;
        // NOTE: -1 is never a valid reduction method.
        int method = -1;
        bool eop = false;
        std::shared_ptr<const eop_provider> eop_prov;
    };

    bool m_use_cache = true;
    cache_entry m_cache;
    std::optional<nutation_result> m_last;
    std::uint64_t m_n_hits = 0;
    std::uint64_t m_n_misses = 0;

    [[nodiscard]] bool cache_hit(double, const ephemeris_config &) const;

public:
    explicit nutation_evaluator(bool = true);

    // Nutation in longitude and obliquity (radians) at the input time in Julian
    // centuries (TT) since J2000, including the celestial pole offsets if requested
    // in the configuration.
    nutation_result calc_nutation(double, const ephemeris_config &);
    void clear_previous_calculation() noexcept;

    [[nodiscard]] double true_obliquity(double, const ephemeris_config &);

    // Transform a position or position/velocity vector at the input TT Julian date
    // from the mean to the true equatorial frame (if the boolean flag is true),
    // or vice versa.
    std::array<double, 3> nutate_in_equatorial_coordinates(double, const ephemeris_config &,
                                                           const std::array<double, 3> &, bool);
    std::array<double, 6> nutate_in_equatorial_coordinates(double, const ephemeris_config &,
                                                           const std::array<double, 6> &, bool);
    std::vector<double> nutate_in_equatorial_coordinates(double, const ephemeris_config &,
                                                         const std::vector<double> &, bool);

    [[nodiscard]] bool get_use_cache() const noexcept;
    [[nodiscard]] const std::optional<nutation_result> &get_last_result() const noexcept;
    [[nodiscard]] std::uint64_t get_n_hits() const noexcept;
    [[nodiscard]] std::uint64_t get_n_misses() const noexcept;
};

// The evaluator used by the free functions below. There is one per thread.
[[nodiscard]] NUTCORE_DLL_PUBLIC nutation_evaluator &default_nutation_evaluator();

NUTCORE_DLL_PUBLIC nutation_result calc_nutation(double, const ephemeris_config &);
NUTCORE_DLL_PUBLIC void clear_previous_calculation() noexcept;
[[nodiscard]] NUTCORE_DLL_PUBLIC double true_obliquity(double, const ephemeris_config &);
NUTCORE_DLL_PUBLIC std::array<double, 3> nutate_in_equatorial_coordinates(double, const ephemeris_config &,
                                                                          const std::array<double, 3> &, bool);
NUTCORE_DLL_PUBLIC std::array<double, 6> nutate_in_equatorial_coordinates(double, const ephemeris_config &,
                                                                          const std::array<double, 6> &, bool);
NUTCORE_DLL_PUBLIC std::vector<double> nutate_in_equatorial_coordinates(double, const ephemeris_config &,
                                                                        const std::vector<double> &, bool);

NUTCORE_END_NAMESPACE

#endif
