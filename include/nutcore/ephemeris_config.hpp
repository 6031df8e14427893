// Copyright 2020-2025 Francesco Biscani (bluescarni@gmail.com), Dario Izzo (dario.izzo@gmail.com)
//
// This file is part of the nutcore library.
//
// This Source Code Form is subject to the terms of the Mozilla
// Public License v. 2.0. If a copy of the MPL was not distributed
// with this file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef NUTCORE_EPHEMERIS_CONFIG_HPP
#define NUTCORE_EPHEMERIS_CONFIG_HPP

#include <memory>

#include <nutcore/config.hpp>
#include <nutcore/reduction_method.hpp>

NUTCORE_BEGIN_NAMESPACE

class eop_provider;

// Configuration of an ephemeris computation, as far as the reduction
// of coordinates between the mean and true frames is concerned.
struct ephemeris_config {
    // The precession/nutation/obliquity theory.
    reduction_method method = reduction_method::IAU_2006;
    // Add the observed celestial pole offsets (free core nutation)
    // to the nutation angles.
    bool correct_for_eop = false;
    // Use the long-term mean obliquity model from Vondrak et al. (2011)
    // with the IAU 2006/2009 methods.
    bool use_vondrak_2011_obliquity = false;
    // The source of the EOP data. Required only if correct_for_eop is true.
    std::shared_ptr<const eop_provider> eop;
};

NUTCORE_END_NAMESPACE

#endif
