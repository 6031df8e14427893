// Copyright 2020-2025 Francesco Biscani (bluescarni@gmail.com), Dario Izzo (dario.izzo@gmail.com)
//
// This file is part of the nutcore library.
//
// This Source Code Form is subject to the terms of the Mozilla
// Public License v. 2.0. If a copy of the MPL was not distributed
// with this file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef NUTCORE_DETAIL_NUTATION_IAU1980_HPP
#define NUTCORE_DETAIL_NUTATION_IAU1980_HPP

#include <cstdint>

#include <nutcore/config.hpp>

NUTCORE_BEGIN_NAMESPACE

namespace model::detail
{

extern const std::int8_t iau1980_args_idxs[105][5];
extern const std::int16_t iau1980_cfs[105][4];

} // namespace model::detail

NUTCORE_END_NAMESPACE

#endif
