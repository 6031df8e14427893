// Copyright 2020-2025 Francesco Biscani (bluescarni@gmail.com), Dario Izzo (dario.izzo@gmail.com)
//
// This file is part of the nutcore library.
//
// This Source Code Form is subject to the terms of the Mozilla
// Public License v. 2.0. If a copy of the MPL was not distributed
// with this file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef NUTCORE_DETAIL_NUTATION_IAU2000A_HPP
#define NUTCORE_DETAIL_NUTATION_IAU2000A_HPP

#include <cstdint>

#include <nutcore/config.hpp>

NUTCORE_BEGIN_NAMESPACE

namespace model::detail
{

extern const std::int8_t iau2000a_ls_args_idxs[678][5];
extern const double iau2000a_ls_cfs[678][6];

extern const std::int8_t iau2000a_pl_args_idxs[687][14];
extern const double iau2000a_pl_cfs[687][4];

} // namespace model::detail

NUTCORE_END_NAMESPACE

#endif
