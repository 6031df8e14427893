// Copyright 2020-2025 Francesco Biscani (bluescarni@gmail.com), Dario Izzo (dario.izzo@gmail.com)
//
// This file is part of the nutcore library.
//
// This Source Code Form is subject to the terms of the Mozilla
// Public License v. 2.0. If a copy of the MPL was not distributed
// with this file, You can obtain one at http://mozilla.org/MPL/2.0/.

#include <cstdint>

#include <nutcore/config.hpp>
#include <nutcore/detail/nutation/iau1980.hpp>

// NOTE: IAU 1980 nutation series (Seidelmann 1982), without the dominant 18.6-year term
// in Omega, which is handled separately in the evaluator because its amplitudes do not fit
// the compact encoding used below.
//
// Multipliers are ordered as (l, l', F, D, Omega). Amplitudes are (A, B, C, D) with
// dpsi += (A + B*T/10)*sin(arg), deps += (C + D*T/10)*cos(arg), in units of 1e-4 arcsec.

NUTCORE_BEGIN_NAMESPACE

namespace model::detail
{

const std::int8_t iau1980_args_idxs[105][5] = {
    {0, 0, 0, 0, 2},
    {-2, 0, 2, 0, 1},
    {2, 0, -2, 0, 0},
    {-2, 0, 2, 0, 2},
    {1, -1, 0, -1, 0},
    {0, -2, 2, -2, 1},
    {2, 0, -2, 0, 1},
    {0, 0, 2, -2, 2},
    {0, 1, 0, 0, 0},
    {0, 1, 2, -2, 2},
    {0, -1, 2, -2, 2},
    {0, 0, 2, -2, 1},
    {2, 0, 0, -2, 0},
    {0, 0, 2, -2, 0},
    {0, 2, 0, 0, 0},
    {0, 1, 0, 0, 1},
    {0, 2, 2, -2, 2},
    {0, -1, 0, 0, 1},
    {-2, 0, 0, 2, 1},
    {0, -1, 2, -2, 1},
    {2, 0, 0, -2, 1},
    {0, 1, 2, -2, 1},
    {1, 0, 0, -1, 0},
    {2, 1, 0, -2, 0},
    {0, 0, -2, 2, 1},
    {0, 1, -2, 2, 0},
    {0, 1, 0, 0, 2},
    {-1, 0, 0, 1, 1},
    {0, 1, 2, -2, 0},
    {0, 0, 2, 0, 2},
    {1, 0, 0, 0, 0},
    {0, 0, 2, 0, 1},
    {1, 0, 2, 0, 2},
    {1, 0, 0, -2, 0},
    {-1, 0, 2, 0, 2},
    {0, 0, 0, 2, 0},
    {1, 0, 0, 0, 1},
    {-1, 0, 0, 0, 1},
    {-1, 0, 2, 2, 2},
    {1, 0, 2, 0, 1},
    {0, 0, 2, 2, 2},
    {2, 0, 0, 0, 0},
    {1, 0, 2, -2, 2},
    {2, 0, 2, 0, 2},
    {0, 0, 2, 0, 0},
    {-1, 0, 2, 0, 1},
    {-1, 0, 0, 2, 1},
    {1, 0, 0, -2, 1},
    {-1, 0, 2, 2, 1},
    {1, 1, 0, -2, 0},
    {0, 1, 2, 0, 2},
    {0, -1, 2, 0, 2},
    {1, 0, 2, 2, 2},
    {1, 0, 0, 2, 0},
    {2, 0, 2, -2, 2},
    {0, 0, 0, 2, 1},
    {0, 0, 2, 2, 1},
    {1, 0, 2, -2, 1},
    {0, 0, 0, -2, 1},
    {1, -1, 0, 0, 0},
    {2, 0, 2, 0, 1},
    {0, 1, 0, -2, 0},
    {1, 0, -2, 0, 0},
    {0, 0, 0, 1, 0},
    {1, 1, 0, 0, 0},
    {1, 0, 2, 0, 0},
    {1, -1, 2, 0, 2},
    {-1, -1, 2, 2, 2},
    {-2, 0, 0, 0, 1},
    {3, 0, 2, 0, 2},
    {0, -1, 2, 2, 2},
    {1, 1, 2, 0, 2},
    {-1, 0, 2, -2, 1},
    {2, 0, 0, 0, 1},
    {1, 0, 0, 0, 2},
    {3, 0, 0, 0, 0},
    {0, 0, 2, 1, 2},
    {-1, 0, 0, 0, 2},
    {1, 0, 0, -4, 0},
    {-2, 0, 2, 2, 2},
    {-1, 0, 2, 4, 2},
    {2, 0, 0, -4, 0},
    {1, 1, 2, -2, 2},
    {1, 0, 2, 2, 1},
    {-2, 0, 2, 4, 2},
    {-1, 0, 4, 0, 2},
    {1, -1, 0, -2, 0},
    {2, 0, 2, -2, 1},
    {2, 0, 2, 2, 2},
    {1, 0, 0, 2, 1},
    {0, 0, 4, -2, 2},
    {3, 0, 2, -2, 2},
    {1, 0, 2, -2, 0},
    {0, 1, 2, 0, 1},
    {-1, -1, 0, 2, 1},
    {0, 0, -2, 0, 1},
    {0, 0, 2, -1, 2},
    {0, 1, 0, 2, 0},
    {1, 0, -2, -2, 0},
    {0, -1, 2, 0, 1},
    {1, 1, 0, -2, 1},
    {1, 0, -2, 2, 0},
    {2, 0, 0, 2, 0},
    {0, 0, 2, 4, 2},
    {0, 1, 0, 1, 0},
};

const std::int16_t iau1980_cfs[105][4] = {
    {2062, 2, -895, 5},
    {46, 0, -24, 0},
    {11, 0, 0, 0},
    {-3, 0, 1, 0},
    {-3, 0, 0, 0},
    {-2, 0, 1, 0},
    {1, 0, 0, 0},
    {-13187, -16, 5736, -31},
    {1426, -34, 54, -1},
    {-517, 12, 224, -6},
    {217, -5, -95, 3},
    {129, 1, -70, 0},
    {48, 0, 1, 0},
    {-22, 0, 0, 0},
    {17, -1, 0, 0},
    {-15, 0, 9, 0},
    {-16, 1, 7, 0},
    {-12, 0, 6, 0},
    {-6, 0, 3, 0},
    {-5, 0, 3, 0},
    {4, 0, -2, 0},
    {4, 0, -2, 0},
    {-4, 0, 0, 0},
    {1, 0, 0, 0},
    {1, 0, 0, 0},
    {-1, 0, 0, 0},
    {1, 0, 0, 0},
    {1, 0, 0, 0},
    {-1, 0, 0, 0},
    {-2274, -2, 977, -5},
    {712, 1, -7, 0},
    {-386, -4, 200, 0},
    {-301, 0, 129, -1},
    {-158, 0, -1, 0},
    {123, 0, -53, 0},
    {63, 0, -2, 0},
    {63, 1, -33, 0},
    {-58, -1, 32, 0},
    {-59, 0, 26, 0},
    {-51, 0, 27, 0},
    {-38, 0, 16, 0},
    {29, 0, -1, 0},
    {29, 0, -12, 0},
    {-31, 0, 13, 0},
    {26, 0, -1, 0},
    {21, 0, -10, 0},
    {16, 0, -8, 0},
    {-13, 0, 7, 0},
    {-10, 0, 5, 0},
    {-7, 0, 0, 0},
    {7, 0, -3, 0},
    {-7, 0, 3, 0},
    {-8, 0, 3, 0},
    {6, 0, 0, 0},
    {6, 0, -3, 0},
    {-6, 0, 3, 0},
    {-7, 0, 3, 0},
    {6, 0, -3, 0},
    {-5, 0, 3, 0},
    {5, 0, 0, 0},
    {-5, 0, 3, 0},
    {-4, 0, 0, 0},
    {4, 0, 0, 0},
    {-4, 0, 0, 0},
    {-3, 0, 0, 0},
    {3, 0, 0, 0},
    {-3, 0, 1, 0},
    {-3, 0, 1, 0},
    {-2, 0, 1, 0},
    {-3, 0, 1, 0},
    {-3, 0, 1, 0},
    {2, 0, -1, 0},
    {-2, 0, 1, 0},
    {2, 0, -1, 0},
    {-2, 0, 1, 0},
    {2, 0, 0, 0},
    {2, 0, -1, 0},
    {1, 0, -1, 0},
    {-1, 0, 0, 0},
    {1, 0, -1, 0},
    {-2, 0, 1, 0},
    {-1, 0, 0, 0},
    {1, 0, -1, 0},
    {-1, 0, 1, 0},
    {-1, 0, 1, 0},
    {1, 0, 0, 0},
    {1, 0, 0, 0},
    {1, 0, -1, 0},
    {-1, 0, 0, 0},
    {-1, 0, 0, 0},
    {1, 0, 0, 0},
    {1, 0, 0, 0},
    {-1, 0, 0, 0},
    {1, 0, 0, 0},
    {1, 0, 0, 0},
    {-1, 0, 0, 0},
    {-1, 0, 0, 0},
    {-1, 0, 0, 0},
    {-1, 0, 0, 0},
    {-1, 0, 0, 0},
    {-1, 0, 0, 0},
    {-1, 0, 0, 0},
    {1, 0, 0, 0},
    {-1, 0, 0, 0},
    {1, 0, 0, 0},
};

} // namespace model::detail

NUTCORE_END_NAMESPACE
