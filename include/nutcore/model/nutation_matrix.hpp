// Copyright 2020-2025 Francesco Biscani (bluescarni@gmail.com), Dario Izzo (dario.izzo@gmail.com)
//
// This file is part of the nutcore library.
//
// This Source Code Form is subject to the terms of the Mozilla
// Public License v. 2.0. If a copy of the MPL was not distributed
// with this file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef NUTCORE_MODEL_NUTATION_MATRIX_HPP
#define NUTCORE_MODEL_NUTATION_MATRIX_HPP

#include <array>

#include <nutcore/config.hpp>
#include <nutcore/detail/visibility.hpp>

NUTCORE_BEGIN_NAMESPACE

namespace model
{

// Rotation matrix, stored in row-major order.
using rot_matrix = std::array<double, 9>;

// Nutation matrix from the mean to the true equatorial frame, given
// the mean obliquity, the true obliquity and the nutation in longitude (radians).
[[nodiscard]] NUTCORE_DLL_PUBLIC rot_matrix nutation_matrix(double, double, double);

// Apply a rotation matrix (or its transpose, if the boolean flag is true) to a position
// vector or a position/velocity state vector. In the latter case, positions and velocities
// are rotated independently.
[[nodiscard]] NUTCORE_DLL_PUBLIC std::array<double, 3> rotate(const rot_matrix &, const std::array<double, 3> &, bool);
[[nodiscard]] NUTCORE_DLL_PUBLIC std::array<double, 6> rotate(const rot_matrix &, const std::array<double, 6> &, bool);

} // namespace model

NUTCORE_END_NAMESPACE

#endif
