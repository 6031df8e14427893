// Copyright 2020-2025 Francesco Biscani (bluescarni@gmail.com), Dario Izzo (dario.izzo@gmail.com)
//
// This file is part of the nutcore library.
//
// This Source Code Form is subject to the terms of the Mozilla
// Public License v. 2.0. If a copy of the MPL was not distributed
// with this file, You can obtain one at http://mozilla.org/MPL/2.0/.

#include <array>
#include <cmath>
#include <cstddef>

#include <nutcore/config.hpp>
#include <nutcore/model/nutation_matrix.hpp>

NUTCORE_BEGIN_NAMESPACE

namespace model
{

namespace detail
{

namespace
{

// Product between the matrix m (or its transpose) and the 3-vector
// starting at in, writing the result into out.
void rotate3(const rot_matrix &m, const double *in, double *out, bool transpose)
{
    if (transpose) {
        out[0] = m[0] * in[0] + m[3] * in[1] + m[6] * in[2];
        out[1] = m[1] * in[0] + m[4] * in[1] + m[7] * in[2];
        out[2] = m[2] * in[0] + m[5] * in[1] + m[8] * in[2];
    } else {
        out[0] = m[0] * in[0] + m[1] * in[1] + m[2] * in[2];
        out[1] = m[3] * in[0] + m[4] * in[1] + m[5] * in[2];
        out[2] = m[6] * in[0] + m[7] * in[1] + m[8] * in[2];
    }
}

} // namespace

} // namespace detail

// NOTE: this is the product R1(-eps_true) R3(-dpsi) R1(eps_mean), see
// the Explanatory Supplement to the Astronomical Almanac, section 3.222.
rot_matrix nutation_matrix(double eps_mean, double eps_true, double dpsi)
{
    const auto cobm = std::cos(eps_mean), sobm = std::sin(eps_mean);
    const auto cobt = std::cos(eps_true), sobt = std::sin(eps_true);
    const auto cpsi = std::cos(dpsi), spsi = std::sin(dpsi);

    return {cpsi,
            -spsi * cobm,
            -spsi * sobm,
            spsi * cobt,
            cpsi * cobm * cobt + sobm * sobt,
            cpsi * sobm * cobt - cobm * sobt,
            spsi * sobt,
            cpsi * cobm * sobt - sobm * cobt,
            cpsi * sobm * sobt + cobm * cobt};
}

std::array<double, 3> rotate(const rot_matrix &m, const std::array<double, 3> &v, bool transpose)
{
    std::array<double, 3> ret{};
    detail::rotate3(m, v.data(), ret.data(), transpose);

    return ret;
}

std::array<double, 6> rotate(const rot_matrix &m, const std::array<double, 6> &v, bool transpose)
{
    std::array<double, 6> ret{};
    detail::rotate3(m, v.data(), ret.data(), transpose);
    detail::rotate3(m, v.data() + 3, ret.data() + 3, transpose);

    return ret;
}

} // namespace model

NUTCORE_END_NAMESPACE
