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
#include <initializer_list>
#include <tuple>

#include <nutcore/model/nutation_matrix.hpp>

#include <catch2/catch.hpp>

#include "test_utils.hpp"

using namespace nutcore;
using namespace nutcore_test;

TEST_CASE("orthogonality")
{
    const auto eps0 = 84381.406 / rad2arcsec;

    for (const auto [deps, dpsi] : {std::tuple{0., 0.}, std::tuple{4.3391, 14.7823}, std::tuple{-9.2, 17.2},
                                    std::tuple{1e-3, -1e-3}, std::tuple{1000., -3000.}}) {
        const auto m = model::nutation_matrix(eps0, eps0 + deps / rad2arcsec, dpsi / rad2arcsec);

        const auto p = mtm(m);
        for (std::size_t i = 0; i < 3u; ++i) {
            for (std::size_t j = 0; j < 3u; ++j) {
                REQUIRE(std::abs(p[i * 3u + j] - (i == j ? 1. : 0.)) < 1e-12);
            }
        }

        // Proper rotation.
        const auto det = m[0] * (m[4] * m[8] - m[5] * m[7]) - m[1] * (m[3] * m[8] - m[5] * m[6])
                         + m[2] * (m[3] * m[7] - m[4] * m[6]);
        REQUIRE(std::abs(det - 1.) < 1e-12);
    }
}

TEST_CASE("identity")
{
    for (const auto eps : {0., 0.40909, -0.3, 1.}) {
        const auto m = model::nutation_matrix(eps, eps, 0.);

        for (std::size_t i = 0; i < 3u; ++i) {
            for (std::size_t j = 0; j < 3u; ++j) {
                REQUIRE(std::abs(m[i * 3u + j] - (i == j ? 1. : 0.)) < 1e-15);
            }
        }
    }
}

TEST_CASE("structure")
{
    // With no nutation in longitude, the matrix is a rotation
    // around the x axis by the nutation in obliquity.
    const auto eps0 = 0.40909280422232897;
    const auto deps = 5e-5;
    const auto m = model::nutation_matrix(eps0, eps0 + deps, 0.);

    REQUIRE(m[0] == 1.);
    REQUIRE(m[1] == 0.);
    REQUIRE(m[2] == 0.);
    REQUIRE(m[3] == 0.);
    REQUIRE(m[6] == 0.);
    REQUIRE(m[4] == approximately(std::cos(deps), 10.));
    REQUIRE(std::abs(m[5] + std::sin(deps)) < 1e-15);
    REQUIRE(std::abs(m[7] - std::sin(deps)) < 1e-15);
    REQUIRE(m[8] == approximately(std::cos(deps), 10.));

    // The equinox moves along the ecliptic: a vector pointing at the mean
    // equinox is displaced by dpsi in longitude.
    const auto dpsi = 7e-5;
    const auto m2 = model::nutation_matrix(eps0, eps0, dpsi);
    const auto x = model::rotate(m2, std::array{1., 0., 0.}, false);
    REQUIRE(x[0] == approximately(std::cos(dpsi), 10.));
    REQUIRE(x[1] == approximately(std::sin(dpsi) * std::cos(eps0), 1e4));
    REQUIRE(x[2] == approximately(std::sin(dpsi) * std::sin(eps0), 1e4));
}

TEST_CASE("rotate")
{
    const auto eps0 = 0.40909280422232897;
    const auto m = model::nutation_matrix(eps0, eps0 + 2.1e-5, 7.16e-5);

    const std::array v3 = {1.2, -3.4, 0.56};
    const std::array v6 = {1.2, -3.4, 0.56, 7e-3, 1.1e-2, -4e-3};

    // Forward then transpose gives back the input.
    const auto r3 = model::rotate(m, v3, false);
    const auto b3 = model::rotate(m, r3, true);
    for (std::size_t i = 0; i < 3u; ++i) {
        REQUIRE(std::abs(b3[i] - v3[i]) < 1e-14);
    }

    const auto r6 = model::rotate(m, v6, false);
    const auto b6 = model::rotate(m, r6, true);
    for (std::size_t i = 0; i < 6u; ++i) {
        REQUIRE(std::abs(b6[i] - v6[i]) < 1e-14);
    }

    // Positions and velocities are rotated independently.
    const auto rv = model::rotate(m, std::array{v6[3], v6[4], v6[5]}, false);
    for (std::size_t i = 0; i < 3u; ++i) {
        REQUIRE(r6[i] == r3[i]);
        REQUIRE(r6[i + 3u] == rv[i]);
    }

    // The norm is preserved.
    REQUIRE(std::hypot(r3[0], r3[1], r3[2]) == approximately(std::hypot(v3[0], v3[1], v3[2])));
}
