// Copyright 2020-2025 Francesco Biscani (bluescarni@gmail.com), Dario Izzo (dario.izzo@gmail.com)
//
// This file is part of the nutcore library.
//
// This Source Code Form is subject to the terms of the Mozilla
// Public License v. 2.0. If a copy of the MPL was not distributed
// with this file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef NUTCORE_TEST_UTILS_HPP
#define NUTCORE_TEST_UTILS_HPP

#include <array>
#include <cmath>
#include <cstddef>
#include <limits>
#include <ostream>
#include <sstream>
#include <string>

#include <boost/math/constants/constants.hpp>

namespace nutcore_test
{

template <typename T>
struct approximately {
    const T m_value;
    const T m_eps_mul;

    explicit approximately(T x, T eps_mul = T(100)) : m_value(x), m_eps_mul(eps_mul) {}
};

template <typename T>
inline bool operator==(const T &cmp, const approximately<T> &a)
{
    using std::abs;

    const auto tol = std::numeric_limits<T>::epsilon() * a.m_eps_mul;

    if (abs(cmp) < tol) {
        return abs(cmp - a.m_value) <= tol;
    } else {
        return abs((cmp - a.m_value) / cmp) <= tol;
    }
}

template <typename T>
inline std::ostream &operator<<(std::ostream &os, const approximately<T> &a)
{
    std::ostringstream oss;
    oss.precision(std::numeric_limits<T>::max_digits10);
    oss << a.m_value;

    return os << oss.str();
}

// Conversion factor from radians to arcseconds.
inline constexpr double rad2arcsec = 180 * 3600. / boost::math::constants::pi<double>();

// Product of the transpose of a row-major 3x3 matrix with the matrix itself.
inline std::array<double, 9> mtm(const std::array<double, 9> &m)
{
    std::array<double, 9> ret{};

    for (std::size_t i = 0; i < 3u; ++i) {
        for (std::size_t j = 0; j < 3u; ++j) {
            for (std::size_t k = 0; k < 3u; ++k) {
                ret[i * 3u + j] += m[k * 3u + i] * m[k * 3u + j];
            }
        }
    }

    return ret;
}

// A line in the IERS rapid EOP data format for the given MJD, with
// bulletin B values for UT1-UTC and the celestial pole offsets (in
// the format of the sample lines from the finals2000A.all file).
inline std::string make_iers_rapid_line(int mjd, const std::string &ut1_utc, const std::string &d1,
                                        const std::string &d2)
{
    // Columns [0, 154): date, MJD and the bulletin A data (left blank here).
    std::string ret(185, ' ');
    ret.replace(0, 6, "73 1 2");
    const auto mjd_str = std::to_string(mjd) + ".00";
    ret.replace(15 - mjd_str.size(), mjd_str.size(), mjd_str);

    // Bulletin B data, right-aligned in their columns.
    const auto put = [&ret](std::size_t begin, std::size_t size, const std::string &s) {
        ret.replace(begin + size - s.size(), s.size(), s);
    };
    put(154, 11, ut1_utc);
    put(165, 10, d1);
    put(175, 10, d2);

    return ret;
}

} // namespace nutcore_test

#endif
