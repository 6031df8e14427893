// Copyright 2020-2025 Francesco Biscani (bluescarni@gmail.com), Dario Izzo (dario.izzo@gmail.com)
//
// This file is part of the nutcore library.
//
// This Source Code Form is subject to the terms of the Mozilla
// Public License v. 2.0. If a copy of the MPL was not distributed
// with this file, You can obtain one at http://mozilla.org/MPL/2.0/.

#include <ostream>
#include <string>
#include <type_traits>

#include <fmt/core.h>

#include <nutcore/config.hpp>
#include <nutcore/exceptions.hpp>
#include <nutcore/reduction_method.hpp>

NUTCORE_BEGIN_NAMESPACE

namespace detail
{

void throw_unsupported_reduction_method(reduction_method m, const char *where)
{
    throw unsupported_reduction_method_error(
        fmt::format("The reduction method with numerical value {} is not supported by {}",
                    static_cast<std::underlying_type_t<reduction_method>>(m), where));
}

} // namespace detail

// NOTE: all the switch statements on reduction_method in this library
// omit the default label on purpose, so that the compiler can flag
// unhandled enumerators. Out-of-range values fall through to an exception.
bool uses_iau1980_nutation(reduction_method m)
{
    switch (m) {
        case reduction_method::IAU_2000:
        case reduction_method::IAU_2006:
        case reduction_method::IAU_2009:
            return false;
        case reduction_method::JPL_DE4xx:
        case reduction_method::WILLIAMS_1994:
        case reduction_method::SIMON_1994:
        case reduction_method::LASKAR_1986:
        case reduction_method::IAU_1976:
            return true;
    }

    detail::throw_unsupported_reduction_method(m, "uses_iau1980_nutation()");
}

#define NUTCORE_REDUCTION_METHOD_STRING_CASE(val)                                                                      \
    case reduction_method::val:                                                                                        \
        return #val

std::string to_string(reduction_method m)
{
    switch (m) {
        NUTCORE_REDUCTION_METHOD_STRING_CASE(IAU_2000);
        NUTCORE_REDUCTION_METHOD_STRING_CASE(IAU_2006);
        NUTCORE_REDUCTION_METHOD_STRING_CASE(IAU_2009);
        NUTCORE_REDUCTION_METHOD_STRING_CASE(JPL_DE4xx);
        NUTCORE_REDUCTION_METHOD_STRING_CASE(WILLIAMS_1994);
        NUTCORE_REDUCTION_METHOD_STRING_CASE(SIMON_1994);
        NUTCORE_REDUCTION_METHOD_STRING_CASE(LASKAR_1986);
        NUTCORE_REDUCTION_METHOD_STRING_CASE(IAU_1976);
    }

    return "invalid";
}

#undef NUTCORE_REDUCTION_METHOD_STRING_CASE

std::ostream &operator<<(std::ostream &os, reduction_method m)
{
    return os << to_string(m);
}

NUTCORE_END_NAMESPACE
