// Copyright 2020-2025 Francesco Biscani (bluescarni@gmail.com), Dario Izzo (dario.izzo@gmail.com)
//
// This file is part of the nutcore library.
//
// This Source Code Form is subject to the terms of the Mozilla
// Public License v. 2.0. If a copy of the MPL was not distributed
// with this file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef NUTCORE_EXCEPTIONS_HPP
#define NUTCORE_EXCEPTIONS_HPP

#include <stdexcept>

#include <nutcore/config.hpp>
#include <nutcore/detail/visibility.hpp>

NUTCORE_BEGIN_NAMESPACE

// Exception to signal that Earth orientation parameters were requested
// but cannot be supplied (no provider, date outside the tables, unreadable file).
struct NUTCORE_DLL_PUBLIC_INLINE_CLASS eop_data_unavailable_error final : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Exception to signal that a reduction method outside the known
// enumeration reached a dispatcher.
struct NUTCORE_DLL_PUBLIC_INLINE_CLASS unsupported_reduction_method_error final : std::invalid_argument {
    using std::invalid_argument::invalid_argument;
};

NUTCORE_END_NAMESPACE

#endif
