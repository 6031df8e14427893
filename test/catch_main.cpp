// Copyright 2020-2025 Francesco Biscani (bluescarni@gmail.com), Dario Izzo (dario.izzo@gmail.com)
//
// This file is part of the nutcore library.
//
// This Source Code Form is subject to the terms of the Mozilla
// Public License v. 2.0. If a copy of the MPL was not distributed
// with this file, You can obtain one at http://mozilla.org/MPL/2.0/.

// Shared Catch2 entry point, compiled once and linked
// into every test executable.
#define CATCH_CONFIG_MAIN

// NOTE: force the plain main() also on unicode MSVC builds.
#define DO_NOT_USE_WMAIN

#include <catch2/catch.hpp>
