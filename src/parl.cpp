// Copyright (c) 2023-2026 Logan McDougall
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt)

// The out-of-line definitions of parl are compiled here, once.
#define PARL_IMPL
#include "parl/all_headers.hpp"

#include "parl/concepts.hpp"

// awaitable_slice provides every queue capability
static_assert(parl::closable_sink<parl::awaitable_slice<int>, int>);
static_assert(parl::closable_all_source<parl::awaitable_slice<int>, int>);
static_assert(parl::iterable_source<parl::awaitable_slice<int>, int>);
