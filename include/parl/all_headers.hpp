// Copyright (c) 2023-2026 Logan McDougall
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt)

#pragma once

// Includes every parl header. The translation unit that defines PARL_IMPL
// includes this to compile all out-of-line definitions.

#include "parl/atomic_max.hpp"
#include "parl/atomic_min.hpp"
#include "parl/awaitable.hpp"
#include "parl/awaitable_ch.hpp"
#include "parl/awaitable_slice.hpp"
#include "parl/concepts.hpp"
#include "parl/cyclic_awaitable.hpp"
#include "parl/log.hpp"
#include "parl/slice_config.hpp"
#include "parl/slice_err.hpp"
#include "parl/version.hpp"
