// Copyright (c) 2023-2026 Logan McDougall
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include <cstddef>

#if defined(_MSC_VER)

#ifdef __has_cpp_attribute

#if __has_cpp_attribute(msvc::forceinline)
#define PARL_FORCE_INLINE [[msvc::forceinline]]
#else
#define PARL_FORCE_INLINE
#endif

#else // not __has_cpp_attribute
#define PARL_FORCE_INLINE [[msvc::forceinline]]
#endif
#else // not _MSC_VER
#define PARL_FORCE_INLINE __attribute__((always_inline))
#endif

// Spreads the hot atomics of the two lock domains over separate cache lines.
static inline constexpr size_t PARL_CACHE_LINE = 64;
