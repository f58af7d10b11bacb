// Copyright (c) 2023-2026 Logan McDougall
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include <cstddef>
#include <exception>
#include <system_error>
#include <type_traits>

namespace parl {
/// The default compile-time configuration of `parl::awaitable_slice`. To
/// customize, write a struct with the same members and pass it as the Config
/// template parameter.
struct slice_default_config {
  /// The default allocation size of a new value slice, in bytes. The element
  /// count is this divided by sizeof(T), but at least MinElements.
  static inline constexpr size_t TargetSliceBytes = 4096;

  /// The smallest element count of a default-sized value slice.
  static inline constexpr size_t MinElements = 10;

  /// A value slice whose capacity reached this element count is never grown.
  /// Further values go into a new slice.
  static inline constexpr size_t MaxAppendCapacity = 16 * 1024 * 1024;

  /// Slices up to this capacity (or the configured size, if larger) are
  /// retained for reuse. Larger slices are released when they leave the queue.
  static inline constexpr size_t MaxForPrealloc = 100;

  /// The number of slices the backing of a slice list is allocated for.
  static inline constexpr size_t SliceListSize =
    TargetSliceBytes / sizeof(void*);

  /// The number of slices the backing of a slice list is allocated for in
  /// low-alloc mode.
  static inline constexpr size_t LowAllocListSize = 10;
};

/// Element types for which `awaitable_slice` uses small allocations and no
/// speculative pre-allocation by default. Such queues are expected to carry
/// few values, like error sinks. Specialize to opt in other types.
template <typename T> struct low_alloc_type : std::false_type {};
template <> struct low_alloc_type<std::exception_ptr> : std::true_type {};
template <> struct low_alloc_type<std::error_code> : std::true_type {};

template <typename T>
inline constexpr bool low_alloc_type_v = low_alloc_type<T>::value;
} // namespace parl
