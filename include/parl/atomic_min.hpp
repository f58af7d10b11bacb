// Copyright (c) 2023-2026 Logan McDougall
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include <atomic>
#include <concepts>
#include <limits>
#include <mutex>
#include <optional>

namespace parl {
/// Tracks the minimum of the values presented to it.
/// The first value is installed under a one-shot lock. After that, updates
/// are lock-free.
template <std::integral T> class atomic_min {
  T threshold;
  std::atomic<T> current;
  std::atomic<bool> has_value;
  std::mutex init_lock;

public:
  /// Values above Threshold are ignored.
  inline explicit atomic_min(T Threshold) noexcept
      : threshold(Threshold), current(T{}), has_value(false) {}

  inline atomic_min() noexcept
      : atomic_min(std::numeric_limits<T>::max()) {}

  /// Presents Value. Returns true if Value became the new minimum.
  /// Thread-safe.
  inline bool value(T Value) {
    if (Value > threshold) {
      return false;
    }
    if (!has_value.load(std::memory_order_acquire)) {
      std::scoped_lock<std::mutex> l{init_lock};
      if (!has_value.load(std::memory_order_relaxed)) {
        current.store(Value, std::memory_order_relaxed);
        has_value.store(true, std::memory_order_release);
        return true;
      }
    }
    T c = current.load(std::memory_order_acquire);
    while (Value < c) {
      // On failure, c is updated to the value that won
      if (current.compare_exchange_weak(
            c, Value, std::memory_order_acq_rel, std::memory_order_acquire
          )) {
        return true;
      }
    }
    return false;
  }

  /// Returns the minimum, or std::nullopt if no value was presented yet.
  inline std::optional<T> get() const noexcept {
    if (!has_value.load(std::memory_order_acquire)) {
      return std::nullopt;
    }
    return current.load(std::memory_order_acquire);
  }

  /// Returns the minimum, or T{} if no value was presented yet.
  inline T load() const noexcept {
    return current.load(std::memory_order_acquire);
  }

  atomic_min(atomic_min const&) = delete;
  atomic_min& operator=(atomic_min const&) = delete;
};
} // namespace parl
