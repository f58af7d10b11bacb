// Copyright (c) 2023-2026 Logan McDougall
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "parl/cyclic_awaitable.hpp"

#include <atomic>
#include <mutex>

namespace parl {
namespace detail {
/// A cyclic_awaitable that is only maintained once someone asked for it.
/// The owner holds `lock` while it re-reads the state that the signal mirrors
/// and opens or closes the signal to match.
struct lazy_cyclic {
  parl::cyclic_awaitable cyclic;
  // Set once by the first caller that requests the channel
  std::atomic<bool> is_active;
  std::mutex lock;

  inline lazy_cyclic() : is_active(false) {}

  /// Returns true if this call activated the signal.
  inline bool activate() noexcept {
    if (is_active.load(std::memory_order_acquire)) {
      return false;
    }
    bool expected = false;
    return is_active.compare_exchange_strong(
      expected, true, std::memory_order_seq_cst
    );
  }
};
} // namespace detail
} // namespace parl
