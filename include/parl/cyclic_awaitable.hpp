// Copyright (c) 2023-2026 Logan McDougall
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "parl/awaitable_ch.hpp"
#include "parl/detail/signal.hpp"

#include <atomic>
#include <memory>

namespace parl {
/// The result of `cyclic_awaitable::open()`.
struct cyclic_open_result {
  /// True if this call replaced a closed signal with a fresh open one.
  bool did_open;
  /// The signal that is open after the call.
  awaitable_ch ch;
};

/// A closing signal that can be re-opened. Each open period is a distinct
/// one-shot signal: a handle obtained before a re-open stays closed.
/// All operations are thread-safe.
class cyclic_awaitable {
  std::atomic<std::shared_ptr<parl::detail::signal>> current;

public:
  /// The initial state is open.
  inline cyclic_awaitable()
      : current(std::make_shared<parl::detail::signal>()) {}

  /// Returns a handle to the current signal.
  /// Each call may return a different signal.
  inline awaitable_ch ch() const noexcept {
    return awaitable_ch(current.load(std::memory_order_acquire));
  }

  /// Returns true if the current signal is closed.
  inline bool is_closed() const noexcept {
    return current.load(std::memory_order_acquire)->is_closed();
  }

  /// Closes the current signal in place and wakes its waiters.
  /// Returns true if this call performed the transition.
  bool close() noexcept;

  /// Closes the current signal in place. Waiters are woken when Wakes is
  /// destroyed.
  bool close(parl::detail::wake_list& Wakes) noexcept;

  /// If the current signal is closed, replaces it with a fresh open one.
  /// Returns did_open == false and the current signal if it was already open.
  cyclic_open_result open();

  cyclic_awaitable(cyclic_awaitable const&) = delete;
  cyclic_awaitable& operator=(cyclic_awaitable const&) = delete;
};
} // namespace parl

#ifdef PARL_IMPL
#include "parl/detail/cyclic_awaitable.ipp"
#endif
