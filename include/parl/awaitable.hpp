// Copyright (c) 2023-2026 Logan McDougall
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "parl/awaitable_ch.hpp"
#include "parl/detail/signal.hpp"

#include <memory>

namespace parl {
/// A one-shot signal. It starts open and closes exactly once.
/// All operations are thread-safe.
class awaitable {
  std::shared_ptr<parl::detail::signal> sig;

public:
  inline awaitable() : sig(std::make_shared<parl::detail::signal>()) {}

  /// Returns a handle that closes when this closes. Every call returns a
  /// handle to the same signal.
  inline awaitable_ch ch() const noexcept { return awaitable_ch(sig); }

  /// Returns true if close() has been called.
  inline bool is_closed() const noexcept { return sig->is_closed(); }

  /// Closes the signal and wakes all waiters before returning.
  /// Returns true only for the call that performed the transition. Other calls
  /// return false, after the closed state is visible.
  inline bool close() noexcept { return sig->close(); }

  /// Closes the signal. Waiters are woken when Wakes is destroyed.
  inline bool close(parl::detail::wake_list& Wakes) noexcept {
    return sig->close(Wakes);
  }

  /// Suspends until the signal is closed.
  inline aw_awaitable_ch operator co_await() const noexcept {
    return ch().operator co_await();
  }

  awaitable(awaitable const&) = delete;
  awaitable& operator=(awaitable const&) = delete;
};
} // namespace parl
