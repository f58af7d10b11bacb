// Copyright (c) 2023-2026 Logan McDougall
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt)

#pragma once

// A handle to a closing signal, and the ways to wait for one or more of them
// to close: from a thread with wait() / wait_any(), or from a coroutine with
// co_await / co_wait_any().

#include "parl/detail/signal.hpp"

#include <array>
#include <cassert>
#include <coroutine>
#include <cstddef>
#include <memory>
#include <span>
#include <utility>
#include <vector>

namespace parl {
class awaitable_ch;

/// The awaitable type returned by `co_await awaitable_ch`.
/// Awaiting coroutines are resumed inline by the thread that closes the
/// signal.
class [[nodiscard(
  "You must co_await aw_awaitable_ch for it to have any effect."
)]] aw_awaitable_ch {
  std::shared_ptr<parl::detail::signal> sig;
  std::shared_ptr<parl::detail::waiter> me;

  friend class awaitable_ch;

  inline aw_awaitable_ch(std::shared_ptr<parl::detail::signal> Signal) noexcept
      : sig(std::move(Signal)) {}

public:
  inline bool await_ready() noexcept { return sig->is_closed(); }

  bool await_suspend(std::coroutine_handle<> Outer);

  inline void await_resume() noexcept {}

  // Cannot be moved or copied; the waiter refers to the suspended coroutine
  aw_awaitable_ch(aw_awaitable_ch const&) = delete;
  aw_awaitable_ch& operator=(aw_awaitable_ch const&) = delete;
  aw_awaitable_ch(aw_awaitable_ch&&) = delete;
  aw_awaitable_ch& operator=(aw_awaitable_ch&&) = delete;
};

/// A channel-like handle that closes exactly once. Copies refer to the same
/// signal. Two handles compare equal if they refer to the same signal.
class awaitable_ch {
  std::shared_ptr<parl::detail::signal> sig;

public:
  /// Refers to no signal. Such a handle never closes and must not be waited
  /// on.
  inline awaitable_ch() noexcept {}

  inline explicit awaitable_ch(std::shared_ptr<parl::detail::signal> Signal
  ) noexcept
      : sig(std::move(Signal)) {}

  /// Returns true if this refers to a signal.
  inline bool valid() const noexcept { return sig != nullptr; }

  /// Returns true if the signal has closed. Never blocks.
  inline bool is_closed() const noexcept {
    return sig != nullptr && sig->is_closed();
  }

  /// Blocks the calling thread until the signal closes.
  void wait() const;

  /// Suspends the calling coroutine until the signal closes.
  /// If it is already closed, resumes immediately.
  inline aw_awaitable_ch operator co_await() const noexcept {
    assert(sig != nullptr);
    return aw_awaitable_ch(sig);
  }

  inline bool operator==(awaitable_ch const& Other) const noexcept {
    return sig == Other.sig;
  }

  /// Registers W to be fired when the signal closes. Returns false without
  /// registering if it is already closed.
  /// Used by awaiters that wait on several signals with one waiter.
  inline bool add_waiter(std::shared_ptr<parl::detail::waiter> const& W) const {
    assert(sig != nullptr);
    return sig->add_waiter(W);
  }

  /// Unregisters W if it is still registered.
  inline void remove_waiter(parl::detail::waiter* W) const noexcept {
    sig->remove_waiter(W);
  }
};

/// The awaitable type returned by `parl::co_wait_any()`.
/// `co_await` produces the index of the first closed channel.
class [[nodiscard(
  "You must co_await aw_wait_any for it to have any effect."
)]] aw_wait_any {
  std::vector<awaitable_ch> chs;
  std::shared_ptr<parl::detail::waiter> me;

  template <typename... Chs> friend aw_wait_any co_wait_any(Chs const&... Ch);

  inline aw_wait_any(std::vector<awaitable_ch>&& Chs) noexcept
      : chs(std::move(Chs)) {}

  void unregister() noexcept;

  size_t first_closed() const noexcept;

public:
  inline bool await_ready() noexcept { return first_closed() != chs.size(); }

  bool await_suspend(std::coroutine_handle<> Outer);

  size_t await_resume() noexcept;

  // Cannot be moved or copied; the waiter refers to the suspended coroutine
  aw_wait_any(aw_wait_any const&) = delete;
  aw_wait_any& operator=(aw_wait_any const&) = delete;
  aw_wait_any(aw_wait_any&&) = delete;
  aw_wait_any& operator=(aw_wait_any&&) = delete;
};

/// Blocks the calling thread until any of Chs closes.
/// Returns the index of the first closed channel in Chs.
size_t wait_any(std::span<awaitable_ch const> Chs);

/// Blocks the calling thread until any of the channels closes.
/// Returns the index of the first closed channel in argument order.
template <typename... Chs>
  requires(sizeof...(Chs) > 1)
inline size_t wait_any(Chs const&... Ch) {
  std::array<awaitable_ch, sizeof...(Chs)> chs{Ch...};
  return wait_any(std::span<awaitable_ch const>(chs));
}

/// Suspends the calling coroutine until any of the channels closes.
/// `co_await` produces the index of the first closed channel in argument
/// order.
template <typename... Chs> inline aw_wait_any co_wait_any(Chs const&... Ch) {
  static_assert(sizeof...(Chs) > 0, "co_wait_any requires a channel");
  std::vector<awaitable_ch> chs{Ch...};
  return aw_wait_any(std::move(chs));
}
} // namespace parl

#ifdef PARL_IMPL
#include "parl/detail/awaitable_ch.ipp"
#endif
