// Copyright (c) 2023-2026 Logan McDougall
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include <atomic>
#include <coroutine>
#include <memory>
#include <mutex>
#include <vector>

namespace parl {
namespace detail {

/// A single wake-up registration. The same waiter may be registered on several
/// signals at once; it is fired at most once regardless of how many of them
/// close.
struct waiter {
  // 3 states:
  // REGISTERING while the owner is still adding it to signals
  // ARMED once the owner has finished registering and is suspended / blocked
  // FIRED after the first signal closed
  static inline constexpr int REGISTERING = 0;
  static inline constexpr int ARMED = 1;
  static inline constexpr int FIRED = 2;

  std::atomic<int> state;

  /// Resumed by the firing thread if the waiter was ARMED.
  /// Null for thread waiters.
  std::coroutine_handle<> continuation;

  /// If set, called instead of resuming continuation.
  void (*on_fire)(void* Context) noexcept;
  void* context;

  inline waiter() noexcept
      : state(REGISTERING), continuation(), on_fire(nullptr),
        context(nullptr) {}

  inline explicit waiter(std::coroutine_handle<> Outer) noexcept
      : state(REGISTERING), continuation(Outer), on_fire(nullptr),
        context(nullptr) {}

  /// Transitions REGISTERING -> ARMED. Returns false if the waiter was already
  /// fired, in which case the owner must not suspend.
  inline bool arm() noexcept {
    int expected = REGISTERING;
    return state.compare_exchange_strong(
      expected, ARMED, std::memory_order_acq_rel, std::memory_order_acquire
    );
  }

  inline bool is_fired() const noexcept {
    return state.load(std::memory_order_acquire) == FIRED;
  }

  /// Blocks the calling thread until fire() is called.
  void wait() noexcept;

  /// Marks the waiter fired and wakes its owner.
  /// Only the first call has any effect.
  void fire() noexcept;

  waiter(waiter const&) = delete;
  waiter& operator=(waiter const&) = delete;
  waiter(waiter&&) = delete;
  waiter& operator=(waiter&&) = delete;
};

/// Collects waiters taken from signals so that they can be fired after all
/// locks held by the closing thread have been released. Declare it before the
/// lock guard; the waiters fire when it is destroyed.
class wake_list {
  std::vector<std::shared_ptr<waiter>> waiters;

public:
  inline wake_list() noexcept {}

  inline void take(std::vector<std::shared_ptr<waiter>>& Other) {
    if (waiters.empty()) {
      waiters.swap(Other);
    } else {
      for (size_t i = 0; i < Other.size(); ++i) {
        waiters.push_back(std::move(Other[i]));
      }
      Other.clear();
    }
  }

  /// Fires all collected waiters now.
  void fire_all() noexcept;

  inline ~wake_list() { fire_all(); }

  wake_list(wake_list const&) = delete;
  wake_list& operator=(wake_list const&) = delete;
  wake_list(wake_list&&) = delete;
  wake_list& operator=(wake_list&&) = delete;
};

/// A one-shot open -> closed transition with a list of waiters.
class signal {
  std::atomic<bool> closed;
  std::mutex waiters_lock;
  std::vector<std::shared_ptr<waiter>> waiters;

public:
  inline signal() noexcept : closed(false) {}

  inline bool is_closed() const noexcept {
    return closed.load(std::memory_order_acquire);
  }

  /// Registers W. Returns false without registering if the signal is already
  /// closed.
  bool add_waiter(std::shared_ptr<waiter> const& W);

  /// Unregisters W if it is still registered.
  void remove_waiter(waiter* W) noexcept;

  /// Closes the signal. Waiters are moved into Wakes and fire when Wakes is
  /// destroyed. Returns true if this call performed the transition.
  bool close(wake_list& Wakes) noexcept;

  /// Closes the signal and fires the waiters before returning.
  bool close() noexcept;

  signal(signal const&) = delete;
  signal& operator=(signal const&) = delete;
  signal(signal&&) = delete;
  signal& operator=(signal&&) = delete;
};

} // namespace detail
} // namespace parl

#ifdef PARL_IMPL
#include "parl/detail/signal.ipp"
#endif
