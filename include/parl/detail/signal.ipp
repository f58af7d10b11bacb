// Copyright (c) 2023-2026 Logan McDougall
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "parl/detail/signal.hpp"

#include <atomic>
#include <memory>
#include <mutex>

namespace parl {
namespace detail {
void waiter::wait() noexcept {
  int s = state.load(std::memory_order_acquire);
  while (s != FIRED) {
    state.wait(s, std::memory_order_acquire);
    s = state.load(std::memory_order_acquire);
  }
}

void waiter::fire() noexcept {
  int prev = state.exchange(FIRED, std::memory_order_acq_rel);
  if (prev == FIRED) {
    return;
  }
  if (!continuation && on_fire == nullptr) {
    // A blocked thread
    state.notify_all();
    return;
  }
  if (prev != ARMED) {
    // The owner is still registering. It will see FIRED when it tries to arm
    // and will not suspend.
    return;
  }
  if (on_fire != nullptr) {
    on_fire(context);
  } else {
    continuation.resume();
  }
}

void wake_list::fire_all() noexcept {
  // Firing may resume a coroutine that registers new waiters somewhere else,
  // but never on this list.
  for (size_t i = 0; i < waiters.size(); ++i) {
    waiters[i]->fire();
  }
  waiters.clear();
}

bool signal::add_waiter(std::shared_ptr<waiter> const& W) {
  std::scoped_lock<std::mutex> l{waiters_lock};
  if (closed.load(std::memory_order_relaxed)) {
    return false;
  }
  waiters.push_back(W);
  return true;
}

void signal::remove_waiter(waiter* W) noexcept {
  std::scoped_lock<std::mutex> l{waiters_lock};
  auto sz = waiters.size();
  for (size_t i = 0; i < sz; ++i) {
    if (waiters[i].get() == W) {
      waiters[i] = std::move(waiters[sz - 1]);
      waiters.pop_back();
      return;
    }
  }
}

bool signal::close(wake_list& Wakes) noexcept {
  std::scoped_lock<std::mutex> l{waiters_lock};
  if (closed.load(std::memory_order_relaxed)) {
    return false;
  }
  closed.store(true, std::memory_order_release);
  Wakes.take(waiters);
  return true;
}

bool signal::close() noexcept {
  wake_list wakes;
  return close(wakes);
}
} // namespace detail
} // namespace parl
