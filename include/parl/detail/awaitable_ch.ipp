// Copyright (c) 2023-2026 Logan McDougall
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "parl/awaitable_ch.hpp"
#include "parl/detail/signal.hpp"

#include <cassert>
#include <coroutine>
#include <memory>
#include <span>

namespace parl {
bool aw_awaitable_ch::await_suspend(std::coroutine_handle<> Outer) {
  me = std::make_shared<parl::detail::waiter>(Outer);
  if (!sig->add_waiter(me)) {
    // Closed in the meantime, don't wait
    return false;
  }
  // If the signal closed after add_waiter, the waiter was already fired and
  // won't resume us. Resume immediately instead.
  return me->arm();
}

void awaitable_ch::wait() const {
  assert(sig != nullptr);
  if (sig->is_closed()) {
    return;
  }
  auto w = std::make_shared<parl::detail::waiter>();
  if (!sig->add_waiter(w)) {
    return;
  }
  w->wait();
}

size_t aw_wait_any::first_closed() const noexcept {
  for (size_t i = 0; i < chs.size(); ++i) {
    if (chs[i].is_closed()) {
      return i;
    }
  }
  return chs.size();
}

void aw_wait_any::unregister() noexcept {
  if (me == nullptr) {
    return;
  }
  for (size_t i = 0; i < chs.size(); ++i) {
    chs[i].remove_waiter(me.get());
  }
}

bool aw_wait_any::await_suspend(std::coroutine_handle<> Outer) {
  me = std::make_shared<parl::detail::waiter>(Outer);
  for (size_t i = 0; i < chs.size(); ++i) {
    if (!chs[i].add_waiter(me)) {
      // One of them is already closed
      unregister();
      return false;
    }
  }
  if (!me->arm()) {
    // Fired during registration
    unregister();
    return false;
  }
  return true;
}

size_t aw_wait_any::await_resume() noexcept {
  // The waiter may still be registered on the channels that did not close
  unregister();
  return first_closed();
}

size_t wait_any(std::span<awaitable_ch const> Chs) {
  for (size_t i = 0; i < Chs.size(); ++i) {
    if (Chs[i].is_closed()) {
      return i;
    }
  }

  auto w = std::make_shared<parl::detail::waiter>();
  size_t registered = 0;
  for (; registered < Chs.size(); ++registered) {
    if (!Chs[registered].add_waiter(w)) {
      break;
    }
  }
  if (registered == Chs.size()) {
    w->wait();
  }
  for (size_t i = 0; i < registered; ++i) {
    Chs[i].remove_waiter(w.get());
  }

  for (size_t i = 0; i < Chs.size(); ++i) {
    if (Chs[i].is_closed()) {
      return i;
    }
  }
  // Unreachable: the waiter only fires after a signal closed.
  assert(false);
  return Chs.size();
}
} // namespace parl
