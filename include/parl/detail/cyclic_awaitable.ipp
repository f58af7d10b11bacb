// Copyright (c) 2023-2026 Logan McDougall
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "parl/cyclic_awaitable.hpp"
#include "parl/detail/signal.hpp"

#include <atomic>
#include <memory>

namespace parl {
bool cyclic_awaitable::close() noexcept {
  return current.load(std::memory_order_acquire)->close();
}

bool cyclic_awaitable::close(parl::detail::wake_list& Wakes) noexcept {
  return current.load(std::memory_order_acquire)->close(Wakes);
}

cyclic_open_result cyclic_awaitable::open() {
  std::shared_ptr<parl::detail::signal> fresh;
  auto sig = current.load(std::memory_order_acquire);
  while (true) {
    if (!sig->is_closed()) {
      return cyclic_open_result{false, awaitable_ch(std::move(sig))};
    }
    if (fresh == nullptr) {
      fresh = std::make_shared<parl::detail::signal>();
    }
    // On failure, sig is updated to the value that won
    if (current.compare_exchange_strong(
          sig, fresh, std::memory_order_acq_rel, std::memory_order_acquire
        )) {
      return cyclic_open_result{true, awaitable_ch(std::move(fresh))};
    }
  }
}
} // namespace parl
