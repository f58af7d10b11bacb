// Copyright (c) 2023-2026 Logan McDougall
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt)

#include "parl/cyclic_awaitable.hpp"
#include "parl/detail/lazy_cyclic.hpp"
#include "parl/detail/signal.hpp"

#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

TEST(cyclic_awaitable, starts_open) {
  parl::cyclic_awaitable c;
  EXPECT_FALSE(c.is_closed());
  EXPECT_FALSE(c.ch().is_closed());
}

TEST(cyclic_awaitable, open_when_open_does_nothing) {
  parl::cyclic_awaitable c;
  auto ch = c.ch();
  auto result = c.open();
  EXPECT_FALSE(result.did_open);
  EXPECT_TRUE(result.ch == ch);
}

TEST(cyclic_awaitable, close_then_open_gives_fresh_channel) {
  parl::cyclic_awaitable c;
  auto ch1 = c.ch();
  EXPECT_TRUE(c.close());
  EXPECT_FALSE(c.close());
  EXPECT_TRUE(c.is_closed());
  EXPECT_TRUE(ch1.is_closed());

  auto result = c.open();
  EXPECT_TRUE(result.did_open);
  EXPECT_FALSE(result.ch.is_closed());
  EXPECT_FALSE(result.ch == ch1);
  EXPECT_TRUE(c.ch() == result.ch);

  // A channel obtained before the re-open stays closed
  EXPECT_TRUE(ch1.is_closed());
  EXPECT_FALSE(c.is_closed());
}

TEST(cyclic_awaitable, concurrent_open_has_one_winner) {
  for (int round = 0; round < 50; ++round) {
    parl::cyclic_awaitable c;
    c.close();
    std::atomic<int> opened{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
      threads.emplace_back([&]() {
        if (c.open().did_open) {
          ++opened;
        }
      });
    }
    for (auto& t : threads) {
      t.join();
    }
    EXPECT_EQ(opened.load(), 1);
    EXPECT_FALSE(c.is_closed());
  }
}

TEST(cyclic_awaitable, close_with_wake_list_defers_wake) {
  parl::cyclic_awaitable c;
  bool woke = false;
  std::thread waiter;
  {
    auto ch = c.ch();
    waiter = std::thread([ch, &woke]() {
      ch.wait();
      woke = true;
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    parl::detail::wake_list wakes;
    EXPECT_TRUE(c.close(wakes));
    EXPECT_TRUE(c.is_closed());
  }
  waiter.join();
  EXPECT_TRUE(woke);
}

namespace {
parl_test::detached await_ch(parl::awaitable_ch Ch, int& Count) {
  co_await Ch;
  ++Count;
}
} // namespace

TEST(cyclic_awaitable, coroutines_resumed_per_cycle) {
  parl::cyclic_awaitable c;
  int count = 0;
  await_ch(c.ch(), count);
  await_ch(c.ch(), count);
  EXPECT_EQ(count, 0);
  c.close();
  EXPECT_EQ(count, 2);

  c.open();
  await_ch(c.ch(), count);
  EXPECT_EQ(count, 2);
  c.close();
  EXPECT_EQ(count, 3);
}

TEST(lazy_cyclic, activates_once) {
  parl::detail::lazy_cyclic lc;
  EXPECT_FALSE(lc.is_active.load());
  EXPECT_TRUE(lc.activate());
  EXPECT_FALSE(lc.activate());
  EXPECT_TRUE(lc.is_active.load());
}
