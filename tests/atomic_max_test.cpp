// Copyright (c) 2023-2026 Logan McDougall
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt)

#include "parl/atomic_max.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <thread>
#include <vector>

TEST(atomic_max, first_value_is_installed) {
  parl::atomic_max<int> m;
  EXPECT_FALSE(m.get().has_value());
  EXPECT_EQ(m.load(), 0);

  EXPECT_TRUE(m.value(-5));
  ASSERT_TRUE(m.get().has_value());
  EXPECT_EQ(*m.get(), -5);
}

TEST(atomic_max, keeps_maximum) {
  parl::atomic_max<uint64_t> m;
  EXPECT_TRUE(m.value(5));
  EXPECT_FALSE(m.value(3));
  EXPECT_FALSE(m.value(5));
  EXPECT_TRUE(m.value(7));
  EXPECT_EQ(m.load(), 7u);
}

TEST(atomic_max, threshold_ignores_smaller) {
  parl::atomic_max<int> m(10);
  EXPECT_FALSE(m.value(9));
  EXPECT_FALSE(m.get().has_value());
  EXPECT_TRUE(m.value(10));
  EXPECT_EQ(*m.get(), 10);
}

TEST(atomic_max, concurrent) {
  parl::atomic_max<int> m;
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&m, t]() {
      for (int i = 0; i < 10000; ++i) {
        m.value(i * 4 + t);
      }
    });
  }
  for (auto& t : threads) {
    t.join();
  }
  EXPECT_EQ(m.load(), 9999 * 4 + 3);
}
