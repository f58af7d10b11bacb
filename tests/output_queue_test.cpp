// Copyright (c) 2023-2026 Logan McDougall
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt)

#include "parl/detail/output_queue.hpp"
#include "parl/slice_config.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <optional>
#include <span>
#include <vector>

namespace {
struct small_config : parl::slice_default_config {
  static inline constexpr size_t MaxAppendCapacity = 16;
};

template <typename T>
using queue = parl::detail::output_queue<T, small_config>;

template <typename T> void configure(queue<T>& Q, size_t Size) {
  Q.in.size.store(Size);
  Q.in.size_max_4kib.store(true);
  Q.in.max_retain_size.store(
    std::max<size_t>(Size, small_config::MaxForPrealloc)
  );
}

// What a producer does under the input lock
template <typename T> void produce(queue<T>& Q, T Value) {
  Q.in.send(std::move(Value));
  Q.bits.set_all_bits();
}

template <typename T>
void produce_slice(queue<T>& Q, std::vector<T> Values) {
  Q.in.send_slice(std::move(Values));
  Q.bits.set_all_bits();
}
} // namespace

TEST(output_queue, get_single_value_clears_bits) {
  queue<int> q;
  configure(q, 4);
  produce(q, 1);

  bool checked = false;
  auto v = q.get(checked);
  ASSERT_TRUE(v.has_value());
  EXPECT_EQ(*v, 1);
  EXPECT_TRUE(checked);
  EXPECT_FALSE(q.bits.has_data());
  EXPECT_TRUE(q.is_empty_output());
}

TEST(output_queue, get_keeps_bits_while_values_remain) {
  queue<int> q;
  configure(q, 4);
  produce(q, 1);
  produce(q, 2);
  produce(q, 3);

  bool checked = false;
  EXPECT_EQ(q.get(checked), std::optional<int>(1));
  EXPECT_TRUE(checked);
  EXPECT_TRUE(q.bits.has_data());
  EXPECT_TRUE(q.bits.is_in_q_empty());
  EXPECT_EQ(q.head_length(), 2u);

  checked = false;
  EXPECT_EQ(q.get(checked), std::optional<int>(2));
  EXPECT_FALSE(checked);
  EXPECT_EQ(q.get(checked), std::optional<int>(3));
  EXPECT_TRUE(q.is_empty_output());
}

TEST(output_queue, stale_has_data_is_cleared) {
  queue<int> q;
  configure(q, 4);
  // HAS_DATA without any values on either side
  q.bits.set_all_bits();
  q.bits.reset_to_has_data_bit();

  bool checked = false;
  EXPECT_FALSE(q.get(checked).has_value());
  EXPECT_FALSE(q.bits.has_data());
}

TEST(output_queue, get_slice_returns_sent_slice) {
  queue<int> q;
  configure(q, 4);
  std::vector<int> values{1, 2, 3};
  int* data = values.data();
  produce_slice(q, std::move(values));

  bool checked = false;
  auto slice = q.get_slice(checked);
  EXPECT_EQ(slice, (std::vector<int>{1, 2, 3}));
  EXPECT_EQ(slice.data(), data);
  EXPECT_FALSE(q.bits.has_data());
}

TEST(output_queue, get_slice_then_more_input_keeps_order) {
  queue<int> q;
  configure(q, 4);
  produce_slice(q, {1});
  produce_slice(q, {2});
  produce_slice(q, {3});

  bool checked = false;
  EXPECT_EQ(q.get_slice(checked), (std::vector<int>{1}));
  EXPECT_TRUE(q.bits.has_data());
  // The rest is now on the output side, in the list
  EXPECT_TRUE(q.is_empty_head());
  EXPECT_EQ(q.list.size(), 2u);

  produce_slice(q, {4});
  EXPECT_EQ(q.get_all(), (std::vector<int>{2, 3, 4}));
  EXPECT_FALSE(q.bits.has_data());
}

TEST(output_queue, get_all_aggregates) {
  queue<int> q;
  configure(q, 4);
  produce_slice(q, {1, 2});
  produce_slice(q, {3});
  produce(q, 4);

  EXPECT_EQ(q.get_all(), (std::vector<int>{1, 2, 3, 4}));
  EXPECT_FALSE(q.bits.has_data());
  EXPECT_TRUE(q.is_empty_output());
}

TEST(output_queue, get_all_single_slice_is_handed_over) {
  queue<int> q;
  configure(q, 4);
  std::vector<int> values{1, 2, 3};
  int* data = values.data();
  produce_slice(q, std::move(values));
  auto all = q.get_all();
  EXPECT_EQ(all.data(), data);
}

TEST(output_queue, get_slices_in_order) {
  queue<int> q;
  configure(q, 4);
  produce(q, 1);
  bool checked = false;
  // Leaves nothing on the output side
  EXPECT_EQ(q.get(checked), std::optional<int>(1));

  produce_slice(q, {2, 3});
  produce_slice(q, {4});
  produce_slice(q, {5, 6});
  auto slices = q.get_slices({});
  ASSERT_EQ(slices.size(), 3u);
  EXPECT_EQ(slices[0], (std::vector<int>{2, 3}));
  EXPECT_EQ(slices[1], (std::vector<int>{4}));
  EXPECT_EQ(slices[2], (std::vector<int>{5, 6}));
  EXPECT_FALSE(q.bits.has_data());
}

TEST(output_queue, read_partial_then_rest) {
  queue<int> q;
  configure(q, 8);
  for (int i = 0; i < 5; ++i) {
    produce(q, i);
  }

  std::vector<int> buffer(3);
  size_t n = 0;
  q.read(std::span<int>(buffer), n);
  EXPECT_EQ(n, 3u);
  EXPECT_EQ(buffer, (std::vector<int>{0, 1, 2}));
  EXPECT_TRUE(q.bits.has_data());

  std::vector<int> rest(5, -1);
  n = 0;
  q.read(std::span<int>(rest), n);
  EXPECT_EQ(n, 2u);
  EXPECT_EQ(rest[0], 3);
  EXPECT_EQ(rest[1], 4);
  EXPECT_FALSE(q.bits.has_data());
}

TEST(output_queue, read_exact_clears_bits) {
  queue<int> q;
  configure(q, 8);
  produce_slice(q, {1, 2});
  produce_slice(q, {3});

  std::vector<int> buffer(3);
  size_t n = 0;
  q.read(std::span<int>(buffer), n);
  EXPECT_EQ(n, 3u);
  EXPECT_EQ(buffer, (std::vector<int>{1, 2, 3}));
  EXPECT_FALSE(q.bits.has_data());
}

TEST(output_queue, dequeued_values_are_released) {
  queue<std::shared_ptr<int>> q;
  configure(q, 4);
  auto p = std::make_shared<int>(1);
  produce(q, p);
  produce(q, std::make_shared<int>(2));
  EXPECT_EQ(p.use_count(), 2);

  bool checked = false;
  {
    auto v = q.get(checked);
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->get(), p.get());
  }
  // The head still holds the second value but not the first
  EXPECT_EQ(q.head_length(), 1u);
  EXPECT_EQ(p.use_count(), 1);
}

TEST(output_queue, large_primary_is_remembered) {
  queue<int> q;
  configure(q, 4);
  std::vector<int> large;
  large.reserve(1000);
  large.push_back(1);
  produce_slice(q, std::move(large));

  bool checked = false;
  auto slice = q.get_slice(checked);
  EXPECT_EQ(slice.capacity(), 1000u);
  EXPECT_TRUE(q.last_primary_large);

  produce(q, 2);
  EXPECT_EQ(q.get_slice(checked), (std::vector<int>{2}));
  EXPECT_FALSE(q.last_primary_large);
}

TEST(output_queue, transfer_hands_cached_output_to_input) {
  queue<int> q;
  configure(q, 4);
  produce(q, 1);
  bool checked = false;
  EXPECT_EQ(q.get(checked), std::optional<int>(1));
  // The speculative slice went to the input side
  EXPECT_TRUE(q.in.has_input.load());
  EXPECT_GE(q.in.cached_input.capacity(), 4u);
  // The prepared head became the new primary
  EXPECT_GE(q.in.primary.capacity(), 4u);
}

namespace {
// No slice kept anywhere in the queue may exceed max_retain_size
template <typename T> void expect_retained_within_limit(queue<T>& Q) {
  size_t limit = Q.in.max_retain_size.load();
  EXPECT_LE(Q.in.primary.capacity(), limit);
  EXPECT_LE(Q.in.cached_input.capacity(), limit);
  EXPECT_LE(Q.head.capacity(), limit);
  EXPECT_LE(Q.cached_output.capacity(), limit);
}
} // namespace

TEST(output_queue, large_slice_drained_by_get_is_released) {
  queue<int> q;
  configure(q, 4);
  produce_slice(q, std::vector<int>(1000, 7));

  bool checked = false;
  size_t n = 0;
  while (q.get(checked).has_value()) {
    ++n;
  }
  EXPECT_EQ(n, 1000u);
  expect_retained_within_limit(q);

  for (int round = 0; round < 5; ++round) {
    produce(q, round);
    EXPECT_EQ(q.get(checked), std::optional<int>(round));
    expect_retained_within_limit(q);
  }
}

TEST(output_queue, large_slice_drained_by_read_is_released) {
  queue<int> q;
  configure(q, 4);
  produce_slice(q, std::vector<int>(1000, 7));

  std::vector<int> buffer(64);
  size_t total = 0;
  while (true) {
    size_t n = 0;
    q.read(std::span<int>(buffer), n);
    if (n == 0) {
      break;
    }
    total += n;
  }
  EXPECT_EQ(total, 1000u);
  EXPECT_FALSE(q.bits.has_data());
  expect_retained_within_limit(q);

  bool checked = false;
  for (int round = 0; round < 5; ++round) {
    produce(q, round);
    EXPECT_EQ(q.get(checked), std::optional<int>(round));
    expect_retained_within_limit(q);
  }
}

TEST(output_queue, large_slice_released_in_low_alloc_mode) {
  queue<int> q;
  configure(q, 4);
  q.in.is_low_alloc.store(true);
  produce_slice(q, std::vector<int>(1000, 7));

  bool checked = false;
  size_t n = 0;
  while (q.get(checked).has_value()) {
    ++n;
  }
  EXPECT_EQ(n, 1000u);

  for (int round = 0; round < 5; ++round) {
    produce(q, round);
    EXPECT_EQ(q.get(checked), std::optional<int>(round));
    expect_retained_within_limit(q);
  }
}
