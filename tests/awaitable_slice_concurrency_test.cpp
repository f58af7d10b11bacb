// Copyright (c) 2023-2026 Logan McDougall
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt)

#include "parl/awaitable_slice.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <optional>
#include <span>
#include <thread>
#include <vector>

namespace {
constexpr int PRODUCERS = 4;
constexpr int PER_PRODUCER = 10000;
constexpr int STRIDE = 1000000;

// Value I of producer P
inline int encode(int P, int I) { return P * STRIDE + I; }

// Producers mix every send flavor
void produce(parl::awaitable_slice<int>& Q, int P, int Count) {
  int i = 0;
  while (i < Count) {
    switch (i % 4) {
    case 0:
    case 1:
      Q.send(encode(P, i));
      ++i;
      break;
    case 2: {
      std::vector<int> xs;
      for (int j = 0; j < 3 && i < Count; ++j, ++i) {
        xs.push_back(encode(P, i));
      }
      Q.send_slice(std::move(xs));
      break;
    }
    default: {
      std::vector<int> xs;
      for (int j = 0; j < 2 && i < Count; ++j, ++i) {
        xs.push_back(encode(P, i));
      }
      Q.send_clone(std::span<int const>(xs));
      break;
    }
    }
  }
}

// Each producer's values must arrive in the order they were sent
void expect_per_producer_order(std::vector<int> const& Got) {
  std::vector<int> last(PRODUCERS, -1);
  for (int v : Got) {
    int p = v / STRIDE;
    int i = v % STRIDE;
    ASSERT_GE(p, 0);
    ASSERT_LT(p, PRODUCERS);
    EXPECT_GT(i, last[static_cast<size_t>(p)]);
    last[static_cast<size_t>(p)] = i;
  }
}

// Every value must arrive exactly once
void expect_exactly_once(std::vector<std::vector<int>> const& PerConsumer) {
  std::vector<int> all;
  for (auto const& got : PerConsumer) {
    all.insert(all.end(), got.begin(), got.end());
  }
  std::sort(all.begin(), all.end());
  std::vector<int> expected;
  for (int p = 0; p < PRODUCERS; ++p) {
    for (int i = 0; i < PER_PRODUCER; ++i) {
      expected.push_back(encode(p, i));
    }
  }
  EXPECT_EQ(all, expected);
}
} // namespace

TEST(awaitable_slice_concurrency, seq_consumers) {
  parl::awaitable_slice<int> q;
  constexpr int CONSUMERS = 3;
  std::vector<std::vector<int>> got(CONSUMERS);

  std::vector<std::thread> consumers;
  for (int c = 0; c < CONSUMERS; ++c) {
    consumers.emplace_back([&q, &got, c]() {
      auto& mine = got[static_cast<size_t>(c)];
      q.seq([&mine](int Value) {
        mine.push_back(Value);
        return true;
      });
    });
  }
  std::vector<std::thread> producers;
  for (int p = 0; p < PRODUCERS; ++p) {
    producers.emplace_back([&q, p]() { produce(q, p, PER_PRODUCER); });
  }
  for (auto& t : producers) {
    t.join();
  }
  q.close();
  for (auto& t : consumers) {
    t.join();
  }

  EXPECT_TRUE(q.is_closed());
  for (auto const& mine : got) {
    expect_per_producer_order(mine);
  }
  expect_exactly_once(got);
}

TEST(awaitable_slice_concurrency, await_value_consumers) {
  parl::awaitable_slice<int> q;
  constexpr int CONSUMERS = 2;
  std::vector<std::vector<int>> got(CONSUMERS);

  std::vector<std::thread> consumers;
  for (int c = 0; c < CONSUMERS; ++c) {
    consumers.emplace_back([&q, &got, c]() {
      auto& mine = got[static_cast<size_t>(c)];
      while (auto v = q.await_value()) {
        mine.push_back(*v);
      }
    });
  }
  std::vector<std::thread> producers;
  for (int p = 0; p < PRODUCERS; ++p) {
    producers.emplace_back([&q, p]() { produce(q, p, PER_PRODUCER); });
  }
  for (auto& t : producers) {
    t.join();
  }
  q.close();
  for (auto& t : consumers) {
    t.join();
  }

  for (auto const& mine : got) {
    expect_per_producer_order(mine);
  }
  expect_exactly_once(got);
}

TEST(awaitable_slice_concurrency, polling_consumers) {
  parl::awaitable_slice<int> q;
  constexpr int CONSUMERS = 3;
  std::vector<std::vector<int>> got(CONSUMERS);

  std::vector<std::thread> consumers;
  for (int c = 0; c < CONSUMERS; ++c) {
    consumers.emplace_back([&q, &got, c]() {
      auto& mine = got[static_cast<size_t>(c)];
      std::vector<int> buf(7);
      auto endCh = q.close_ch();
      while (true) {
        // Each consumer uses a different way to take values
        if (c == 0) {
          auto v = q.get();
          if (v.has_value()) {
            mine.push_back(*v);
            continue;
          }
        } else if (c == 1) {
          auto s = q.get_slice();
          if (!s.empty()) {
            mine.insert(mine.end(), s.begin(), s.end());
            continue;
          }
        } else {
          auto r = q.read(std::span<int>(buf));
          mine.insert(
            mine.end(), buf.begin(),
            buf.begin() + static_cast<std::ptrdiff_t>(r.n)
          );
          if (r.err == parl::slice_err::END) {
            return;
          }
          if (r.n != 0) {
            continue;
          }
        }
        if (parl::wait_any(endCh, q.data_wait_ch()) == 0) {
          return;
        }
      }
    });
  }
  std::vector<std::thread> producers;
  for (int p = 0; p < PRODUCERS; ++p) {
    producers.emplace_back([&q, p]() { produce(q, p, PER_PRODUCER); });
  }
  for (auto& t : producers) {
    t.join();
  }
  q.close();
  for (auto& t : consumers) {
    t.join();
  }

  for (auto const& mine : got) {
    expect_per_producer_order(mine);
  }
  expect_exactly_once(got);
}

TEST(awaitable_slice_concurrency, co_await_value_single_thread) {
  parl::awaitable_slice<int> q;
  std::vector<int> got;
  bool done = false;

  auto consumer = [](
                    parl::awaitable_slice<int>& Q, std::vector<int>& Got,
                    bool& Done
                  ) -> parl_test::detached {
    while (auto v = co_await Q.co_await_value()) {
      Got.push_back(*v);
    }
    Done = true;
  };
  consumer(q, got, done);

  // Suspended on the empty queue
  EXPECT_TRUE(got.empty());
  EXPECT_FALSE(done);

  // The sending thread resumes the coroutine
  q.send(1);
  EXPECT_EQ(got, (std::vector<int>{1}));
  q.send_slice({2, 3});
  EXPECT_EQ(got, (std::vector<int>{1, 2, 3}));
  EXPECT_FALSE(done);

  q.close();
  EXPECT_TRUE(done);
  EXPECT_TRUE(q.is_closed());
}

TEST(awaitable_slice_concurrency, co_await_value_ready_values) {
  parl::awaitable_slice<int> q;
  q.send_slice({1, 2});
  q.close();
  std::vector<int> got;
  bool done = false;

  auto consumer = [](
                    parl::awaitable_slice<int>& Q, std::vector<int>& Got,
                    bool& Done
                  ) -> parl_test::detached {
    while (auto v = co_await Q.co_await_value()) {
      Got.push_back(*v);
    }
    Done = true;
  };
  consumer(q, got, done);

  EXPECT_TRUE(done);
  EXPECT_EQ(got, (std::vector<int>{1, 2}));
}

TEST(awaitable_slice_concurrency, co_await_value_with_producer_threads) {
  parl::awaitable_slice<int> q;
  constexpr int CONSUMERS = 2;
  constexpr int COUNT = 2000;
  std::atomic<int> received{0};
  std::atomic<long long> sum{0};
  std::atomic<int> finished{0};

  auto consumer = [](
                    parl::awaitable_slice<int>& Q, std::atomic<int>& Received,
                    std::atomic<long long>& Sum, std::atomic<int>& Finished
                  ) -> parl_test::detached {
    while (auto v = co_await Q.co_await_value()) {
      Received.fetch_add(1);
      Sum.fetch_add(*v);
    }
    Finished.fetch_add(1);
  };
  for (int c = 0; c < CONSUMERS; ++c) {
    consumer(q, received, sum, finished);
  }

  std::vector<std::thread> producers;
  for (int p = 0; p < PRODUCERS; ++p) {
    producers.emplace_back([&q]() {
      for (int i = 1; i <= COUNT; ++i) {
        q.send(i);
      }
    });
  }
  for (auto& t : producers) {
    t.join();
  }
  q.close();

  EXPECT_TRUE(parl_test::eventually([&]() {
    return finished.load() == CONSUMERS;
  }));
  EXPECT_EQ(received.load(), PRODUCERS * COUNT);
  EXPECT_EQ(sum.load(), static_cast<long long>(PRODUCERS) * COUNT * (COUNT + 1) / 2);
}

TEST(awaitable_slice_concurrency, data_wait_settles_after_quiescence) {
  parl::awaitable_slice<int> q;
  (void)q.data_wait_ch();
  std::atomic<bool> stop{false};
  std::atomic<int> taken{0};

  std::vector<std::thread> threads;
  for (int p = 0; p < 2; ++p) {
    threads.emplace_back([&q, p]() { produce(q, p, PER_PRODUCER); });
  }
  for (int c = 0; c < 2; ++c) {
    threads.emplace_back([&q, &stop, &taken]() {
      while (!stop.load()) {
        if (q.get().has_value()) {
          taken.fetch_add(1);
        }
      }
    });
  }
  threads[0].join();
  threads[1].join();
  stop.store(true);
  threads[2].join();
  threads[3].join();

  auto rest = q.get_all();
  EXPECT_EQ(taken.load() + static_cast<int>(rest.size()), 2 * PER_PRODUCER);

  // Empty and quiescent: the data wait channel is open
  EXPECT_FALSE(q.get().has_value());
  EXPECT_FALSE(q.data_wait_ch().is_closed());

  q.send(1);
  EXPECT_TRUE(q.data_wait_ch().is_closed());
  EXPECT_EQ(q.get(), std::optional<int>(1));
  EXPECT_FALSE(q.data_wait_ch().is_closed());
}

TEST(awaitable_slice_concurrency, length_under_load) {
  parl::awaitable_slice<int> q;
  auto l = q.length();
  EXPECT_EQ(l.length, 0u);
  EXPECT_EQ(l.max_length, 0u);

  std::vector<std::thread> producers;
  for (int p = 0; p < PRODUCERS; ++p) {
    producers.emplace_back([&q, p]() { produce(q, p, PER_PRODUCER); });
  }
  int taken = 0;
  while (taken < PRODUCERS * PER_PRODUCER) {
    taken += static_cast<int>(q.get_slice().size());
  }
  for (auto& t : producers) {
    t.join();
  }

  l = q.length();
  EXPECT_EQ(l.length, 0u);
  EXPECT_GT(l.max_length, 0u);
  EXPECT_LE(l.max_length, static_cast<size_t>(PRODUCERS * PER_PRODUCER));
}
