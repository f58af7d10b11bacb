// Copyright (c) 2023-2026 Logan McDougall
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt)

#pragma once

// Capabilities of a queue, so that code can accept the narrowest interface it
// needs. parl::awaitable_slice satisfies all of them.

#include "parl/awaitable_ch.hpp"

#include <concepts>
#include <optional>
#include <span>
#include <utility>
#include <vector>

namespace parl {
/// Accepts values.
template <typename Q, typename T>
concept sink = requires(Q& Queue, T Value, std::vector<T> Values) {
  Queue.send(std::move(Value));
  Queue.send_slice(std::move(Values));
};

/// Accepts values and can be closed.
template <typename Q, typename T>
concept closable_sink = sink<Q, T> && requires(Q& Queue) { Queue.close(); };

/// Provides one value at a time, and a channel to wait for the next one.
template <typename Q, typename T>
concept source1 = requires(Q& Queue) {
  { Queue.get() } -> std::same_as<std::optional<T>>;
  { Queue.data_wait_ch() } -> std::same_as<awaitable_ch>;
};

/// Also provides values a slice at a time.
template <typename Q, typename T>
concept source = source1<Q, T> && requires(Q& Queue, std::span<T> Dest) {
  { Queue.get_slice() } -> std::same_as<std::vector<T>>;
  { Queue.read(Dest) };
};

/// A source that can hand over everything at once and signals its end.
template <typename Q, typename T>
concept closable_all_source = source<Q, T> && requires(Q& Queue) {
  { Queue.get_all() } -> std::same_as<std::vector<T>>;
  { Queue.get_slices() } -> std::same_as<std::vector<std::vector<T>>>;
  { Queue.close_ch() } -> std::same_as<awaitable_ch>;
  { Queue.is_closed() } -> std::same_as<bool>;
  Queue.close();
};

/// A source that can be iterated until it ends.
template <typename Q, typename T>
concept iterable_source = requires(Q& Queue, bool (*Yield)(T)) {
  Queue.seq(Yield);
  { Queue.await_value() } -> std::same_as<std::optional<T>>;
};
} // namespace parl
