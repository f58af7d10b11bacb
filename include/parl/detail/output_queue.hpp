// Copyright (c) 2023-2026 Logan McDougall
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "parl/detail/compat.hpp"
#include "parl/detail/has_data_bits.hpp"
#include "parl/detail/input_queue.hpp"
#include "parl/detail/slice_list.hpp"
#include "parl/detail/value_slice.hpp"
#include "parl/log.hpp"

#include <cassert>
#include <cstddef>
#include <mutex>
#include <optional>
#include <span>
#include <utility>
#include <vector>

namespace parl {
namespace detail {
/// What a consumer wants from a transfer of the input side.
struct get_action {
  enum value {
    // One value. The transferred primary is returned.
    VALUE,
    // One whole slice. The transferred primary is returned.
    SLICE,
    // Everything is moved to the output side and nothing is returned.
    // The caller empties the output side afterwards.
    NOTHING,
    // Up to MaxN values. Everything is moved to the output side.
    MAX
  };
};

/// The consumer side of an awaitable_slice. It owns the input side and the
/// transfer protocol that moves input data over while both locks are held.
///
/// `head` is consumed from index `head_off`. An empty head always has size 0,
/// so its capacity can be reused from the start.
///
/// Everything except `bits` and the atomics of `in` requires `lock` to be
/// held. `in` requires `in.lock`. The lock order is `lock` before `in.lock`.
template <typename T, typename Config> class output_queue {
public:
  alignas(PARL_CACHE_LINE) std::mutex lock;

  std::vector<T> head;
  size_t head_off;
  slice_list<T> list;
  // An empty slice with capacity, handed to the input side on transfer
  std::vector<T> cached_output;
  // The primary taken by the last transfer was larger than the configured
  // size. The next transfer does not pre-allocate a replacement.
  bool last_primary_large;

  has_data_bits bits;

  input_queue<T, Config> in;

  inline output_queue() noexcept : head_off(0), last_primary_large(false) {}

  PARL_FORCE_INLINE inline bool is_empty_head() const noexcept {
    return head_off == head.size();
  }

  inline size_t head_length() const noexcept { return head.size() - head_off; }

  inline bool is_empty_output() const noexcept {
    return is_empty_head() && list.empty();
  }

  /// Number of values on the output side.
  inline size_t element_count() const noexcept {
    return head_length() + list.element_count();
  }

  /// Keeps the empty head as cached_output if there is none and its capacity
  /// is worth keeping.
  inline void try_save_to_cached_output() noexcept {
    assert(is_empty_head());
    size_t capacity = head.capacity();
    if (cached_output.capacity() != 0 || capacity == 0 ||
        capacity > in.max_retain_size.load(std::memory_order_relaxed)) {
      return;
    }
    cached_output = std::move(head);
    head = std::vector<T>{};
    head_off = 0;
  }

  /// Empties the fully consumed head. Its capacity is kept for reuse unless
  /// it is larger than max_retain_size, in which case it is released.
  inline void reset_head() {
    size_t capacity = head.capacity();
    if (capacity > in.max_retain_size.load(std::memory_order_relaxed)) {
      head = std::vector<T>{};
      parl::logger()->trace("releasing output slice of capacity {}", capacity);
    } else {
      head.clear();
    }
    head_off = 0;
  }

  /// Removes the empty head so it can serve as the input's primary. A head
  /// larger than max_retain_size is released instead and an empty vector is
  /// returned.
  inline std::vector<T> take_reusable_head() noexcept {
    assert(is_empty_head());
    std::vector<T> slice;
    if (head.capacity() <= in.max_retain_size.load(std::memory_order_relaxed)) {
      slice = std::move(head);
    }
    head = std::vector<T>{};
    head_off = 0;
    return slice;
  }

  /// Replaces the empty head with Slice.
  inline void install_head(std::vector<T>&& Slice) noexcept {
    assert(is_empty_head());
    try_save_to_cached_output();
    head = std::move(Slice);
    head_off = 0;
  }

  /// Removes and returns the unconsumed part of head.
  inline std::vector<T> take_head() {
    if (head_off != 0) {
      head.erase(head.begin(), head.begin() + static_cast<std::ptrdiff_t>(head_off));
      head_off = 0;
    }
    std::vector<T> result = std::move(head);
    head = std::vector<T>{};
    return result;
  }

  /// Removes the first value of head, which must not be empty.
  inline T dequeue_from_head() {
    assert(!is_empty_head());
    T value = std::move(head[head_off]);
    zero_cell(head[head_off]);
    ++head_off;
    if (head_off == head.size()) {
      reset_head();
    }
    return value;
  }

  /// Moves all of head to the front of Dest, which must be large enough.
  inline void dequeue_head(std::span<T>& Dest, size_t& N) {
    move_to_span(head, head_off, Dest, N);
    reset_head();
  }

  /// Moves values from head, then the list, into Dest until Dest is full or
  /// the output side is empty. Returns true if Dest is full.
  inline bool dequeue_n_from_output(std::span<T>& Dest, size_t& N) {
    if (!is_empty_head()) {
      bool isDone = move_to_span(head, head_off, Dest, N);
      if (head_off == head.size()) {
        reset_head();
      }
      if (isDone) {
        return true;
      }
    }
    return list.dequeue_n(Dest, N);
  }

  /// Ensures the slices a transfer will need exist before the input lock is
  /// taken. Returns the slice that replaces the input's primary, if one was
  /// allocated. If OutputNonEmpty is false, the empty head is prepared to be
  /// that replacement instead.
  std::vector<T> pre_alloc(bool OutputNonEmpty) {
    std::vector<T> futurePrimary;
    // An empty head may become the new primary, so it must not be oversized
    if (is_empty_head() &&
        head.capacity() > in.max_retain_size.load(std::memory_order_relaxed)) {
      reset_head();
    }
    if (in.is_low_alloc.load(std::memory_order_relaxed)) {
      return futurePrimary;
    }

    if (!last_primary_large) {
      if (OutputNonEmpty) {
        futurePrimary = in.make_value_slice();
      } else {
        size_t capacity = head.capacity();
        if (capacity < Config::MinElements ||
            capacity > in.max_retain_size.load(std::memory_order_relaxed)) {
          head = in.make_value_slice();
          head_off = 0;
        }
      }
    }

    if (cached_output.capacity() == 0 &&
        in.size_max_4kib.load(std::memory_order_relaxed)) {
      cached_output = in.make_value_slice();
    }
    return futurePrimary;
  }

  /// Hands pre-allocated storage to the input side. Both locks are held.
  void transfer_cached(std::vector<std::vector<T>>&& FutureList) {
    if (!in.has_list.load(std::memory_order_relaxed) &&
        FutureList.capacity() != 0) {
      in.list.set_list(std::move(FutureList));
      in.has_list.store(true, std::memory_order_relaxed);
    }
    if (!in.has_input.load(std::memory_order_relaxed) &&
        cached_output.capacity() != 0) {
      std::vector<T> slice = std::move(cached_output);
      cached_output = std::vector<T>{};
      in.set_cached_input(std::move(slice));
    }
  }

  /// Takes the input lock and moves all input data to the output side.
  /// For VALUE and SLICE, the input's primary is returned instead of being
  /// stored. Output order is preserved: input data is placed after any
  /// output data.
  std::vector<T> empty_in_q(get_action::value Action) {
    bool outputNonEmpty = !is_empty_output();

    if (!list.is_allocated()) {
      bool needList = in.has_list.load(std::memory_order_relaxed);
      if (!needList && outputNonEmpty &&
          (Action == get_action::NOTHING || Action == get_action::MAX)) {
        needList = true;
      }
      if (needList) {
        list.set_list(in.make_slice_list_backing());
      }
    }

    std::vector<std::vector<T>> futureList;
    if (!in.has_list.load(std::memory_order_relaxed)) {
      futureList = in.make_slice_list_backing();
    }

    std::vector<T> futurePrimary = pre_alloc(outputNonEmpty);

    std::vector<T> result;
    size_t primaryCapacity = 0;
    size_t slicesMoved = 0;
    {
      std::scoped_lock<std::mutex> l{in.lock};

      // Both locks are held, so the bits can be stored directly
      bits.reset_to_has_data_bit();
      transfer_cached(std::move(futureList));

      std::vector<T> primary = std::move(in.primary);
      in.primary = std::vector<T>{};
      primaryCapacity = primary.capacity();
      bool setPrimary = true;

      switch (Action) {
      case get_action::VALUE:
      case get_action::SLICE:
        result = std::move(primary);
        break;
      case get_action::NOTHING:
      case get_action::MAX:
        if (outputNonEmpty) {
          list.enqueue(std::move(primary));
        } else {
          // The empty head becomes the new primary
          in.primary = take_reusable_head();
          head = std::move(primary);
          head_off = 0;
          setPrimary = false;
        }
        break;
      }

      if (setPrimary) {
        if (futurePrimary.capacity() == 0 && is_empty_head()) {
          futurePrimary = take_reusable_head();
        }
        in.primary = std::move(futurePrimary);
      }

      slicesMoved = in.list.size();
      if (slicesMoved != 0) {
        list.enqueue_all(in.list);
      }
    }

    last_primary_large =
      primaryCapacity > in.size.load(std::memory_order_relaxed);
    parl::logger()->trace(
      "transferred input primary of capacity {} and {} slices to output",
      primaryCapacity, slicesMoved
    );
    return result;
  }

  /// Moves all input data to the output side, then clears HAS_DATA unless
  /// values will remain after the caller consumes what Action asks for.
  /// MaxN is the number of values a MAX caller will consume.
  std::vector<T> transfer_to_out_q(get_action::value Action, size_t MaxN) {
    std::vector<T> slice;
    if (!bits.is_in_q_empty()) {
      slice = empty_in_q(Action);
    }

    switch (Action) {
    case get_action::VALUE:
      if (slice.size() > 1 || !is_empty_output()) {
        return slice;
      }
      break;
    case get_action::SLICE:
      if (!is_empty_output()) {
        return slice;
      }
      break;
    case get_action::NOTHING:
      break;
    case get_action::MAX:
      if (element_count() > MaxN) {
        return slice;
      }
      break;
    }

    bits.set_output_lock_empty();
    return slice;
  }

  /// Returns one value. HAS_DATA must have been observed set.
  /// CheckedQueue is set if the input side was examined, in which case the
  /// bits are already up to date.
  std::optional<T> get(bool& CheckedQueue) {
    if (is_empty_head() && !list.empty()) {
      install_head(list.dequeue());
    }
    if (!is_empty_head()) {
      return dequeue_from_head();
    }

    std::vector<T> slice = transfer_to_out_q(get_action::VALUE, 1);
    CheckedQueue = true;
    if (slice.empty()) {
      return std::nullopt;
    }
    install_head(std::move(slice));
    return dequeue_from_head();
  }

  /// Returns one non-empty slice, or an empty vector if there is no data.
  std::vector<T> get_slice(bool& CheckedQueue) {
    if (!is_empty_head()) {
      return take_head();
    }
    if (!list.empty()) {
      return list.dequeue();
    }
    std::vector<T> slice = transfer_to_out_q(get_action::SLICE, 0);
    CheckedQueue = true;
    return slice;
  }

  /// Returns all slices in queue order. Buffer, if it has capacity, is
  /// cleared and used for the result.
  std::vector<std::vector<T>> get_slices(std::vector<std::vector<T>>&& Buffer) {
    transfer_to_out_q(get_action::NOTHING, 0);

    std::vector<std::vector<T>> result = std::move(Buffer);
    result.clear();
    if (result.capacity() == 0 && is_empty_head()) {
      // The list backing is handed out and a new one is allocated next time
      return list.take_list();
    }
    if (!is_empty_head()) {
      result.push_back(take_head());
    }
    while (!list.empty()) {
      result.push_back(list.dequeue());
    }
    return result;
  }

  /// Returns all values as one slice.
  std::vector<T> get_all() {
    transfer_to_out_q(get_action::NOTHING, 0);

    if (list.empty()) {
      return take_head();
    }

    std::vector<T> values(element_count());
    std::span<T> dest(values);
    size_t n = 0;
    dequeue_head(dest, n);
    list.dequeue_all(dest);
    return values;
  }

  /// Moves up to Dest.size() values into Dest and adds the count to N.
  void read(std::span<T> Dest, size_t& N) {
    bool isDone = false;
    for (int i = 0; i < 2; ++i) {
      if (!isDone) {
        isDone = dequeue_n_from_output(Dest, N);
      }
      if (i != 0) {
        break;
      }
      if (isDone && !is_empty_output()) {
        // Data remains, so the bits need no update
        return;
      }
      transfer_to_out_q(get_action::MAX, Dest.size());
    }
  }
};
} // namespace detail
} // namespace parl
