// Copyright (c) 2023-2026 Logan McDougall
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "parl/atomic_max.hpp"
#include "parl/detail/compat.hpp"
#include "parl/detail/slice_list.hpp"
#include "parl/detail/value_slice.hpp"
#include "parl/log.hpp"

#include <algorithm>
#include <atomic>
#include <cassert>
#include <cstddef>
#include <mutex>
#include <span>
#include <utility>
#include <vector>

namespace parl {
namespace detail {
/// The producer side of an awaitable_slice.
///
/// Values are appended to `primary` while `list` is empty. Once primary cannot
/// take more, further slices go to `list`. If list is non-empty, primary is
/// non-empty. `cached_input` is an empty slice with capacity that is used
/// before allocating.
///
/// Everything except the atomics requires `lock` to be held.
template <typename T, typename Config> class input_queue {
  static inline constexpr size_t MaxAppendCapacity = Config::MaxAppendCapacity;

public:
  alignas(PARL_CACHE_LINE) std::mutex lock;

  // True if cached_input has capacity. Written behind lock.
  std::atomic<bool> has_input;
  // True if list is allocated. Written behind lock.
  std::atomic<bool> has_list;

  // Allocation size of new value slices. 0 until set_size().
  std::atomic<size_t> size;
  // Slices up to this capacity are reused. 0 until set_size().
  std::atomic<size_t> max_retain_size;
  // Small list backings and no speculative allocation.
  std::atomic<bool> is_low_alloc;
  // size * sizeof(T) fits in Config::TargetSliceBytes
  std::atomic<bool> size_max_4kib;

  // Length tracking. is_length is written behind both locks and never reset.
  std::atomic<bool> is_length;
  std::atomic<size_t> length;
  parl::atomic_max<size_t> max_length;

  std::vector<T> primary;
  std::vector<T> cached_input;
  slice_list<T> list;

  inline input_queue() noexcept
      : has_input(false), has_list(false), size(0), max_retain_size(0),
        is_low_alloc(false), size_max_4kib(false), is_length(false),
        length(0) {}

  /// Records Count new values if length is tracked.
  inline void add_length(size_t Count) {
    if (is_length.load(std::memory_order_relaxed)) {
      size_t l = length.fetch_add(Count, std::memory_order_relaxed) + Count;
      max_length.value(l);
    }
  }

  /// Returns an empty slice with the configured capacity.
  inline std::vector<T> make_value_slice() const {
    std::vector<T> slice;
    slice.reserve(size.load(std::memory_order_relaxed));
    return slice;
  }

  /// Returns an empty list backing sized for the configured mode.
  inline std::vector<std::vector<T>> make_slice_list_backing() const {
    size_t capacity = is_low_alloc.load(std::memory_order_relaxed)
                        ? Config::LowAllocListSize
                        : Config::SliceListSize;
    return slice_list<T>::make_backing(capacity);
  }

  /// Installs Slice as cached_input. Slice must be empty.
  inline void set_cached_input(std::vector<T>&& Slice) noexcept {
    assert(Slice.empty());
    cached_input = std::move(Slice);
    bool has = cached_input.capacity() != 0;
    if (has != has_input.load(std::memory_order_relaxed)) {
      has_input.store(has, std::memory_order_relaxed);
    }
  }

  /// Takes cached_input if it can hold Count values.
  inline bool take_cached_input(size_t Count, std::vector<T>& Slice_out) {
    if (!has_input.load(std::memory_order_relaxed) ||
        Count > cached_input.capacity()) {
      return false;
    }
    Slice_out = std::move(cached_input);
    cached_input = std::vector<T>{};
    has_input.store(false, std::memory_order_relaxed);
    return true;
  }

  /// Returns a new value slice holding Values, from cached_input if possible.
  inline std::vector<T> create_input_slice(std::span<T const> Values) {
    std::vector<T> slice;
    if (take_cached_input(Values.size(), slice)) {
      slice.insert(slice.end(), Values.begin(), Values.end());
      return slice;
    }
    return parl::detail::make_value_slice<T>(
      size.load(std::memory_order_relaxed), Values
    );
  }

  /// Returns a new value slice holding Value, from cached_input if possible.
  template <typename U> inline std::vector<T> create_input_slice_1(U&& Value) {
    std::vector<T> slice;
    if (!take_cached_input(1, slice)) {
      slice = make_value_slice();
    }
    slice.push_back(std::forward<U>(Value));
    return slice;
  }

  /// Returns a new slice holding Value, with the same capacity as a large
  /// slice that cannot grow any more.
  template <typename U>
  inline std::vector<T> create_large_slice(size_t Capacity, U&& Value) {
    std::vector<T> slice;
    slice.reserve(Capacity);
    slice.push_back(std::forward<U>(Value));
    return slice;
  }

  /// Appends Slice to list, allocating the list if needed.
  inline void enqueue_in_list(std::vector<T>&& Slice) {
    if (!list.is_allocated()) {
      auto backing = make_slice_list_backing();
      backing.push_back(std::move(Slice));
      list.set_list(std::move(backing));
      has_list.store(true, std::memory_order_relaxed);
      return;
    }
    list.enqueue(std::move(Slice));
  }

  /// Replaces the empty primary with Slice. The old primary is kept as
  /// cached_input if there is none and its capacity is worth keeping.
  inline void set_and_discard_primary(std::vector<T>&& Slice) {
    assert(primary.empty());
    size_t capacity = primary.capacity();
    if (capacity != 0 && cached_input.capacity() == 0 &&
        capacity <= max_retain_size.load(std::memory_order_relaxed)) {
      set_cached_input(std::move(primary));
    } else if (capacity > max_retain_size.load(std::memory_order_relaxed)) {
      parl::logger()->trace("releasing input slice of capacity {}", capacity);
    }
    primary = std::move(Slice);
  }

  /// Appends as much of Values to Slice as the capacity rules allow and
  /// removes the appended values from the front of Values.
  /// A slice below MaxAppendCapacity may be reallocated up to that size. A
  /// slice at or above it only receives values into its spare capacity.
  /// Returns true if Slice changed.
  inline bool
  append_to_value_slice(std::vector<T>& Slice, std::span<T const>& Values) {
    if (Slice.capacity() >= MaxAppendCapacity) {
      size_t room = Slice.capacity() - Slice.size();
      if (room == 0) {
        return false;
      }
      size_t n = std::min(room, Values.size());
      Slice.insert(Slice.end(), Values.begin(), Values.begin() + n);
      Values = Values.subspan(n);
      return true;
    }

    // The slice may grow, but appends stop at MaxAppendCapacity
    size_t n = std::min(MaxAppendCapacity - Slice.size(), Values.size());
    Slice.insert(Slice.end(), Values.begin(), Values.begin() + n);
    Values = Values.subspan(n);
    if (Values.empty()) {
      return true;
    }

    // Use any extra capacity from the reallocation
    size_t room = Slice.capacity() - Slice.size();
    n = std::min(room, Values.size());
    Slice.insert(Slice.end(), Values.begin(), Values.begin() + n);
    Values = Values.subspan(n);
    return true;
  }

  /// Enqueues a single value.
  template <typename U> void send(U&& Value) {
    add_length(1);

    if (primary.capacity() == 0) {
      primary = create_input_slice_1(std::forward<U>(Value));
      return;
    }

    // Append to primary while list is empty and primary may take it
    if (list.empty() && (primary.size() < primary.capacity() ||
                         primary.capacity() < MaxAppendCapacity)) {
      primary.push_back(std::forward<U>(Value));
      return;
    }

    std::vector<T>* last = list.last();
    if (last == nullptr) {
      // primary is full at or above MaxAppendCapacity
      if (primary.capacity() >= MaxAppendCapacity) {
        enqueue_in_list(
          create_large_slice(primary.capacity(), std::forward<U>(Value))
        );
      } else {
        enqueue_in_list(create_input_slice_1(std::forward<U>(Value)));
      }
      return;
    }

    size_t capacity = last->capacity();
    if (last->size() < capacity || capacity < MaxAppendCapacity) {
      last->push_back(std::forward<U>(Value));
      return;
    }
    list.enqueue(create_large_slice(capacity, std::forward<U>(Value)));
  }

  /// Enqueues Values by taking ownership. Values must not be empty.
  void send_slice(std::vector<T>&& Values) {
    add_length(Values.size());

    if (primary.empty()) {
      set_and_discard_primary(std::move(Values));
      return;
    }
    enqueue_in_list(std::move(Values));
  }

  /// Enqueues a copy of Values. Values must not be empty.
  void send_clone(std::span<T const> Values) {
    add_length(Values.size());

    if (primary.capacity() == 0) {
      primary = create_input_slice(Values);
      return;
    }

    if (list.empty()) {
      if (primary.size() + Values.size() <= primary.capacity()) {
        primary.insert(primary.end(), Values.begin(), Values.end());
        return;
      }
      if (append_to_value_slice(primary, Values) && Values.empty()) {
        return;
      }
    }

    std::vector<T>* last = list.last();
    if (last == nullptr) {
      enqueue_in_list(create_input_slice(Values));
      return;
    }

    if (last->size() + Values.size() <= last->capacity()) {
      last->insert(last->end(), Values.begin(), Values.end());
      return;
    }
    if (append_to_value_slice(*last, Values) && Values.empty()) {
      return;
    }
    list.enqueue(create_input_slice(Values));
  }

  /// Enqueues Slices by taking ownership. Slices must not be empty and must
  /// not contain empty slices.
  void send_slices(std::vector<std::vector<T>>&& Slices) {
    size_t count = 0;
    for (size_t i = 0; i < Slices.size(); ++i) {
      count += Slices[i].size();
    }
    add_length(count);

    size_t start = 0;
    if (primary.empty()) {
      set_and_discard_primary(std::move(Slices[0]));
      if (Slices.size() == 1) {
        return;
      }
      start = 1;
    }

    if (!list.is_allocated()) {
      // Slices becomes the list backing
      if (start != 0) {
        Slices.erase(Slices.begin());
      }
      list.set_list(std::move(Slices));
      has_list.store(true, std::memory_order_relaxed);
      return;
    }

    for (size_t i = start; i < Slices.size(); ++i) {
      list.enqueue(std::move(Slices[i]));
    }
  }

  /// Number of values on the input side.
  inline size_t element_count() const noexcept {
    return primary.size() + list.element_count();
  }
};
} // namespace detail
} // namespace parl
