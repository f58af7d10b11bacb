// Copyright (c) 2023-2026 Logan McDougall
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "parl/detail/compat.hpp"
#include "parl/detail/value_slice.hpp"

#include <cassert>
#include <cstddef>
#include <span>
#include <utility>
#include <vector>

namespace parl {
namespace detail {
/// A FIFO of non-empty value slices. The resident slices are the window
/// [offset, slices.size()) of a backing vector. Dequeue advances the window
/// and leaves an empty vector in the vacated cell, so the backing never keeps
/// a dequeued slice alive. When the window becomes empty, it is reset to the
/// start of the backing.
/// Not thread-safe; the owning queue's lock protects it.
template <typename T> class slice_list {
  std::vector<std::vector<T>> slices;
  size_t offset;

  // Moves the resident window to the front of the backing.
  void compact() noexcept {
    if (offset == 0) {
      return;
    }
    size_t count = slices.size() - offset;
    for (size_t i = 0; i < count; ++i) {
      slices[i] = std::move(slices[offset + i]);
    }
    slices.resize(count);
    offset = 0;
  }

public:
  inline slice_list() noexcept : offset(0) {}

  PARL_FORCE_INLINE inline bool empty() const noexcept {
    return offset == slices.size();
  }

  /// Number of resident slices.
  inline size_t size() const noexcept { return slices.size() - offset; }

  /// Capacity of the backing. 0 means not allocated.
  inline size_t capacity() const noexcept { return slices.capacity(); }

  inline bool is_allocated() const noexcept { return slices.capacity() != 0; }

  /// Number of values in all resident slices.
  inline size_t element_count() const noexcept {
    size_t count = 0;
    for (size_t i = offset; i < slices.size(); ++i) {
      count += slices[i].size();
    }
    return count;
  }

  /// Allocates an empty backing with capacity Capacity.
  static inline std::vector<std::vector<T>> make_backing(size_t Capacity) {
    std::vector<std::vector<T>> backing;
    backing.reserve(Capacity);
    return backing;
  }

  /// Installs Backing, which may already contain non-empty slices.
  /// The list must be empty.
  inline void set_list(std::vector<std::vector<T>>&& Backing) noexcept {
    assert(empty());
    slices = std::move(Backing);
    offset = 0;
  }

  /// Removes the backing with all resident slices and returns the resident
  /// slices in order. The list becomes unallocated.
  inline std::vector<std::vector<T>> take_list() noexcept {
    compact();
    std::vector<std::vector<T>> result;
    result.swap(slices);
    return result;
  }

  /// Drops all resident slices. The backing is kept.
  inline void clear_list() noexcept {
    slices.clear();
    offset = 0;
  }

  /// Appends Slice, which must not be empty.
  inline void enqueue(std::vector<T>&& Slice) {
    assert(!Slice.empty());
    if (slices.size() == slices.capacity() && offset != 0) {
      // Reuse the vacated cells at the front instead of growing
      compact();
    }
    slices.push_back(std::move(Slice));
  }

  /// Moves all resident slices of Other to the end of this list. Other is
  /// left empty with its backing kept.
  inline void enqueue_all(slice_list& Other) {
    for (size_t i = Other.offset; i < Other.slices.size(); ++i) {
      enqueue(std::move(Other.slices[i]));
    }
    Other.clear_list();
  }

  /// Removes and returns the first slice. Returns an empty vector if the
  /// list is empty.
  inline std::vector<T> dequeue() noexcept {
    if (empty()) {
      return {};
    }
    std::vector<T> slice = std::move(slices[offset]);
    slices[offset] = std::vector<T>{};
    ++offset;
    if (offset == slices.size()) {
      slices.clear();
      offset = 0;
    }
    return slice;
  }

  /// Moves all values of all resident slices into Dest, which must be large
  /// enough. The list becomes empty. Returns the number of values moved.
  inline size_t dequeue_all(std::span<T> Dest) {
    size_t n = 0;
    for (size_t i = offset; i < slices.size(); ++i) {
      size_t off = 0;
      move_to_span(slices[i], off, Dest, n);
    }
    clear_list();
    return n;
  }

  /// Moves values into Dest until Dest is full or the list is empty. A
  /// partially consumed slice stays first in the list. Dest shrinks from the
  /// front and N is increased by the count. Returns true if Dest is full.
  inline bool dequeue_n(std::span<T>& Dest, size_t& N) {
    while (!empty()) {
      auto& first = slices[offset];
      size_t off = 0;
      bool isDone = move_to_span(first, off, Dest, N);
      if (off == first.size()) {
        (void)dequeue();
      } else {
        // Erase destroys the moved-from cells
        first.erase(
          first.begin(), first.begin() + static_cast<std::ptrdiff_t>(off)
        );
      }
      if (isDone) {
        return true;
      }
    }
    return Dest.empty();
  }

  /// Returns the last resident slice, or nullptr if the list is empty.
  inline std::vector<T>* last() noexcept {
    if (empty()) {
      return nullptr;
    }
    return &slices.back();
  }

  /// Calls Func(slice) for each resident slice in order.
  template <typename F> inline void for_each(F&& Func) const {
    for (size_t i = offset; i < slices.size(); ++i) {
      Func(slices[i]);
    }
  }
};
} // namespace detail
} // namespace parl
