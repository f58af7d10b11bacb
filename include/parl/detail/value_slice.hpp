// Copyright (c) 2023-2026 Logan McDougall
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt)

#pragma once

// Helpers for value slices: an owned std::vector<T> whose size() is the
// slice length and whose capacity() is reused across fills.

#include <algorithm>
#include <cstddef>
#include <span>
#include <type_traits>
#include <utility>
#include <vector>

namespace parl {
namespace detail {
/// Cells that were moved out of are reset to T{} if T may own memory.
/// Trivially destructible types cannot keep anything alive.
template <typename T>
inline constexpr bool zero_out_v = !std::is_trivially_destructible_v<T>;

template <typename T> inline void zero_cell(T& Cell) {
  if constexpr (zero_out_v<T>) {
    Cell = T{};
  }
}

/// Moves up to Dest.size() values from Src, starting at SrcOffset, into the
/// front of Dest. Advances SrcOffset, shrinks Dest from the front and adds the
/// count to N. Returns true if Dest is now full.
template <typename T>
inline bool move_to_span(
  std::vector<T>& Src, size_t& SrcOffset, std::span<T>& Dest, size_t& N
) {
  size_t count = std::min(Src.size() - SrcOffset, Dest.size());
  for (size_t i = 0; i < count; ++i) {
    Dest[i] = std::move(Src[SrcOffset + i]);
    zero_cell(Src[SrcOffset + i]);
  }
  SrcOffset += count;
  Dest = Dest.subspan(count);
  N += count;
  return Dest.empty();
}

/// Copies Values into a slice of length Values.size() and capacity at least
/// Capacity.
template <typename T>
inline std::vector<T> make_value_slice(size_t Capacity, std::span<T const> Values) {
  std::vector<T> slice;
  slice.reserve(std::max(Capacity, Values.size()));
  slice.insert(slice.end(), Values.begin(), Values.end());
  return slice;
}
} // namespace detail
} // namespace parl
