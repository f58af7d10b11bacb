// Copyright (c) 2023-2026 Logan McDougall
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "parl/detail/compat.hpp"

#include <atomic>
#include <cstdint>

namespace parl {
namespace detail {
/// Two facts about an awaitable_slice packed into one atomic word so that they
/// can be reconciled between the input lock and the output lock:
///
/// HAS_DATA: the queue holds at least one value somewhere.
/// IN_Q_HAS_DATA: the input side holds at least one value.
///
/// Transitions and the locks they require:
/// - set_all_bits(): producer, input lock held.
/// - reset_to_has_data_bit(): consumer, output lock and input lock held. Plain
///   store because no producer can run.
/// - set_output_lock_empty(): consumer, output lock held. Clears HAS_DATA only
///   if IN_Q_HAS_DATA is still clear.
/// - has_data() and is_in_q_empty() may be read without any lock.
class has_data_bits {
  std::atomic<uint32_t> bits;

public:
  static inline constexpr uint32_t NO_BITS = 0;
  static inline constexpr uint32_t HAS_DATA = 1;
  static inline constexpr uint32_t IN_Q_HAS_DATA = 2;
  static inline constexpr uint32_t ALL_BITS = HAS_DATA | IN_Q_HAS_DATA;

  inline has_data_bits() noexcept : bits(NO_BITS) {}

  PARL_FORCE_INLINE inline bool has_data() const noexcept {
    return (bits.load(std::memory_order_seq_cst) & HAS_DATA) != 0;
  }

  PARL_FORCE_INLINE inline bool is_in_q_empty() const noexcept {
    return (bits.load(std::memory_order_seq_cst) & IN_Q_HAS_DATA) == 0;
  }

  /// Values were added to the input side.
  inline void set_all_bits() noexcept {
    bits.fetch_or(ALL_BITS, std::memory_order_seq_cst);
  }

  /// All input-side values were moved to the output side.
  inline void reset_to_has_data_bit() noexcept {
    bits.store(HAS_DATA, std::memory_order_seq_cst);
  }

  /// The output side is about to be empty. Clears HAS_DATA unless a producer
  /// has set IN_Q_HAS_DATA since the last transfer.
  /// Returns true if the queue is now marked empty.
  inline bool set_output_lock_empty() noexcept {
    uint32_t old = bits.load(std::memory_order_seq_cst);
    while (true) {
      if ((old & IN_Q_HAS_DATA) != 0) {
        return false;
      }
      // On failure, old is updated to the current bits
      if (bits.compare_exchange_weak(
            old, NO_BITS, std::memory_order_seq_cst, std::memory_order_seq_cst
          )) {
        return true;
      }
    }
  }

  /// Returns the raw bits.
  inline uint32_t load() const noexcept {
    return bits.load(std::memory_order_seq_cst);
  }
};
} // namespace detail
} // namespace parl
