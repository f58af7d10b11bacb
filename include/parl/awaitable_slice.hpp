// Copyright (c) 2023-2026 Logan McDougall
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt)

#pragma once

// parl::awaitable_slice is an unbounded, closable, multi-producer
// multi-consumer queue. Producers never block. Consumers either poll with
// get() / read() or wait for data with data_wait_ch(), await_value(),
// co_await_value() or seq().
//
// Producers and consumers use separate locks. Consumers take the producer
// lock only briefly, to move everything the producers have queued over to
// the consumer side in one step.

#include "parl/awaitable.hpp"
#include "parl/awaitable_ch.hpp"
#include "parl/detail/lazy_cyclic.hpp"
#include "parl/detail/output_queue.hpp"
#include "parl/detail/signal.hpp"
#include "parl/detail/type_name.hpp"
#include "parl/detail/value_slice.hpp"
#include "parl/log.hpp"
#include "parl/slice_config.hpp"
#include "parl/slice_err.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <atomic>
#include <concepts>
#include <coroutine>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace parl {
/// Controls what `awaitable_slice::state()` collects.
struct slice_state_opt {
  enum value {
    // Sizes and flags only
    METRICS_ONLY,
    // Also a copy of every queued value
    VALUES
  };
};

struct slice_metrics {
  size_t length;
  size_t capacity;
};

/// The result of `awaitable_slice::length()`.
struct slice_length {
  /// The number of values in the queue.
  size_t length;
  /// The largest length observed since tracking was enabled.
  size_t max_length;
};

/// A snapshot of the internals of an awaitable_slice, for debugging.
template <typename T> struct awaitable_slice_state {
  size_t size;
  size_t max_retain_size;
  uint32_t has_data_bits;
  bool is_data_wait_active;
  bool is_data_wait_closed;
  bool is_close_invoked;
  bool is_closed;
  bool zero_out;
  bool is_low_alloc;
  bool is_length;

  slice_metrics primary;
  slice_metrics cached_input;
  slice_metrics in_list;
  slice_metrics head;
  slice_metrics cached_output;
  slice_metrics out_list;

  // One entry per slice in the input and output slice lists
  std::vector<slice_metrics> in_q;
  std::vector<slice_metrics> out_q;

  // Only filled for slice_state_opt::VALUES, in queue order
  std::vector<T> values;

  /// Multi-line rendering, for logging.
  std::string to_string() const {
    std::string out;
    auto it = std::back_inserter(out);
    fmt::format_to(
      it,
      "size: {} max_retain_size: {} bits: {:#x} zero_out: {} low_alloc: {} "
      "length: {}\n",
      size, max_retain_size, has_data_bits, zero_out, is_low_alloc, is_length
    );
    fmt::format_to(
      it, "data_wait: active: {} closed: {}\n", is_data_wait_active,
      is_data_wait_closed
    );
    fmt::format_to(
      it, "close: invoked: {} closed: {}\n", is_close_invoked, is_closed
    );
    fmt::format_to(
      it, "input: primary {}({}) cached {}({}) list {}({})", primary.length,
      primary.capacity, cached_input.length, cached_input.capacity,
      in_list.length, in_list.capacity
    );
    for (size_t i = 0; i < in_q.size(); ++i) {
      fmt::format_to(it, " {}({})", in_q[i].length, in_q[i].capacity);
    }
    fmt::format_to(
      it, "\noutput: head {}({}) cached {}({}) list {}({})", head.length,
      head.capacity, cached_output.length, cached_output.capacity,
      out_list.length, out_list.capacity
    );
    for (size_t i = 0; i < out_q.size(); ++i) {
      fmt::format_to(it, " {}({})", out_q[i].length, out_q[i].capacity);
    }
    if (!values.empty()) {
      fmt::format_to(it, "\nvalues: {}", values.size());
    }
    return out;
  }
};

template <typename T, typename Config> class aw_awaitable_slice_value;

/// An unbounded, awaitable, closable queue of T.
///
/// All methods are thread-safe. A default-constructed queue is ready to use.
/// Send methods keep working after close(); close() only controls when
/// close_ch() closes: once close() was invoked and the queue is empty.
///
/// Values leaving the queue are moved out, and the vacated cells are reset to
/// T{} if T is not trivially destructible, so the queue never keeps a
/// dequeued value alive.
template <typename T, typename Config = parl::slice_default_config>
class awaitable_slice {
  static_assert(
    std::is_nothrow_move_constructible_v<T>,
    "awaitable_slice values must be nothrow move constructible"
  );
  static_assert(
    std::default_initializable<T>,
    "awaitable_slice values must be default initializable"
  );

  friend class aw_awaitable_slice_value<T, Config>;

  parl::detail::output_queue<T, Config> out_q;
  parl::detail::lazy_cyclic data_wait;
  std::atomic<bool> is_close_invoked;
  // Closes once close() was invoked and the queue was observed empty
  parl::awaitable is_empty;

  // Holds the input lock. On exit, marks the queue as having data.
  class [[nodiscard]] input_section {
    awaitable_slice& parent;

  public:
    [[nodiscard]] inline input_section(awaitable_slice& Parent)
        : parent{Parent} {
      parent.ensure_size();
      parent.out_q.in.lock.lock();
    }
    inline ~input_section() {
      parent.out_q.bits.set_all_bits();
      parent.out_q.in.lock.unlock();
    }
  };

  // Holds the output lock. On exit, clears the data bits if a value was
  // taken without examining the input side and the output side is now empty.
  class [[nodiscard]] output_section {
    awaitable_slice& parent;

  public:
    bool got_value;
    bool checked_queue;
    // Values removed, for length tracking
    size_t taken;

    [[nodiscard]] inline output_section(awaitable_slice& Parent)
        : parent{Parent}, got_value(false), checked_queue(false), taken(0) {
      parent.ensure_size();
      parent.out_q.lock.lock();
    }
    inline ~output_section() {
      if (got_value && !checked_queue && parent.out_q.is_empty_output()) {
        parent.out_q.bits.set_output_lock_empty();
      }
      if (taken != 0 &&
          parent.out_q.in.is_length.load(std::memory_order_relaxed)) {
        parent.out_q.in.length.fetch_sub(taken, std::memory_order_relaxed);
      }
      parent.out_q.lock.unlock();
    }
  };

  inline void ensure_size() {
    if (out_q.in.max_retain_size.load(std::memory_order_acquire) == 0) {
      set_size(0);
    }
  }

  // Brings close_ch() and the data wait signal in line with the data bits.
  // Called after every operation that changed the queue, outside of the
  // queue locks.
  void update_wait() {
    if (is_close_invoked.load() && !is_empty.is_closed() &&
        !out_q.bits.has_data()) {
      if (is_empty.close()) {
        parl::logger()->debug(
          "awaitable_slice {} closed and drained", fmt::ptr(this)
        );
      }
    }

    if (!data_wait.is_active.load()) {
      return;
    }
    // Pairs with the fence after a transition below
    std::atomic_thread_fence(std::memory_order_seq_cst);
    if (out_q.bits.has_data() == data_wait.cyclic.is_closed()) {
      return;
    }

    // Waiters fire after the lock is released
    parl::detail::wake_list wakes;
    std::scoped_lock<std::mutex> l{data_wait.lock};
    // An operation that skipped the lock may have observed the state before
    // this transition, so re-check after each one
    while (true) {
      bool hasData = out_q.bits.has_data();
      if (hasData == data_wait.cyclic.is_closed()) {
        return;
      }
      if (hasData) {
        data_wait.cyclic.close(wakes);
      } else {
        data_wait.cyclic.open();
      }
      std::atomic_thread_fence(std::memory_order_seq_cst);
    }
  }

public:
  inline awaitable_slice() : is_close_invoked(false) {}

  /// Enqueues Value.
  void send(T Value) {
    {
      input_section section{*this};
      out_q.in.send(std::move(Value));
    }
    update_wait();
  }

  /// Enqueues Values, taking ownership of the vector. Does nothing if Values
  /// is empty.
  void send_slice(std::vector<T>&& Values) {
    if (Values.empty()) {
      return;
    }
    {
      input_section section{*this};
      out_q.in.send_slice(std::move(Values));
    }
    update_wait();
  }

  /// Enqueues a copy of Values. Does nothing if Values is empty.
  void send_clone(std::span<T const> Values) {
    if (Values.empty()) {
      return;
    }
    {
      input_section section{*this};
      out_q.in.send_clone(Values);
    }
    update_wait();
  }

  /// Enqueues each non-empty vector of Slices, taking ownership.
  void send_slices(std::vector<std::vector<T>>&& Slices) {
    Slices.erase(
      std::remove_if(
        Slices.begin(), Slices.end(),
        [](std::vector<T> const& Slice) { return Slice.empty(); }
      ),
      Slices.end()
    );
    if (Slices.empty()) {
      return;
    }
    {
      input_section section{*this};
      out_q.in.send_slices(std::move(Slices));
    }
    update_wait();
  }

  /// Enqueues a copy of Values unless close() was invoked.
  /// Returns {Values.size(), OK}, or {0, CLOSED} after close().
  io_result write(std::span<T const> Values) {
    if (is_close_invoked.load()) {
      parl::logger()->debug(
        "write of {} values to closed awaitable_slice {}", Values.size(),
        fmt::ptr(this)
      );
      return io_result{0, slice_err::CLOSED};
    }
    send_clone(Values);
    return io_result{Values.size(), slice_err::OK};
  }

  /// Removes and returns the first value, or std::nullopt if the queue is
  /// empty. Never blocks on an empty queue.
  std::optional<T> get() {
    if (!out_q.bits.has_data()) {
      return std::nullopt;
    }
    std::optional<T> result;
    {
      output_section section{*this};
      if (out_q.bits.has_data()) {
        result = out_q.get(section.checked_queue);
        if (result.has_value()) {
          section.got_value = true;
          section.taken = 1;
        }
      }
    }
    update_wait();
    return result;
  }

  /// Removes and returns a non-empty run of values from the front of the
  /// queue, usually one internal slice. Returns an empty vector if the queue
  /// is empty.
  std::vector<T> get_slice() {
    if (!out_q.bits.has_data()) {
      return {};
    }
    std::vector<T> result;
    {
      output_section section{*this};
      if (out_q.bits.has_data()) {
        section.got_value = true;
        result = out_q.get_slice(section.checked_queue);
        section.taken = result.size();
      }
    }
    update_wait();
    return result;
  }

  /// Removes all values and returns them as a list of non-empty slices in
  /// queue order. If Buffer has capacity, it is cleared and reused for the
  /// result.
  std::vector<std::vector<T>> get_slices(std::vector<std::vector<T>> Buffer = {}
  ) {
    if (!out_q.bits.has_data()) {
      Buffer.clear();
      return Buffer;
    }
    std::vector<std::vector<T>> result;
    {
      output_section section{*this};
      section.checked_queue = true;
      if (out_q.bits.has_data()) {
        result = out_q.get_slices(std::move(Buffer));
        for (size_t i = 0; i < result.size(); ++i) {
          section.taken += result[i].size();
        }
      }
    }
    update_wait();
    return result;
  }

  /// Removes all values and returns them as one slice.
  std::vector<T> get_all() {
    if (!out_q.bits.has_data()) {
      return {};
    }
    std::vector<T> result;
    {
      output_section section{*this};
      section.checked_queue = true;
      if (out_q.bits.has_data()) {
        result = out_q.get_all();
        section.taken = result.size();
      }
    }
    update_wait();
    return result;
  }

  /// Moves up to Dest.size() values into Dest. Never blocks.
  /// The error is END if close() was invoked and the queue is now empty. END
  /// may accompany the last values read.
  io_result read(std::span<T> Dest) {
    if (!out_q.bits.has_data()) {
      return io_result{
        0, is_close_invoked.load() ? slice_err::END : slice_err::OK
      };
    }
    if (Dest.empty()) {
      return io_result{0, slice_err::OK};
    }

    io_result result{0, slice_err::OK};
    {
      output_section section{*this};
      section.checked_queue = true;
      if (out_q.bits.has_data()) {
        out_q.read(Dest, result.n);
        section.taken = result.n;
      }
      if (!out_q.bits.has_data() && is_close_invoked.load()) {
        result.err = slice_err::END;
      }
    }
    update_wait();
    return result;
  }

  /// Calls Yield with each value until Yield returns false, or until the
  /// queue is closed and empty. Blocks the calling thread while the queue is
  /// empty.
  template <typename Yield> void seq(Yield&& Func) {
    awaitable_ch endCh;
    while (true) {
      std::optional<T> value = get();
      if (value.has_value()) {
        if (!Func(std::move(*value))) {
          return;
        }
        continue;
      }
      if (!endCh.valid()) {
        endCh = close_ch();
      }
      if (parl::wait_any(endCh, data_wait_ch()) == 0) {
        return;
      }
    }
  }

  /// Returns the next value, blocking the calling thread while the queue is
  /// empty. Returns std::nullopt once the queue is closed and empty.
  std::optional<T> await_value() {
    awaitable_ch endCh;
    while (true) {
      std::optional<T> value = get();
      if (value.has_value()) {
        return value;
      }
      if (!endCh.valid()) {
        endCh = close_ch();
      }
      if (parl::wait_any(endCh, data_wait_ch()) == 0) {
        return std::nullopt;
      }
    }
  }

  /// The coroutine form of await_value(). `co_await` produces the next value,
  /// or std::nullopt once the queue is closed and empty.
  /// The awaiting coroutine is resumed on the thread that provided the data
  /// or closed the queue.
  inline aw_awaitable_slice_value<T, Config> co_await_value() {
    return aw_awaitable_slice_value<T, Config>(*this);
  }

  /// Returns a channel that closes while the queue has data. Each call may
  /// return a different channel: once a channel has closed, it stays closed,
  /// and the next call after the queue became empty returns a fresh open one.
  awaitable_ch data_wait_ch() {
    if (data_wait.activate()) {
      update_wait();
    }
    return data_wait.cyclic.ch();
  }

  /// Returns the channel that closes once close() was invoked and the queue
  /// is empty. Always the same channel.
  inline awaitable_ch close_ch() const noexcept { return is_empty.ch(); }

  /// Marks the queue closed. Idempotent.
  void close() {
    if (is_close_invoked.load()) {
      return;
    }
    bool expected = false;
    if (!is_close_invoked.compare_exchange_strong(expected, true)) {
      return;
    }
    parl::logger()->debug("awaitable_slice {} close invoked", fmt::ptr(this));
    if (!out_q.bits.has_data()) {
      if (is_empty.close()) {
        parl::logger()->debug(
          "awaitable_slice {} closed and drained", fmt::ptr(this)
        );
      }
    }
  }

  /// Returns true once close() was invoked and the queue was observed empty.
  inline bool is_closed() const noexcept {
    return is_close_invoked.load() && is_empty.is_closed();
  }

  /// Sets the capacity of newly allocated value slices.
  /// Size < 1 selects the default: TargetSliceBytes / sizeof(T), but at least
  /// MinElements. For low-alloc types, the default is MinElements.
  void set_size(std::ptrdiff_t Size) {
    size_t size;
    bool lowAlloc = parl::low_alloc_type_v<T>;
    if (Size < 1) {
      if constexpr (parl::low_alloc_type_v<T>) {
        size = Config::MinElements;
      } else {
        size = std::max(Config::TargetSliceBytes / sizeof(T), Config::MinElements);
      }
    } else {
      size = static_cast<size_t>(Size);
      if (size <= Config::MinElements) {
        lowAlloc = true;
      }
    }

    auto& in = out_q.in;
    in.size.store(size, std::memory_order_relaxed);
    in.is_low_alloc.store(lowAlloc, std::memory_order_relaxed);
    in.size_max_4kib.store(
      size * sizeof(T) <= Config::TargetSliceBytes, std::memory_order_relaxed
    );
    // Written last: a non-zero value marks the queue as configured
    in.max_retain_size.store(
      std::max(size, Config::MaxForPrealloc), std::memory_order_release
    );
    parl::logger()->debug(
      "awaitable_slice {} size {} low_alloc {}", fmt::ptr(this), size, lowAlloc
    );
  }

  /// Returns the current and the maximum length. The first call enables
  /// length tracking, which then stays on for the lifetime of the queue.
  slice_length length() {
    ensure_size();
    std::scoped_lock<std::mutex> outLock{out_q.lock};
    std::scoped_lock<std::mutex> inLock{out_q.in.lock};
    auto& in = out_q.in;
    if (!in.is_length.load(std::memory_order_relaxed)) {
      size_t count = out_q.element_count() + in.element_count();
      in.length.store(count, std::memory_order_relaxed);
      in.max_length.value(count);
      in.is_length.store(true, std::memory_order_relaxed);
    }
    return slice_length{
      in.length.load(std::memory_order_relaxed), in.max_length.load()
    };
  }

  /// Returns a snapshot of the internal state, taken under both locks.
  /// With slice_state_opt::VALUES and a copyable T, all queued values are
  /// copied as well.
  awaitable_slice_state<T>
  state(slice_state_opt::value Opt = slice_state_opt::METRICS_ONLY) {
    std::scoped_lock<std::mutex> outLock{out_q.lock};
    std::scoped_lock<std::mutex> inLock{out_q.in.lock};
    auto& in = out_q.in;

    awaitable_slice_state<T> st{};
    st.size = in.size.load(std::memory_order_relaxed);
    st.max_retain_size = in.max_retain_size.load(std::memory_order_relaxed);
    st.has_data_bits = out_q.bits.load();
    st.is_data_wait_active = data_wait.is_active.load();
    if (st.is_data_wait_active) {
      st.is_data_wait_closed = data_wait.cyclic.is_closed();
    }
    st.is_close_invoked = is_close_invoked.load();
    if (st.is_close_invoked) {
      st.is_closed = is_empty.is_closed();
    }
    st.zero_out = parl::detail::zero_out_v<T>;
    st.is_low_alloc = in.is_low_alloc.load(std::memory_order_relaxed);
    st.is_length = in.is_length.load(std::memory_order_relaxed);

    st.primary = slice_metrics{in.primary.size(), in.primary.capacity()};
    st.cached_input =
      slice_metrics{in.cached_input.size(), in.cached_input.capacity()};
    st.in_list = slice_metrics{in.list.size(), in.list.capacity()};
    st.head = slice_metrics{out_q.head_length(), out_q.head.capacity()};
    st.cached_output =
      slice_metrics{out_q.cached_output.size(), out_q.cached_output.capacity()};
    st.out_list = slice_metrics{out_q.list.size(), out_q.list.capacity()};

    auto collectMetrics = [](std::vector<slice_metrics>& Out) {
      return [&Out](std::vector<T> const& Slice) {
        Out.push_back(slice_metrics{Slice.size(), Slice.capacity()});
      };
    };
    in.list.for_each(collectMetrics(st.in_q));
    out_q.list.for_each(collectMetrics(st.out_q));

    if constexpr (std::is_copy_constructible_v<T>) {
      if (Opt == slice_state_opt::VALUES) {
        auto& values = st.values;
        values.reserve(out_q.element_count() + in.element_count());
        values.insert(
          values.end(),
          out_q.head.begin() + static_cast<std::ptrdiff_t>(out_q.head_off),
          out_q.head.end()
        );
        auto copyValues = [&values](std::vector<T> const& Slice) {
          values.insert(values.end(), Slice.begin(), Slice.end());
        };
        out_q.list.for_each(copyValues);
        copyValues(in.primary);
        in.list.for_each(copyValues);
      }
    }
    return st;
  }

  /// Returns "awaitableSlice:<T>_state:<state>_0x<address>" where state is
  /// one of uninit, data, empty, drain or closed. Takes no lock.
  std::string to_string() const {
    char const* st;
    if (out_q.in.size.load(std::memory_order_relaxed) == 0) {
      st = "uninit";
    } else if (!is_close_invoked.load()) {
      st = out_q.bits.has_data() ? "data" : "empty";
    } else if (is_empty.is_closed()) {
      st = "closed";
    } else {
      st = "drain";
    }
    return fmt::format(
      "awaitableSlice:{}_state:{}_{:#x}", parl::detail::type_name<T>(), st,
      reinterpret_cast<std::uintptr_t>(this)
    );
  }

  awaitable_slice(awaitable_slice const&) = delete;
  awaitable_slice& operator=(awaitable_slice const&) = delete;
  awaitable_slice(awaitable_slice&&) = delete;
  awaitable_slice& operator=(awaitable_slice&&) = delete;
};

/// The awaitable type returned by `awaitable_slice::co_await_value()`.
/// `co_await` produces std::optional<T>.
///
/// While suspended, one waiter is registered on both close_ch() and the
/// current data wait channel. When either fires, the firing thread retries
/// get() on behalf of the coroutine and re-registers if another consumer got
/// there first. The coroutine is resumed only with a value, or once the queue
/// is closed and empty.
template <typename T, typename Config>
class [[nodiscard(
  "You must co_await aw_awaitable_slice_value for it to have any effect."
)]] aw_awaitable_slice_value {
  awaitable_slice<T, Config>& parent;
  std::optional<T> result;
  std::coroutine_handle<> outer;
  std::shared_ptr<parl::detail::waiter> me;
  awaitable_ch end_ch;
  awaitable_ch data_ch;

  friend class awaitable_slice<T, Config>;

  inline aw_awaitable_slice_value(awaitable_slice<T, Config>& Parent) noexcept
      : parent(Parent) {}

  inline void unregister() noexcept {
    if (me == nullptr) {
      return;
    }
    if (end_ch.valid()) {
      end_ch.remove_waiter(me.get());
    }
    if (data_ch.valid()) {
      data_ch.remove_waiter(me.get());
    }
  }

  // Gets a value or registers a fresh waiter. Returns true if the coroutine
  // must stay suspended until the waiter fires.
  bool park() {
    while (true) {
      result = parent.get();
      if (result.has_value()) {
        return false;
      }
      end_ch = parent.close_ch();
      if (end_ch.is_closed()) {
        return false;
      }
      data_ch = parent.data_wait_ch();

      me = std::make_shared<parl::detail::waiter>();
      me->on_fire = &on_fire;
      me->context = this;
      if (!end_ch.add_waiter(me)) {
        return false;
      }
      if (!data_ch.add_waiter(me)) {
        // Data arrived in the meantime
        unregister();
        continue;
      }
      if (me->arm()) {
        return true;
      }
      // Fired while registering
      unregister();
      if (end_ch.is_closed()) {
        return false;
      }
    }
  }

  static void on_fire(void* Context) noexcept {
    auto* self = static_cast<aw_awaitable_slice_value*>(Context);
    self->unregister();
    if (!self->park()) {
      self->outer.resume();
    }
  }

public:
  inline bool await_ready() {
    result = parent.get();
    return result.has_value() || parent.close_ch().is_closed();
  }

  inline bool await_suspend(std::coroutine_handle<> Outer) {
    outer = Outer;
    return park();
  }

  inline std::optional<T> await_resume() noexcept { return std::move(result); }

  inline ~aw_awaitable_slice_value() { unregister(); }

  // Cannot be moved or copied; the waiter refers to this object
  aw_awaitable_slice_value(aw_awaitable_slice_value const&) = delete;
  aw_awaitable_slice_value& operator=(aw_awaitable_slice_value const&) = delete;
  aw_awaitable_slice_value(aw_awaitable_slice_value&&) = delete;
  aw_awaitable_slice_value& operator=(aw_awaitable_slice_value&&) = delete;
};
} // namespace parl
