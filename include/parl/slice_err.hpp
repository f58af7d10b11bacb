// Copyright (c) 2023-2026 Logan McDougall
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include <cstddef>

namespace parl {
struct slice_err {
  /// OK: the operation completed.
  /// CLOSED: write() after close() was invoked. Nothing was written.
  /// END: read() found the queue closed and drained. May accompany the last
  /// values read.
  enum value { OK = 0u, CLOSED = 1u, END = 2u };
};

/// The result of `awaitable_slice::read()` and `awaitable_slice::write()`.
struct io_result {
  /// The number of values transferred.
  size_t n;
  slice_err::value err;
};

inline char const* to_string(slice_err::value Err) noexcept {
  switch (Err) {
  case slice_err::OK:
    return "ok";
  case slice_err::CLOSED:
    return "closed";
  case slice_err::END:
    return "end of stream";
  }
  return "unknown";
}
} // namespace parl
