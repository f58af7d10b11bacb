// Copyright (c) 2023-2026 Logan McDougall
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt)

// Several producer threads feed one awaitable_slice. One consumer thread
// drains it with seq() until the queue is closed and empty.
//
// Log levels can be set with the SPDLOG_LEVEL environment variable, for
// example SPDLOG_LEVEL=parl=debug.

#include "parl/awaitable_slice.hpp"
#include "parl/concepts.hpp"
#include "parl/log.hpp"
#include "parl/version.hpp"

#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>

#include <cstddef>
#include <cstdlib>
#include <string>
#include <thread>
#include <vector>

namespace {
struct reading {
  size_t source;
  size_t seq;
};

template <typename Sink>
  requires parl::closable_sink<Sink, reading>
void produce(Sink& Out, size_t Source, size_t Count) {
  std::vector<reading> batch;
  for (size_t i = 0; i < Count; ++i) {
    if (i % 8 == 7) {
      // Every eighth reading arrives as part of a batch
      batch.push_back(reading{Source, i});
      Out.send_slice(std::move(batch));
      batch = std::vector<reading>{};
    } else {
      Out.send(reading{Source, i});
    }
  }
  Out.send_slice(std::move(batch));
}

template <typename Source>
  requires parl::iterable_source<Source, reading>
std::vector<size_t> consume(Source& In, size_t Sources) {
  std::vector<size_t> perSource(Sources, 0);
  In.seq([&perSource](reading Value) {
    ++perSource[Value.source];
    return true;
  });
  return perSource;
}
} // namespace

int main(int argc, char** argv) {
  spdlog::cfg::load_env_levels();

  size_t sources = 4;
  size_t count = 100000;
  if (argc > 1) {
    sources = static_cast<size_t>(std::strtoul(argv[1], nullptr, 10));
  }
  if (argc > 2) {
    count = static_cast<size_t>(std::strtoul(argv[2], nullptr, 10));
  }
  if (sources == 0) {
    spdlog::error("usage: parl_fan_in [sources] [count]");
    return 1;
  }

  spdlog::info(
    "parl {}.{}.{}: {} sources of {} readings", PARL_VERSION_MAJOR,
    PARL_VERSION_MINOR, PARL_VERSION_PATCH, sources, count
  );

  parl::awaitable_slice<reading> q;
  std::vector<size_t> perSource;
  std::thread consumer(
    [&q, &perSource, sources]() { perSource = consume(q, sources); }
  );

  std::vector<std::thread> producers;
  for (size_t i = 0; i < sources; ++i) {
    producers.emplace_back([&q, i, count]() { produce(q, i, count); });
  }
  for (auto& t : producers) {
    t.join();
  }
  auto length = q.length();
  q.close();
  consumer.join();

  int rc = 0;
  for (size_t i = 0; i < sources; ++i) {
    if (perSource[i] != count) {
      spdlog::error("source {}: got {} of {}", i, perSource[i], count);
      rc = 1;
    }
  }
  spdlog::info(
    "queue {} drained, {} left at close, max length {}", q.to_string(),
    length.length, length.max_length
  );
  parl::logger()->flush();
  return rc;
}
