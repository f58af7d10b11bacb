// Copyright (c) 2023-2026 Logan McDougall
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "parl/log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>

namespace parl {
std::shared_ptr<spdlog::logger> const& logger() {
  static std::shared_ptr<spdlog::logger> const instance = []() {
    auto existing = spdlog::get("parl");
    if (existing != nullptr) {
      return existing;
    }
    return spdlog::stderr_color_mt("parl");
  }();
  return instance;
}
} // namespace parl
