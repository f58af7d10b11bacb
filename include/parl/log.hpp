// Copyright (c) 2023-2026 Logan McDougall
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include <spdlog/logger.h>

#include <memory>

namespace parl {
/// Returns the logger used by parl.
///
/// If the application registered a spdlog logger named "parl" before the first
/// call, that logger is used. Otherwise a stderr color logger named "parl" is
/// created and registered. Its level follows the spdlog registry, so
/// `spdlog::cfg::load_env_levels()` and `spdlog::set_level()` apply to it.
///
/// parl only logs at debug and trace level, and never per value.
std::shared_ptr<spdlog::logger> const& logger();
} // namespace parl

#ifdef PARL_IMPL
#include "parl/detail/log.ipp"
#endif
