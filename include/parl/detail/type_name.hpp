// Copyright (c) 2023-2026 Logan McDougall
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include <cstdlib>
#include <memory>
#include <string>
#include <typeinfo>

#if defined(__GNUG__)
#include <cxxabi.h>
#endif

namespace parl {
namespace detail {
/// Returns a readable name of T, demangled where the ABI allows it.
template <typename T> inline std::string type_name() {
  char const* mangled = typeid(T).name();
#if defined(__GNUG__)
  int status = 0;
  std::unique_ptr<char, void (*)(void*)> demangled(
    abi::__cxa_demangle(mangled, nullptr, nullptr, &status), std::free
  );
  if (status == 0 && demangled != nullptr) {
    return std::string(demangled.get());
  }
#endif
  return std::string(mangled);
}
} // namespace detail
} // namespace parl
