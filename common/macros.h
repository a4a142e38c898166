#pragma once

#include <iostream>
#include <string>

// Branch prediction hint
#define UNLIKELY(x) __builtin_expect(!!(x), 0)

// Cache line alignment for contended atomics
#define CACHE_LINE_SIZE 64

// Programming invariants only. Recoverable conditions return error codes.
inline auto ASSERT(bool cond, const std::string &msg) noexcept {
  if (UNLIKELY(!cond)) {
    std::cerr << "ASSERT : " << msg << std::endl;
    __builtin_trap();
  }
}
