// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/time.hpp"

#include <atomic>

namespace meshwire {
namespace util {

// 0 means mock time is disabled
static std::atomic<int64_t> g_mock_time_ms{0};

std::chrono::steady_clock::time_point GetSteadyTime() {
  int64_t mock = g_mock_time_ms.load(std::memory_order_relaxed);
  if (mock != 0) {
    return std::chrono::steady_clock::time_point(std::chrono::milliseconds(mock));
  }
  return std::chrono::steady_clock::now();
}

void SetMockTime(int64_t time_ms) {
  g_mock_time_ms.store(time_ms, std::memory_order_relaxed);
}

int64_t GetMockTime() {
  return g_mock_time_ms.load(std::memory_order_relaxed);
}

void AdvanceMockTime(std::chrono::milliseconds delta) {
  int64_t current = g_mock_time_ms.load(std::memory_order_relaxed);
  while (current != 0 &&
         !g_mock_time_ms.compare_exchange_weak(current, current + delta.count(), std::memory_order_relaxed)) {
  }
}

}  // namespace util
}  // namespace meshwire
