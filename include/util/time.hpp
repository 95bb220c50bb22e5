// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <cstdint>

namespace meshwire {
namespace util {

// Steady clock that can be frozen for deterministic tests.
// While mock time is set (non-zero milliseconds), GetSteadyTime() returns it
// verbatim instead of the real clock. Callers must only move it forward.
std::chrono::steady_clock::time_point GetSteadyTime();

// Set mock steady time in milliseconds since the clock epoch (0 = disabled).
void SetMockTime(int64_t time_ms);

int64_t GetMockTime();

// Advance mock time by the given amount. No-op while mock time is disabled.
void AdvanceMockTime(std::chrono::milliseconds delta);

// RAII helper: enables mock time for the lifetime of the scope and restores
// the previous value on exit.
class MockTimeScope {
public:
  explicit MockTimeScope(int64_t time_ms) : previous_(GetMockTime()) { SetMockTime(time_ms); }
  ~MockTimeScope() { SetMockTime(previous_); }

  MockTimeScope(const MockTimeScope&) = delete;
  MockTimeScope& operator=(const MockTimeScope&) = delete;

private:
  int64_t previous_;
};

}  // namespace util
}  // namespace meshwire
