// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Per-callsite log throttling

#pragma once

#include <chrono>
#include <mutex>
#include <string>
#include <unordered_map>

namespace meshwire {
namespace util {

/**
 * RateLimiter - Token bucket keyed by log callsite
 *
 * Every package that reaches a node is remote input: a peer that floods
 * malformed frames, unknown topics or stale responses must not be able to
 * turn each one into a log line. Each callsite gets `tokens_per_period`
 * tokens which refill continuously over `period`.
 */
class RateLimiter {
public:
  // Returns true if the caller may log now, consuming one token.
  bool should_log(const std::string& callsite_key, int tokens_per_period, std::chrono::seconds period);

  // Drop all buckets (tests).
  void reset();

  static RateLimiter& instance();

private:
  struct TokenBucket {
    double tokens{0.0};
    std::chrono::steady_clock::time_point last_refill{};
  };

  std::mutex mutex_;
  std::unordered_map<std::string, TokenBucket> buckets_;
};

}  // namespace util
}  // namespace meshwire
