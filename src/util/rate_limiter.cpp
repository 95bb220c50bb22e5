// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/rate_limiter.hpp"

#include "util/time.hpp"

#include <algorithm>

namespace meshwire {
namespace util {

bool RateLimiter::should_log(const std::string& callsite_key, int tokens_per_period, std::chrono::seconds period) {
  if (tokens_per_period <= 0 || period.count() <= 0) {
    return false;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  const auto now = GetSteadyTime();
  const double capacity = static_cast<double>(tokens_per_period);

  auto [it, inserted] = buckets_.try_emplace(callsite_key);
  TokenBucket& bucket = it->second;
  if (inserted) {
    // New callsites start with a full burst
    bucket.tokens = capacity;
    bucket.last_refill = now;
  } else if (now > bucket.last_refill) {
    std::chrono::duration<double> elapsed = now - bucket.last_refill;
    bucket.tokens = std::min(capacity, bucket.tokens + elapsed.count() * capacity / static_cast<double>(period.count()));
    bucket.last_refill = now;
  }

  if (bucket.tokens < 1.0) {
    return false;
  }
  bucket.tokens -= 1.0;
  return true;
}

void RateLimiter::reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  buckets_.clear();
}

RateLimiter& RateLimiter::instance() {
  static RateLimiter instance;
  return instance;
}

}  // namespace util
}  // namespace meshwire
