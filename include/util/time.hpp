// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <string>

namespace rdvp {
namespace util {

/**
 * Mockable wall clock
 *
 * Registration expiry is computed from GetTime(). Tests pin the clock with
 * SetMockTime() (or MockTimeScope) to step through TTLs without sleeping.
 */

/**
 * Current time as Unix timestamp (seconds since epoch)
 * Returns mock time if set, otherwise real system time
 */
int64_t GetTime();

/**
 * @param time Unix timestamp in seconds (0 to disable mocking)
 */
void SetMockTime(int64_t time);

// 0 if mock time is disabled
int64_t GetMockTime();

/**
 * Format a registration expiry for logs, relative to now:
 * "2025-10-25 14:33:09 UTC (7200s left)", or "... (expired)" once reached
 */
std::string FormatExpiry(int64_t expiry, int64_t now);

/**
 * RAII helper to set mock time and restore it when scope exits
 */
class MockTimeScope {
public:
  explicit MockTimeScope(int64_t time) : previous_time_(GetMockTime()) {
    SetMockTime(time);
  }

  ~MockTimeScope() { SetMockTime(previous_time_); }

  MockTimeScope(const MockTimeScope&) = delete;
  MockTimeScope& operator=(const MockTimeScope&) = delete;

private:
  const int64_t previous_time_;
};

} // namespace util
} // namespace rdvp
