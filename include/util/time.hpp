// Copyright (c) 2025 The Palm developers
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace palm {
namespace util {

/**
 * Mockable wall clock
 *
 * Log entries are stamped through Now() so tests can pin timestamps:
 * - Production code calls Now() instead of system_clock::now()
 * - Tests call SetMockTime() (or use MockTimeScope) to freeze the clock
 * - Mock time 0 (default) means real time
 */

/**
 * Current wall-clock time; the mock time if one is set
 */
std::chrono::system_clock::time_point Now();

/**
 * Set mock time as a Unix timestamp in seconds (0 disables mocking)
 */
void SetMockTime(int64_t time);

/**
 * Current mock time setting, 0 if disabled
 */
int64_t GetMockTime();

/**
 * Format a time point in local time with millisecond precision
 *
 * Example: "2025-10-25 14:33:09.120"
 */
std::string FormatTimestamp(std::chrono::system_clock::time_point tp);

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
  MockTimeScope(MockTimeScope&&) = delete;
  MockTimeScope& operator=(MockTimeScope&&) = delete;

private:
  const int64_t previous_time_;
};

} // namespace util
} // namespace palm
