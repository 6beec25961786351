// Copyright (c) 2025 The Palm developers
// Distributed under the MIT software license

#include "util/time.hpp"
#include <atomic>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace palm {
namespace util {

// 0 means mock time is disabled
static std::atomic<int64_t> g_mock_time{0};

std::chrono::system_clock::time_point Now() {
  int64_t mock = g_mock_time.load(std::memory_order_relaxed);
  if (mock != 0) {
    return std::chrono::system_clock::time_point(std::chrono::seconds(mock));
  }
  return std::chrono::system_clock::now();
}

void SetMockTime(int64_t time) {
  g_mock_time.store(time, std::memory_order_relaxed);
}

int64_t GetMockTime() { return g_mock_time.load(std::memory_order_relaxed); }

std::string FormatTimestamp(std::chrono::system_clock::time_point tp) {
  std::time_t t = std::chrono::system_clock::to_time_t(tp);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                tp.time_since_epoch()) % 1000;

  std::tm tm_local;
#if defined(_WIN32)
  if (localtime_s(&tm_local, &t) != 0) {
    return "invalid";
  }
#else
  if (!localtime_r(&t, &tm_local)) {
    return "invalid";
  }
#endif

  std::ostringstream oss;
  oss << std::put_time(&tm_local, "%Y-%m-%d %H:%M:%S") << '.'
      << std::setw(3) << std::setfill('0') << ms.count();
  return oss.str();
}

} // namespace util
} // namespace palm
