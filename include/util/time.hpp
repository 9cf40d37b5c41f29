// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace custody {
namespace util {

/**
 * Wall-clock time with a test override
 *
 * Timestamps recorded by the node (tenant open time, message receipt time)
 * go through these functions so tests can pin them. Response timeouts use
 * std::chrono::steady_clock directly and are never mocked.
 */

// Unix time in seconds; the mock value when one is set
int64_t GetTime();

// system_clock equivalent of GetTime() (sub-second precision when unmocked)
std::chrono::system_clock::time_point GetSystemTime();

// 0 disables the override
void SetMockTime(int64_t time);
int64_t GetMockTime();

// "2025-10-25T14:33:09Z"
std::string FormatISO8601(int64_t unix_time);

// Sets mock time for the lifetime of the scope
class MockTimeScope {
public:
  explicit MockTimeScope(int64_t time) : previous_time_(GetMockTime()) {
    SetMockTime(time);
  }
  ~MockTimeScope() { SetMockTime(previous_time_); }

  MockTimeScope(const MockTimeScope &) = delete;
  MockTimeScope &operator=(const MockTimeScope &) = delete;

private:
  const int64_t previous_time_;
};

} // namespace util
} // namespace custody
