/*
 * PriceBase
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace pricebase
{

using UnixNanos = int64_t;
using TimePoint = std::chrono::time_point<std::chrono::system_clock, std::chrono::nanoseconds>;

inline constexpr int64_t kNanosPerSecond = 1'000'000'000LL;
inline constexpr int64_t kNanosPerMinute = 60 * kNanosPerSecond;

inline TimePoint fromUnixNs(UnixNanos ns)
{
  return TimePoint(std::chrono::nanoseconds(ns));
}

inline UnixNanos toUnixNs(TimePoint tp)
{
  return tp.time_since_epoch().count();
}

inline TimePoint fromUnixSeconds(int64_t seconds)
{
  return TimePoint(std::chrono::seconds(seconds));
}

inline int64_t toUnixSeconds(TimePoint tp)
{
  return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

/// "YYYY-MM-DD HH:MM:SS+00" in UTC, sub-second part dropped.
std::string formatUtc(TimePoint tp);

/// Accepts Unix seconds ("1483228800") or "YYYY-MM-DD[ T]HH:MM:SS" with an
/// optional "+00", "+00:00" or "Z" suffix. Other offsets are rejected.
std::optional<TimePoint> parseUtc(std::string_view text);

}  // namespace pricebase
