/*
 * PriceBase
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#pragma once

#include "pricebase/common.h"
#include "pricebase/market/market.h"

#include <compare>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace pricebase
{

/// Interval value reserved for the raw tick partition of a market.
inline constexpr uint32_t kTickInterval = 0;

/// One storage unit: all bars of one market at one interval, or the ticks of
/// one market when intervalMinutes == kTickInterval.
struct PartitionKey
{
  MarketId market{InvalidMarketId};
  uint32_t intervalMinutes{0};

  constexpr bool isTick() const noexcept { return intervalMinutes == kTickInterval; }

  constexpr auto operator<=>(const PartitionKey&) const = default;
};

inline constexpr int64_t intervalNs(uint32_t intervalMinutes) noexcept
{
  return static_cast<int64_t>(intervalMinutes) * kNanosPerMinute;
}

/// floor(ts / interval) * interval, rounding toward negative infinity.
TimePoint alignToInterval(TimePoint ts, uint32_t intervalMinutes) noexcept;

inline bool isAligned(TimePoint ts, uint32_t intervalMinutes) noexcept
{
  return alignToInterval(ts, intervalMinutes) == ts;
}

/// "PriceData_<exchange>_<base>_<quote>_<N>mins" or "PriceData_<...>_tick".
std::string partitionName(const Market& market, uint32_t intervalMinutes);

struct ParsedPartitionName
{
  std::string exchange;
  std::string base;
  std::string quote;
  uint32_t intervalMinutes{0};
};

/// Returns nullopt for names without the "PriceData_" prefix. Throws
/// InvalidArgumentError when the prefix is present but the rest is malformed.
std::optional<ParsedPartitionName> parsePartitionName(std::string_view name);

}  // namespace pricebase

template <>
struct std::hash<pricebase::PartitionKey>
{
  std::size_t operator()(const pricebase::PartitionKey& key) const noexcept
  {
    std::size_t h1 = std::hash<uint32_t>{}(key.market);
    std::size_t h2 = std::hash<uint32_t>{}(key.intervalMinutes);
    return h1 ^ (h2 << 1);
  }
};
