/*
 * PriceBase
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#include "pricebase/aggregator/aggregate.h"
#include "pricebase/error.h"
#include "pricebase/storage/partition.h"

#include <map>
#include <string>
#include <utility>

namespace pricebase
{

std::vector<OhlcvBar> aggregateTicks(std::span<const PriceTick> ticks, uint32_t intervalMinutes)
{
  if (intervalMinutes == 0)
  {
    throw InvalidArgumentError("aggregation interval must be positive");
  }

  std::map<std::pair<MarketId, UnixNanos>, BarAccumulator> buckets;
  for (const auto& tick : ticks)
  {
    const TimePoint start = alignToInterval(tick.timestamp, intervalMinutes);
    auto [it, _] = buckets.try_emplace({tick.market, toUnixNs(start)}, tick.market,
                                       intervalMinutes, start);
    it->second.add(tick);
  }

  std::vector<OhlcvBar> bars;
  bars.reserve(buckets.size());
  for (const auto& [key, acc] : buckets)
  {
    bars.push_back(acc.bar());
  }
  return bars;
}

std::vector<OhlcvBar> rollupBars(std::span<const OhlcvBar> bars, uint32_t targetMinutes)
{
  if (targetMinutes == 0)
  {
    throw InvalidArgumentError("rollup interval must be positive");
  }

  struct Merge
  {
    OhlcvBar bar;
    TimePoint first;
    TimePoint last;
  };

  std::map<std::pair<MarketId, UnixNanos>, Merge> buckets;
  for (const auto& bar : bars)
  {
    if (bar.intervalMinutes == 0 || targetMinutes % bar.intervalMinutes != 0)
    {
      throw InvalidArgumentError("cannot roll " + std::to_string(bar.intervalMinutes) +
                                 "-minute bars into " + std::to_string(targetMinutes) +
                                 "-minute bars");
    }

    const TimePoint start = alignToInterval(bar.periodStart, targetMinutes);
    auto [it, inserted] =
        buckets.try_emplace({bar.market, toUnixNs(start)}, Merge{bar, bar.periodStart, bar.periodStart});
    Merge& merge = it->second;
    if (inserted)
    {
      merge.bar.intervalMinutes = targetMinutes;
      merge.bar.periodStart = start;
      continue;
    }

    merge.bar.high = std::max(merge.bar.high, bar.high);
    merge.bar.low = std::min(merge.bar.low, bar.low);
    merge.bar.volume += bar.volume;
    if (bar.periodStart < merge.first)
    {
      merge.bar.open = bar.open;
      merge.first = bar.periodStart;
    }
    if (bar.periodStart >= merge.last)
    {
      merge.bar.close = bar.close;
      merge.last = bar.periodStart;
    }
  }

  std::vector<OhlcvBar> result;
  result.reserve(buckets.size());
  for (const auto& [key, merge] : buckets)
  {
    result.push_back(merge.bar);
  }
  return result;
}

}  // namespace pricebase
