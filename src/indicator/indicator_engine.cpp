/*
 * PriceBase
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#include "pricebase/indicator/indicator_engine.h"
#include "pricebase/error.h"
#include "pricebase/storage/partition.h"

#include <limits>
#include <string>

namespace pricebase
{

namespace
{

// `periods` whole intervals before `ts`; throws when that leaves the representable range
TimePoint periodsBefore(TimePoint ts, uint32_t intervalMinutes, size_t periods)
{
  int64_t offsetNs = 0;
  int64_t resultNs = 0;
  if (periods > static_cast<size_t>(std::numeric_limits<int64_t>::max()) ||
      __builtin_mul_overflow(intervalNs(intervalMinutes), static_cast<int64_t>(periods),
                             &offsetNs) ||
      __builtin_sub_overflow(toUnixNs(ts), offsetNs, &resultNs))
  {
    throw InvalidArgumentError(std::to_string(periods) + " periods of " +
                               std::to_string(intervalMinutes) +
                               " minutes reach outside the time range");
  }
  return fromUnixNs(resultNs);
}

}  // namespace

IndicatorEngine::IndicatorEngine(const PriceSeriesStore& store, IndicatorConfig config)
    : _store(store), _config(config)
{
  if (_config.minPeriods == 0)
  {
    throw InvalidArgumentError("minimum period count must be positive");
  }
  if (_config.defaultWindow == 0)
  {
    throw InvalidArgumentError("default window must be positive");
  }
}

RollingAverage IndicatorEngine::rollingAverage(MarketId market, uint32_t intervalMinutes,
                                               TimePoint referenceTs, BarField field,
                                               size_t windowSize) const
{
  if (intervalMinutes == 0)
  {
    throw InvalidArgumentError("indicator interval must be positive");
  }
  if (windowSize == 0)
  {
    throw InvalidArgumentError("indicator window must be positive");
  }

  const TimePoint reference = alignToInterval(referenceTs, intervalMinutes);
  const TimePoint from = periodsBefore(reference, intervalMinutes, windowSize - 1);

  RollingAverage result;
  __int128 sum = 0;
  std::optional<int64_t> current;
  for (const auto& bar : _store.queryRange(market, intervalMinutes, from, reference))
  {
    const int64_t value = fieldRaw(bar, field);
    sum += value;
    ++result.periodsUsed;
    if (bar.periodStart == reference)
    {
      current = value;
    }
  }

  if (result.periodsUsed < _config.minPeriods)
  {
    return result;
  }

  result.status = IndicatorStatus::Ok;
  result.average = Price::fromRaw(
      detail::divRoundNearest(sum, static_cast<__int128>(result.periodsUsed)));

  if (current)
  {
    result.hasCurrent = true;
    result.current = Price::fromRaw(*current);
    result.isAboveCurrent = result.average.raw() > *current;
    result.isBelowCurrent = result.average.raw() < *current;
  }
  return result;
}

std::optional<Price> IndicatorEngine::priceAt(MarketId market, uint32_t intervalMinutes,
                                              TimePoint ts, BarField field,
                                              size_t periodsAgo) const
{
  auto bar = _store.latestBefore(market, intervalMinutes,
                                 periodsBefore(ts, intervalMinutes, periodsAgo));
  if (!bar)
  {
    return std::nullopt;
  }
  return Price::fromRaw(fieldRaw(*bar, field));
}

}  // namespace pricebase
