/*
 * PriceBase
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#include "pricebase/storage/bar_validator.h"
#include "pricebase/error.h"
#include "pricebase/storage/partition.h"

namespace pricebase
{

std::optional<std::string> checkBar(const OhlcvBar& bar, TimePoint now)
{
  if (bar.market == InvalidMarketId)
  {
    return "bar has no market";
  }
  if (bar.intervalMinutes == 0)
  {
    return "bar interval must be positive";
  }
  if (!isAligned(bar.periodStart, bar.intervalMinutes))
  {
    return "period start " + formatUtc(bar.periodStart) + " is not aligned to " +
           std::to_string(bar.intervalMinutes) + " minutes";
  }
  if (bar.periodStart > now)
  {
    return "period start " + formatUtc(bar.periodStart) + " is in the future";
  }
  if (bar.low > bar.high)
  {
    return "low " + bar.low.toString() + " is above high " + bar.high.toString();
  }
  if (bar.open < bar.low || bar.open > bar.high)
  {
    return "open " + bar.open.toString() + " is outside [low, high]";
  }
  if (bar.close < bar.low || bar.close > bar.high)
  {
    return "close " + bar.close.toString() + " is outside [low, high]";
  }
  if (!bar.volume.isPositive())
  {
    return "volume " + bar.volume.toString() + " must be positive";
  }
  return std::nullopt;
}

std::optional<std::string> checkTick(const PriceTick& tick, TimePoint now)
{
  if (tick.market == InvalidMarketId)
  {
    return "tick has no market";
  }
  if (!tick.volume.isPositive())
  {
    return "tick volume " + tick.volume.toString() + " must be positive";
  }
  if (tick.timestamp > now)
  {
    return "tick timestamp " + formatUtc(tick.timestamp) + " is in the future";
  }
  return std::nullopt;
}

void validateBar(const OhlcvBar& bar, TimePoint now)
{
  if (auto violation = checkBar(bar, now))
  {
    throw InvalidBarError(*violation);
  }
}

void validateTick(const PriceTick& tick, TimePoint now)
{
  if (auto violation = checkTick(tick, now))
  {
    throw InvalidBarError(*violation);
  }
}

}  // namespace pricebase
