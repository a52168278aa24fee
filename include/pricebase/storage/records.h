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

#include <cstdint>

namespace pricebase
{

/// One executed trade. Append-only input to aggregation.
struct PriceTick
{
  MarketId market{InvalidMarketId};
  TimePoint timestamp{};
  Price price{};
  Volume volume{};

  bool operator==(const PriceTick&) const = default;
};

/// OHLCV summary of one fixed-length bucket.
/// Primary key: (market, intervalMinutes, periodStart).
struct OhlcvBar
{
  MarketId market{InvalidMarketId};
  uint32_t intervalMinutes{0};
  TimePoint periodStart{};  // inclusive start of the bucket
  Price open{};
  Price high{};
  Price low{};
  Price close{};
  Volume volume{};

  OhlcvBar() = default;

  OhlcvBar(MarketId m, uint32_t interval, TimePoint start, Price price, Volume vol)
      : market(m),
        intervalMinutes(interval),
        periodStart(start),
        open(price),
        high(price),
        low(price),
        close(price),
        volume(vol)
  {
  }

  bool sameKey(const OhlcvBar& other) const noexcept
  {
    return market == other.market && intervalMinutes == other.intervalMinutes &&
           periodStart == other.periodStart;
  }

  bool samePayload(const OhlcvBar& other) const noexcept
  {
    return open == other.open && high == other.high && low == other.low &&
           close == other.close && volume == other.volume;
  }

  bool operator==(const OhlcvBar& other) const noexcept
  {
    return sameKey(other) && samePayload(other);
  }
};

enum class BarField : uint8_t
{
  Open,
  High,
  Low,
  Close,
  Volume
};

/// Raw fixed-point value of `field` (all fields share the 8-digit scale).
inline int64_t fieldRaw(const OhlcvBar& bar, BarField field) noexcept
{
  switch (field)
  {
    case BarField::Open:
      return bar.open.raw();
    case BarField::High:
      return bar.high.raw();
    case BarField::Low:
      return bar.low.raw();
    case BarField::Close:
      return bar.close.raw();
    case BarField::Volume:
      return bar.volume.raw();
  }
  return 0;
}

}  // namespace pricebase
