/*
 * PriceBase
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#pragma once

#include "pricebase/storage/records.h"

#include <algorithm>
#include <span>
#include <vector>

namespace pricebase
{

/// Running OHLCV state of one bucket. Arrival order does not matter: open and
/// close follow the earliest and latest tick timestamps (ties keep the first
/// tick for open and the last one for close).
class BarAccumulator
{
 public:
  BarAccumulator(MarketId market, uint32_t intervalMinutes, TimePoint periodStart)
      : _bar(market, intervalMinutes, periodStart, Price{}, Volume{})
  {
  }

  void add(const PriceTick& tick) noexcept
  {
    if (_tickCount == 0)
    {
      _bar.open = _bar.high = _bar.low = _bar.close = tick.price;
      _bar.volume = tick.volume;
      _openTs = _closeTs = tick.timestamp;
      _tickCount = 1;
      return;
    }

    _bar.high = std::max(_bar.high, tick.price);
    _bar.low = std::min(_bar.low, tick.price);
    _bar.volume += tick.volume;

    if (tick.timestamp < _openTs)
    {
      _bar.open = tick.price;
      _openTs = tick.timestamp;
    }
    if (tick.timestamp >= _closeTs)
    {
      _bar.close = tick.price;
      _closeTs = tick.timestamp;
    }
    ++_tickCount;
  }

  const OhlcvBar& bar() const noexcept { return _bar; }
  size_t tickCount() const noexcept { return _tickCount; }
  bool empty() const noexcept { return _tickCount == 0; }

 private:
  OhlcvBar _bar;
  TimePoint _openTs{};
  TimePoint _closeTs{};
  size_t _tickCount{0};
};

/// Buckets `ticks` by floor(timestamp / interval) and returns one bar per
/// non-empty bucket, ordered by market then period start. Throws
/// InvalidArgumentError for a zero interval.
std::vector<OhlcvBar> aggregateTicks(std::span<const PriceTick> ticks, uint32_t intervalMinutes);

/// Merges finer bars into bars of targetMinutes: first open, last close,
/// extreme high/low, summed volume. Every input interval must divide
/// targetMinutes; otherwise InvalidArgumentError is thrown.
std::vector<OhlcvBar> rollupBars(std::span<const OhlcvBar> bars, uint32_t targetMinutes);

}  // namespace pricebase
