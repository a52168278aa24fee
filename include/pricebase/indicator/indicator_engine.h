/*
 * PriceBase
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#pragma once

#include "pricebase/config/engine_config.h"
#include "pricebase/storage/price_series_store.h"

#include <cstddef>
#include <optional>

namespace pricebase
{

enum class IndicatorStatus : uint8_t
{
  Ok,
  Insufficient
};

struct RollingAverage
{
  IndicatorStatus status{IndicatorStatus::Insufficient};
  Price average{};  // volume averages share the 8-digit scale
  Price current{};  // value of the reference bar when hasCurrent
  bool isAboveCurrent{false};
  bool isBelowCurrent{false};
  bool hasCurrent{false};
  size_t periodsUsed{0};

  bool sufficient() const noexcept { return status == IndicatorStatus::Ok; }
};

/// Rolling statistics over stored bars. Missing periods are skipped rather
/// than counted as zero; too little history yields Insufficient, never an
/// exception.
class IndicatorEngine
{
 public:
  explicit IndicatorEngine(const PriceSeriesStore& store, IndicatorConfig config = {});

  /// Simple moving average of `field` over the windowSize periods ending at
  /// the bucket containing referenceTs. isAboveCurrent / isBelowCurrent compare
  /// the average with that bucket's own value and are both false when the
  /// bucket has no bar. Throws InvalidArgumentError for a zero interval or
  /// window.
  RollingAverage rollingAverage(MarketId market, uint32_t intervalMinutes, TimePoint referenceTs,
                                BarField field, size_t windowSize) const;

  RollingAverage rollingAverage(MarketId market, uint32_t intervalMinutes, TimePoint referenceTs,
                                BarField field) const
  {
    return rollingAverage(market, intervalMinutes, referenceTs, field, _config.defaultWindow);
  }

  /// Value of `field` from the latest bar at or before `periodsAgo` intervals
  /// before ts, looking past gaps.
  std::optional<Price> priceAt(MarketId market, uint32_t intervalMinutes, TimePoint ts,
                               BarField field, size_t periodsAgo = 0) const;

  const IndicatorConfig& config() const { return _config; }

 private:
  const PriceSeriesStore& _store;
  IndicatorConfig _config;
};

}  // namespace pricebase
