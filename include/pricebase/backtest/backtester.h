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
#include "pricebase/indicator/indicator_engine.h"
#include "pricebase/market/market_registry.h"
#include "pricebase/storage/price_series_store.h"

#include <optional>
#include <vector>

namespace pricebase
{

struct BacktestConfig
{
  MarketId market{InvalidMarketId};
  uint32_t intervalMinutes{1};
  size_t windowSize{config::DEFAULT_WINDOW_SIZE};
  BarField field{BarField::Close};
  Amount initialBalance{Amount::fromInt(1)};
  Amount stake{};  ///< base currency per entry; zero commits the whole balance
};

struct BacktestStep
{
  TimePoint time{};
  std::optional<Price> average;  // nullopt when history was insufficient
  bool bought{false};
  bool sold{false};
  Amount equity{};  // balance plus the open position marked at the last close
};

struct BacktestSummary
{
  size_t steps{0};
  size_t insufficientSteps{0};
  size_t trades{0};  // closed sessions
  Amount realizedPnl{};
  Amount initialEquity{};
  Amount finalEquity{};
  bool positionOpen{false};
  bool marketRetired{false};  // replayed history of a deactivated market

  UnixNanos startTimeNs{0};
  UnixNanos endTimeNs{0};
};

struct BacktestReport
{
  std::vector<BacktestStep> steps;
  BacktestSummary summary;
};

/**
 * Moving-average reversion replay over stored bars.
 *
 * Steps through [start, end) one interval at a time on a simulated clock.
 * With no position open and the average above the current bar it buys the
 * stake; with a position open and the average below the current bar it
 * sells everything. Missing history only skips the step. Retired markets are
 * replayed like active ones.
 */
class Backtester
{
 public:
  Backtester(const PriceSeriesStore& store, const MarketRegistry& registry,
             IndicatorConfig indicatorConfig = {});

  /// Throws NotFoundError for unknown markets and InvalidArgumentError for
  /// an empty time range, a zero interval or a non-positive balance.
  BacktestReport run(const BacktestConfig& config, TimePoint start, TimePoint end) const;

 private:
  const PriceSeriesStore& _store;
  const MarketRegistry& _registry;
  IndicatorConfig _indicatorConfig;
};

}  // namespace pricebase
