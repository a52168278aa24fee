/*
 * PriceBase
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#include "pricebase/backtest/backtester.h"
#include "pricebase/clock/simulated_clock.h"
#include "pricebase/error.h"
#include "pricebase/log/log_stream.h"
#include "pricebase/session/session_tracker.h"
#include "pricebase/storage/partition.h"

namespace pricebase
{

Backtester::Backtester(const PriceSeriesStore& store, const MarketRegistry& registry,
                       IndicatorConfig indicatorConfig)
    : _store(store), _registry(registry), _indicatorConfig(indicatorConfig)
{
}

BacktestReport Backtester::run(const BacktestConfig& config, TimePoint start, TimePoint end) const
{
  if (config.intervalMinutes == 0)
  {
    throw InvalidArgumentError("backtest interval must be positive");
  }
  if (!config.initialBalance.isPositive())
  {
    throw InvalidArgumentError("backtest needs a positive initial balance");
  }
  if (config.stake.isNegative())
  {
    throw InvalidArgumentError("backtest stake must not be negative");
  }
  if (start >= end)
  {
    throw InvalidArgumentError("backtest range is empty");
  }

  const Market market = _registry.lookup(config.market);
  const auto step = std::chrono::nanoseconds(intervalNs(config.intervalMinutes));

  // First whole interval at or after start
  TimePoint t = alignToInterval(start, config.intervalMinutes);
  if (t < start)
  {
    t += step;
  }

  SimulatedClock clock(t);
  SessionTracker tracker(_registry, clock, SessionTrackerOptions{.allowRetiredMarkets = true});
  tracker.deposit(market.exchange, market.base, config.initialBalance);
  IndicatorEngine indicators(_store, _indicatorConfig);

  BacktestReport report;
  report.summary.initialEquity = config.initialBalance;
  report.summary.marketRetired = !market.active;
  report.summary.startTimeNs = toUnixNs(t);

  std::optional<SessionId> openSession;
  Amount realized{};

  for (; t < end; t += step)
  {
    clock.advanceTo(t);

    BacktestStep current;
    current.time = t;

    const auto signal =
        indicators.rollingAverage(config.market, config.intervalMinutes, t, config.field,
                                  config.windowSize);
    if (!signal.sufficient())
    {
      ++report.summary.insufficientSteps;
    }
    else
    {
      current.average = signal.average;
    }

    if (signal.sufficient() && signal.hasCurrent)
    {
      const Price price = signal.current;
      if (!openSession && signal.isAboveCurrent)
      {
        const Amount available = tracker.balance(market.exchange, market.base);
        const Amount stake = config.stake.isZero() ? available : config.stake;
        const Quantity amount = stake / price;
        if (!amount.isPositive())
        {
          PRICEBASE_LOG_DEBUG << "backtest " << formatUtc(t) << ": stake too small to buy";
        }
        else
        {
          try
          {
            openSession = tracker.open(config.market, price, amount).id();
            current.bought = true;
          }
          catch (const InsufficientBalanceError& e)
          {
            PRICEBASE_LOG_DEBUG << "backtest " << formatUtc(t) << ": " << e.what();
          }
        }
      }
      else if (openSession && signal.isBelowCurrent)
      {
        const auto closed = tracker.close(*openSession, price);
        realized += closed.realizedPnl().value_or(Amount{});
        openSession.reset();
        current.sold = true;
        ++report.summary.trades;
      }
    }

    current.equity = tracker.balance(market.exchange, market.base);
    if (openSession)
    {
      const auto session = tracker.session(*openSession);
      const auto mark = indicators.priceAt(config.market, config.intervalMinutes, t,
                                           BarField::Close);
      current.equity += mark.value_or(session->startedPrice()) * session->amount();
    }

    report.steps.push_back(current);
  }

  report.summary.steps = report.steps.size();
  report.summary.realizedPnl = realized;
  report.summary.finalEquity =
      report.steps.empty() ? config.initialBalance : report.steps.back().equity;
  report.summary.positionOpen = openSession.has_value();
  report.summary.endTimeNs = toUnixNs(clock.now());

  PRICEBASE_LOG_INFO << "backtest " << market.displayName() << ": " << report.summary.steps
                     << " steps, " << report.summary.trades << " round trips, final equity "
                     << report.summary.finalEquity;
  return report;
}

}  // namespace pricebase
