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
#include "pricebase/storage/memory_storage_backend.h"

#include <gtest/gtest.h>
#include <vector>

using namespace pricebase;

namespace
{

TimePoint minutes(int64_t m) { return fromUnixSeconds(m * 60); }

class BacktesterTest : public ::testing::Test
{
 protected:
  void SetUp() override
  {
    market = registry.resolve("USD", "BTC", "Bitstamp");
    // Flat at 100, a dip to 90, then a jump to 120
    const std::vector<int64_t> closes = {100, 100, 100, 100, 100, 90, 120, 120, 120, 120};
    for (size_t m = 0; m < closes.size(); ++m)
    {
      store.ingestBar(OhlcvBar(market, 1, minutes(static_cast<int64_t>(m)),
                               Price::fromInt(closes[m]), Volume::fromInt(1)));
    }
  }

  BacktestConfig config(Amount balance, Amount stake = Amount{})
  {
    BacktestConfig c;
    c.market = market;
    c.intervalMinutes = 1;
    c.windowSize = 5;
    c.initialBalance = balance;
    c.stake = stake;
    return c;
  }

  MarketRegistry registry;
  MemoryStorageBackend backend;
  SimulatedClock clock{minutes(1'000)};
  PriceSeriesStore store{backend, clock};
  Backtester backtester{store, registry};
  MarketId market{InvalidMarketId};
};

}  // namespace

TEST_F(BacktesterTest, BuysTheDipAndSellsTheRally)
{
  auto report = backtester.run(config(Amount::fromInt(1000)), minutes(0), minutes(8));
  const auto& s = report.summary;

  ASSERT_EQ(report.steps.size(), 8u);
  EXPECT_EQ(s.steps, 8u);
  EXPECT_EQ(s.insufficientSteps, 4u);
  EXPECT_FALSE(report.steps[3].average.has_value());
  EXPECT_EQ(report.steps[4].average, Price::fromInt(100));

  EXPECT_TRUE(report.steps[5].bought);
  EXPECT_EQ(report.steps[5].average, Price::fromInt(98));
  EXPECT_TRUE(report.steps[6].sold);
  EXPECT_FALSE(report.steps[7].bought);

  // All-in at 90: 11.11111111 BTC for 999.9999999 USD
  EXPECT_EQ(report.steps[5].equity, Amount::fromInt(1000));
  EXPECT_EQ(s.trades, 1u);
  EXPECT_EQ(s.realizedPnl, Amount::fromRaw(33'333'333'330));
  EXPECT_EQ(s.finalEquity, Amount::fromRaw(133'333'333'330));
  EXPECT_EQ(s.initialEquity, Amount::fromInt(1000));
  EXPECT_FALSE(s.positionOpen);
  EXPECT_FALSE(s.marketRetired);
  EXPECT_EQ(s.startTimeNs, toUnixNs(minutes(0)));
  EXPECT_EQ(s.endTimeNs, toUnixNs(minutes(7)));
}

TEST_F(BacktesterTest, FixedStake)
{
  auto report =
      backtester.run(config(Amount::fromInt(1000), Amount::fromInt(450)), minutes(0), minutes(8));

  EXPECT_EQ(report.summary.trades, 1u);
  EXPECT_EQ(report.summary.realizedPnl, Amount::fromInt(150));
  EXPECT_EQ(report.summary.finalEquity, Amount::fromInt(1150));
}

TEST_F(BacktesterTest, StakeAboveBalanceSkipsTheTrade)
{
  auto report =
      backtester.run(config(Amount::fromInt(100), Amount::fromInt(450)), minutes(0), minutes(8));

  EXPECT_EQ(report.summary.trades, 0u);
  EXPECT_FALSE(report.steps[5].bought);
  EXPECT_EQ(report.summary.finalEquity, Amount::fromInt(100));
}

TEST_F(BacktesterTest, OpenPositionIsMarkedToLastClose)
{
  auto report = backtester.run(config(Amount::fromInt(900)), minutes(0), minutes(6));

  EXPECT_TRUE(report.summary.positionOpen);
  EXPECT_EQ(report.summary.trades, 0u);
  EXPECT_EQ(report.summary.finalEquity, Amount::fromInt(900));
}

TEST_F(BacktesterTest, StartIsRoundedUpToInterval)
{
  auto report = backtester.run(config(Amount::fromInt(1000)), minutes(0) + std::chrono::seconds(30),
                               minutes(3));
  ASSERT_EQ(report.steps.size(), 2u);
  EXPECT_EQ(report.steps[0].time, minutes(1));
}

TEST_F(BacktesterTest, RetiredMarketHistoryStillReplays)
{
  registry.deactivate(market);

  auto report = backtester.run(config(Amount::fromInt(1000)), minutes(0), minutes(8));
  EXPECT_TRUE(report.summary.marketRetired);
  EXPECT_TRUE(report.steps[5].bought);
  EXPECT_TRUE(report.steps[6].sold);
  EXPECT_EQ(report.summary.trades, 1u);
  EXPECT_EQ(report.summary.finalEquity, Amount::fromRaw(133'333'333'330));
}

TEST_F(BacktesterTest, NoDataMeansNoTrades)
{
  auto other = registry.resolve("USD", "ETH", "Bitstamp");
  auto c = config(Amount::fromInt(1000));
  c.market = other;

  auto report = backtester.run(c, minutes(0), minutes(10));
  EXPECT_EQ(report.summary.insufficientSteps, 10u);
  EXPECT_EQ(report.summary.trades, 0u);
  EXPECT_EQ(report.summary.finalEquity, Amount::fromInt(1000));
}

TEST_F(BacktesterTest, InvalidRuns)
{
  EXPECT_THROW(backtester.run(config(Amount::fromInt(1)), minutes(5), minutes(5)),
               InvalidArgumentError);
  EXPECT_THROW(backtester.run(config(Amount{}), minutes(0), minutes(5)), InvalidArgumentError);

  auto c = config(Amount::fromInt(1));
  c.market = 42;
  EXPECT_THROW(backtester.run(c, minutes(0), minutes(5)), NotFoundError);

  c = config(Amount::fromInt(1));
  c.intervalMinutes = 0;
  EXPECT_THROW(backtester.run(c, minutes(0), minutes(5)), InvalidArgumentError);
}
