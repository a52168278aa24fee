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

#include <gtest/gtest.h>
#include <vector>

using namespace pricebase;

namespace
{

constexpr MarketId MARKET = 7;

PriceTick tick(int64_t seconds, double price, double volume, MarketId market = MARKET)
{
  return PriceTick{market, fromUnixSeconds(seconds), Price::fromDouble(price),
                   Volume::fromDouble(volume)};
}

OhlcvBar minuteBar(int64_t minute, int64_t open, int64_t high, int64_t low, int64_t close)
{
  OhlcvBar bar(MARKET, 1, fromUnixSeconds(minute * 60), Price::fromInt(open), Volume::fromInt(1));
  bar.high = Price::fromInt(high);
  bar.low = Price::fromInt(low);
  bar.close = Price::fromInt(close);
  return bar;
}

}  // namespace

// =============================================================================
// BarAccumulator / aggregateTicks
// =============================================================================

TEST(AggregateTest, SingleBucketOhlcv)
{
  std::vector<PriceTick> ticks = {tick(0, 100, 1), tick(30, 105, 2)};

  auto bars = aggregateTicks(ticks, 60);
  ASSERT_EQ(bars.size(), 1u);
  const auto& bar = bars[0];
  EXPECT_EQ(bar.market, MARKET);
  EXPECT_EQ(bar.intervalMinutes, 60u);
  EXPECT_EQ(bar.periodStart, fromUnixSeconds(0));
  EXPECT_EQ(bar.open, Price::fromInt(100));
  EXPECT_EQ(bar.high, Price::fromInt(105));
  EXPECT_EQ(bar.low, Price::fromInt(100));
  EXPECT_EQ(bar.close, Price::fromInt(105));
  EXPECT_EQ(bar.volume, Volume::fromInt(3));
}

TEST(AggregateTest, OpenAndCloseFollowTimestampsNotArrival)
{
  std::vector<PriceTick> ticks = {tick(50, 103, 1), tick(10, 101, 1), tick(59, 99, 1),
                                  tick(20, 110, 1)};

  auto bars = aggregateTicks(ticks, 1);
  ASSERT_EQ(bars.size(), 1u);
  EXPECT_EQ(bars[0].open, Price::fromInt(101));
  EXPECT_EQ(bars[0].close, Price::fromInt(99));
  EXPECT_EQ(bars[0].high, Price::fromInt(110));
  EXPECT_EQ(bars[0].low, Price::fromInt(99));
}

TEST(AggregateTest, EqualTimestampsKeepFirstOpenAndLastClose)
{
  BarAccumulator acc(MARKET, 1, fromUnixSeconds(0));
  EXPECT_TRUE(acc.empty());
  acc.add(tick(5, 100, 1));
  acc.add(tick(5, 102, 1));
  acc.add(tick(5, 101, 1));

  EXPECT_EQ(acc.tickCount(), 3u);
  EXPECT_EQ(acc.bar().open, Price::fromInt(100));
  EXPECT_EQ(acc.bar().close, Price::fromInt(101));
}

TEST(AggregateTest, SplitsByBucketAndMarket)
{
  std::vector<PriceTick> ticks = {tick(0, 100, 1), tick(61, 101, 1), tick(125, 102, 1),
                                  tick(1, 50, 1, 2)};

  auto bars = aggregateTicks(ticks, 1);
  ASSERT_EQ(bars.size(), 4u);
  EXPECT_EQ(bars[0].market, 2u);
  EXPECT_EQ(bars[1].periodStart, fromUnixSeconds(0));
  EXPECT_EQ(bars[2].periodStart, fromUnixSeconds(60));
  EXPECT_EQ(bars[3].periodStart, fromUnixSeconds(120));
}

TEST(AggregateTest, EmptyInputAndZeroInterval)
{
  EXPECT_TRUE(aggregateTicks({}, 5).empty());
  std::vector<PriceTick> ticks = {tick(0, 100, 1)};
  EXPECT_THROW(aggregateTicks(ticks, 0), InvalidArgumentError);
}

// =============================================================================
// rollupBars
// =============================================================================

TEST(RollupTest, MergesIntoCoarserBars)
{
  std::vector<OhlcvBar> bars = {minuteBar(2, 12, 15, 11, 14), minuteBar(0, 10, 11, 8, 10),
                                minuteBar(1, 10, 20, 9, 12), minuteBar(5, 30, 31, 29, 30)};

  auto rolled = rollupBars(bars, 5);
  ASSERT_EQ(rolled.size(), 2u);

  const auto& first = rolled[0];
  EXPECT_EQ(first.intervalMinutes, 5u);
  EXPECT_EQ(first.periodStart, fromUnixSeconds(0));
  EXPECT_EQ(first.open, Price::fromInt(10));
  EXPECT_EQ(first.high, Price::fromInt(20));
  EXPECT_EQ(first.low, Price::fromInt(8));
  EXPECT_EQ(first.close, Price::fromInt(14));
  EXPECT_EQ(first.volume, Volume::fromInt(3));

  EXPECT_EQ(rolled[1].periodStart, fromUnixSeconds(300));
  EXPECT_EQ(rolled[1].close, Price::fromInt(30));
}

TEST(RollupTest, MatchesDirectAggregation)
{
  std::vector<PriceTick> ticks;
  for (int64_t s = 0; s < 3600; s += 7)
  {
    ticks.push_back(tick(s, 100 + static_cast<double>((s * 13) % 17), 0.5));
  }

  const auto minuteBars = aggregateTicks(ticks, 1);
  EXPECT_EQ(rollupBars(minuteBars, 15), aggregateTicks(ticks, 15));
}

TEST(RollupTest, RejectsIncompatibleIntervals)
{
  std::vector<OhlcvBar> bars = {minuteBar(0, 10, 11, 9, 10)};
  bars[0].intervalMinutes = 7;
  EXPECT_THROW(rollupBars(bars, 60), InvalidArgumentError);
  EXPECT_THROW(rollupBars(bars, 0), InvalidArgumentError);
}
