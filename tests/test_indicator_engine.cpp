/*
 * PriceBase
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#include "pricebase/clock/simulated_clock.h"
#include "pricebase/error.h"
#include "pricebase/indicator/indicator_engine.h"
#include "pricebase/storage/memory_storage_backend.h"

#include <gtest/gtest.h>
#include <limits>

using namespace pricebase;

namespace
{

constexpr MarketId MARKET = 1;

TimePoint minutes(int64_t m) { return fromUnixSeconds(m * 60); }

class IndicatorEngineTest : public ::testing::Test
{
 protected:
  void addBar(int64_t minute, const char* close, uint32_t interval = 1)
  {
    const auto price = Price::parse(close).value();
    OhlcvBar bar(MARKET, interval, minutes(minute), price, Volume::fromInt(minute + 1));
    store.ingestBar(bar);
  }

  MemoryStorageBackend backend;
  SimulatedClock clock{minutes(100'000)};
  PriceSeriesStore store{backend, clock};
  IndicatorEngine engine{store};
};

}  // namespace

TEST_F(IndicatorEngineTest, AverageOverWindow)
{
  // closes 100..109 at minutes 0..9
  for (int64_t m = 0; m < 10; ++m)
  {
    addBar(m, std::to_string(100 + m).c_str());
  }

  auto result = engine.rollingAverage(MARKET, 1, minutes(9), BarField::Close, 5);
  ASSERT_TRUE(result.sufficient());
  EXPECT_EQ(result.periodsUsed, 5u);
  EXPECT_EQ(result.average, Price::fromInt(107));
  ASSERT_TRUE(result.hasCurrent);
  EXPECT_EQ(result.current, Price::fromInt(109));
  EXPECT_FALSE(result.isAboveCurrent);
  EXPECT_TRUE(result.isBelowCurrent);
}

TEST_F(IndicatorEngineTest, ReferenceIsAlignedToItsBucket)
{
  for (int64_t m = 0; m < 10; ++m)
  {
    addBar(m, std::to_string(100 + m).c_str());
  }

  const auto inside = minutes(9) + std::chrono::seconds(42);
  EXPECT_EQ(engine.rollingAverage(MARKET, 1, inside, BarField::Close, 5).average,
            engine.rollingAverage(MARKET, 1, minutes(9), BarField::Close, 5).average);
}

TEST_F(IndicatorEngineTest, FewerThanMinimumPeriodsIsInsufficient)
{
  for (int64_t m = 0; m < 4; ++m)
  {
    addBar(m, "100");
  }

  auto result = engine.rollingAverage(MARKET, 1, minutes(3), BarField::Close, 50);
  EXPECT_EQ(result.status, IndicatorStatus::Insufficient);
  EXPECT_EQ(result.periodsUsed, 4u);
  EXPECT_FALSE(result.isAboveCurrent);
  EXPECT_FALSE(result.isBelowCurrent);

  addBar(4, "100");
  EXPECT_TRUE(engine.rollingAverage(MARKET, 1, minutes(4), BarField::Close, 50).sufficient());
}

TEST_F(IndicatorEngineTest, GapsAreSkippedNotZeroed)
{
  for (int64_t m : {0, 2, 4, 6, 8, 10})
  {
    addBar(m, "50");
  }

  auto result = engine.rollingAverage(MARKET, 1, minutes(10), BarField::Close, 11);
  ASSERT_TRUE(result.sufficient());
  EXPECT_EQ(result.periodsUsed, 6u);
  EXPECT_EQ(result.average, Price::fromInt(50));
  EXPECT_FALSE(result.isAboveCurrent);
  EXPECT_FALSE(result.isBelowCurrent);
}

TEST_F(IndicatorEngineTest, MissingReferenceBarHasNoCurrent)
{
  for (int64_t m = 0; m < 6; ++m)
  {
    addBar(m, "100");
  }

  auto result = engine.rollingAverage(MARKET, 1, minutes(6), BarField::Close, 10);
  ASSERT_TRUE(result.sufficient());
  EXPECT_FALSE(result.hasCurrent);
  EXPECT_FALSE(result.isAboveCurrent);
  EXPECT_FALSE(result.isBelowCurrent);
}

TEST_F(IndicatorEngineTest, AverageRoundsToNearestUnit)
{
  addBar(0, "0.00000001");
  addBar(1, "0.00000001");
  addBar(2, "0.00000002");
  addBar(3, "0.00000002");
  addBar(4, "0.00000002");
  addBar(5, "0.00000001");

  // 9 / 6 = 1.5 units -> 2
  auto result = engine.rollingAverage(MARKET, 1, minutes(5), BarField::Close, 6);
  EXPECT_EQ(result.average.raw(), 2);
  EXPECT_TRUE(result.isAboveCurrent);
}

TEST_F(IndicatorEngineTest, VolumeField)
{
  for (int64_t m = 0; m < 5; ++m)
  {
    addBar(m, "100");  // volume m + 1
  }
  auto result = engine.rollingAverage(MARKET, 1, minutes(4), BarField::Volume, 5);
  EXPECT_EQ(result.average, Price::fromInt(3));
}

TEST_F(IndicatorEngineTest, DefaultWindowFromConfig)
{
  IndicatorEngine small(store, IndicatorConfig{2, 3});
  for (int64_t m = 0; m < 10; ++m)
  {
    addBar(m, std::to_string(100 + m).c_str());
  }
  auto result = small.rollingAverage(MARKET, 1, minutes(9), BarField::Close);
  EXPECT_EQ(result.periodsUsed, 3u);
  EXPECT_EQ(result.average, Price::fromInt(108));
}

TEST_F(IndicatorEngineTest, PriceAtLooksBackAcrossGaps)
{
  addBar(0, "100", 5);
  addBar(5, "105", 5);
  addBar(20, "120", 5);

  EXPECT_EQ(engine.priceAt(MARKET, 5, minutes(20), BarField::Close), Price::fromInt(120));
  EXPECT_EQ(engine.priceAt(MARKET, 5, minutes(20), BarField::Close, 1), Price::fromInt(105));
  EXPECT_EQ(engine.priceAt(MARKET, 5, minutes(20), BarField::Close, 4), Price::fromInt(100));
  EXPECT_FALSE(engine.priceAt(MARKET, 5, minutes(20), BarField::Close, 5).has_value());
}

TEST_F(IndicatorEngineTest, InvalidArguments)
{
  EXPECT_THROW(engine.rollingAverage(MARKET, 0, minutes(0), BarField::Close, 5),
               InvalidArgumentError);
  EXPECT_THROW(engine.rollingAverage(MARKET, 1, minutes(0), BarField::Close, 0),
               InvalidArgumentError);
  EXPECT_THROW({ IndicatorEngine bad(store, IndicatorConfig{0, 50}); }, InvalidArgumentError);
}

TEST_F(IndicatorEngineTest, WindowsBeyondTheTimeRangeThrow)
{
  for (int64_t m = 0; m < 10; ++m)
  {
    addBar(m, "100");
  }

  // Ten million minutes still fits, and only the stored bars count
  auto wide = engine.rollingAverage(MARKET, 1, minutes(9), BarField::Close, 10'000'000);
  EXPECT_EQ(wide.periodsUsed, 10u);

  EXPECT_THROW(engine.rollingAverage(MARKET, 1, minutes(9), BarField::Close, 200'000'000'000),
               InvalidArgumentError);
  EXPECT_THROW(engine.rollingAverage(MARKET, 1, minutes(9), BarField::Close,
                                     std::numeric_limits<size_t>::max()),
               InvalidArgumentError);
  EXPECT_THROW(engine.priceAt(MARKET, 1, minutes(9), BarField::Close, 200'000'000'000),
               InvalidArgumentError);
}
