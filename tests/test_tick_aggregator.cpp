/*
 * PriceBase
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#include "pricebase/aggregator/tick_aggregator.h"
#include "pricebase/clock/simulated_clock.h"
#include "pricebase/error.h"
#include "pricebase/storage/memory_storage_backend.h"
#include "pricebase/storage/price_series_store.h"

#include <gtest/gtest.h>
#include <future>
#include <mutex>
#include <thread>
#include <vector>

using namespace pricebase;

namespace
{

constexpr MarketId MARKET = 1;

TimePoint ts(int64_t seconds) { return fromUnixSeconds(seconds); }

PriceTick makeTick(int64_t seconds, int64_t price, int64_t volume = 1)
{
  return PriceTick{MARKET, ts(seconds), Price::fromInt(price), Volume::fromInt(volume)};
}

class RecordingSink : public IBarSink
{
 public:
  void onBar(const OhlcvBar& bar) override
  {
    std::scoped_lock lock(_mutex);
    if (failuresLeft > 0)
    {
      --failuresLeft;
      throw StorageUnavailableError("backend offline");
    }
    if (rejectAll)
    {
      throw InvalidBarError("rejected");
    }
    bars.push_back(bar);
  }

  std::vector<OhlcvBar> snapshot()
  {
    std::scoped_lock lock(_mutex);
    return bars;
  }

  int failuresLeft{0};
  bool rejectAll{false};
  std::vector<OhlcvBar> bars;

 private:
  std::mutex _mutex;
};

// Parks emission of MARKET's bar until released; other markets pass straight through
class GatedSink : public IBarSink
{
 public:
  void onBar(const OhlcvBar& bar) override
  {
    if (bar.market == MARKET)
    {
      entered.set_value();
      released.wait();
    }
    std::scoped_lock lock(_mutex);
    bars.push_back(bar);
  }

  std::vector<OhlcvBar> snapshot()
  {
    std::scoped_lock lock(_mutex);
    return bars;
  }

  std::promise<void> entered;
  std::promise<void> release;
  std::shared_future<void> released{release.get_future().share()};
  std::vector<OhlcvBar> bars;

 private:
  std::mutex _mutex;
};

AggregatorConfig hourly(std::chrono::seconds grace = std::chrono::seconds(0),
                        LateTickPolicy policy = LateTickPolicy::Reject)
{
  AggregatorConfig config;
  config.intervalMinutes = 60;
  config.gracePeriod = grace;
  config.latePolicy = policy;
  return config;
}

}  // namespace

TEST(TickAggregatorTest, BuildsBarFromTicks)
{
  RecordingSink sink;
  SimulatedClock clock(ts(30));
  TickAggregator aggregator(sink, clock, hourly());

  EXPECT_EQ(aggregator.onTick(makeTick(0, 100, 1)), TickOutcome::Accepted);
  EXPECT_EQ(aggregator.onTick(makeTick(30, 105, 2)), TickOutcome::Accepted);
  EXPECT_EQ(aggregator.openBuckets(), 1u);

  auto peeked = aggregator.peek(MARKET, ts(0));
  ASSERT_TRUE(peeked.has_value());
  EXPECT_EQ(peeked->close, Price::fromInt(105));

  ASSERT_TRUE(aggregator.finalize(MARKET, ts(0)));
  ASSERT_EQ(sink.bars.size(), 1u);
  const auto& bar = sink.bars[0];
  EXPECT_EQ(bar.open, Price::fromInt(100));
  EXPECT_EQ(bar.high, Price::fromInt(105));
  EXPECT_EQ(bar.low, Price::fromInt(100));
  EXPECT_EQ(bar.close, Price::fromInt(105));
  EXPECT_EQ(bar.volume, Volume::fromInt(3));
  EXPECT_EQ(bar.intervalMinutes, 60u);

  EXPECT_TRUE(aggregator.isFinalized(MARKET, ts(0)));
  EXPECT_EQ(aggregator.openBuckets(), 0u);
  EXPECT_FALSE(aggregator.finalize(MARKET, ts(0)));
}

TEST(TickAggregatorTest, ExpiredBucketsHonorGracePeriod)
{
  RecordingSink sink;
  SimulatedClock clock(ts(10));
  TickAggregator aggregator(sink, clock, hourly(std::chrono::seconds(30)));

  aggregator.onTick(makeTick(10, 100));
  clock.advanceTo(ts(3600));
  aggregator.onTick(makeTick(3600, 101));

  // Bucket 0 ends at 3600 but grace runs until 3630
  EXPECT_EQ(aggregator.finalizeExpired(), 0u);
  clock.advanceTo(ts(3629));
  EXPECT_EQ(aggregator.finalizeExpired(), 0u);
  clock.advanceTo(ts(3630));
  EXPECT_EQ(aggregator.finalizeExpired(), 1u);

  ASSERT_EQ(sink.bars.size(), 1u);
  EXPECT_EQ(sink.bars[0].periodStart, ts(0));
  EXPECT_EQ(aggregator.openBuckets(), 1u);
  EXPECT_EQ(aggregator.deadlineFor(ts(3600)), ts(7230));
}

TEST(TickAggregatorTest, LateTickRejectedByDefault)
{
  RecordingSink sink;
  SimulatedClock clock(ts(100));
  TickAggregator aggregator(sink, clock, hourly());

  aggregator.onTick(makeTick(10, 100));
  aggregator.finalizeAll();

  EXPECT_THROW(aggregator.onTick(makeTick(20, 100)), ConflictError);
  ASSERT_EQ(sink.bars.size(), 1u);
  EXPECT_EQ(sink.bars[0].volume, Volume::fromInt(1));
}

TEST(TickAggregatorTest, LateTickDroppedWhenConfigured)
{
  RecordingSink sink;
  SimulatedClock clock(ts(100));
  TickAggregator aggregator(sink, clock, hourly(std::chrono::seconds(0), LateTickPolicy::Drop));

  aggregator.onTick(makeTick(10, 100));
  aggregator.finalizeAll();

  EXPECT_EQ(aggregator.onTick(makeTick(20, 100)), TickOutcome::Dropped);
  EXPECT_EQ(aggregator.openBuckets(), 0u);
}

TEST(TickAggregatorTest, InvalidTicksThrow)
{
  RecordingSink sink;
  SimulatedClock clock(ts(100));
  TickAggregator aggregator(sink, clock, hourly());

  EXPECT_THROW(aggregator.onTick(makeTick(10, 100, 0)), InvalidBarError);
  EXPECT_THROW(aggregator.onTick(makeTick(200, 100)), InvalidBarError);
  EXPECT_EQ(aggregator.openBuckets(), 0u);
}

TEST(TickAggregatorTest, RetryableSinkFailureKeepsBucketOpen)
{
  RecordingSink sink;
  sink.failuresLeft = 1;
  SimulatedClock clock(ts(100));
  TickAggregator aggregator(sink, clock, hourly());

  aggregator.onTick(makeTick(10, 100));
  EXPECT_THROW(aggregator.finalize(MARKET, ts(0)), StorageUnavailableError);
  EXPECT_EQ(aggregator.openBuckets(), 1u);
  EXPECT_FALSE(aggregator.isFinalized(MARKET, ts(0)));

  EXPECT_TRUE(aggregator.finalize(MARKET, ts(0)));
  EXPECT_EQ(sink.bars.size(), 1u);
}

TEST(TickAggregatorTest, RejectedBarRetiresBucket)
{
  RecordingSink sink;
  sink.rejectAll = true;
  SimulatedClock clock(ts(100));
  TickAggregator aggregator(sink, clock, hourly());

  aggregator.onTick(makeTick(10, 100));
  EXPECT_THROW(aggregator.finalize(MARKET, ts(0)), InvalidBarError);
  EXPECT_EQ(aggregator.openBuckets(), 0u);
  EXPECT_TRUE(aggregator.isFinalized(MARKET, ts(0)));
  EXPECT_EQ(aggregator.finalizedCount(), 1u);
}

TEST(TickAggregatorTest, FinalizedBucketsForgottenAfterRetention)
{
  RecordingSink sink;
  SimulatedClock clock(ts(3600));
  AggregatorConfig config = hourly();
  config.finalizedRetention = std::chrono::hours(1);
  TickAggregator aggregator(sink, clock, config);

  aggregator.onTick(makeTick(10, 100));
  EXPECT_EQ(aggregator.finalizeExpired(), 1u);
  EXPECT_EQ(aggregator.rememberedFinalized(), 1u);

  clock.advanceTo(ts(7199));
  EXPECT_EQ(aggregator.finalizeExpired(), 0u);
  EXPECT_TRUE(aggregator.isFinalized(MARKET, ts(0)));

  clock.advanceTo(ts(7200));
  EXPECT_EQ(aggregator.finalizeExpired(), 0u);
  EXPECT_FALSE(aggregator.isFinalized(MARKET, ts(0)));
  EXPECT_EQ(aggregator.rememberedFinalized(), 0u);
  EXPECT_EQ(aggregator.finalizedCount(), 1u);
}

TEST(TickAggregatorTest, StoreRejectsTickForForgottenBucket)
{
  MemoryStorageBackend backend;
  SimulatedClock clock(ts(3600));
  PriceSeriesStore store(backend, clock);
  AggregatorConfig config = hourly();
  config.finalizedRetention = std::chrono::minutes(0);
  TickAggregator aggregator(store, clock, config);

  aggregator.onTick(makeTick(10, 100));
  EXPECT_EQ(aggregator.finalizeExpired(), 1u);
  EXPECT_EQ(aggregator.rememberedFinalized(), 0u);

  // The aggregator no longer knows the hour is closed, but the stored bar still wins
  EXPECT_EQ(aggregator.onTick(makeTick(20, 90)), TickOutcome::Accepted);
  EXPECT_THROW(aggregator.finalize(MARKET, ts(0)), ConflictError);
  EXPECT_EQ(aggregator.openBuckets(), 0u);

  auto bars = store.queryRange(MARKET, 60, ts(0), ts(3600)).toVector();
  ASSERT_EQ(bars.size(), 1u);
  EXPECT_EQ(bars[0].close, Price::fromInt(100));
}

TEST(TickAggregatorTest, SlowSinkDoesNotStallOtherMarkets)
{
  constexpr MarketId OTHER = 2;
  GatedSink sink;
  SimulatedClock clock(ts(7200));
  TickAggregator aggregator(sink, clock, hourly());

  aggregator.onTick(makeTick(10, 100));
  aggregator.onTick(PriceTick{OTHER, ts(20), Price::fromInt(50), Volume::fromInt(1)});

  auto entered = sink.entered.get_future();
  auto parked = std::async(std::launch::async, [&] { return aggregator.finalize(MARKET, ts(0)); });
  entered.wait();

  auto other = std::async(std::launch::async,
                          [&]
                          {
                            aggregator.onTick(
                                PriceTick{OTHER, ts(30), Price::fromInt(55), Volume::fromInt(2)});
                            return aggregator.finalize(OTHER, ts(0));
                          });
  const bool otherFinished = other.wait_for(std::chrono::seconds(5)) == std::future_status::ready;

  // A tick for the bar being emitted waits and then sees it finalized
  auto sameBucket = std::async(std::launch::async, [&] { return aggregator.onTick(makeTick(15, 101)); });
  const bool sameBucketWaited =
      sameBucket.wait_for(std::chrono::milliseconds(50)) == std::future_status::timeout;

  sink.release.set_value();

  EXPECT_TRUE(otherFinished);
  EXPECT_TRUE(other.get());
  EXPECT_TRUE(sameBucketWaited);
  EXPECT_TRUE(parked.get());
  EXPECT_THROW(sameBucket.get(), ConflictError);

  auto bars = sink.snapshot();
  ASSERT_EQ(bars.size(), 2u);
  EXPECT_EQ(bars[0].market, OTHER);
  EXPECT_EQ(bars[0].volume, Volume::fromInt(3));
  EXPECT_EQ(bars[1].market, MARKET);
  EXPECT_EQ(bars[1].close, Price::fromInt(100));
  EXPECT_EQ(aggregator.finalizedCount(), 2u);
}

TEST(TickAggregatorTest, FeedsPriceSeriesStore)
{
  MemoryStorageBackend backend;
  SimulatedClock clock(ts(7200));
  PriceSeriesStore store(backend, clock);
  TickAggregator aggregator(store, clock, hourly());

  aggregator.onTick(makeTick(0, 100, 1));
  aggregator.onTick(makeTick(30, 105, 2));
  aggregator.onTick(makeTick(3700, 110, 1));
  EXPECT_EQ(aggregator.finalizeExpired(), 2u);

  auto bars = store.queryRange(MARKET, 60, ts(0), ts(7200)).toVector();
  ASSERT_EQ(bars.size(), 2u);
  EXPECT_EQ(bars[0].volume, Volume::fromInt(3));
  EXPECT_EQ(bars[1].periodStart, ts(3600));
}

TEST(TickAggregatorTest, AwaitFinalizesOnceClockPassesDeadline)
{
  RecordingSink sink;
  SimulatedClock clock(ts(10));
  TickAggregator aggregator(sink, clock, hourly(std::chrono::seconds(5)));
  aggregator.onTick(makeTick(10, 100));

  auto result = std::async(std::launch::async, [&]
                           { return aggregator.awaitAndFinalize(MARKET, ts(0), std::stop_token{}); });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  EXPECT_EQ(aggregator.openBuckets(), 1u);

  clock.advanceTo(ts(3605));
  aggregator.wake();

  EXPECT_EQ(result.get(), FinalizeResult::Finalized);
  EXPECT_EQ(sink.snapshot().size(), 1u);
}

TEST(TickAggregatorTest, AwaitCanBeCancelled)
{
  RecordingSink sink;
  SimulatedClock clock(ts(10));
  TickAggregator aggregator(sink, clock, hourly());
  aggregator.onTick(makeTick(10, 100));

  std::stop_source stop;
  auto result = std::async(std::launch::async, [&]
                           { return aggregator.awaitAndFinalize(MARKET, ts(0), stop.get_token()); });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  stop.request_stop();

  EXPECT_EQ(result.get(), FinalizeResult::Cancelled);
  EXPECT_EQ(aggregator.openBuckets(), 1u);
  EXPECT_TRUE(sink.snapshot().empty());
}

TEST(TickAggregatorTest, AwaitWithoutBucket)
{
  RecordingSink sink;
  SimulatedClock clock(ts(10));
  TickAggregator aggregator(sink, clock, hourly());

  EXPECT_EQ(aggregator.awaitAndFinalize(MARKET, ts(0), std::stop_token{}),
            FinalizeResult::NoBucket);
}

TEST(TickAggregatorTest, RejectsBadConfig)
{
  RecordingSink sink;
  SimulatedClock clock;
  AggregatorConfig config;
  config.intervalMinutes = 0;
  EXPECT_THROW({ TickAggregator aggregator(sink, clock, config); }, InvalidArgumentError);
}
