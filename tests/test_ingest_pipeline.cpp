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
#include "pricebase/ingest/bounded_queue.h"
#include "pricebase/ingest/ingest_pipeline.h"
#include "pricebase/ingest/retry.h"
#include "pricebase/storage/memory_storage_backend.h"

#include <gtest/gtest.h>
#include <atomic>
#include <thread>
#include <vector>

using namespace pricebase;

namespace
{

constexpr MarketId MARKET = 1;

TimePoint minutes(int64_t m) { return fromUnixSeconds(m * 60); }

OhlcvBar makeBar(int64_t minute, int64_t close)
{
  OhlcvBar bar(MARKET, 1, minutes(minute), Price::fromInt(close), Volume::fromInt(1));
  return bar;
}

PriceTick makeTick(int64_t seconds, int64_t price)
{
  return PriceTick{MARKET, fromUnixSeconds(seconds), Price::fromInt(price), Volume::fromInt(1)};
}

RetryPolicy fastRetry(uint32_t attempts)
{
  RetryPolicy policy;
  policy.maxAttempts = attempts;
  policy.initialDelay = std::chrono::milliseconds(1);
  policy.maxDelay = std::chrono::milliseconds(2);
  return policy;
}

// Fails the first `failures` bar inserts with a transient error
class FaultyBackend : public MemoryStorageBackend
{
 public:
  explicit FaultyBackend(int failures) : _failuresLeft(failures) {}

  void insertBar(const PartitionKey& key, const OhlcvBar& bar) override
  {
    if (_failuresLeft.fetch_sub(1) > 0)
    {
      throw StorageUnavailableError("connection reset");
    }
    MemoryStorageBackend::insertBar(key, bar);
  }

 private:
  std::atomic<int> _failuresLeft;
};

}  // namespace

// =============================================================================
// BoundedQueue
// =============================================================================

TEST(BoundedQueueTest, FifoWithCapacity)
{
  BoundedQueue<int> queue(2);
  EXPECT_TRUE(queue.tryPush(1));
  EXPECT_TRUE(queue.tryPush(2));
  EXPECT_FALSE(queue.tryPush(3));
  EXPECT_EQ(queue.size(), 2u);

  EXPECT_EQ(queue.pop(), 1);
  EXPECT_EQ(queue.tryPop(), 2);
  EXPECT_FALSE(queue.tryPop().has_value());
}

TEST(BoundedQueueTest, CloseDrainsThenEnds)
{
  BoundedQueue<int> queue(4);
  queue.push(1);
  queue.close();

  EXPECT_FALSE(queue.push(2));
  EXPECT_TRUE(queue.closed());
  EXPECT_EQ(queue.pop(), 1);
  EXPECT_FALSE(queue.pop().has_value());
}

TEST(BoundedQueueTest, BlockedProducerResumes)
{
  BoundedQueue<int> queue(1);
  queue.push(1);

  std::atomic<bool> pushed{false};
  std::thread producer(
      [&]
      {
        queue.push(2);
        pushed = true;
      });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  EXPECT_FALSE(pushed.load());
  EXPECT_EQ(queue.pop(), 1);
  producer.join();
  EXPECT_TRUE(pushed.load());
  EXPECT_EQ(queue.pop(), 2);
}

// =============================================================================
// Retry
// =============================================================================

TEST(RetryTest, BackoffGrowsAndCaps)
{
  RetryPolicy policy;
  policy.initialDelay = std::chrono::milliseconds(10);
  policy.multiplier = 2.0;
  policy.maxDelay = std::chrono::milliseconds(50);

  EXPECT_EQ(backoffDelay(policy, 1), std::chrono::milliseconds(10));
  EXPECT_EQ(backoffDelay(policy, 2), std::chrono::milliseconds(20));
  EXPECT_EQ(backoffDelay(policy, 3), std::chrono::milliseconds(40));
  EXPECT_EQ(backoffDelay(policy, 4), std::chrono::milliseconds(50));
  EXPECT_EQ(backoffDelay(policy, 30), std::chrono::milliseconds(50));
}

TEST(RetryTest, RetriesOnlyTransientErrors)
{
  int calls = 0;
  int retries = 0;
  auto result = retryWithBackoff(
      fastRetry(5),
      [&]
      {
        if (++calls < 3)
        {
          throw StorageUnavailableError("busy");
        }
        return 42;
      },
      [&](uint32_t, const Error&) { ++retries; });
  EXPECT_EQ(result, 42);
  EXPECT_EQ(calls, 3);
  EXPECT_EQ(retries, 2);

  calls = 0;
  EXPECT_THROW(retryWithBackoff(fastRetry(5),
                                [&]
                                {
                                  ++calls;
                                  throw ConflictError("no");
                                }),
               ConflictError);
  EXPECT_EQ(calls, 1);
}

TEST(RetryTest, GivesUpAfterMaxAttempts)
{
  int calls = 0;
  EXPECT_THROW(retryWithBackoff(fastRetry(3),
                                [&]
                                {
                                  ++calls;
                                  throw StorageUnavailableError("down");
                                }),
               StorageUnavailableError);
  EXPECT_EQ(calls, 3);
}

// =============================================================================
// IngestPipeline
// =============================================================================

TEST(IngestPipelineTest, StoresBarsFromManyProducers)
{
  MemoryStorageBackend backend;
  SimulatedClock clock(minutes(1'000'000));
  PriceSeriesStore store(backend, clock);

  PipelineConfig config;
  config.workerCount = 4;
  config.queueCapacity = 16;
  IngestPipeline pipeline(store, nullptr, config);
  pipeline.start();

  constexpr int producers = 4;
  std::vector<std::thread> threads;
  for (int p = 0; p < producers; ++p)
  {
    threads.emplace_back(
        [&pipeline]()
        {
          // Every producer replays the same feed
          for (int64_t m = 0; m < 100; ++m)
          {
            pipeline.submit(makeBar(m, 100 + m));
          }
        });
  }
  for (auto& th : threads)
  {
    th.join();
  }
  pipeline.stop();

  const auto stats = pipeline.stats();
  EXPECT_EQ(stats.barsInserted, 100u);
  EXPECT_EQ(stats.barsUnchanged, 300u);
  EXPECT_EQ(stats.conflicts, 0u);
  EXPECT_EQ(backend.barCount(PartitionKey{MARKET, 1}), 100u);
  EXPECT_FALSE(pipeline.submit(makeBar(200, 1)));
}

TEST(IngestPipelineTest, TransientFailuresAreRetried)
{
  FaultyBackend backend(3);
  SimulatedClock clock(minutes(1'000'000));
  PriceSeriesStore store(backend, clock);

  PipelineConfig config;
  config.workerCount = 1;
  config.retry = fastRetry(5);
  IngestPipeline pipeline(store, nullptr, config);
  pipeline.start();
  pipeline.submit(makeBar(1, 100));
  pipeline.stop();

  const auto stats = pipeline.stats();
  EXPECT_EQ(stats.barsInserted, 1u);
  EXPECT_EQ(stats.retries, 3u);
  EXPECT_EQ(stats.storageFailures, 0u);
}

TEST(IngestPipelineTest, PersistentFailureIsCounted)
{
  FaultyBackend backend(100);
  SimulatedClock clock(minutes(1'000'000));
  PriceSeriesStore store(backend, clock);

  PipelineConfig config;
  config.workerCount = 1;
  config.retry = fastRetry(2);
  IngestPipeline pipeline(store, nullptr, config);
  pipeline.start();
  pipeline.submit(makeBar(1, 100));
  pipeline.stop();

  const auto stats = pipeline.stats();
  EXPECT_EQ(stats.barsInserted, 0u);
  EXPECT_EQ(stats.retries, 1u);
  EXPECT_EQ(stats.storageFailures, 1u);
}

TEST(IngestPipelineTest, ConflictsAndInvalidBarsAreCountedNotRetried)
{
  MemoryStorageBackend backend;
  SimulatedClock clock(minutes(1'000));
  PriceSeriesStore store(backend, clock);

  PipelineConfig config;
  config.workerCount = 1;
  IngestPipeline pipeline(store, nullptr, config);
  pipeline.start();
  pipeline.submit(makeBar(1, 100));
  pipeline.submit(makeBar(1, 101));
  pipeline.submit(makeBar(5'000, 100));  // not started yet
  pipeline.stop();

  const auto stats = pipeline.stats();
  EXPECT_EQ(stats.barsInserted, 1u);
  EXPECT_EQ(stats.conflicts, 1u);
  EXPECT_EQ(stats.invalid, 1u);
  EXPECT_EQ(stats.retries, 0u);
}

TEST(IngestPipelineTest, TicksAreStoredAndAggregated)
{
  MemoryStorageBackend backend;
  SimulatedClock clock(fromUnixSeconds(150));
  PriceSeriesStore store(backend, clock);
  // Buckets only close on shutdown, so tick order cannot race the finalizer
  AggregatorConfig aggConfig;
  aggConfig.gracePeriod = std::chrono::hours(1);
  TickAggregator aggregator(store, clock, aggConfig);

  PipelineConfig config;
  config.workerCount = 1;
  IngestPipeline pipeline(store, &aggregator, config, std::chrono::milliseconds(5));
  pipeline.start();
  pipeline.submit(makeTick(0, 100));
  pipeline.submit(makeTick(30, 105));
  pipeline.submit(makeTick(90, 110));
  pipeline.stop();

  const auto stats = pipeline.stats();
  EXPECT_EQ(stats.ticksStored, 3u);
  EXPECT_EQ(stats.ticksAggregated, 3u);
  EXPECT_EQ(stats.barsFinalized, 2u);
  EXPECT_EQ(aggregator.openBuckets(), 0u);
  EXPECT_EQ(backend.tickCount(MARKET), 3u);

  auto bars = store.queryRange(MARKET, 1, fromUnixSeconds(0), fromUnixSeconds(120)).toVector();
  ASSERT_EQ(bars.size(), 2u);
  EXPECT_EQ(bars[0].close, Price::fromInt(105));
  EXPECT_EQ(bars[1].open, Price::fromInt(110));
}

TEST(IngestPipelineTest, LateTicksAreNotArchived)
{
  MemoryStorageBackend backend;
  SimulatedClock clock(fromUnixSeconds(150));
  PriceSeriesStore store(backend, clock);
  AggregatorConfig aggConfig;
  aggConfig.gracePeriod = std::chrono::hours(1);
  TickAggregator aggregator(store, clock, aggConfig);

  aggregator.onTick(makeTick(0, 100));
  ASSERT_TRUE(aggregator.finalize(MARKET, fromUnixSeconds(0)));

  PipelineConfig config;
  config.workerCount = 1;
  IngestPipeline pipeline(store, &aggregator, config, std::chrono::milliseconds(5));
  pipeline.start();
  pipeline.submit(makeTick(10, 90));
  pipeline.submit(makeTick(70, 100));
  pipeline.stop();

  const auto stats = pipeline.stats();
  EXPECT_EQ(stats.conflicts, 1u);
  EXPECT_EQ(stats.ticksAggregated, 1u);
  EXPECT_EQ(stats.ticksStored, 1u);
  ASSERT_EQ(backend.tickCount(MARKET), 1u);
  EXPECT_EQ(store.queryTicks(MARKET, fromUnixSeconds(0), fromUnixSeconds(150)).front().timestamp,
            fromUnixSeconds(70));
}

TEST(IngestPipelineTest, CannotRestartAfterStop)
{
  MemoryStorageBackend backend;
  SimulatedClock clock;
  PriceSeriesStore store(backend, clock);
  IngestPipeline pipeline(store, nullptr);

  EXPECT_FALSE(pipeline.trySubmit(makeBar(0, 1)));
  pipeline.start();
  EXPECT_TRUE(pipeline.running());
  pipeline.stop();
  EXPECT_FALSE(pipeline.running());
  EXPECT_THROW(pipeline.start(), InvalidStateTransitionError);
}
