/*
 * PriceBase
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#include "pricebase/clock/simulated_clock.h"
#include "pricebase/indicator/indicator_engine.h"
#include "pricebase/storage/memory_storage_backend.h"
#include "pricebase/storage/price_series_store.h"

#include <benchmark/benchmark.h>
#include <random>

using namespace pricebase;

namespace
{

constexpr MarketId kMarket = 1;
constexpr int64_t kMinuteNs = 60'000'000'000LL;

OhlcvBar makeBar(int64_t minute, double price)
{
  OhlcvBar bar(kMarket, 1, fromUnixNs(minute * kMinuteNs), Price::fromDouble(price),
               Volume::fromDouble(1.5));
  bar.high = Price::fromDouble(price + 1.0);
  bar.low = Price::fromDouble(price - 1.0);
  return bar;
}

}  // namespace

// =============================================================================
// Ingest benchmarks
// =============================================================================

static void BM_PriceSeriesStore_IngestBar(benchmark::State& state)
{
  MemoryStorageBackend backend;
  SimulatedClock clock(fromUnixSeconds(4'000'000'000LL));
  PriceSeriesStore store(backend, clock);

  std::mt19937 rng(42);
  std::uniform_real_distribution<> priceDist(100.0, 110.0);

  int64_t minute = 0;
  for (auto _ : state)
  {
    benchmark::DoNotOptimize(store.ingestBar(makeBar(minute++, priceDist(rng))));
  }
  state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_PriceSeriesStore_IngestBar);

static void BM_PriceSeriesStore_IngestDuplicate(benchmark::State& state)
{
  MemoryStorageBackend backend;
  SimulatedClock clock(fromUnixSeconds(4'000'000'000LL));
  PriceSeriesStore store(backend, clock);

  const auto bar = makeBar(10, 100.0);
  store.ingestBar(bar);

  for (auto _ : state)
  {
    benchmark::DoNotOptimize(store.ingestBar(bar));
  }
  state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_PriceSeriesStore_IngestDuplicate);

// =============================================================================
// Query benchmarks
// =============================================================================

static void BM_PriceSeriesStore_QueryRange(benchmark::State& state)
{
  const auto numBars = state.range(0);

  MemoryStorageBackend backend;
  SimulatedClock clock(fromUnixSeconds(4'000'000'000LL));
  PriceSeriesStore store(backend, clock);
  for (int64_t i = 0; i < numBars; ++i)
  {
    store.ingestBar(makeBar(i, 100.0 + static_cast<double>(i % 10)));
  }

  for (auto _ : state)
  {
    size_t count = 0;
    for (const auto& bar : store.queryRange(kMarket, 1, fromUnixNs(0), fromUnixNs(numBars * kMinuteNs)))
    {
      benchmark::DoNotOptimize(bar.close);
      ++count;
    }
    benchmark::DoNotOptimize(count);
  }
  state.SetItemsProcessed(state.iterations() * numBars);
}
BENCHMARK(BM_PriceSeriesStore_QueryRange)->Range(1 << 10, 1 << 16);

static void BM_IndicatorEngine_RollingAverage(benchmark::State& state)
{
  const auto window = static_cast<size_t>(state.range(0));

  MemoryStorageBackend backend;
  SimulatedClock clock(fromUnixSeconds(4'000'000'000LL));
  PriceSeriesStore store(backend, clock);
  for (int64_t i = 0; i < 10'000; ++i)
  {
    store.ingestBar(makeBar(i, 100.0 + static_cast<double>(i % 25)));
  }
  IndicatorEngine engine(store);

  int64_t minute = static_cast<int64_t>(window);
  for (auto _ : state)
  {
    auto result = engine.rollingAverage(kMarket, 1, fromUnixNs(minute * kMinuteNs), BarField::Close,
                                        window);
    benchmark::DoNotOptimize(result.average);
    if (++minute >= 10'000)
    {
      minute = static_cast<int64_t>(window);
    }
  }
}
BENCHMARK(BM_IndicatorEngine_RollingAverage)->Arg(5)->Arg(50)->Arg(500);

BENCHMARK_MAIN();
