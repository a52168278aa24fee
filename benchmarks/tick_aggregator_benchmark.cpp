/*
 * PriceBase
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#include "pricebase/aggregator/aggregate.h"
#include "pricebase/aggregator/tick_aggregator.h"
#include "pricebase/clock/simulated_clock.h"

#include <benchmark/benchmark.h>
#include <memory>
#include <random>
#include <vector>

using namespace pricebase;

namespace
{

class NullSink : public IBarSink
{
 public:
  void onBar(const OhlcvBar& bar) override { benchmark::DoNotOptimize(bar.close); }
};

std::vector<PriceTick> makeTicks(size_t count, MarketId market)
{
  std::mt19937 rng(42);
  std::uniform_real_distribution<> priceDist(100.0, 110.0);
  std::uniform_real_distribution<> qtyDist(0.01, 5.0);

  std::vector<PriceTick> ticks;
  ticks.reserve(count);
  for (size_t i = 0; i < count; ++i)
  {
    PriceTick tick;
    tick.market = market;
    tick.timestamp = fromUnixNs(static_cast<int64_t>(i) * 250'000'000LL);
    tick.price = Price::fromDouble(priceDist(rng));
    tick.volume = Volume::fromDouble(qtyDist(rng));
    ticks.push_back(tick);
  }
  return ticks;
}

}  // namespace

// =============================================================================
// TickAggregator benchmarks
// =============================================================================

static void BM_TickAggregator_OnTick(benchmark::State& state)
{
  NullSink sink;
  SimulatedClock clock(fromUnixSeconds(4'000'000'000LL));
  AggregatorConfig config;
  config.intervalMinutes = 1;
  auto aggregator = std::make_unique<TickAggregator>(sink, clock, config);

  const auto ticks = makeTicks(1 << 16, 1);
  size_t i = 0;
  for (auto _ : state)
  {
    benchmark::DoNotOptimize(aggregator->onTick(ticks[i]));
    if (++i == ticks.size())
    {
      // Finalized buckets reject late ticks, so replay into a new aggregator
      state.PauseTiming();
      aggregator = std::make_unique<TickAggregator>(sink, clock, config);
      i = 0;
      state.ResumeTiming();
    }
  }
  state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_TickAggregator_OnTick);

static void BM_TickAggregator_FinalizeExpired(benchmark::State& state)
{
  NullSink sink;
  SimulatedClock clock(0);
  AggregatorConfig config;
  config.intervalMinutes = 1;

  const auto ticks = makeTicks(static_cast<size_t>(state.range(0)), 1);
  for (auto _ : state)
  {
    state.PauseTiming();
    clock.reset(0);
    TickAggregator aggregator(sink, clock, config);
    for (const auto& tick : ticks)
    {
      aggregator.onTick(tick);
    }
    clock.reset(toUnixNs(ticks.back().timestamp) + 120'000'000'000LL);
    state.ResumeTiming();

    benchmark::DoNotOptimize(aggregator.finalizeExpired());
  }
}
BENCHMARK(BM_TickAggregator_FinalizeExpired)->Range(1 << 10, 1 << 14);

// =============================================================================
// Batch aggregation benchmarks
// =============================================================================

static void BM_AggregateTicks(benchmark::State& state)
{
  const auto ticks = makeTicks(static_cast<size_t>(state.range(0)), 1);
  for (auto _ : state)
  {
    auto bars = aggregateTicks(ticks, 5);
    benchmark::DoNotOptimize(bars.data());
  }
  state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_AggregateTicks)->Range(1 << 10, 1 << 16);

static void BM_RollupBars(benchmark::State& state)
{
  const auto minuteBars = aggregateTicks(makeTicks(static_cast<size_t>(state.range(0)), 1), 1);
  for (auto _ : state)
  {
    auto bars = rollupBars(minuteBars, 60);
    benchmark::DoNotOptimize(bars.data());
  }
  state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(minuteBars.size()));
}
BENCHMARK(BM_RollupBars)->Range(1 << 12, 1 << 18);

BENCHMARK_MAIN();
