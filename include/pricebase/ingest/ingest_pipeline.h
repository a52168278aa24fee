/*
 * PriceBase
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#pragma once

#include "pricebase/aggregator/tick_aggregator.h"
#include "pricebase/config/engine_config.h"
#include "pricebase/ingest/bounded_queue.h"
#include "pricebase/storage/price_series_store.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <thread>
#include <variant>
#include <vector>

namespace pricebase
{

using MarketEvent = std::variant<PriceTick, OhlcvBar>;

struct PipelineStats
{
  uint64_t ticksStored{0};
  uint64_t ticksAggregated{0};
  uint64_t ticksDropped{0};
  uint64_t barsInserted{0};
  uint64_t barsUnchanged{0};
  uint64_t barsFinalized{0};
  uint64_t conflicts{0};
  uint64_t invalid{0};
  uint64_t retries{0};
  uint64_t storageFailures{0};
};

/**
 * Fan-in from many producers (one per feed) to a pool of workers.
 *
 * Ticks are folded into the attached aggregator's open buckets and then
 * stored raw; a tick the aggregator refuses as late is not stored. Bars go
 * straight to the store. A background task finalizes
 * buckets whose grace period has passed. Transient storage failures are
 * retried with the configured backoff; every other failure is logged and
 * counted, never retried.
 */
class IngestPipeline
{
 public:
  IngestPipeline(PriceSeriesStore& store, TickAggregator* aggregator, PipelineConfig config = {},
                 std::chrono::milliseconds finalizeEvery = std::chrono::milliseconds(200));
  ~IngestPipeline();

  IngestPipeline(const IngestPipeline&) = delete;
  IngestPipeline& operator=(const IngestPipeline&) = delete;

  void start();

  /// Drains the queue, finalizes every open bucket and flushes the store.
  void stop();

  /// Blocks while the queue is full; false once stopped.
  bool submit(MarketEvent event);
  bool trySubmit(MarketEvent event);

  PipelineStats stats() const;
  bool running() const { return _running.load(std::memory_order_acquire); }
  size_t pending() const { return _queue.size(); }

 private:
  void workerLoop();
  void finalizerLoop(std::stop_token stop);

  void handle(const PriceTick& tick);
  void handle(const OhlcvBar& bar);
  void finalizeExpired();
  void finalizeRemaining();

  template <typename Fn>
  bool guarded(const char* what, Fn&& fn);

  struct Counters
  {
    std::atomic<uint64_t> ticksStored{0};
    std::atomic<uint64_t> ticksAggregated{0};
    std::atomic<uint64_t> ticksDropped{0};
    std::atomic<uint64_t> barsInserted{0};
    std::atomic<uint64_t> barsUnchanged{0};
    std::atomic<uint64_t> conflicts{0};
    std::atomic<uint64_t> invalid{0};
    std::atomic<uint64_t> retries{0};
    std::atomic<uint64_t> storageFailures{0};
  };

  PriceSeriesStore& _store;
  TickAggregator* _aggregator;
  PipelineConfig _config;
  std::chrono::milliseconds _finalizeEvery;

  BoundedQueue<MarketEvent> _queue;
  std::vector<std::jthread> _workers;
  std::optional<std::jthread> _finalizer;
  std::atomic<bool> _running{false};
  std::atomic<bool> _stopped{false};

  Counters _counters;
};

}  // namespace pricebase
