/*
 * PriceBase
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#include "pricebase/ingest/ingest_pipeline.h"
#include "pricebase/error.h"
#include "pricebase/ingest/retry.h"
#include "pricebase/log/log_stream.h"

#include <condition_variable>
#include <mutex>

namespace pricebase
{

IngestPipeline::IngestPipeline(PriceSeriesStore& store, TickAggregator* aggregator,
                               PipelineConfig config, std::chrono::milliseconds finalizeEvery)
    : _store(store),
      _aggregator(aggregator),
      _config(config),
      _finalizeEvery(finalizeEvery),
      _queue(config.queueCapacity)
{
  if (_config.workerCount == 0)
  {
    throw InvalidArgumentError("pipeline needs at least one worker");
  }
}

IngestPipeline::~IngestPipeline() { stop(); }

void IngestPipeline::start()
{
  if (_stopped.load(std::memory_order_acquire))
  {
    throw InvalidStateTransitionError("pipeline cannot be restarted after stop");
  }
  if (_running.exchange(true, std::memory_order_acq_rel))
  {
    return;
  }

  _workers.reserve(_config.workerCount);
  for (size_t i = 0; i < _config.workerCount; ++i)
  {
    _workers.emplace_back([this] { workerLoop(); });
  }
  if (_aggregator)
  {
    _finalizer.emplace([this](std::stop_token stop) { finalizerLoop(stop); });
  }

  PRICEBASE_LOG_INFO << "ingest pipeline started with " << _config.workerCount << " workers";
}

void IngestPipeline::stop()
{
  if (!_running.exchange(false, std::memory_order_acq_rel))
  {
    return;
  }
  _stopped.store(true, std::memory_order_release);

  _queue.close();
  _workers.clear();  // jthread joins; workers exit once the queue is drained

  if (_finalizer)
  {
    _finalizer->request_stop();
    _finalizer.reset();
  }

  finalizeRemaining();
  guarded("flush", [this] { _store.flush(); });

  const auto s = stats();
  PRICEBASE_LOG_INFO << "ingest pipeline stopped: " << s.barsInserted << " bars inserted, "
                     << s.ticksStored << " ticks stored, " << s.conflicts << " conflicts, "
                     << s.storageFailures << " storage failures";
}

bool IngestPipeline::submit(MarketEvent event)
{
  if (!running())
  {
    return false;
  }
  return _queue.push(std::move(event));
}

bool IngestPipeline::trySubmit(MarketEvent event)
{
  if (!running())
  {
    return false;
  }
  return _queue.tryPush(std::move(event));
}

PipelineStats IngestPipeline::stats() const
{
  PipelineStats s;
  s.ticksStored = _counters.ticksStored.load(std::memory_order_relaxed);
  s.ticksAggregated = _counters.ticksAggregated.load(std::memory_order_relaxed);
  s.ticksDropped = _counters.ticksDropped.load(std::memory_order_relaxed);
  s.barsInserted = _counters.barsInserted.load(std::memory_order_relaxed);
  s.barsUnchanged = _counters.barsUnchanged.load(std::memory_order_relaxed);
  s.barsFinalized = _aggregator ? _aggregator->finalizedCount() : 0;
  s.conflicts = _counters.conflicts.load(std::memory_order_relaxed);
  s.invalid = _counters.invalid.load(std::memory_order_relaxed);
  s.retries = _counters.retries.load(std::memory_order_relaxed);
  s.storageFailures = _counters.storageFailures.load(std::memory_order_relaxed);
  return s;
}

// =============================================================================
// Workers
// =============================================================================

template <typename Fn>
bool IngestPipeline::guarded(const char* what, Fn&& fn)
{
  auto onRetry = [this, what](uint32_t attempt, const Error& e)
  {
    _counters.retries.fetch_add(1, std::memory_order_relaxed);
    PRICEBASE_LOG_WARN << what << ": attempt " << attempt << " failed, retrying: " << e.what();
  };

  try
  {
    retryWithBackoff(_config.retry, fn, onRetry);
    return true;
  }
  catch (const ConflictError& e)
  {
    _counters.conflicts.fetch_add(1, std::memory_order_relaxed);
    PRICEBASE_LOG_WARN << what << ": " << e.what();
  }
  catch (const InvalidBarError& e)
  {
    _counters.invalid.fetch_add(1, std::memory_order_relaxed);
    PRICEBASE_LOG_WARN << what << ": " << e.what();
  }
  catch (const StorageUnavailableError& e)
  {
    _counters.storageFailures.fetch_add(1, std::memory_order_relaxed);
    PRICEBASE_LOG_ERROR << what << ": giving up after " << _config.retry.maxAttempts
                        << " attempts: " << e.what();
  }
  catch (const Error& e)
  {
    _counters.invalid.fetch_add(1, std::memory_order_relaxed);
    PRICEBASE_LOG_ERROR << what << ": " << e.what();
  }
  return false;
}

void IngestPipeline::workerLoop()
{
  while (auto event = _queue.pop())
  {
    std::visit([this](const auto& payload) { handle(payload); }, *event);
  }
}

void IngestPipeline::handle(const PriceTick& tick)
{
  // Late ticks the aggregator refuses are not archived either
  if (_aggregator)
  {
    TickOutcome outcome = TickOutcome::Accepted;
    if (!guarded("aggregate tick", [&] { outcome = _aggregator->onTick(tick); }))
    {
      return;
    }
    if (outcome == TickOutcome::Dropped)
    {
      _counters.ticksDropped.fetch_add(1, std::memory_order_relaxed);
      return;
    }
    _counters.ticksAggregated.fetch_add(1, std::memory_order_relaxed);
  }

  if (guarded("store tick", [&] { _store.ingestTick(tick); }))
  {
    _counters.ticksStored.fetch_add(1, std::memory_order_relaxed);
  }
}

void IngestPipeline::handle(const OhlcvBar& bar)
{
  IngestOutcome outcome = IngestOutcome::Inserted;
  if (!guarded("store bar", [&] { outcome = _store.ingestBar(bar); }))
  {
    return;
  }
  if (outcome == IngestOutcome::Inserted)
  {
    _counters.barsInserted.fetch_add(1, std::memory_order_relaxed);
  }
  else
  {
    _counters.barsUnchanged.fetch_add(1, std::memory_order_relaxed);
  }
}

// =============================================================================
// Finalization
// =============================================================================

void IngestPipeline::finalizerLoop(std::stop_token stop)
{
  std::mutex mutex;
  std::condition_variable_any cv;
  while (!stop.stop_requested())
  {
    {
      std::unique_lock lock(mutex);
      if (cv.wait_for(lock, stop, _finalizeEvery, [] { return false; }) || stop.stop_requested())
      {
        break;
      }
    }
    finalizeExpired();
  }
}

void IngestPipeline::finalizeExpired()
{
  guarded("finalize", [this] { _aggregator->finalizeExpired(); });
}

void IngestPipeline::finalizeRemaining()
{
  if (!_aggregator)
  {
    return;
  }

  while (_aggregator->openBuckets() > 0)
  {
    const size_t before = _aggregator->openBuckets();
    guarded("final flush", [this] { _aggregator->finalizeAll(); });
    const size_t after = _aggregator->openBuckets();
    if (after >= before)
    {
      PRICEBASE_LOG_ERROR << after << " bars could not be finalized on shutdown";
      break;
    }
  }
}

}  // namespace pricebase
