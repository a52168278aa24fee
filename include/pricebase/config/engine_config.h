/*
 * PriceBase
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#pragma once

#include "pricebase/log/abstract_logger.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>

#ifndef PRICEBASE_DEFAULT_QUERY_PAGE_SIZE
#define PRICEBASE_DEFAULT_QUERY_PAGE_SIZE 1024
#endif

#ifndef PRICEBASE_DEFAULT_TICK_RETENTION_HOURS
#define PRICEBASE_DEFAULT_TICK_RETENTION_HOURS (7 * 24)
#endif

#ifndef PRICEBASE_DEFAULT_MIN_PERIODS
#define PRICEBASE_DEFAULT_MIN_PERIODS 5
#endif

#ifndef PRICEBASE_DEFAULT_WINDOW_SIZE
#define PRICEBASE_DEFAULT_WINDOW_SIZE 50
#endif

#ifndef PRICEBASE_DEFAULT_QUEUE_CAPACITY
#define PRICEBASE_DEFAULT_QUEUE_CAPACITY 4096
#endif

namespace pricebase
{

namespace config
{

inline constexpr size_t DEFAULT_QUERY_PAGE_SIZE = PRICEBASE_DEFAULT_QUERY_PAGE_SIZE;
inline constexpr int64_t DEFAULT_TICK_RETENTION_HOURS = PRICEBASE_DEFAULT_TICK_RETENTION_HOURS;
inline constexpr size_t DEFAULT_MIN_PERIODS = PRICEBASE_DEFAULT_MIN_PERIODS;
inline constexpr size_t DEFAULT_WINDOW_SIZE = PRICEBASE_DEFAULT_WINDOW_SIZE;
inline constexpr size_t DEFAULT_QUEUE_CAPACITY = PRICEBASE_DEFAULT_QUEUE_CAPACITY;

static_assert(DEFAULT_QUERY_PAGE_SIZE > 0, "Query page size must be positive");
static_assert(DEFAULT_MIN_PERIODS > 0, "Minimum period count must be positive");

}  // namespace config

struct StoreConfig
{
  size_t queryPageSize = config::DEFAULT_QUERY_PAGE_SIZE;  ///< Bars fetched per backend scan
  std::chrono::nanoseconds tickRetention =
      std::chrono::hours(config::DEFAULT_TICK_RETENTION_HOURS);  ///< 0 keeps ticks forever
};

enum class LateTickPolicy : uint8_t
{
  Reject,  ///< raise ConflictError
  Drop     ///< discard with a warning
};

struct AggregatorConfig
{
  uint32_t intervalMinutes = 1;
  std::chrono::nanoseconds gracePeriod = std::chrono::seconds(0);
  LateTickPolicy latePolicy = LateTickPolicy::Reject;
  /// How long past its grace deadline a finalized bucket is remembered for
  /// late-tick checks. Older late ticks reach the store, which rejects any
  /// change to the stored bar.
  std::chrono::nanoseconds finalizedRetention = std::chrono::hours(24);
};

struct IndicatorConfig
{
  size_t minPeriods = config::DEFAULT_MIN_PERIODS;
  size_t defaultWindow = config::DEFAULT_WINDOW_SIZE;
};

struct RetryPolicy
{
  uint32_t maxAttempts = 5;
  std::chrono::milliseconds initialDelay{10};
  double multiplier = 2.0;
  std::chrono::milliseconds maxDelay{1000};
};

struct PipelineConfig
{
  size_t queueCapacity = config::DEFAULT_QUEUE_CAPACITY;
  size_t workerCount = 2;
  RetryPolicy retry;
};

struct PriceBaseConfig
{
  std::filesystem::path dataDir = "data";
  LogLevel logLevel = LogLevel::Info;

  StoreConfig store;
  AggregatorConfig aggregator;
  IndicatorConfig indicator;
  PipelineConfig pipeline;
};

}  // namespace pricebase
