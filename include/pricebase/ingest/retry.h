/*
 * PriceBase
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#pragma once

#include "pricebase/config/engine_config.h"
#include "pricebase/error.h"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <thread>
#include <type_traits>
#include <utility>

namespace pricebase
{

/// Delay before retry number `attempt` (1-based), capped at maxDelay.
inline std::chrono::milliseconds backoffDelay(const RetryPolicy& policy, uint32_t attempt)
{
  double delay = static_cast<double>(policy.initialDelay.count());
  for (uint32_t i = 1; i < attempt; ++i)
  {
    delay *= policy.multiplier;
    if (delay >= static_cast<double>(policy.maxDelay.count()))
    {
      return policy.maxDelay;
    }
  }
  return std::min(policy.maxDelay, std::chrono::milliseconds(static_cast<int64_t>(delay)));
}

/// Calls fn until it returns or throws a non-retryable error. Retryable
/// errors (StorageUnavailable) are retried up to maxAttempts in total, with
/// onRetry(attempt, error) called before each backoff sleep. The last error
/// is rethrown once the attempts are used up.
template <typename Fn, typename OnRetry>
auto retryWithBackoff(const RetryPolicy& policy, Fn&& fn, OnRetry&& onRetry)
    -> std::invoke_result_t<Fn&>
{
  const uint32_t attempts = std::max<uint32_t>(policy.maxAttempts, 1);
  for (uint32_t attempt = 1;; ++attempt)
  {
    try
    {
      return fn();
    }
    catch (const Error& e)
    {
      if (!e.retryable() || attempt >= attempts)
      {
        throw;
      }
      onRetry(attempt, e);
    }
    std::this_thread::sleep_for(backoffDelay(policy, attempt));
  }
}

template <typename Fn>
auto retryWithBackoff(const RetryPolicy& policy, Fn&& fn) -> std::invoke_result_t<Fn&>
{
  return retryWithBackoff(policy, std::forward<Fn>(fn), [](uint32_t, const Error&) {});
}

}  // namespace pricebase
