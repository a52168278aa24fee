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

#include <filesystem>
#include <iosfwd>

namespace pricebase
{

/**
 * Reads `key=value` lines on top of the defaults. Blank lines and lines
 * starting with '#' are ignored. Recognized keys:
 *
 *   data_dir, log_level,
 *   store.query_page_size, store.tick_retention_minutes,
 *   aggregator.interval_minutes, aggregator.grace_seconds, aggregator.late_policy,
 *   aggregator.finalized_retention_minutes,
 *   indicator.min_periods, indicator.window,
 *   pipeline.queue_capacity, pipeline.workers,
 *   retry.max_attempts, retry.initial_delay_ms, retry.multiplier, retry.max_delay_ms
 *
 * Unknown keys and malformed values raise InvalidArgumentError naming the line.
 */
PriceBaseConfig parseConfig(std::istream& in);

/// Throws NotFoundError when the file cannot be opened.
PriceBaseConfig loadConfig(const std::filesystem::path& path);

}  // namespace pricebase
