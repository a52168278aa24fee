/*
 * PriceBase
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#pragma once

#include <cstddef>
#include <filesystem>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "pricebase/common.h"
#include "pricebase/market/market.h"

namespace pricebase
{

/// Canonical store of Market identities. Markets are never removed; retired
/// markets are only flagged inactive so their history stays queryable.
class MarketRegistry
{
 public:
  /// Idempotent: identical (normalized) inputs always yield the same id.
  /// Throws InvalidSymbolError for empty or malformed names.
  MarketId resolve(std::string_view base, std::string_view quote, std::string_view exchange);

  /// Throws NotFoundError for unknown ids.
  Market lookup(MarketId id) const;
  std::optional<Market> findMarket(MarketId id) const;
  std::optional<MarketId> findId(std::string_view base, std::string_view quote,
                                 std::string_view exchange) const;

  void deactivate(MarketId id);
  void reactivate(MarketId id);
  bool isActive(MarketId id) const;

  std::vector<Market> markets() const;
  size_t size() const;

  // Persistence
  bool saveToFile(const std::filesystem::path& path) const;
  bool loadFromFile(const std::filesystem::path& path);

  std::vector<std::byte> serialize() const;
  bool deserialize(std::span<const std::byte> data);

 private:
  static std::string makeKey(const std::string& base, const std::string& quote,
                             const std::string& exchange);

  Market* findLocked(MarketId id);
  const Market* findLocked(MarketId id) const;

  mutable std::mutex _mutex;
  std::vector<Market> _markets;  // _markets[id - 1]
  std::unordered_map<std::string, MarketId> _map;
};

}  // namespace pricebase
