/*
 * PriceBase
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#pragma once

#include "pricebase/storage/price_series_store.h"

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pricebase
{

struct ImportReport
{
  size_t lines{0};  // data lines seen, blanks and comments excluded
  size_t inserted{0};
  size_t unchanged{0};
  size_t conflicts{0};
  size_t invalid{0};
  std::optional<std::string> storageFailure;  // set when the import stopped early
  std::vector<std::string> messages;          // first few per-line problems

  bool complete() const { return !storageFailure.has_value(); }
};

/// Parses "<timestamp><sep><open><sep><high><sep><low><sep><close><sep><volume>".
/// Returns nullopt and fills `error` on malformed rows.
std::optional<OhlcvBar> parseBarRow(std::string_view line, char sep, MarketId market,
                                    uint32_t intervalMinutes, std::string* error = nullptr);

/// Parses "<timestamp><sep><price><sep><volume>".
std::optional<PriceTick> parseTickRow(std::string_view line, char sep, MarketId market,
                                      std::string* error = nullptr);

/// Bulk loader for OHLCV rows. Each row goes through PriceSeriesStore::ingestBar,
/// so the file may overlap data already stored: identical rows count as
/// unchanged, differing ones as conflicts. The first storage failure ends the
/// import; rows before it stay stored.
class CsvBarImporter
{
 public:
  explicit CsvBarImporter(PriceSeriesStore& store, char separator = ',');

  /// Throws NotFoundError when the file cannot be opened.
  ImportReport importFile(const std::filesystem::path& path, MarketId market,
                          uint32_t intervalMinutes);
  ImportReport importStream(std::istream& in, MarketId market, uint32_t intervalMinutes);

  static constexpr size_t kMaxMessages = 20;

 private:
  PriceSeriesStore& _store;
  char _separator;
};

/// Reads tick rows, skipping (and counting in `invalid`) malformed ones.
std::vector<PriceTick> readTicksCsv(std::istream& in, MarketId market, char sep = ',',
                                    size_t* invalid = nullptr);

}  // namespace pricebase
