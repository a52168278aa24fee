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
#include "pricebase/storage/csv_importer.h"
#include "pricebase/storage/memory_storage_backend.h"

#include <gtest/gtest.h>
#include <sstream>

using namespace pricebase;

namespace
{

constexpr MarketId MARKET = 3;

// Fails every insert after the first `allowed` ones
class FlakyBackend : public MemoryStorageBackend
{
 public:
  explicit FlakyBackend(size_t allowed) : _allowed(allowed) {}

  void insertBar(const PartitionKey& key, const OhlcvBar& bar) override
  {
    if (_inserts++ >= _allowed)
    {
      throw StorageUnavailableError("disk full");
    }
    MemoryStorageBackend::insertBar(key, bar);
  }

 private:
  size_t _allowed;
  size_t _inserts{0};
};

}  // namespace

TEST(CsvImporterTest, ParsesBarRow)
{
  std::string error;
  auto bar = parseBarRow("2017-06-21 10:00:00,2700.5,2710,2690.25,2705,12.5", ',', MARKET, 1,
                         &error);
  ASSERT_TRUE(bar.has_value()) << error;
  EXPECT_EQ(bar->market, MARKET);
  EXPECT_EQ(bar->intervalMinutes, 1u);
  EXPECT_EQ(bar->periodStart, fromUnixSeconds(1'498'039'200));
  EXPECT_EQ(bar->open, Price::parse("2700.5").value());
  EXPECT_EQ(bar->low, Price::parse("2690.25").value());
  EXPECT_EQ(bar->volume, Volume::parse("12.5").value());
}

TEST(CsvImporterTest, CustomSeparator)
{
  auto bar = parseBarRow("1498039200;1;2;0.5;1.5;3", ';', MARKET, 5);
  ASSERT_TRUE(bar.has_value());
  EXPECT_EQ(bar->high, Price::fromInt(2));
  EXPECT_FALSE(parseBarRow("1498039200;1;2;0.5;1.5;3", ',', MARKET, 5).has_value());
}

TEST(CsvImporterTest, MalformedRowsExplainThemselves)
{
  std::string error;
  EXPECT_FALSE(parseBarRow("1498039200,1,2,3", ',', MARKET, 1, &error).has_value());
  EXPECT_EQ(error, "expected 6 fields");

  EXPECT_FALSE(parseBarRow("soon,1,2,0.5,1.5,3", ',', MARKET, 1, &error).has_value());
  EXPECT_NE(error.find("timestamp"), std::string::npos);

  EXPECT_FALSE(parseBarRow("1498039200,1,x,0.5,1.5,3", ',', MARKET, 1, &error).has_value());
  EXPECT_NE(error.find("'x'"), std::string::npos);

  EXPECT_FALSE(parseTickRow("1498039200,100", ',', MARKET, &error).has_value());
}

TEST(CsvImporterTest, ImportCountsEveryOutcome)
{
  MemoryStorageBackend backend;
  SimulatedClock clock(fromUnixSeconds(2'000'000'000));
  PriceSeriesStore store(backend, clock);
  store.ingestBar(*parseBarRow("60,10,12,9,11,1", ',', MARKET, 1));
  store.ingestBar(*parseBarRow("120,10,12,9,11,1", ',', MARKET, 1));

  std::istringstream in(
      "timestamp,open,high,low,close,volume\n"
      "# exported from the exchange\n"
      "0,10,12,9,11,1\n"
      "\n"
      "60,10,12,9,11,1\n"         // identical
      "120,10,12,9,11.5,1\n"      // conflicting close
      "180,10,12,9,13,1\n"        // close above high
      "240,10,12,9,11\n"          // short row
      "300,10,12,9,11,2\r\n");

  CsvBarImporter importer(store);
  auto report = importer.importStream(in, MARKET, 1);

  EXPECT_EQ(report.lines, 6u);
  EXPECT_EQ(report.inserted, 2u);
  EXPECT_EQ(report.unchanged, 1u);
  EXPECT_EQ(report.conflicts, 1u);
  EXPECT_EQ(report.invalid, 2u);
  EXPECT_TRUE(report.complete());
  ASSERT_EQ(report.messages.size(), 3u);
  EXPECT_EQ(report.messages[0].rfind("line 6:", 0), 0u);
  EXPECT_EQ(backend.barCount(PartitionKey{MARKET, 1}), 4u);
}

TEST(CsvImporterTest, StorageFailureStopsImport)
{
  FlakyBackend backend(2);
  SimulatedClock clock(fromUnixSeconds(2'000'000'000));
  PriceSeriesStore store(backend, clock);

  std::istringstream in(
      "0,10,12,9,11,1\n"
      "60,10,12,9,11,1\n"
      "120,10,12,9,11,1\n"
      "180,10,12,9,11,1\n");

  CsvBarImporter importer(store);
  auto report = importer.importStream(in, MARKET, 1);

  EXPECT_FALSE(report.complete());
  EXPECT_EQ(report.inserted, 2u);
  EXPECT_EQ(report.lines, 3u);
  EXPECT_EQ(backend.barCount(PartitionKey{MARKET, 1}), 2u);
}

TEST(CsvImporterTest, MissingFileThrows)
{
  MemoryStorageBackend backend;
  SimulatedClock clock(fromUnixSeconds(2'000'000'000));
  PriceSeriesStore store(backend, clock);
  CsvBarImporter importer(store);

  EXPECT_THROW(importer.importFile("/nonexistent/pricebase/bars.csv", MARKET, 1), NotFoundError);
}

TEST(CsvImporterTest, ReadsTicksSkippingBadRows)
{
  std::istringstream in(
      "timestamp,price,volume\n"
      "10,100.5,0.25\n"
      "oops\n"
      "20\t101\t1\n"
      "30,101.5,2\n");

  size_t invalid = 0;
  auto ticks = readTicksCsv(in, MARKET, ',', &invalid);
  ASSERT_EQ(ticks.size(), 2u);
  EXPECT_EQ(invalid, 2u);
  EXPECT_EQ(ticks[0].timestamp, fromUnixSeconds(10));
  EXPECT_EQ(ticks[0].price, Price::parse("100.5").value());
  EXPECT_EQ(ticks[1].volume, Volume::fromInt(2));
  EXPECT_EQ(ticks[1].market, MARKET);
}
