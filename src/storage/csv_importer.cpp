/*
 * PriceBase
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#include "pricebase/storage/csv_importer.h"
#include "pricebase/error.h"
#include "pricebase/log/log_stream.h"

#include <array>
#include <fstream>
#include <istream>

namespace pricebase
{

namespace
{

std::string_view trim(std::string_view text)
{
  while (!text.empty() && (text.front() == ' ' || text.front() == '\t'))
  {
    text.remove_prefix(1);
  }
  while (!text.empty() && (text.back() == ' ' || text.back() == '\t' || text.back() == '\r'))
  {
    text.remove_suffix(1);
  }
  return text;
}

// Splits into exactly N fields
template <size_t N>
bool splitFields(std::string_view line, char sep, std::array<std::string_view, N>& out)
{
  size_t field = 0;
  size_t start = 0;
  for (size_t i = 0; i <= line.size(); ++i)
  {
    if (i == line.size() || line[i] == sep)
    {
      if (field >= N)
      {
        return false;
      }
      out[field++] = trim(line.substr(start, i - start));
      start = i + 1;
    }
  }
  return field == N;
}

bool skippable(std::string_view line)
{
  line = trim(line);
  return line.empty() || line.front() == '#';
}

bool isHeader(std::string_view line)
{
  line = trim(line);
  constexpr std::string_view kHeader = "timestamp";
  if (line.size() < kHeader.size())
  {
    return false;
  }
  for (size_t i = 0; i < kHeader.size(); ++i)
  {
    if ((line[i] | 0x20) != kHeader[i])
    {
      return false;
    }
  }
  return true;
}

void fail(std::string* error, std::string message)
{
  if (error)
  {
    *error = std::move(message);
  }
}

}  // namespace

std::optional<OhlcvBar> parseBarRow(std::string_view line, char sep, MarketId market,
                                    uint32_t intervalMinutes, std::string* error)
{
  std::array<std::string_view, 6> fields;
  if (!splitFields(line, sep, fields))
  {
    fail(error, "expected 6 fields");
    return std::nullopt;
  }

  auto ts = parseUtc(fields[0]);
  if (!ts)
  {
    fail(error, "bad timestamp '" + std::string(fields[0]) + "'");
    return std::nullopt;
  }

  std::array<int64_t, 5> raw{};
  for (size_t i = 0; i < raw.size(); ++i)
  {
    auto value = Price::parse(fields[i + 1]);
    if (!value)
    {
      fail(error, "bad number '" + std::string(fields[i + 1]) + "'");
      return std::nullopt;
    }
    raw[i] = value->raw();
  }

  OhlcvBar bar;
  bar.market = market;
  bar.intervalMinutes = intervalMinutes;
  bar.periodStart = *ts;
  bar.open = Price::fromRaw(raw[0]);
  bar.high = Price::fromRaw(raw[1]);
  bar.low = Price::fromRaw(raw[2]);
  bar.close = Price::fromRaw(raw[3]);
  bar.volume = Volume::fromRaw(raw[4]);
  return bar;
}

std::optional<PriceTick> parseTickRow(std::string_view line, char sep, MarketId market,
                                      std::string* error)
{
  std::array<std::string_view, 3> fields;
  if (!splitFields(line, sep, fields))
  {
    fail(error, "expected 3 fields");
    return std::nullopt;
  }

  auto ts = parseUtc(fields[0]);
  auto price = Price::parse(fields[1]);
  auto volume = Volume::parse(fields[2]);
  if (!ts || !price || !volume)
  {
    fail(error, "malformed tick row");
    return std::nullopt;
  }

  PriceTick tick;
  tick.market = market;
  tick.timestamp = *ts;
  tick.price = *price;
  tick.volume = *volume;
  return tick;
}

CsvBarImporter::CsvBarImporter(PriceSeriesStore& store, char separator)
    : _store(store), _separator(separator)
{
}

ImportReport CsvBarImporter::importFile(const std::filesystem::path& path, MarketId market,
                                        uint32_t intervalMinutes)
{
  std::ifstream in(path);
  if (!in)
  {
    throw NotFoundError("cannot open " + path.string());
  }

  PRICEBASE_LOG_INFO << "importing " << path.string() << " as " << intervalMinutes
                     << "-minute bars";
  auto report = importStream(in, market, intervalMinutes);
  PRICEBASE_LOG_INFO << "imported " << path.filename().string() << ": " << report.inserted
                     << " inserted, " << report.unchanged << " unchanged, " << report.conflicts
                     << " conflicts, " << report.invalid << " invalid";
  return report;
}

ImportReport CsvBarImporter::importStream(std::istream& in, MarketId market,
                                          uint32_t intervalMinutes)
{
  ImportReport report;
  auto note = [&report](size_t lineNo, const std::string& message)
  {
    if (report.messages.size() < kMaxMessages)
    {
      report.messages.push_back("line " + std::to_string(lineNo) + ": " + message);
    }
  };

  std::string line;
  size_t lineNo = 0;
  while (std::getline(in, line))
  {
    ++lineNo;
    if (skippable(line) || (lineNo == 1 && isHeader(line)))
    {
      continue;
    }
    ++report.lines;

    std::string error;
    auto bar = parseBarRow(line, _separator, market, intervalMinutes, &error);
    if (!bar)
    {
      ++report.invalid;
      note(lineNo, error);
      continue;
    }

    try
    {
      if (_store.ingestBar(*bar) == IngestOutcome::Inserted)
      {
        ++report.inserted;
      }
      else
      {
        ++report.unchanged;
      }
    }
    catch (const InvalidBarError& e)
    {
      ++report.invalid;
      note(lineNo, e.what());
    }
    catch (const ConflictError& e)
    {
      ++report.conflicts;
      note(lineNo, e.what());
    }
    catch (const StorageUnavailableError& e)
    {
      report.storageFailure = e.what();
      PRICEBASE_LOG_ERROR << "import stopped at line " << lineNo << ": " << e.what();
      break;
    }
  }
  return report;
}

std::vector<PriceTick> readTicksCsv(std::istream& in, MarketId market, char sep, size_t* invalid)
{
  std::vector<PriceTick> ticks;
  std::string line;
  size_t lineNo = 0;
  while (std::getline(in, line))
  {
    ++lineNo;
    if (skippable(line) || (lineNo == 1 && isHeader(line)))
    {
      continue;
    }

    if (auto tick = parseTickRow(line, sep, market))
    {
      ticks.push_back(*tick);
    }
    else if (invalid)
    {
      ++*invalid;
    }
  }
  return ticks;
}

}  // namespace pricebase
