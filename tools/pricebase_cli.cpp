/*
 * PriceBase
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

/**
 * Command line front end for a PriceBase data directory.
 *
 * Usage: pricebase_cli [--config <file>] <command> <dataDir> [args...]
 *
 * Every partition lives in <dataDir> as PriceData_<exchange>_<base>_<quote>_<N>mins.bin
 * (or _tick.bin for raw trades); markets.reg keeps the market ids stable
 * between runs.
 */

#include "pricebase/aggregator/aggregate.h"
#include "pricebase/backtest/backtester.h"
#include "pricebase/clock/system_clock.h"
#include "pricebase/config/config_loader.h"
#include "pricebase/error.h"
#include "pricebase/log/console_logger.h"
#include "pricebase/log/log_stream.h"
#include "pricebase/market/market_registry.h"
#include "pricebase/storage/csv_importer.h"
#include "pricebase/storage/file_storage_backend.h"
#include "pricebase/storage/price_series_store.h"

#include <charconv>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

using namespace pricebase;

namespace
{

constexpr const char* kRegistryFile = "markets.reg";

void printUsage(const char* progName)
{
  std::cerr << "Usage: " << progName << " [--config <file>] <command> <dataDir> [args...]\n\n";
  std::cerr << "Commands:\n";
  std::cerr << "  import     <dataDir> <exchange> <base> <quote> <minutes> <bars.csv> [sep]\n";
  std::cerr << "  aggregate  <dataDir> <exchange> <base> <quote> <minutes> <ticks.csv> [sep]\n";
  std::cerr << "  rollup     <dataDir> <exchange> <base> <quote> <fromMinutes> <toMinutes>\n";
  std::cerr << "  query      <dataDir> <exchange> <base> <quote> <minutes> <from> <to>\n";
  std::cerr << "  partitions <dataDir>\n";
  std::cerr << "  purge      <dataDir>\n";
  std::cerr << "  backtest   <dataDir> <exchange> <base> <quote> <minutes> <from> <to> <balance> "
               "[stake] [window]\n";
  std::cerr << "\nA dataDir of '-' uses data_dir from the config file.\n";
  std::cerr << "Times are Unix seconds or 'YYYY-MM-DD HH:MM:SS' in UTC.\n";
  std::cerr << "\nExamples:\n";
  std::cerr << "  " << progName << " import data Bitstamp USD BTC 1 bitstamp_1m.csv\n";
  std::cerr << "  " << progName
            << " backtest data Bitstamp USD BTC 1 '2017-06-21 10:00:00' '2017-06-21 12:00:00' 1000\n";
}

uint32_t parseMinutes(std::string_view text)
{
  uint32_t value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc() || ptr != text.data() + text.size() || value == 0)
  {
    throw InvalidArgumentError("'" + std::string(text) + "' is not a positive minute count");
  }
  return value;
}

TimePoint parseTime(std::string_view text)
{
  auto tp = parseUtc(text);
  if (!tp)
  {
    throw InvalidArgumentError("'" + std::string(text) + "' is not a timestamp");
  }
  return *tp;
}

Amount parseAmount(std::string_view text)
{
  auto value = Amount::parse(text);
  if (!value)
  {
    throw InvalidArgumentError("'" + std::string(text) + "' is not a decimal amount");
  }
  return *value;
}

char parseSeparator(const std::vector<std::string>& args, size_t index)
{
  if (args.size() <= index)
  {
    return ',';
  }
  const auto& sep = args[index];
  if (sep == "\\t" || sep == "tab")
  {
    return '\t';
  }
  if (sep.size() != 1)
  {
    throw InvalidArgumentError("separator must be a single character");
  }
  return sep[0];
}

void requireArgs(const std::vector<std::string>& args, size_t count)
{
  if (args.size() < count)
  {
    throw InvalidArgumentError("missing arguments");
  }
}

/// Registry, durable backend and store over one data directory.
class Workspace
{
 public:
  // "-" selects the data_dir of the config file
  Workspace(const std::string& dataDirArg, const PriceBaseConfig& config)
      : _registryPath((dataDirArg == "-" ? config.dataDir : std::filesystem::path(dataDirArg)) /
                      kRegistryFile)
  {
    const auto dataDir = _registryPath.parent_path();
    if (std::filesystem::exists(_registryPath) && !_registry.loadFromFile(_registryPath))
    {
      throw StorageUnavailableError("cannot read market registry " + _registryPath.string());
    }
    _backend.emplace(dataDir, _registry);
    _store.emplace(*_backend, _clock, config.store);
  }

  ~Workspace()
  {
    _store.reset();
    _backend.reset();
    if (!_registry.saveToFile(_registryPath))
    {
      PRICEBASE_LOG_ERROR << "cannot write market registry " << _registryPath.string();
    }
  }

  MarketRegistry& registry() { return _registry; }
  PriceSeriesStore& store() { return *_store; }

 private:
  std::filesystem::path _registryPath;
  SystemClock _clock;
  MarketRegistry _registry;
  std::optional<FileStorageBackend> _backend;
  std::optional<PriceSeriesStore> _store;
};

int cmdImport(const std::vector<std::string>& args, const PriceBaseConfig& config)
{
  requireArgs(args, 6);
  Workspace ws(args[0], config);
  const MarketId market = ws.registry().resolve(args[2], args[3], args[1]);
  const uint32_t minutes = parseMinutes(args[4]);

  CsvBarImporter importer(ws.store(), parseSeparator(args, 6));
  const auto report = importer.importFile(args[5], market, minutes);

  std::cout << "lines:     " << report.lines << "\n";
  std::cout << "inserted:  " << report.inserted << "\n";
  std::cout << "unchanged: " << report.unchanged << "\n";
  std::cout << "conflicts: " << report.conflicts << "\n";
  std::cout << "invalid:   " << report.invalid << "\n";
  for (const auto& message : report.messages)
  {
    std::cout << "  " << message << "\n";
  }
  if (!report.complete())
  {
    std::cerr << "Error: import stopped: " << *report.storageFailure << "\n";
    return 2;
  }
  return 0;
}

int cmdAggregate(const std::vector<std::string>& args, const PriceBaseConfig& config)
{
  requireArgs(args, 6);
  Workspace ws(args[0], config);
  const MarketId market = ws.registry().resolve(args[2], args[3], args[1]);
  const uint32_t minutes = parseMinutes(args[4]);

  std::ifstream in(args[5]);
  if (!in)
  {
    throw NotFoundError("cannot open " + args[5]);
  }

  size_t invalid = 0;
  const auto ticks = readTicksCsv(in, market, parseSeparator(args, 6), &invalid);
  for (const auto& tick : ticks)
  {
    ws.store().ingestTick(tick);
  }

  size_t inserted = 0;
  size_t unchanged = 0;
  for (const auto& bar : aggregateTicks(ticks, minutes))
  {
    if (ws.store().ingestBar(bar) == IngestOutcome::Inserted)
    {
      ++inserted;
    }
    else
    {
      ++unchanged;
    }
  }

  std::cout << "ticks:     " << ticks.size() << " (" << invalid << " invalid rows skipped)\n";
  std::cout << "inserted:  " << inserted << " bars\n";
  std::cout << "unchanged: " << unchanged << " bars\n";
  return 0;
}

int cmdRollup(const std::vector<std::string>& args, const PriceBaseConfig& config)
{
  requireArgs(args, 6);
  Workspace ws(args[0], config);
  const MarketId market = ws.registry().resolve(args[2], args[3], args[1]);
  const uint32_t from = parseMinutes(args[4]);
  const uint32_t to = parseMinutes(args[5]);

  const auto source = ws.store()
                          .queryRange(market, from, TimePoint::min(), TimePoint::max())
                          .toVector();

  // The newest target bucket may still be filling up
  const TimePoint openBucket = alignToInterval(SystemClock().now(), to);
  size_t inserted = 0;
  for (const auto& bar : rollupBars(source, to))
  {
    if (bar.periodStart >= openBucket)
    {
      continue;
    }
    if (ws.store().ingestBar(bar) == IngestOutcome::Inserted)
    {
      ++inserted;
    }
  }

  std::cout << "rolled " << source.size() << " " << from << "-minute bars into " << inserted
            << " new " << to << "-minute bars\n";
  return 0;
}

int cmdQuery(const std::vector<std::string>& args, const PriceBaseConfig& config)
{
  requireArgs(args, 7);
  Workspace ws(args[0], config);
  const auto market = ws.registry().findId(args[2], args[3], args[1]);
  if (!market)
  {
    throw NotFoundError("no data for " + args[1] + " " + args[2] + "/" + args[3]);
  }

  const uint32_t minutes = parseMinutes(args[4]);
  size_t count = 0;
  std::cout << "timestamp,open,high,low,close,volume\n";
  for (const auto& bar :
       ws.store().queryRange(*market, minutes, parseTime(args[5]), parseTime(args[6])))
  {
    std::cout << formatUtc(bar.periodStart) << "," << bar.open << "," << bar.high << ","
              << bar.low << "," << bar.close << "," << bar.volume << "\n";
    ++count;
  }
  PRICEBASE_LOG_INFO << count << " bars";
  return 0;
}

int cmdPartitions(const std::vector<std::string>& args, const PriceBaseConfig& config)
{
  requireArgs(args, 1);
  Workspace ws(args[0], config);
  for (const auto& key : ws.store().partitions())
  {
    const Market market = ws.registry().lookup(key.market);
    std::cout << partitionName(market, key.intervalMinutes)
              << (market.active ? "" : " (inactive)") << "\n";
  }
  return 0;
}

int cmdPurge(const std::vector<std::string>& args, const PriceBaseConfig& config)
{
  requireArgs(args, 1);
  Workspace ws(args[0], config);
  std::cout << "purged " << ws.store().purgeExpiredTicks() << " ticks\n";
  return 0;
}

int cmdBacktest(const std::vector<std::string>& args, const PriceBaseConfig& config)
{
  requireArgs(args, 8);
  Workspace ws(args[0], config);
  const auto market = ws.registry().findId(args[2], args[3], args[1]);
  if (!market)
  {
    throw NotFoundError("no data for " + args[1] + " " + args[2] + "/" + args[3]);
  }

  BacktestConfig bt;
  bt.market = *market;
  bt.intervalMinutes = parseMinutes(args[4]);
  bt.initialBalance = parseAmount(args[7]);
  bt.stake = args.size() > 8 ? parseAmount(args[8]) : Amount{};
  bt.windowSize = args.size() > 9 ? parseMinutes(args[9]) : config.indicator.defaultWindow;

  Backtester backtester(ws.store(), ws.registry(), config.indicator);
  const auto report = backtester.run(bt, parseTime(args[5]), parseTime(args[6]));

  std::cout << "time,average,bought,sold,equity\n";
  for (const auto& step : report.steps)
  {
    std::cout << formatUtc(step.time) << ",";
    if (step.average)
    {
      std::cout << *step.average;
    }
    std::cout << "," << (step.bought ? 1 : 0) << "," << (step.sold ? 1 : 0) << "," << step.equity
              << "\n";
  }

  const auto& s = report.summary;
  std::cerr << "\n=== Backtest ===\n";
  std::cerr << "Steps:        " << s.steps << " (" << s.insufficientSteps
            << " without enough history)\n";
  std::cerr << "Round trips:  " << s.trades << "\n";
  std::cerr << "Realized P/L: " << s.realizedPnl << "\n";
  std::cerr << "Equity:       " << s.initialEquity << " -> " << s.finalEquity
            << (s.positionOpen ? " (position still open)" : "") << "\n";
  return 0;
}

}  // namespace

int main(int argc, char** argv)
{
  std::vector<std::string> args(argv + 1, argv + argc);

  PriceBaseConfig config;
  try
  {
    if (args.size() >= 2 && args[0] == "--config")
    {
      config = loadConfig(args[1]);
      args.erase(args.begin(), args.begin() + 2);
    }
  }
  catch (const Error& e)
  {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
  consoleLogger().setMinLevel(config.logLevel);

  if (args.size() < 2)
  {
    printUsage(argv[0]);
    return 1;
  }

  const std::string command = args[0];
  args.erase(args.begin());

  try
  {
    if (command == "import")
    {
      return cmdImport(args, config);
    }
    if (command == "aggregate")
    {
      return cmdAggregate(args, config);
    }
    if (command == "rollup")
    {
      return cmdRollup(args, config);
    }
    if (command == "query")
    {
      return cmdQuery(args, config);
    }
    if (command == "partitions")
    {
      return cmdPartitions(args, config);
    }
    if (command == "purge")
    {
      return cmdPurge(args, config);
    }
    if (command == "backtest")
    {
      return cmdBacktest(args, config);
    }
  }
  catch (const Error& e)
  {
    std::cerr << "Error: " << e.what() << "\n";
    return e.retryable() ? 3 : 1;
  }

  std::cerr << "Error: unknown command '" << command << "'\n\n";
  printUsage(argv[0]);
  return 1;
}
