/*
 * PriceBase
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#include "pricebase/storage/file_storage_backend.h"
#include "pricebase/error.h"
#include "pricebase/log/log_stream.h"
#include "pricebase/storage/file_format.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <limits>
#include <set>
#include <span>

namespace pricebase
{

namespace
{

std::string ioError(const std::string& what, const std::filesystem::path& path)
{
  return what + " " + path.string() + ": " + std::strerror(errno);
}

void truncateTo(const std::filesystem::path& path, uintmax_t size)
{
  std::error_code ec;
  std::filesystem::resize_file(path, size, ec);
  if (ec)
  {
    throw StorageUnavailableError("cannot truncate " + path.string() + ": " + ec.message());
  }
}

OhlcvBar toBar(const format::BarRecord& rec, MarketId market, uint32_t intervalMinutes)
{
  OhlcvBar bar;
  bar.market = market;
  bar.intervalMinutes = intervalMinutes;
  bar.periodStart = fromUnixNs(rec.period_start_ns);
  bar.open = Price::fromRaw(rec.open_raw);
  bar.high = Price::fromRaw(rec.high_raw);
  bar.low = Price::fromRaw(rec.low_raw);
  bar.close = Price::fromRaw(rec.close_raw);
  bar.volume = Volume::fromRaw(rec.volume_raw);
  return bar;
}

format::BarRecord toRecord(const OhlcvBar& bar)
{
  format::BarRecord rec;
  rec.period_start_ns = toUnixNs(bar.periodStart);
  rec.open_raw = bar.open.raw();
  rec.high_raw = bar.high.raw();
  rec.low_raw = bar.low.raw();
  rec.close_raw = bar.close.raw();
  rec.volume_raw = bar.volume.raw();
  return rec;
}

}  // namespace

FileStorageBackend::FileStorageBackend(std::filesystem::path dataDir, MarketRegistry& registry,
                                       FileStorageOptions options)
    : _dataDir(std::move(dataDir)), _registry(registry), _options(options)
{
  if (!isCompressionAvailable(_options.compression))
  {
    throw InvalidArgumentError("requested tick compression is not available in this build");
  }
  if (_options.ticksPerBlock == 0)
  {
    throw InvalidArgumentError("ticksPerBlock must be positive");
  }

  std::error_code ec;
  std::filesystem::create_directories(_dataDir, ec);
  if (ec)
  {
    throw StorageUnavailableError("cannot create data directory " + _dataDir.string() + ": " +
                                  ec.message());
  }

  discover();
}

FileStorageBackend::~FileStorageBackend()
{
  try
  {
    flush();
  }
  catch (const Error& e)
  {
    PRICEBASE_LOG_ERROR << "FileStorageBackend: buffered ticks lost on close: " << e.what();
  }
}

std::filesystem::path FileStorageBackend::pathFor(const PartitionKey& key) const
{
  const Market market = _registry.lookup(key.market);
  return _dataDir / (partitionName(market, key.intervalMinutes) + format::kPartitionFileExtension);
}

// =============================================================================
// Discovery
// =============================================================================

void FileStorageBackend::discover()
{
  std::error_code ec;
  std::filesystem::directory_iterator it(_dataDir, ec);
  if (ec)
  {
    throw StorageUnavailableError("cannot list " + _dataDir.string() + ": " + ec.message());
  }

  for (const auto& entry : it)
  {
    if (!entry.is_regular_file() || entry.path().extension() != format::kPartitionFileExtension)
    {
      continue;
    }

    std::optional<ParsedPartitionName> parsed;
    MarketId market = InvalidMarketId;
    try
    {
      parsed = parsePartitionName(entry.path().stem().string());
      if (!parsed)
      {
        continue;
      }
      market = _registry.resolve(parsed->base, parsed->quote, parsed->exchange);
    }
    catch (const InvalidArgumentError& e)
    {
      PRICEBASE_LOG_WARN << "skipping " << entry.path().filename().string() << ": " << e.what();
      continue;
    }
    catch (const InvalidSymbolError& e)
    {
      PRICEBASE_LOG_WARN << "skipping " << entry.path().filename().string() << ": " << e.what();
      continue;
    }

    if (parsed->intervalMinutes == kTickInterval)
    {
      loadTickFile(entry.path(), market);
    }
    else
    {
      loadBarFile(entry.path(), market, parsed->intervalMinutes);
    }
  }
}

void FileStorageBackend::loadBarFile(const std::filesystem::path& path, MarketId market,
                                     uint32_t intervalMinutes)
{
  std::ifstream in(path, std::ios::binary);
  if (!in)
  {
    throw StorageUnavailableError(ioError("cannot open", path));
  }

  format::BarFileHeader header;
  in.read(reinterpret_cast<char*>(&header), sizeof(header));
  if (!in || !header.isValid() || header.interval_minutes != intervalMinutes)
  {
    throw StorageUnavailableError("corrupt bar partition header in " + path.string());
  }

  const PartitionKey key{market, intervalMinutes};
  size_t count = 0;
  format::BarRecord rec;
  while (in.read(reinterpret_cast<char*>(&rec), sizeof(rec)))
  {
    _cache.insertBar(key, toBar(rec, market, intervalMinutes));
    ++count;
  }

  if (in.gcount() > 0)
  {
    // Torn append from an interrupted write
    in.close();
    PRICEBASE_LOG_WARN << "truncating partial bar record at the end of " << path.string();
    truncateTo(path, sizeof(header) + count * sizeof(rec));
  }

  auto file = std::make_unique<BarFile>();
  file->path = path;
  std::scoped_lock lock(_filesMutex);
  _barFiles[key] = std::move(file);

  PRICEBASE_LOG_DEBUG << "loaded " << count << " bars from " << path.filename().string();
}

void FileStorageBackend::loadTickFile(const std::filesystem::path& path, MarketId market)
{
  std::ifstream in(path, std::ios::binary);
  if (!in)
  {
    throw StorageUnavailableError(ioError("cannot open", path));
  }

  format::TickFileHeader header;
  in.read(reinterpret_cast<char*>(&header), sizeof(header));
  if (!in || !header.isValid())
  {
    throw StorageUnavailableError("corrupt tick partition header in " + path.string());
  }

  uintmax_t goodSize = sizeof(header);
  size_t count = 0;
  bool torn = false;
  std::vector<std::byte> stored;
  std::vector<format::TickRecord> records;

  while (true)
  {
    format::TickBlockHeader block;
    in.read(reinterpret_cast<char*>(&block), sizeof(block));
    if (in.gcount() == 0)
    {
      break;
    }
    if (!in || !block.isValid() || block.raw_size != block.tick_count * sizeof(format::TickRecord))
    {
      torn = true;
      break;
    }

    const auto type = static_cast<CompressionType>(block.compression);
    if (!isCompressionAvailable(type))
    {
      throw StorageUnavailableError("tick partition " + path.string() +
                                    " uses a compression codec not available in this build");
    }

    stored.resize(block.stored_size);
    in.read(reinterpret_cast<char*>(stored.data()), static_cast<std::streamsize>(stored.size()));
    if (!in || format::Crc32::compute(stored.data(), stored.size()) != block.crc32)
    {
      torn = true;
      break;
    }

    auto raw = TickBlockCodec::decode(type, stored, block.raw_size);
    if (!raw)
    {
      throw StorageUnavailableError("cannot decode " + std::string(toString(type)) +
                                    " tick block in " + path.string());
    }
    records.resize(block.tick_count);
    std::memcpy(records.data(), raw->data(), raw->size());

    for (const auto& rec : records)
    {
      PriceTick tick;
      tick.market = market;
      tick.timestamp = fromUnixNs(rec.timestamp_ns);
      tick.price = Price::fromRaw(rec.price_raw);
      tick.volume = Volume::fromRaw(rec.volume_raw);
      _cache.appendTick(tick);
    }

    count += block.tick_count;
    goodSize += sizeof(block) + block.stored_size;
  }

  if (torn)
  {
    in.close();
    PRICEBASE_LOG_WARN << "truncating damaged tick block at the end of " << path.string();
    truncateTo(path, goodSize);
  }

  auto file = std::make_unique<TickFile>();
  file->path = path;
  std::scoped_lock lock(_filesMutex);
  _tickFiles[market] = std::move(file);

  PRICEBASE_LOG_DEBUG << "loaded " << count << " ticks from " << path.filename().string();
}

// =============================================================================
// File handles
// =============================================================================

FileStorageBackend::BarFile& FileStorageBackend::barFileFor(const PartitionKey& key)
{
  {
    std::scoped_lock lock(_filesMutex);
    auto it = _barFiles.find(key);
    if (it != _barFiles.end())
    {
      return *it->second;
    }
  }

  auto path = pathFor(key);

  std::scoped_lock lock(_filesMutex);
  auto& slot = _barFiles[key];
  if (!slot)
  {
    slot = std::make_unique<BarFile>();
    slot->path = std::move(path);
  }
  return *slot;
}

FileStorageBackend::TickFile& FileStorageBackend::tickFileFor(MarketId market)
{
  {
    std::scoped_lock lock(_filesMutex);
    auto it = _tickFiles.find(market);
    if (it != _tickFiles.end())
    {
      return *it->second;
    }
  }

  auto path = pathFor(PartitionKey{market, kTickInterval});

  std::scoped_lock lock(_filesMutex);
  auto& slot = _tickFiles[market];
  if (!slot)
  {
    slot = std::make_unique<TickFile>();
    slot->path = std::move(path);
  }
  return *slot;
}

FileStorageBackend::FilePtr FileStorageBackend::openForAppend(const std::filesystem::path& path,
                                                              const void* header,
                                                              size_t headerSize) const
{
  std::error_code ec;
  const bool fresh = !std::filesystem::exists(path, ec) || std::filesystem::file_size(path, ec) == 0;

  FilePtr file(std::fopen(path.string().c_str(), "ab"));
  if (!file)
  {
    throw StorageUnavailableError(ioError("cannot open", path));
  }

  if (fresh)
  {
    if (std::fwrite(header, headerSize, 1, file.get()) != 1 || std::fflush(file.get()) != 0)
    {
      throw StorageUnavailableError(ioError("cannot write header to", path));
    }
  }
  return file;
}

// =============================================================================
// Bars
// =============================================================================

std::optional<OhlcvBar> FileStorageBackend::findBar(const PartitionKey& key,
                                                    TimePoint periodStart) const
{
  return _cache.findBar(key, periodStart);
}

void FileStorageBackend::insertBar(const PartitionKey& key, const OhlcvBar& bar)
{
  auto& barFile = barFileFor(key);
  std::scoped_lock lock(barFile.mutex);

  if (!barFile.file)
  {
    format::BarFileHeader header;
    header.interval_minutes = key.intervalMinutes;
    barFile.file = openForAppend(barFile.path, &header, sizeof(header));
  }

  std::error_code ec;
  const auto sizeBefore = std::filesystem::file_size(barFile.path, ec);
  if (ec)
  {
    throw StorageUnavailableError("cannot stat " + barFile.path.string() + ": " + ec.message());
  }

  const auto rec = toRecord(bar);
  if (std::fwrite(&rec, sizeof(rec), 1, barFile.file.get()) != 1 ||
      std::fflush(barFile.file.get()) != 0)
  {
    const auto message = ioError("cannot append bar to", barFile.path);
    barFile.file.reset();
    truncateTo(barFile.path, sizeBefore);
    throw StorageUnavailableError(message);
  }

  _cache.insertBar(key, bar);
}

std::vector<OhlcvBar> FileStorageBackend::scanBars(const PartitionKey& key, TimePoint from,
                                                   TimePoint to, size_t limit) const
{
  return _cache.scanBars(key, from, to, limit);
}

std::optional<OhlcvBar> FileStorageBackend::latestBarAtOrBefore(const PartitionKey& key,
                                                                TimePoint ts) const
{
  return _cache.latestBarAtOrBefore(key, ts);
}

// =============================================================================
// Ticks
// =============================================================================

void FileStorageBackend::writeTickBlock(std::FILE* file, const std::filesystem::path& path,
                                        const std::vector<PriceTick>& ticks) const
{
  std::vector<format::TickRecord> records;
  records.reserve(ticks.size());
  format::TickBlockHeader block;
  block.min_ts_ns = std::numeric_limits<int64_t>::max();
  block.max_ts_ns = std::numeric_limits<int64_t>::min();

  for (const auto& tick : ticks)
  {
    format::TickRecord rec;
    rec.timestamp_ns = toUnixNs(tick.timestamp);
    rec.price_raw = tick.price.raw();
    rec.volume_raw = tick.volume.raw();
    records.push_back(rec);
    block.min_ts_ns = std::min(block.min_ts_ns, rec.timestamp_ns);
    block.max_ts_ns = std::max(block.max_ts_ns, rec.timestamp_ns);
  }

  const size_t rawSize = records.size() * sizeof(format::TickRecord);
  const auto stored = TickBlockCodec::encode(
      _options.compression, std::as_bytes(std::span<const format::TickRecord>(records)));
  const size_t storedSize = stored.size();
  if (storedSize == 0 && rawSize > 0)
  {
    throw StorageUnavailableError("cannot compress tick block for " + path.string());
  }

  block.compression = static_cast<uint8_t>(_options.compression);
  block.tick_count = static_cast<uint32_t>(records.size());
  block.raw_size = static_cast<uint32_t>(rawSize);
  block.stored_size = static_cast<uint32_t>(storedSize);
  block.crc32 = format::Crc32::compute(stored.data(), storedSize);

  if (std::fwrite(&block, sizeof(block), 1, file) != 1 ||
      std::fwrite(stored.data(), 1, storedSize, file) != storedSize || std::fflush(file) != 0)
  {
    throw StorageUnavailableError(ioError("cannot append tick block to", path));
  }
}

void FileStorageBackend::flushTicksLocked(TickFile& tickFile)
{
  if (tickFile.pending.empty())
  {
    return;
  }

  if (!tickFile.file)
  {
    format::TickFileHeader header;
    tickFile.file = openForAppend(tickFile.path, &header, sizeof(header));
  }

  std::error_code ec;
  const auto sizeBefore = std::filesystem::file_size(tickFile.path, ec);
  if (ec)
  {
    throw StorageUnavailableError("cannot stat " + tickFile.path.string() + ": " + ec.message());
  }

  try
  {
    writeTickBlock(tickFile.file.get(), tickFile.path, tickFile.pending);
  }
  catch (const StorageUnavailableError&)
  {
    tickFile.file.reset();
    truncateTo(tickFile.path, sizeBefore);
    throw;
  }
  tickFile.pending.clear();
}

void FileStorageBackend::appendTick(const PriceTick& tick)
{
  auto& tickFile = tickFileFor(tick.market);
  std::scoped_lock lock(tickFile.mutex);

  // A failed block write leaves no trace of this tick, so a retry stores it once
  tickFile.pending.push_back(tick);
  if (tickFile.pending.size() >= _options.ticksPerBlock)
  {
    try
    {
      flushTicksLocked(tickFile);
    }
    catch (const StorageUnavailableError&)
    {
      tickFile.pending.pop_back();
      throw;
    }
  }
  _cache.appendTick(tick);
}

std::vector<PriceTick> FileStorageBackend::scanTicks(MarketId market, TimePoint from,
                                                     TimePoint to) const
{
  return _cache.scanTicks(market, from, to);
}

size_t FileStorageBackend::purgeTicksBefore(MarketId market, TimePoint cutoff)
{
  TickFile* tickFile = nullptr;
  {
    std::scoped_lock lock(_filesMutex);
    auto it = _tickFiles.find(market);
    if (it == _tickFiles.end())
    {
      return 0;
    }
    tickFile = it->second.get();
  }

  std::scoped_lock lock(tickFile->mutex);

  // Rewrite the survivors to a sibling file, then swap it in
  const auto survivors = _cache.scanTicks(market, cutoff, TimePoint::max());
  if (survivors.size() == _cache.tickCount(market))
  {
    return 0;
  }

  const auto tmpPath = std::filesystem::path(tickFile->path.string() + ".tmp");
  {
    FilePtr tmp(std::fopen(tmpPath.string().c_str(), "wb"));
    if (!tmp)
    {
      throw StorageUnavailableError(ioError("cannot create", tmpPath));
    }

    format::TickFileHeader header;
    if (std::fwrite(&header, sizeof(header), 1, tmp.get()) != 1)
    {
      throw StorageUnavailableError(ioError("cannot write", tmpPath));
    }

    for (size_t offset = 0; offset < survivors.size(); offset += _options.ticksPerBlock)
    {
      const auto end = std::min(survivors.size(), offset + _options.ticksPerBlock);
      writeTickBlock(tmp.get(), tmpPath,
                     std::vector<PriceTick>(survivors.begin() + static_cast<std::ptrdiff_t>(offset),
                                            survivors.begin() + static_cast<std::ptrdiff_t>(end)));
    }
  }

  tickFile->file.reset();
  std::error_code ec;
  std::filesystem::rename(tmpPath, tickFile->path, ec);
  if (ec)
  {
    throw StorageUnavailableError("cannot replace " + tickFile->path.string() + ": " +
                                  ec.message());
  }

  // Buffered ticks at or after the cutoff are now in the rewritten file
  tickFile->pending.clear();
  return _cache.purgeTicksBefore(market, cutoff);
}

// =============================================================================
// Partitions
// =============================================================================

std::vector<PartitionKey> FileStorageBackend::partitions() const
{
  std::set<PartitionKey> keys;
  for (const auto& key : _cache.partitions())
  {
    keys.insert(key);
  }

  std::scoped_lock lock(_filesMutex);
  for (const auto& [key, _] : _barFiles)
  {
    keys.insert(key);
  }
  for (const auto& [market, _] : _tickFiles)
  {
    keys.insert(PartitionKey{market, kTickInterval});
  }
  return {keys.begin(), keys.end()};
}

void FileStorageBackend::flush()
{
  std::vector<TickFile*> tickFiles;
  {
    std::scoped_lock lock(_filesMutex);
    tickFiles.reserve(_tickFiles.size());
    for (const auto& [_, file] : _tickFiles)
    {
      tickFiles.push_back(file.get());
    }
  }

  for (auto* tickFile : tickFiles)
  {
    std::scoped_lock lock(tickFile->mutex);
    flushTicksLocked(*tickFile);
  }
}

}  // namespace pricebase
