/*
 * PriceBase
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#pragma once

#include "pricebase/market/market_registry.h"
#include "pricebase/storage/compression.h"
#include "pricebase/storage/memory_storage_backend.h"

#include <cstdio>
#include <filesystem>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace pricebase
{

struct FileStorageOptions
{
  CompressionType compression{CompressionType::None};
  size_t ticksPerBlock{4096};
};

/// Durable backend: one file per partition under `dataDir`, named after the
/// partition. Existing files are loaded on construction and their markets
/// registered in `registry`. Reads are served from memory; every write is
/// appended and flushed before it becomes visible.
class FileStorageBackend : public IStorageBackend
{
 public:
  FileStorageBackend(std::filesystem::path dataDir, MarketRegistry& registry,
                     FileStorageOptions options = {});
  ~FileStorageBackend() override;

  FileStorageBackend(const FileStorageBackend&) = delete;
  FileStorageBackend& operator=(const FileStorageBackend&) = delete;

  std::optional<OhlcvBar> findBar(const PartitionKey& key, TimePoint periodStart) const override;
  void insertBar(const PartitionKey& key, const OhlcvBar& bar) override;
  std::vector<OhlcvBar> scanBars(const PartitionKey& key, TimePoint from, TimePoint to,
                                 size_t limit) const override;
  std::optional<OhlcvBar> latestBarAtOrBefore(const PartitionKey& key, TimePoint ts) const override;

  void appendTick(const PriceTick& tick) override;
  std::vector<PriceTick> scanTicks(MarketId market, TimePoint from, TimePoint to) const override;
  size_t purgeTicksBefore(MarketId market, TimePoint cutoff) override;

  std::vector<PartitionKey> partitions() const override;

  /// Writes buffered ticks as a final block of every tick partition.
  void flush() override;

  const std::filesystem::path& dataDir() const { return _dataDir; }
  std::filesystem::path pathFor(const PartitionKey& key) const;

 private:
  struct FileCloser
  {
    void operator()(std::FILE* f) const
    {
      if (f)
      {
        std::fclose(f);
      }
    }
  };
  using FilePtr = std::unique_ptr<std::FILE, FileCloser>;

  struct BarFile
  {
    std::mutex mutex;
    std::filesystem::path path;
    FilePtr file;
  };

  struct TickFile
  {
    std::mutex mutex;
    std::filesystem::path path;
    FilePtr file;
    std::vector<PriceTick> pending;
  };

  void discover();
  void loadBarFile(const std::filesystem::path& path, MarketId market, uint32_t intervalMinutes);
  void loadTickFile(const std::filesystem::path& path, MarketId market);

  BarFile& barFileFor(const PartitionKey& key);
  TickFile& tickFileFor(MarketId market);

  FilePtr openForAppend(const std::filesystem::path& path, const void* header,
                        size_t headerSize) const;
  void writeTickBlock(std::FILE* file, const std::filesystem::path& path,
                      const std::vector<PriceTick>& ticks) const;
  void flushTicksLocked(TickFile& tickFile);

  std::filesystem::path _dataDir;
  MarketRegistry& _registry;
  FileStorageOptions _options;

  MemoryStorageBackend _cache;

  mutable std::mutex _filesMutex;
  std::unordered_map<PartitionKey, std::unique_ptr<BarFile>> _barFiles;
  std::unordered_map<MarketId, std::unique_ptr<TickFile>> _tickFiles;
};

}  // namespace pricebase
