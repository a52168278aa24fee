/*
 * PriceBase
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace pricebase::format
{

// On-disk layout of FileStorageBackend partitions. Little-endian, fixed size.
//
// Bar partition  (PriceData_<...>_<N>mins.bin): BarFileHeader, BarRecord*
// Tick partition (PriceData_<...>_tick.bin):    TickFileHeader, (TickBlockHeader, payload)*
//
// Bar records are appended in arrival order; the reader rebuilds the
// time index. Tick payloads are arrays of TickRecord, optionally compressed.

inline constexpr uint32_t kBarFileMagic = 0x52424250;   // "PBBR"
inline constexpr uint32_t kTickFileMagic = 0x4B544250;  // "PBTK"
inline constexpr uint32_t kTickBlockMagic = 0x4B4C4254;  // "TBLK"
inline constexpr uint16_t kFormatVersion = 1;

inline constexpr const char* kPartitionFileExtension = ".bin";

struct BarFileHeader
{
  uint32_t magic{kBarFileMagic};
  uint16_t version{kFormatVersion};
  uint16_t reserved0{0};
  uint32_t interval_minutes{0};
  uint32_t reserved1{0};

  bool isValid() const noexcept { return magic == kBarFileMagic && version == kFormatVersion; }
};
static_assert(sizeof(BarFileHeader) == 16, "BarFileHeader must be 16 bytes");

struct alignas(8) BarRecord
{
  int64_t period_start_ns{0};
  int64_t open_raw{0};
  int64_t high_raw{0};
  int64_t low_raw{0};
  int64_t close_raw{0};
  int64_t volume_raw{0};
};
static_assert(sizeof(BarRecord) == 48, "BarRecord must be 48 bytes");

struct TickFileHeader
{
  uint32_t magic{kTickFileMagic};
  uint16_t version{kFormatVersion};
  uint16_t reserved0{0};
  uint64_t reserved1{0};

  bool isValid() const noexcept { return magic == kTickFileMagic && version == kFormatVersion; }
};
static_assert(sizeof(TickFileHeader) == 16, "TickFileHeader must be 16 bytes");

struct alignas(8) TickBlockHeader
{
  uint32_t magic{kTickBlockMagic};
  uint8_t compression{0};
  uint8_t reserved[3]{};
  uint32_t tick_count{0};
  uint32_t raw_size{0};
  uint32_t stored_size{0};
  uint32_t crc32{0};  // over the stored payload
  int64_t min_ts_ns{0};
  int64_t max_ts_ns{0};

  bool isValid() const noexcept { return magic == kTickBlockMagic; }
};
static_assert(sizeof(TickBlockHeader) == 40, "TickBlockHeader must be 40 bytes");

struct alignas(8) TickRecord
{
  int64_t timestamp_ns{0};
  int64_t price_raw{0};
  int64_t volume_raw{0};
};
static_assert(sizeof(TickRecord) == 24, "TickRecord must be 24 bytes");

namespace detail
{

constexpr std::array<uint32_t, 256> makeCrc32Table() noexcept
{
  std::array<uint32_t, 256> table{};
  for (uint32_t i = 0; i < 256; ++i)
  {
    uint32_t c = i;
    for (int k = 0; k < 8; ++k)
    {
      c = (c & 1) ? (0xEDB88320u ^ (c >> 1)) : (c >> 1);
    }
    table[i] = c;
  }
  return table;
}

}  // namespace detail

class Crc32
{
 public:
  static uint32_t compute(const void* data, size_t size) noexcept
  {
    uint32_t crc = 0xFFFFFFFFu;
    const auto* p = static_cast<const uint8_t*>(data);
    for (size_t i = 0; i < size; ++i)
    {
      crc = kTable[(crc ^ p[i]) & 0xFF] ^ (crc >> 8);
    }
    return crc ^ 0xFFFFFFFFu;
  }

 private:
  static constexpr std::array<uint32_t, 256> kTable = detail::makeCrc32Table();
};

}  // namespace pricebase::format
