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
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#if PRICEBASE_LZ4_ENABLED
#include <lz4.h>
#endif

namespace pricebase
{

// Stored in TickBlockHeader::compression; values are part of the file format
enum class CompressionType : uint8_t
{
  None = 0,
  LZ4 = 1
};

inline std::string_view toString(CompressionType type)
{
  return type == CompressionType::LZ4 ? "lz4" : "none";
}

inline constexpr bool isCompressionAvailable(CompressionType type)
{
  if (type == CompressionType::None)
  {
    return true;
  }
#if PRICEBASE_LZ4_ENABLED
  return type == CompressionType::LZ4;
#else
  return false;
#endif
}

/// Encodes and decodes the payload of one tick block.
struct TickBlockCodec
{
  /// Empty result means the codec failed or is unavailable.
  static std::vector<std::byte> encode(CompressionType type, std::span<const std::byte> raw)
  {
    if (type == CompressionType::None)
    {
      return {raw.begin(), raw.end()};
    }
#if PRICEBASE_LZ4_ENABLED
    if (type == CompressionType::LZ4 && !raw.empty())
    {
      std::vector<std::byte> out(
          static_cast<size_t>(LZ4_compressBound(static_cast<int>(raw.size()))));
      const int written = LZ4_compress_default(reinterpret_cast<const char*>(raw.data()),
                                               reinterpret_cast<char*>(out.data()),
                                               static_cast<int>(raw.size()),
                                               static_cast<int>(out.size()));
      out.resize(written > 0 ? static_cast<size_t>(written) : 0);
      return out;
    }
#endif
    return {};
  }

  /// Decodes into exactly rawSize bytes, or nullopt on a size mismatch or codec error.
  static std::optional<std::vector<std::byte>> decode(CompressionType type,
                                                      std::span<const std::byte> stored,
                                                      size_t rawSize)
  {
    if (type == CompressionType::None)
    {
      if (stored.size() != rawSize)
      {
        return std::nullopt;
      }
      return std::vector<std::byte>(stored.begin(), stored.end());
    }
#if PRICEBASE_LZ4_ENABLED
    if (type == CompressionType::LZ4)
    {
      std::vector<std::byte> out(rawSize);
      const int n = LZ4_decompress_safe(reinterpret_cast<const char*>(stored.data()),
                                        reinterpret_cast<char*>(out.data()),
                                        static_cast<int>(stored.size()),
                                        static_cast<int>(rawSize));
      if (n < 0 || static_cast<size_t>(n) != rawSize)
      {
        return std::nullopt;
      }
      return out;
    }
#endif
    return std::nullopt;
  }
};

}  // namespace pricebase
