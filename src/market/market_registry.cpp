/*
 * PriceBase
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#include "pricebase/market/market_registry.h"
#include "pricebase/error.h"

#include <fstream>
#include <iterator>

namespace pricebase
{

std::string MarketRegistry::makeKey(const std::string& base, const std::string& quote,
                                    const std::string& exchange)
{
  return exchange + ":" + base + "/" + quote;
}

Market* MarketRegistry::findLocked(MarketId id)
{
  if (id == InvalidMarketId || id > _markets.size())
  {
    return nullptr;
  }
  return &_markets[id - 1];
}

const Market* MarketRegistry::findLocked(MarketId id) const
{
  if (id == InvalidMarketId || id > _markets.size())
  {
    return nullptr;
  }
  return &_markets[id - 1];
}

// =============================================================================
// Registration and lookup
// =============================================================================

MarketId MarketRegistry::resolve(std::string_view base, std::string_view quote,
                                 std::string_view exchange)
{
  // Normalization throws before any state is touched
  auto normBase = normalizeCurrency(base);
  auto normQuote = normalizeCurrency(quote);
  auto normExchange = normalizeExchange(exchange);

  std::string key = makeKey(normBase, normQuote, normExchange);

  std::scoped_lock lock(_mutex);
  auto it = _map.find(key);
  if (it != _map.end())
  {
    return it->second;
  }

  MarketId id = static_cast<MarketId>(_markets.size() + 1);
  Market market;
  market.id = id;
  market.base = std::move(normBase);
  market.quote = std::move(normQuote);
  market.exchange = std::move(normExchange);
  _markets.push_back(std::move(market));
  _map.emplace(std::move(key), id);
  return id;
}

Market MarketRegistry::lookup(MarketId id) const
{
  std::scoped_lock lock(_mutex);
  const Market* market = findLocked(id);
  if (!market)
  {
    throw NotFoundError("market id " + std::to_string(id) + " is not registered");
  }
  return *market;
}

std::optional<Market> MarketRegistry::findMarket(MarketId id) const
{
  std::scoped_lock lock(_mutex);
  const Market* market = findLocked(id);
  if (!market)
  {
    return std::nullopt;
  }
  return *market;
}

std::optional<MarketId> MarketRegistry::findId(std::string_view base, std::string_view quote,
                                               std::string_view exchange) const
{
  std::string key;
  try
  {
    key = makeKey(normalizeCurrency(base), normalizeCurrency(quote), normalizeExchange(exchange));
  }
  catch (const InvalidSymbolError&)
  {
    return std::nullopt;
  }

  std::scoped_lock lock(_mutex);
  auto it = _map.find(key);
  if (it == _map.end())
  {
    return std::nullopt;
  }
  return it->second;
}

void MarketRegistry::deactivate(MarketId id)
{
  std::scoped_lock lock(_mutex);
  Market* market = findLocked(id);
  if (!market)
  {
    throw NotFoundError("market id " + std::to_string(id) + " is not registered");
  }
  market->active = false;
}

void MarketRegistry::reactivate(MarketId id)
{
  std::scoped_lock lock(_mutex);
  Market* market = findLocked(id);
  if (!market)
  {
    throw NotFoundError("market id " + std::to_string(id) + " is not registered");
  }
  market->active = true;
}

bool MarketRegistry::isActive(MarketId id) const
{
  std::scoped_lock lock(_mutex);
  const Market* market = findLocked(id);
  return market && market->active;
}

std::vector<Market> MarketRegistry::markets() const
{
  std::scoped_lock lock(_mutex);
  return _markets;
}

size_t MarketRegistry::size() const
{
  std::scoped_lock lock(_mutex);
  return _markets.size();
}

// =============================================================================
// Persistence
// =============================================================================

// Binary format:
// [4 bytes] magic: "MREG"
// [4 bytes] version
// [4 bytes] market count
// For each market, in id order:
//   [4 bytes] id
//   [2 bytes] base length    [N bytes] base
//   [2 bytes] quote length   [N bytes] quote
//   [2 bytes] exchange length [N bytes] exchange
//   [1 byte] flags (bit 0: active)

static constexpr uint32_t kMarketRegistryMagic = 0x4745524D;  // "MREG"
static constexpr uint32_t kMarketRegistryVersion = 1;

std::vector<std::byte> MarketRegistry::serialize() const
{
  std::scoped_lock lock(_mutex);

  std::vector<std::byte> result;
  result.reserve(12 + _markets.size() * 32);

  auto write_u32 = [&result](uint32_t v)
  {
    for (int i = 0; i < 4; ++i)
    {
      result.push_back(static_cast<std::byte>((v >> (i * 8)) & 0xFF));
    }
  };

  auto write_u16 = [&result](uint16_t v)
  {
    result.push_back(static_cast<std::byte>(v & 0xFF));
    result.push_back(static_cast<std::byte>((v >> 8) & 0xFF));
  };

  auto write_string = [&](const std::string& s)
  {
    write_u16(static_cast<uint16_t>(s.size()));
    for (char c : s)
    {
      result.push_back(static_cast<std::byte>(c));
    }
  };

  write_u32(kMarketRegistryMagic);
  write_u32(kMarketRegistryVersion);
  write_u32(static_cast<uint32_t>(_markets.size()));

  for (const auto& m : _markets)
  {
    write_u32(m.id);
    write_string(m.base);
    write_string(m.quote);
    write_string(m.exchange);
    result.push_back(static_cast<std::byte>(m.active ? 0x01 : 0x00));
  }

  return result;
}

bool MarketRegistry::deserialize(std::span<const std::byte> data)
{
  size_t pos = 0;
  bool ok = true;

  auto read_u32 = [&]() -> uint32_t
  {
    if (pos + 4 > data.size())
    {
      ok = false;
      return 0;
    }
    uint32_t v = 0;
    for (int i = 0; i < 4; ++i)
    {
      v |= static_cast<uint32_t>(data[pos + i]) << (i * 8);
    }
    pos += 4;
    return v;
  };

  auto read_u16 = [&]() -> uint16_t
  {
    if (pos + 2 > data.size())
    {
      ok = false;
      return 0;
    }
    uint16_t v = static_cast<uint16_t>(static_cast<uint16_t>(data[pos]) |
                                        (static_cast<uint16_t>(data[pos + 1]) << 8));
    pos += 2;
    return v;
  };

  auto read_string = [&]() -> std::string
  {
    uint16_t len = read_u16();
    if (!ok || pos + len > data.size())
    {
      ok = false;
      return {};
    }
    std::string s(len, '\0');
    for (uint16_t i = 0; i < len; ++i)
    {
      s[i] = static_cast<char>(data[pos + i]);
    }
    pos += len;
    return s;
  };

  if (read_u32() != kMarketRegistryMagic || !ok)
  {
    return false;
  }
  if (read_u32() != kMarketRegistryVersion || !ok)
  {
    return false;
  }

  const uint32_t count = read_u32();
  if (!ok)
  {
    return false;
  }

  std::vector<Market> markets;
  std::unordered_map<std::string, MarketId> map;
  markets.reserve(count);

  for (uint32_t i = 0; i < count; ++i)
  {
    Market m;
    m.id = read_u32();
    m.base = read_string();
    m.quote = read_string();
    m.exchange = read_string();
    if (pos >= data.size())
    {
      ok = false;
    }
    if (!ok)
    {
      return false;
    }
    m.active = (static_cast<uint8_t>(data[pos++]) & 0x01) != 0;

    // Ids are dense and start at 1
    if (m.id != i + 1)
    {
      return false;
    }

    map.emplace(makeKey(m.base, m.quote, m.exchange), m.id);
    markets.push_back(std::move(m));
  }

  std::scoped_lock lock(_mutex);
  _markets = std::move(markets);
  _map = std::move(map);
  return true;
}

bool MarketRegistry::saveToFile(const std::filesystem::path& path) const
{
  const auto bytes = serialize();

  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out)
  {
    return false;
  }
  out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
  return static_cast<bool>(out);
}

bool MarketRegistry::loadFromFile(const std::filesystem::path& path)
{
  std::ifstream in(path, std::ios::binary);
  if (!in)
  {
    return false;
  }

  std::vector<char> raw((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  return deserialize(std::span<const std::byte>(reinterpret_cast<const std::byte*>(raw.data()),
                                                raw.size()));
}

}  // namespace pricebase
