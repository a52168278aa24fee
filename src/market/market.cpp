/*
 * PriceBase
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#include "pricebase/market/market.h"
#include "pricebase/error.h"

#include <cctype>

namespace pricebase
{

namespace
{

std::string_view trim(std::string_view s)
{
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
  {
    s.remove_prefix(1);
  }
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
  {
    s.remove_suffix(1);
  }
  return s;
}

// '_' separates fields of a partition name, so it can never be part of one
void checkCharacters(std::string_view what, std::string_view raw, std::string_view s)
{
  if (s.empty())
  {
    throw InvalidSymbolError(std::string(what) + " is empty");
  }
  for (char c : s)
  {
    const auto u = static_cast<unsigned char>(c);
    if (!std::isalnum(u) && c != '-' && c != '.')
    {
      throw InvalidSymbolError(std::string(what) + " '" + std::string(raw) +
                               "' contains invalid character '" + std::string(1, c) + "'");
    }
  }
}

}  // namespace

std::string normalizeCurrency(std::string_view symbol)
{
  const auto trimmed = trim(symbol);
  checkCharacters("currency symbol", symbol, trimmed);

  std::string out;
  out.reserve(trimmed.size());
  for (char c : trimmed)
  {
    out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
  }
  return out;
}

std::string normalizeExchange(std::string_view exchange)
{
  const auto trimmed = trim(exchange);
  checkCharacters("exchange name", exchange, trimmed);

  std::string out;
  out.reserve(trimmed.size());
  for (size_t i = 0; i < trimmed.size(); ++i)
  {
    const auto u = static_cast<unsigned char>(trimmed[i]);
    out.push_back(static_cast<char>(i == 0 ? std::toupper(u) : std::tolower(u)));
  }
  return out;
}

}  // namespace pricebase
