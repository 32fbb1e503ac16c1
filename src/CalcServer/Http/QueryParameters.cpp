//****************************************************************************************************************************************************
//* Zero-Clause BSD (0BSD)
//*
//* Copyright (c) 2025, Mana Battery
//*
//* Permission to use, copy, modify, and/or distribute this software for any purpose with or without fee is hereby granted.
//*
//* THE SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL WARRANTIES WITH REGARD TO THIS SOFTWARE INCLUDING ALL IMPLIED WARRANTIES OF
//* MERCHANTABILITY AND FITNESS. IN NO EVENT SHALL THE AUTHOR BE LIABLE FOR ANY SPECIAL, DIRECT, INDIRECT, OR CONSEQUENTIAL DAMAGES OR ANY DAMAGES
//* WHATSOEVER RESULTING FROM LOSS OF USE, DATA OR PROFITS, WHETHER IN AN ACTION OF CONTRACT, NEGLIGENCE OR OTHER TORTIOUS ACTION, ARISING OUT OF
//* OR IN CONNECTION WITH THE USE OR PERFORMANCE OF THIS SOFTWARE.
//****************************************************************************************************************************************************

#include <CalcServer/Http/QueryParameters.hpp>

namespace CalcServer
{
  namespace
  {
    int HexValue(const char ch) noexcept
    {
      if (ch >= '0' && ch <= '9')
      {
        return ch - '0';
      }
      if (ch >= 'a' && ch <= 'f')
      {
        return ch - 'a' + 10;
      }
      if (ch >= 'A' && ch <= 'F')
      {
        return ch - 'A' + 10;
      }
      return -1;
    }
  }


  QueryParameters QueryParameters::Parse(std::string_view query)
  {
    QueryParameters result;
    while (!query.empty())
    {
      const auto separator = query.find('&');
      const std::string_view pair = query.substr(0, separator);
      query = separator == std::string_view::npos ? std::string_view{} : query.substr(separator + 1);

      if (pair.empty())
      {
        continue;
      }

      const auto equals = pair.find('=');
      std::string name = Decode(pair.substr(0, equals));
      std::string value = equals == std::string_view::npos ? std::string{} : Decode(pair.substr(equals + 1));
      // try_emplace keeps the first occurrence
      result.m_values.try_emplace(std::move(name), std::move(value));
    }
    return result;
  }


  std::string QueryParameters::Decode(const std::string_view encoded)
  {
    std::string decoded;
    decoded.reserve(encoded.size());
    for (std::size_t i = 0; i < encoded.size(); ++i)
    {
      const char ch = encoded[i];
      if (ch == '+')
      {
        decoded.push_back(' ');
      }
      else if (ch == '%' && (i + 2) < encoded.size() && HexValue(encoded[i + 1]) >= 0 && HexValue(encoded[i + 2]) >= 0)
      {
        decoded.push_back(static_cast<char>((HexValue(encoded[i + 1]) << 4) | HexValue(encoded[i + 2])));
        i += 2;
      }
      else
      {
        decoded.push_back(ch);
      }
    }
    return decoded;
  }


  std::optional<std::string_view> QueryParameters::TryGet(const std::string_view name) const
  {
    const auto itr = m_values.find(name);
    if (itr == m_values.end())
    {
      return std::nullopt;
    }
    return std::string_view(itr->second);
  }
}
