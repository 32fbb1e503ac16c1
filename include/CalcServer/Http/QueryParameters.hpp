#ifndef CALC_SERVER_HTTP_QUERYPARAMETERS_HPP
#define CALC_SERVER_HTTP_QUERYPARAMETERS_HPP
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

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace CalcServer
{
  /// @brief Decoded name/value pairs of a URL query string.
  ///
  /// Names and values are percent-decoded and '+' decodes to a space. When a name occurs more than once
  /// the first occurrence wins. Malformed escapes are kept verbatim.
  class QueryParameters
  {
    std::map<std::string, std::string, std::less<>> m_values;

  public:
    QueryParameters() = default;

    /// @brief Parses the part of a request target that follows the '?' (without the '?').
    static QueryParameters Parse(std::string_view query);

    /// @brief Decodes a single application/x-www-form-urlencoded component.
    static std::string Decode(std::string_view encoded);

    [[nodiscard]] std::optional<std::string_view> TryGet(std::string_view name) const;

    [[nodiscard]] bool Contains(std::string_view name) const
    {
      return m_values.find(name) != m_values.end();
    }

    [[nodiscard]] std::size_t Size() const noexcept
    {
      return m_values.size();
    }

    [[nodiscard]] bool Empty() const noexcept
    {
      return m_values.empty();
    }
  };
}

#endif
