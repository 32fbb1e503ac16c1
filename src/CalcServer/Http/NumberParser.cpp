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

#include <CalcServer/Exception/InvalidNumberException.hpp>
#include <CalcServer/Exception/MissingParameterException.hpp>
#include <CalcServer/Http/NumberParser.hpp>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <string>
#include <system_error>

namespace CalcServer::NumberParser
{
  namespace
  {
    bool IsSpace(const char ch) noexcept
    {
      return std::isspace(static_cast<unsigned char>(ch)) != 0;
    }

    std::string_view Trim(std::string_view text) noexcept
    {
      while (!text.empty() && IsSpace(text.front()))
      {
        text.remove_prefix(1);
      }
      while (!text.empty() && IsSpace(text.back()))
      {
        text.remove_suffix(1);
      }
      return text;
    }
  }


  std::optional<double> TryParseFiniteDouble(const std::string_view text)
  {
    std::string_view number = Trim(text);
    // from_chars does not take an explicit plus sign
    if (number.size() > 1 && number.front() == '+' && number[1] != '-' && number[1] != '+')
    {
      number.remove_prefix(1);
    }

    const char* const pBegin = number.data();
    const char* const pEnd = pBegin + number.size();
    double result = 0.0;
    const auto [pLast, ec] = std::from_chars(pBegin, pEnd, result, std::chars_format::general);
    if (pLast != pEnd || (ec != std::errc() && ec != std::errc::result_out_of_range))
    {
      return std::nullopt;
    }

    if (ec == std::errc::result_out_of_range)
    {
      // The text is a valid decimal number, strtod tells overflow (+-HUGE_VAL) apart from subnormal underflow
      const std::string value(number);
      result = std::strtod(value.c_str(), nullptr);
    }

    if (!std::isfinite(result))
    {
      return std::nullopt;
    }
    return result;
  }


  double GetRequiredNumber(const QueryParameters& parameters, const std::string_view name)
  {
    const auto rawValue = parameters.TryGet(name);
    if (!rawValue)
    {
      throw MissingParameterException(name);
    }

    const auto value = TryParseFiniteDouble(*rawValue);
    if (!value)
    {
      throw InvalidNumberException(name, *rawValue);
    }
    return *value;
  }
}
