#ifndef CALC_SERVER_HTTP_NUMBERPARSER_HPP
#define CALC_SERVER_HTTP_NUMBERPARSER_HPP
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
#include <optional>
#include <string_view>

namespace CalcServer::NumberParser
{
  /// @brief Parses a decimal floating point number.
  ///
  /// Surrounding whitespace and a single leading '+' are accepted. Hexadecimal notation, trailing characters,
  /// infinities, NaN and magnitudes beyond the largest double are rejected. Values below the smallest normal
  /// double parse as subnormals (or zero).
  /// @return The value or std::nullopt if the text is not a finite number.
  [[nodiscard]] std::optional<double> TryParseFiniteDouble(std::string_view text);

  /// @brief Reads a required numeric query parameter.
  /// @throws MissingParameterException if the parameter is absent.
  /// @throws InvalidNumberException if the parameter value is not a finite number.
  [[nodiscard]] double GetRequiredNumber(const QueryParameters& parameters, std::string_view name);
}

#endif
