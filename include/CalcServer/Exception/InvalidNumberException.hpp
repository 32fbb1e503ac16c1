#ifndef CALC_SERVER_EXCEPTION_INVALIDNUMBEREXCEPTION_HPP
#define CALC_SERVER_EXCEPTION_INVALIDNUMBEREXCEPTION_HPP
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

#include <CalcServer/Exception/BadRequestException.hpp>
#include <fmt/format.h>
#include <string>
#include <string_view>

namespace CalcServer
{
  /// @brief Exception thrown when a query parameter is present but does not hold a finite number.
  class InvalidNumberException : public BadRequestException
  {
    std::string m_parameterName;
    std::string m_value;

  public:
    /// @param parameterName The name of the offending parameter.
    /// @param value The raw (decoded) value that failed to parse.
    InvalidNumberException(std::string_view parameterName, std::string_view value)
      : BadRequestException(fmt::format("Invalid number for parameter '{}': '{}'", parameterName, value))
      , m_parameterName(parameterName)
      , m_value(value)
    {
    }

    const std::string& GetParameterName() const noexcept
    {
      return m_parameterName;
    }

    const std::string& GetValue() const noexcept
    {
      return m_value;
    }
  };
}

#endif
