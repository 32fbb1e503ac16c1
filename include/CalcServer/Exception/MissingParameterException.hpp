#ifndef CALC_SERVER_EXCEPTION_MISSINGPARAMETEREXCEPTION_HPP
#define CALC_SERVER_EXCEPTION_MISSINGPARAMETEREXCEPTION_HPP
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
  /// @brief Exception thrown when a required query parameter is absent from the request.
  class MissingParameterException : public BadRequestException
  {
    std::string m_parameterName;

  public:
    explicit MissingParameterException(std::string_view parameterName)
      : BadRequestException(fmt::format("Missing required parameter '{}'", parameterName))
      , m_parameterName(parameterName)
    {
    }

    const std::string& GetParameterName() const noexcept
    {
      return m_parameterName;
    }
  };
}

#endif
