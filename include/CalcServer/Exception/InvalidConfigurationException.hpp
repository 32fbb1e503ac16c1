#ifndef CALC_SERVER_EXCEPTION_INVALIDCONFIGURATIONEXCEPTION_HPP
#define CALC_SERVER_EXCEPTION_INVALIDCONFIGURATIONEXCEPTION_HPP
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

#include <fmt/format.h>
#include <stdexcept>
#include <string>
#include <string_view>

namespace CalcServer
{
  /// @brief Exception thrown when a configuration value from the environment or the command line is rejected.
  class InvalidConfigurationException : public std::runtime_error
  {
  public:
    explicit InvalidConfigurationException(const std::string& message)
      : std::runtime_error(message)
    {
    }

    /// @param source Where the value came from, e.g. "--port" or "CALC_SERVER_PORT".
    /// @param value The rejected value.
    /// @param expected Short description of what was expected.
    InvalidConfigurationException(std::string_view source, std::string_view value, std::string_view expected)
      : std::runtime_error(fmt::format("{}: invalid value '{}' (expected {})", source, value, expected))
    {
    }
  };
}

#endif
