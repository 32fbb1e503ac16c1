#ifndef CALC_SERVER_CONFIG_SERVERCONFIGLOADER_HPP
#define CALC_SERVER_CONFIG_SERVERCONFIGLOADER_HPP
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

#include <CalcServer/Config/LaunchOptions.hpp>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace CalcServer
{
  namespace EnvironmentVariables
  {
    constexpr const char* Address = "CALC_SERVER_ADDRESS";
    constexpr const char* Port = "CALC_SERVER_PORT";
    constexpr const char* Threads = "CALC_SERVER_THREADS";
    constexpr const char* LogLevel = "CALC_SERVER_LOG_LEVEL";
    constexpr const char* IdleTimeout = "CALC_SERVER_IDLE_TIMEOUT";
  }

  /// @brief Looks up an environment variable, returns std::nullopt if it is not set.
  using EnvironmentLookup = std::function<std::optional<std::string>(const char* name)>;

  namespace ServerConfigLoader
  {
    /// @brief EnvironmentLookup backed by the process environment.
    std::optional<std::string> GetProcessEnvironment(const char* name);

    /// @brief Builds the launch options.
    ///
    /// Precedence is defaults, then environment variables, then command line arguments.
    /// Arguments take the forms "--name value" and "--name=value".
    /// @param args The command line arguments without the program name.
    /// @param environment Source of environment variables.
    /// @throws InvalidConfigurationException on unknown arguments, missing or malformed values.
    LaunchOptions Load(const std::vector<std::string_view>& args, const EnvironmentLookup& environment);

    /// @brief The text printed for --help.
    std::string GetUsage(std::string_view programName);

    /// @brief The default worker thread count, the hardware concurrency or ServerDefaults::FallbackThreadCount if unknown.
    uint32_t GetDefaultThreadCount() noexcept;
  }
}

#endif
