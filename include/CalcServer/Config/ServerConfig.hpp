#ifndef CALC_SERVER_CONFIG_SERVERCONFIG_HPP
#define CALC_SERVER_CONFIG_SERVERCONFIG_HPP
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

#include <spdlog/common.h>
#include <chrono>
#include <cstdint>
#include <string>

namespace CalcServer
{
  namespace ServerDefaults
  {
    constexpr const char* Address = "0.0.0.0";
    constexpr uint16_t Port = 8080;
    /// @brief Used when the hardware concurrency is unknown. ServerConfigLoader defaults to the hardware concurrency.
    constexpr uint32_t FallbackThreadCount = 1;
    constexpr spdlog::level::level_enum LogLevel = spdlog::level::info;
    constexpr std::chrono::seconds IdleTimeout{30};
  }

  /// @brief Configuration for HttpServer.
  struct ServerConfig
  {
    /// @brief IPv4 or IPv6 address to listen on.
    std::string Address{ServerDefaults::Address};
    /// @brief TCP port to listen on, 0 selects an ephemeral port.
    uint16_t Port{ServerDefaults::Port};
    /// @brief Number of worker threads running the io_context (at least one).
    ///        ServerConfigLoader::Load sets it to ServerConfigLoader::GetDefaultThreadCount() unless configured.
    uint32_t ThreadCount{ServerDefaults::FallbackThreadCount};
    spdlog::level::level_enum LogLevel{ServerDefaults::LogLevel};
    /// @brief How long a connection may wait for the next request before it is closed.
    std::chrono::seconds IdleTimeout{ServerDefaults::IdleTimeout};
  };
}

#endif
