#ifndef CALC_SERVER_COMMON_SPDLOGHELPER_HPP
#define CALC_SERVER_COMMON_SPDLOGHELPER_HPP
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

#include <spdlog/async.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <memory>
#include <string>
#include <string_view>

namespace CalcServer::SpdLogHelper
{
  /// @brief Log pattern used by the server (thread id is included as requests are served by a worker pool).
  constexpr const char* DefaultPattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [thread %t] %v";

  /// @brief Replaces the default logger with an asynchronous colour stdout logger.
  ///
  /// Must be called before any named logger is requested so the named loggers inherit the sinks.
  /// Call spdlog::shutdown() before the process exits to flush the queue.
  /// @param level The global log level.
  inline void ConfigureDefaultLogger(const spdlog::level::level_enum level)
  {
    spdlog::init_thread_pool(8192, 1);
    auto stdoutSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto asyncLogger =
      std::make_shared<spdlog::async_logger>("calc_server", stdoutSink, spdlog::thread_pool(), spdlog::async_overflow_policy::block);
    spdlog::set_default_logger(asyncLogger);
    spdlog::set_pattern(DefaultPattern);
    spdlog::set_level(level);
    spdlog::flush_on(spdlog::level::warn);
  }

  /// @brief Gets or creates a logger with the specified name, inheriting global sink configuration.
  /// @tparam Name The compile-time string for the logger name.
  /// @return Shared pointer to the logger.
  template <typename Name>
  inline std::shared_ptr<spdlog::logger> GetLogger()
  {
    static const auto logger = []()
    {
      constexpr std::string_view name = Name::value;
      auto log = spdlog::get(std::string(name));
      if (!log)
      {
        // Use default logger's sinks, level and pattern
        const auto defaultLogger = spdlog::default_logger();
        log = std::make_shared<spdlog::logger>(std::string(name), defaultLogger->sinks().begin(), defaultLogger->sinks().end());
        spdlog::initialize_logger(log);
      }
      return log;
    }();
    return logger;
  }
}

// Macro to define a compile-time string type for logger names
#define CALC_SERVER_LOGGER_NAME(name)                \
  struct LoggerName_##name                           \
  {                                                  \
    static constexpr std::string_view value = #name; \
  }

#endif
