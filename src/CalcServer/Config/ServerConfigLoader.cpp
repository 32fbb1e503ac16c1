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

#include <CalcServer/Config/ServerConfigLoader.hpp>
#include <CalcServer/Exception/InvalidConfigurationException.hpp>
#include <fmt/format.h>
#include <spdlog/common.h>
#include <algorithm>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <thread>

namespace CalcServer::ServerConfigLoader
{
  namespace
  {
    constexpr uint32_t MaxThreadCount = 1024;
    constexpr uint32_t MaxIdleTimeoutSeconds = 24 * 60 * 60;

    uint32_t ParseUInt32(const std::string_view source, const std::string_view value, const uint32_t minValue, const uint32_t maxValue)
    {
      uint32_t result = 0;
      const auto* const begin = value.data();
      const auto* const end = value.data() + value.size();
      const auto [ptr, ec] = std::from_chars(begin, end, result);
      if (value.empty() || ec != std::errc() || ptr != end || result < minValue || result > maxValue)
      {
        throw InvalidConfigurationException(source, value, fmt::format("an integer in the range [{}, {}]", minValue, maxValue));
      }
      return result;
    }

    spdlog::level::level_enum ParseLogLevel(const std::string_view source, const std::string_view value)
    {
      const std::string name(value);
      const auto level = spdlog::level::from_str(name);
      // from_str falls back to 'off' for unknown names
      if (level == spdlog::level::off && name != "off")
      {
        throw InvalidConfigurationException(source, value, "one of trace, debug, info, warning, error, critical, off");
      }
      return level;
    }

    enum class Setting
    {
      Address,
      Port,
      Threads,
      LogLevel,
      IdleTimeout
    };

    void Apply(ServerConfig& rConfig, const Setting setting, const std::string_view source, const std::string_view value)
    {
      switch (setting)
      {
      case Setting::Address:
        if (value.empty())
        {
          throw InvalidConfigurationException(source, value, "a non-empty address");
        }
        rConfig.Address = std::string(value);
        break;
      case Setting::Port:
        rConfig.Port = static_cast<uint16_t>(ParseUInt32(source, value, 0, std::numeric_limits<uint16_t>::max()));
        break;
      case Setting::Threads:
        rConfig.ThreadCount = ParseUInt32(source, value, 1, MaxThreadCount);
        break;
      case Setting::LogLevel:
        rConfig.LogLevel = ParseLogLevel(source, value);
        break;
      case Setting::IdleTimeout:
        rConfig.IdleTimeout = std::chrono::seconds(ParseUInt32(source, value, 1, MaxIdleTimeoutSeconds));
        break;
      }
    }

    struct SettingInfo
    {
      Setting Id;
      std::string_view Argument;
      const char* EnvironmentVariable;
    };

    constexpr SettingInfo Settings[] = {
      {Setting::Address, "--address", EnvironmentVariables::Address},
      {Setting::Port, "--port", EnvironmentVariables::Port},
      {Setting::Threads, "--threads", EnvironmentVariables::Threads},
      {Setting::LogLevel, "--log-level", EnvironmentVariables::LogLevel},
      {Setting::IdleTimeout, "--idle-timeout", EnvironmentVariables::IdleTimeout},
    };

    const SettingInfo* TryFindArgument(const std::string_view argument) noexcept
    {
      for (const auto& info : Settings)
      {
        if (info.Argument == argument)
        {
          return &info;
        }
      }
      return nullptr;
    }
  }


  std::optional<std::string> GetProcessEnvironment(const char* name)
  {
    const char* const value = std::getenv(name);
    if (value == nullptr)
    {
      return std::nullopt;
    }
    return std::string(value);
  }


  uint32_t GetDefaultThreadCount() noexcept
  {
    const auto count = std::thread::hardware_concurrency();
    return count > 0 ? std::min(static_cast<uint32_t>(count), MaxThreadCount) : ServerDefaults::FallbackThreadCount;
  }


  LaunchOptions Load(const std::vector<std::string_view>& args, const EnvironmentLookup& environment)
  {
    LaunchOptions options;
    options.Config.ThreadCount = GetDefaultThreadCount();

    if (environment)
    {
      for (const auto& info : Settings)
      {
        const auto value = environment(info.EnvironmentVariable);
        if (value.has_value())
        {
          Apply(options.Config, info.Id, info.EnvironmentVariable, *value);
        }
      }
    }

    for (std::size_t i = 0; i < args.size(); ++i)
    {
      const std::string_view arg = args[i];
      if (arg == "--help" || arg == "-h")
      {
        options.ShowHelp = true;
        continue;
      }

      const auto equals = arg.find('=');
      const std::string_view name = arg.substr(0, equals);
      const SettingInfo* const pInfo = TryFindArgument(name);
      if (pInfo == nullptr)
      {
        throw InvalidConfigurationException(fmt::format("Unknown argument '{}'", arg));
      }

      if (equals != std::string_view::npos)
      {
        Apply(options.Config, pInfo->Id, name, arg.substr(equals + 1));
      }
      else
      {
        if ((i + 1) >= args.size())
        {
          throw InvalidConfigurationException(fmt::format("Argument '{}' requires a value", name));
        }
        ++i;
        Apply(options.Config, pInfo->Id, name, args[i]);
      }
    }
    return options;
  }


  std::string GetUsage(const std::string_view programName)
  {
    return fmt::format("Usage: {} [options]\n"
                       "\n"
                       "Options:\n"
                       "  --address <ip>          Address to listen on (default {}, env {})\n"
                       "  --port <port>           Port to listen on, 0 picks a free port (default {}, env {})\n"
                       "  --threads <count>       Worker thread count (default: hardware concurrency, env {})\n"
                       "  --log-level <level>     trace, debug, info, warning, error, critical or off (default info, env {})\n"
                       "  --idle-timeout <secs>   Keep-alive idle timeout in seconds (default {}, env {})\n"
                       "  -h, --help              Show this text\n",
                       programName, ServerDefaults::Address, EnvironmentVariables::Address, ServerDefaults::Port, EnvironmentVariables::Port,
                       EnvironmentVariables::Threads, EnvironmentVariables::LogLevel, ServerDefaults::IdleTimeout.count(),
                       EnvironmentVariables::IdleTimeout);
  }
}
