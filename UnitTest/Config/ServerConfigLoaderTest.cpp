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

#include <CalcServer/Config/ServerConfig.hpp>
#include <CalcServer/Config/ServerConfigLoader.hpp>
#include <CalcServer/Exception/InvalidConfigurationException.hpp>
#include <gtest/gtest.h>
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace CalcServer
{
  using namespace std::chrono_literals;

  namespace
  {
    EnvironmentLookup CreateEnvironment(std::map<std::string, std::string> values)
    {
      return [values = std::move(values)](const char* name) -> std::optional<std::string>
      {
        const auto itr = values.find(name);
        if (itr == values.end())
        {
          return std::nullopt;
        }
        return itr->second;
      };
    }

    LaunchOptions Load(const std::vector<std::string_view>& args, std::map<std::string, std::string> environment = {})
    {
      return ServerConfigLoader::Load(args, CreateEnvironment(std::move(environment)));
    }
  }

  // ============================================================================
  // Defaults
  // ============================================================================

  TEST(ServerConfigLoader, NoArguments_UsesDefaults)
  {
    const auto options = Load({});
    EXPECT_FALSE(options.ShowHelp);
    EXPECT_EQ(options.Config.Address, "0.0.0.0");
    EXPECT_EQ(options.Config.Port, 8080);
    EXPECT_EQ(options.Config.ThreadCount, ServerConfigLoader::GetDefaultThreadCount());
    EXPECT_EQ(options.Config.LogLevel, spdlog::level::info);
    EXPECT_EQ(options.Config.IdleTimeout, 30s);
  }

  TEST(ServerConfigLoader, DefaultThreadCount_IsAtLeastOne)
  {
    EXPECT_GE(ServerConfigLoader::GetDefaultThreadCount(), 1u);
  }

  TEST(ServerConfigLoader, DefaultThreadCount_FollowsHardwareConcurrency)
  {
    const auto hardware = std::thread::hardware_concurrency();
    const uint32_t expected = hardware > 0 ? std::min(static_cast<uint32_t>(hardware), 1024u) : ServerDefaults::FallbackThreadCount;
    EXPECT_EQ(ServerConfigLoader::GetDefaultThreadCount(), expected);
  }

  TEST(ServerConfigLoader, PlainServerConfig_UsesFallbackThreadCount)
  {
    const ServerConfig config;
    EXPECT_EQ(config.ThreadCount, ServerDefaults::FallbackThreadCount);
    EXPECT_GE(config.ThreadCount, 1u);
  }

  TEST(ServerConfigLoader, NullEnvironment_IsAllowed)
  {
    const auto options = ServerConfigLoader::Load({"--port", "1234"}, EnvironmentLookup{});
    EXPECT_EQ(options.Config.Port, 1234);
  }

  // ============================================================================
  // Command line
  // ============================================================================

  TEST(ServerConfigLoader, Arguments_SeparateValues)
  {
    const auto options = Load({"--address", "127.0.0.1", "--port", "9000", "--threads", "3", "--log-level", "debug", "--idle-timeout", "12"});
    EXPECT_EQ(options.Config.Address, "127.0.0.1");
    EXPECT_EQ(options.Config.Port, 9000);
    EXPECT_EQ(options.Config.ThreadCount, 3u);
    EXPECT_EQ(options.Config.LogLevel, spdlog::level::debug);
    EXPECT_EQ(options.Config.IdleTimeout, 12s);
  }

  TEST(ServerConfigLoader, Arguments_InlineValues)
  {
    const auto options = Load({"--address=::1", "--port=0", "--threads=1", "--log-level=warn"});
    EXPECT_EQ(options.Config.Address, "::1");
    EXPECT_EQ(options.Config.Port, 0);
    EXPECT_EQ(options.Config.ThreadCount, 1u);
    EXPECT_EQ(options.Config.LogLevel, spdlog::level::warn);
  }

  TEST(ServerConfigLoader, Help)
  {
    EXPECT_TRUE(Load({"--help"}).ShowHelp);
    EXPECT_TRUE(Load({"-h"}).ShowHelp);
  }

  TEST(ServerConfigLoader, LastArgumentWins)
  {
    EXPECT_EQ(Load({"--port", "1", "--port=2"}).Config.Port, 2);
  }

  // ============================================================================
  // Environment
  // ============================================================================

  TEST(ServerConfigLoader, Environment_OverridesDefaults)
  {
    const auto options = Load({}, {{"CALC_SERVER_ADDRESS", "10.0.0.1"},
                                   {"CALC_SERVER_PORT", "5000"},
                                   {"CALC_SERVER_THREADS", "4"},
                                   {"CALC_SERVER_LOG_LEVEL", "error"},
                                   {"CALC_SERVER_IDLE_TIMEOUT", "60"}});
    EXPECT_EQ(options.Config.Address, "10.0.0.1");
    EXPECT_EQ(options.Config.Port, 5000);
    EXPECT_EQ(options.Config.ThreadCount, 4u);
    EXPECT_EQ(options.Config.LogLevel, spdlog::level::err);
    EXPECT_EQ(options.Config.IdleTimeout, 60s);
  }

  TEST(ServerConfigLoader, Arguments_OverrideEnvironment)
  {
    const auto options = Load({"--port", "7000"}, {{"CALC_SERVER_PORT", "5000"}, {"CALC_SERVER_THREADS", "4"}});
    EXPECT_EQ(options.Config.Port, 7000);
    EXPECT_EQ(options.Config.ThreadCount, 4u);
  }

  TEST(ServerConfigLoader, InvalidEnvironmentValue_Throws)
  {
    EXPECT_THROW(Load({}, {{"CALC_SERVER_PORT", "http"}}), InvalidConfigurationException);
  }

  // ============================================================================
  // Rejected input
  // ============================================================================

  TEST(ServerConfigLoader, UnknownArgument_Throws)
  {
    EXPECT_THROW(Load({"--verbose"}), InvalidConfigurationException);
    EXPECT_THROW(Load({"8080"}), InvalidConfigurationException);
  }

  TEST(ServerConfigLoader, MissingValue_Throws)
  {
    EXPECT_THROW(Load({"--port"}), InvalidConfigurationException);
  }

  TEST(ServerConfigLoader, InvalidPort_Throws)
  {
    EXPECT_THROW(Load({"--port", "65536"}), InvalidConfigurationException);
    EXPECT_THROW(Load({"--port", "-1"}), InvalidConfigurationException);
    EXPECT_THROW(Load({"--port", "80a"}), InvalidConfigurationException);
    EXPECT_THROW(Load({"--port="}), InvalidConfigurationException);
  }

  TEST(ServerConfigLoader, InvalidThreads_Throws)
  {
    EXPECT_THROW(Load({"--threads", "0"}), InvalidConfigurationException);
    EXPECT_THROW(Load({"--threads", "100000"}), InvalidConfigurationException);
  }

  TEST(ServerConfigLoader, InvalidLogLevel_Throws)
  {
    EXPECT_THROW(Load({"--log-level", "loud"}), InvalidConfigurationException);
    EXPECT_EQ(Load({"--log-level", "off"}).Config.LogLevel, spdlog::level::off);
  }

  TEST(ServerConfigLoader, InvalidIdleTimeout_Throws)
  {
    EXPECT_THROW(Load({"--idle-timeout", "0"}), InvalidConfigurationException);
  }

  TEST(ServerConfigLoader, EmptyAddress_Throws)
  {
    EXPECT_THROW(Load({"--address="}), InvalidConfigurationException);
  }

  TEST(ServerConfigLoader, ErrorMessage_NamesTheSource)
  {
    try
    {
      static_cast<void>(Load({"--port", "abc"}));
      FAIL() << "Expected InvalidConfigurationException";
    }
    catch (const InvalidConfigurationException& ex)
    {
      EXPECT_STREQ(ex.what(), "--port: invalid value 'abc' (expected an integer in the range [0, 65535])");
    }
  }

  TEST(ServerConfigLoader, Usage_MentionsEveryOption)
  {
    const std::string usage = ServerConfigLoader::GetUsage("CalcServer");
    for (const char* option : {"--address", "--port", "--threads", "--log-level", "--idle-timeout", "--help"})
    {
      EXPECT_NE(usage.find(option), std::string::npos) << option;
    }
  }
}
