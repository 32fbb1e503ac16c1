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

#include <CalcServer/Common/SpdLogHelper.hpp>
#include <CalcServer/Config/ServerConfigLoader.hpp>
#include <CalcServer/Exception/InvalidConfigurationException.hpp>
#include <CalcServer/Http/CalculatorRequestHandler.hpp>
#include <CalcServer/Http/HttpServer.hpp>
#include <CalcServer/Services/Calculator/CalculatorService.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/system/system_error.hpp>
#include <boost/version.hpp>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <string_view>
#include <vector>

namespace
{
  CALC_SERVER_LOGGER_NAME(Main);

  int Run(const CalcServer::ServerConfig& config)
  {
    auto logger = CalcServer::SpdLogHelper::GetLogger<LoggerName_Main>();
    logger->info("CalcServer starting (Boost {}.{}.{})", BOOST_VERSION / 100000, BOOST_VERSION / 100 % 1000, BOOST_VERSION % 100);

    auto calculator = std::make_shared<const CalcServer::CalculatorService>();
    auto handler = std::make_shared<const CalcServer::CalculatorRequestHandler>(calculator);
    CalcServer::HttpServer server(config, handler);
    try
    {
      server.Start();
    }
    catch (const boost::system::system_error& ex)
    {
      logger->error("Failed to start server on {}:{}: {}", config.Address, config.Port, ex.code().message());
      return 1;
    }

    // The main thread only waits for a termination signal, requests are served by the worker threads
    boost::asio::io_context signalContext;
    boost::asio::signal_set signals(signalContext, SIGINT, SIGTERM);
    signals.async_wait(
      [logger](const boost::system::error_code& error, const int signalNumber)
      {
        if (!error)
        {
          logger->info("Received signal {}, shutting down", signalNumber);
        }
      });
    signalContext.run();

    server.Stop();
    logger->info("CalcServer stopped");
    return 0;
  }
}

int main(int argc, char* argv[])
{
  const std::string_view programName = argc > 0 ? argv[0] : "CalcServer";

  CalcServer::LaunchOptions options;
  try
  {
    const std::vector<std::string_view> args = argc > 1 ? std::vector<std::string_view>(argv + 1, argv + argc) : std::vector<std::string_view>{};
    options = CalcServer::ServerConfigLoader::Load(args, CalcServer::ServerConfigLoader::GetProcessEnvironment);
  }
  catch (const CalcServer::InvalidConfigurationException& ex)
  {
    std::cerr << "Error: " << ex.what() << "\n\n" << CalcServer::ServerConfigLoader::GetUsage(programName);
    return 1;
  }

  if (options.ShowHelp)
  {
    std::cout << CalcServer::ServerConfigLoader::GetUsage(programName);
    return 0;
  }

  CalcServer::SpdLogHelper::ConfigureDefaultLogger(options.Config.LogLevel);

  int exitCode = 1;
  try
  {
    exitCode = Run(options.Config);
  }
  catch (const std::exception& ex)
  {
    spdlog::critical("Unhandled exception: {}", ex.what());
  }

  spdlog::shutdown();
  return exitCode;
}
