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
#include <CalcServer/Http/HttpServer.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/socket_base.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http/error.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>
#include <boost/system/system_error.hpp>
#include <fmt/format.h>
#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

namespace CalcServer
{
  namespace http = boost::beast::http;
  using boost::asio::ip::tcp;

  namespace
  {
    CALC_SERVER_LOGGER_NAME(HttpServer);

    std::string ToString(const tcp::endpoint& endpoint)
    {
      if (endpoint.address().is_v6())
      {
        return fmt::format("[{}]:{}", endpoint.address().to_string(), endpoint.port());
      }
      return fmt::format("{}:{}", endpoint.address().to_string(), endpoint.port());
    }

    bool IsExpectedDisconnect(const boost::system::error_code& error) noexcept
    {
      return error == http::error::end_of_stream || error == boost::beast::error::timeout || error == boost::asio::error::operation_aborted ||
             error == boost::asio::error::connection_reset || error == boost::asio::error::eof;
    }

    void LogUnhandledException(const std::exception_ptr& exception, const char* const coroutineName)
    {
      if (!exception)
      {
        return;
      }
      try
      {
        std::rethrow_exception(exception);
      }
      catch (const std::exception& ex)
      {
        SpdLogHelper::GetLogger<LoggerName_HttpServer>()->error("{} terminated with exception: {}", coroutineName, ex.what());
      }
    }
  }


  HttpServer::HttpServer(ServerConfig config, std::shared_ptr<const CalculatorRequestHandler> handler)
    : m_config(std::move(config))
    , m_handler(std::move(handler))
    , m_ioContext(static_cast<int>(m_config.ThreadCount))
    , m_workGuard(boost::asio::make_work_guard(m_ioContext))
    , m_acceptor(m_ioContext)
  {
    if (!m_handler)
    {
      throw std::invalid_argument("HttpServer: handler can not be null");
    }
    if (m_config.ThreadCount == 0)
    {
      throw std::invalid_argument("HttpServer: ThreadCount must be at least one");
    }
  }


  HttpServer::~HttpServer()
  {
    Stop();
  }


  void HttpServer::Start()
  {
    if (m_started)
    {
      throw std::logic_error("HttpServer has already been started");
    }

    auto logger = SpdLogHelper::GetLogger<LoggerName_HttpServer>();

    const tcp::endpoint endpoint(boost::asio::ip::make_address(m_config.Address), m_config.Port);
    m_acceptor.open(endpoint.protocol());
    m_acceptor.set_option(boost::asio::socket_base::reuse_address(true));
    m_acceptor.bind(endpoint);
    m_acceptor.listen(boost::asio::socket_base::max_listen_connections);
    m_started = true;

    boost::asio::co_spawn(m_ioContext, AcceptLoopAsync(),
                          [](const std::exception_ptr& exception) { LogUnhandledException(exception, "AcceptLoopAsync"); });

    m_threads.reserve(m_config.ThreadCount);
    for (uint32_t i = 0; i < m_config.ThreadCount; ++i)
    {
      m_threads.emplace_back([this]() { RunWorker(); });
    }

    logger->info("Listening on {} with {} worker thread(s)", ToString(m_acceptor.local_endpoint()), m_config.ThreadCount);
  }


  void HttpServer::Stop()
  {
    if (!m_started || m_stopped)
    {
      return;
    }
    m_stopped = true;

    auto logger = SpdLogHelper::GetLogger<LoggerName_HttpServer>();
    logger->info("Stopping");

    m_workGuard.reset();
    m_ioContext.stop();
    for (auto& thread : m_threads)
    {
      if (thread.joinable())
      {
        thread.join();
      }
    }
    m_threads.clear();

    // The workers are gone so the acceptor can be closed from this thread
    boost::system::error_code error;
    m_acceptor.close(error);
    if (error)
    {
      logger->warn("Failed to close acceptor: {}", error.message());
    }
    logger->info("Stopped");
  }


  tcp::endpoint HttpServer::GetLocalEndpoint() const
  {
    if (!IsRunning())
    {
      throw std::logic_error("HttpServer is not running");
    }
    return m_acceptor.local_endpoint();
  }


  void HttpServer::RunWorker()
  {
    auto logger = SpdLogHelper::GetLogger<LoggerName_HttpServer>();
    logger->debug("Worker thread started");
    for (;;)
    {
      try
      {
        m_ioContext.run();
        break;
      }
      catch (const std::exception& ex)
      {
        // A handler escaped with an exception, keep serving the other connections
        logger->error("Worker caught exception: {}", ex.what());
      }
    }
    logger->debug("Worker thread shutting down");
  }


  boost::asio::awaitable<void> HttpServer::AcceptLoopAsync()
  {
    auto logger = SpdLogHelper::GetLogger<LoggerName_HttpServer>();
    while (m_acceptor.is_open())
    {
      boost::system::error_code error;
      auto socket =
        co_await m_acceptor.async_accept(boost::asio::make_strand(m_ioContext), boost::asio::redirect_error(boost::asio::use_awaitable, error));
      if (error)
      {
        if (error == boost::asio::error::operation_aborted)
        {
          break;
        }
        logger->warn("Accept failed: {}", error.message());
        continue;
      }

      auto executor = socket.get_executor();
      boost::asio::co_spawn(executor, RunSessionAsync(boost::beast::tcp_stream(std::move(socket))),
                            [](const std::exception_ptr& exception) { LogUnhandledException(exception, "RunSessionAsync"); });
    }
    logger->debug("Accept loop finished");
  }


  boost::asio::awaitable<void> HttpServer::RunSessionAsync(boost::beast::tcp_stream stream)
  {
    auto logger = SpdLogHelper::GetLogger<LoggerName_HttpServer>();

    boost::system::error_code error;
    const auto remoteEndpoint = stream.socket().remote_endpoint(error);
    const std::string remote = error ? std::string("unknown") : ToString(remoteEndpoint);
    logger->debug("Connection opened from {}", remote);

    boost::beast::flat_buffer buffer;
    for (;;)
    {
      stream.expires_after(m_config.IdleTimeout);

      HttpRequest request;
      co_await http::async_read(stream, buffer, request, boost::asio::redirect_error(boost::asio::use_awaitable, error));
      if (error)
      {
        if (!IsExpectedDisconnect(error))
        {
          logger->debug("Closing connection from {}: {}", remote, error.message());
        }
        break;
      }

      HttpResponse response = m_handler->Handle(request);
      logger->debug("{} {} {} -> {}", remote, ToStdStringView(request.method_string()), ToStdStringView(request.target()),
                    response.result_int());

      const bool keepAlive = response.keep_alive();
      co_await http::async_write(stream, response, boost::asio::redirect_error(boost::asio::use_awaitable, error));
      if (error)
      {
        if (!IsExpectedDisconnect(error))
        {
          logger->debug("Write to {} failed: {}", remote, error.message());
        }
        break;
      }
      if (!keepAlive)
      {
        break;
      }
    }

    stream.socket().shutdown(tcp::socket::shutdown_send, error);
    logger->debug("Connection from {} closed", remote);
  }
}
