#ifndef CALC_SERVER_HTTP_HTTPSERVER_HPP
#define CALC_SERVER_HTTP_HTTPSERVER_HPP
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
#include <CalcServer/Http/CalculatorRequestHandler.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <memory>
#include <thread>
#include <vector>

namespace CalcServer
{
  /// @brief HTTP/1.1 server that feeds every request to a CalculatorRequestHandler.
  ///
  /// A fixed pool of worker threads runs a shared io_context. One coroutine accepts connections and every
  /// connection is served by its own coroutine on its own strand. Start() and Stop() must be called from
  /// the thread that owns the server.
  class HttpServer
  {
    ServerConfig m_config;
    std::shared_ptr<const CalculatorRequestHandler> m_handler;
    boost::asio::io_context m_ioContext;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> m_workGuard;
    boost::asio::ip::tcp::acceptor m_acceptor;
    std::vector<std::thread> m_threads;
    bool m_started{false};
    bool m_stopped{false};

  public:
    /// @throws std::invalid_argument if handler is null or config.ThreadCount is zero.
    HttpServer(ServerConfig config, std::shared_ptr<const CalculatorRequestHandler> handler);
    ~HttpServer();
    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;
    HttpServer(HttpServer&&) = delete;
    HttpServer& operator=(HttpServer&&) = delete;

    /// @brief Binds the listening socket and launches the worker threads.
    /// @throws boost::system::system_error if the address is invalid or can not be bound.
    /// @throws std::logic_error if the server was already started.
    void Start();

    /// @brief Stops accepting, abandons open connections and joins the worker threads. Safe to call repeatedly.
    void Stop();

    bool IsRunning() const noexcept
    {
      return m_started && !m_stopped;
    }

    /// @brief The endpoint the server is bound to, useful when the configured port is 0.
    /// @throws std::logic_error if the server is not running.
    boost::asio::ip::tcp::endpoint GetLocalEndpoint() const;

  private:
    boost::asio::awaitable<void> AcceptLoopAsync();
    boost::asio::awaitable<void> RunSessionAsync(boost::beast::tcp_stream stream);
    void RunWorker();
  };
}

#endif
