#ifndef CALC_SERVER_HTTP_CALCULATORREQUESTHANDLER_HPP
#define CALC_SERVER_HTTP_CALCULATORREQUESTHANDLER_HPP
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

#include <CalcServer/Http/HttpTypes.hpp>
#include <CalcServer/Services/ArithmeticOperation.hpp>
#include <CalcServer/Services/Calculator/CalculatorService.hpp>
#include <boost/beast/http/status.hpp>
#include <memory>
#include <string>
#include <string_view>

namespace CalcServer
{
  namespace Routes
  {
    constexpr std::string_view CalculatorPrefix = "/calculator/";
    constexpr std::string_view Health = "/health";
    constexpr std::string_view FirstParameter = "first";
    constexpr std::string_view SecondParameter = "second";
  }

  /// @brief Maps an HTTP request to the calculator and builds the JSON response.
  ///
  /// Handle() never throws: client errors become 400, unknown paths 404, wrong methods 405 and anything
  /// unexpected 500. The handler is immutable and may be shared by all connections.
  class CalculatorRequestHandler
  {
    std::shared_ptr<const CalculatorService> m_calculator;

  public:
    /// @throws std::invalid_argument if calculator is null.
    explicit CalculatorRequestHandler(std::shared_ptr<const CalculatorService> calculator);

    HttpResponse Handle(const HttpRequest& request) const noexcept;

  private:
    HttpResponse HandleCalculation(ArithmeticOperation operation, std::string_view query, const HttpRequest& request) const;
    static HttpResponse CreateResponse(boost::beast::http::status status, std::string body, const HttpRequest& request);
    static HttpResponse CreateErrorResponse(boost::beast::http::status status, std::string_view message, const HttpRequest& request);
    static HttpResponse CreateMethodNotAllowedResponse(const HttpRequest& request);
  };
}

#endif
