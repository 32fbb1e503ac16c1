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
#include <CalcServer/Exception/BadRequestException.hpp>
#include <CalcServer/Http/CalculatorRequestHandler.hpp>
#include <CalcServer/Http/JsonResponse.hpp>
#include <CalcServer/Http/NumberParser.hpp>
#include <CalcServer/Http/QueryParameters.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/http/verb.hpp>
#include <fmt/format.h>
#include <exception>
#include <stdexcept>
#include <utility>

namespace CalcServer
{
  namespace http = boost::beast::http;

  namespace
  {
    CALC_SERVER_LOGGER_NAME(RequestHandler);

    constexpr const char* ServerName = "CalcServer";
    constexpr const char* JsonContentType = "application/json";
  }


  CalculatorRequestHandler::CalculatorRequestHandler(std::shared_ptr<const CalculatorService> calculator)
    : m_calculator(std::move(calculator))
  {
    if (!m_calculator)
    {
      throw std::invalid_argument("CalculatorRequestHandler: calculator can not be null");
    }
  }


  HttpResponse CalculatorRequestHandler::Handle(const HttpRequest& request) const noexcept
  {
    const std::string_view target = ToStdStringView(request.target());
    const auto queryStart = target.find('?');
    const std::string_view path = target.substr(0, queryStart);
    const std::string_view query = queryStart == std::string_view::npos ? std::string_view{} : target.substr(queryStart + 1);

    auto logger = SpdLogHelper::GetLogger<LoggerName_RequestHandler>();
    try
    {
      if (path == Routes::Health)
      {
        if (request.method() != http::verb::get)
        {
          return CreateMethodNotAllowedResponse(request);
        }
        return CreateResponse(http::status::ok, JsonResponse::CreateStatusBody("ok"), request);
      }

      if (path.starts_with(Routes::CalculatorPrefix))
      {
        const auto operation = ArithmeticOperationUtil::TryParseRouteName(path.substr(Routes::CalculatorPrefix.size()));
        if (operation.has_value())
        {
          if (request.method() != http::verb::get)
          {
            return CreateMethodNotAllowedResponse(request);
          }
          return HandleCalculation(operation.value(), query, request);
        }
      }

      logger->debug("No route for {} {}", ToStdStringView(request.method_string()), path);
      return CreateErrorResponse(http::status::not_found, fmt::format("Not found: {}", path), request);
    }
    catch (const BadRequestException& ex)
    {
      logger->debug("Rejected {}: {}", target, ex.what());
      return CreateErrorResponse(http::status::bad_request, ex.what(), request);
    }
    catch (const std::exception& ex)
    {
      logger->error("Internal error while handling {}: {}", target, ex.what());
    }

    try
    {
      return CreateErrorResponse(http::status::internal_server_error, "Internal server error", request);
    }
    catch (const std::exception& ex)
    {
      // Building the response itself failed (out of memory), send an empty one
      logger->critical("Failed to build error response: {}", ex.what());
      return HttpResponse{http::status::internal_server_error, request.version()};
    }
  }


  HttpResponse CalculatorRequestHandler::HandleCalculation(const ArithmeticOperation operation, const std::string_view query,
                                                           const HttpRequest& request) const
  {
    const QueryParameters parameters = QueryParameters::Parse(query);
    const double first = NumberParser::GetRequiredNumber(parameters, Routes::FirstParameter);
    const double second = NumberParser::GetRequiredNumber(parameters, Routes::SecondParameter);

    const double result = m_calculator->Compute(operation, first, second);
    return CreateResponse(http::status::ok, JsonResponse::CreateResultBody(result), request);
  }


  HttpResponse CalculatorRequestHandler::CreateResponse(const http::status status, std::string body, const HttpRequest& request)
  {
    HttpResponse response{status, request.version()};
    response.set(http::field::server, ServerName);
    response.set(http::field::content_type, JsonContentType);
    response.keep_alive(request.keep_alive());
    response.body() = std::move(body);
    response.prepare_payload();
    return response;
  }


  HttpResponse CalculatorRequestHandler::CreateErrorResponse(const http::status status, const std::string_view message,
                                                             const HttpRequest& request)
  {
    return CreateResponse(status, JsonResponse::CreateErrorBody(message), request);
  }


  HttpResponse CalculatorRequestHandler::CreateMethodNotAllowedResponse(const HttpRequest& request)
  {
    auto response = CreateErrorResponse(http::status::method_not_allowed,
                                        fmt::format("Method not allowed: {}", ToStdStringView(request.method_string())), request);
    response.set(http::field::allow, "GET");
    return response;
  }
}
