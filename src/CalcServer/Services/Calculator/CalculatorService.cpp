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

#include <CalcServer/Exception/ResultOutOfRangeException.hpp>
#include <CalcServer/Services/Add/AddService.hpp>
#include <CalcServer/Services/Calculator/CalculatorService.hpp>
#include <CalcServer/Services/Divide/DivideService.hpp>
#include <CalcServer/Services/Multiply/MultiplyService.hpp>
#include <CalcServer/Services/Subtract/SubtractService.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <cmath>
#include <cstddef>
#include <stdexcept>

namespace CalcServer
{
  namespace
  {
    std::vector<std::shared_ptr<const IArithmeticService>> CreateDefaultServices()
    {
      return {std::make_shared<AddService>(), std::make_shared<SubtractService>(), std::make_shared<MultiplyService>(),
              std::make_shared<DivideService>()};
    }

    constexpr std::size_t ToIndex(const ArithmeticOperation operation) noexcept
    {
      return static_cast<std::size_t>(operation);
    }
  }


  CalculatorService::CalculatorService()
    : CalculatorService(CreateDefaultServices())
  {
  }


  CalculatorService::CalculatorService(const std::vector<std::shared_ptr<const IArithmeticService>>& services)
  {
    for (const auto& service : services)
    {
      if (!service)
      {
        throw std::invalid_argument("CalculatorService: service can not be null");
      }
      const auto index = ToIndex(service->GetOperation());
      if (index >= m_services.size())
      {
        throw std::invalid_argument("CalculatorService: service reports an unknown operation");
      }
      if (m_services[index])
      {
        throw std::invalid_argument(fmt::format("CalculatorService: duplicate service for operation '{}'",
                                                ArithmeticOperationUtil::ToRouteName(service->GetOperation())));
      }
      m_services[index] = service;
    }

    for (const ArithmeticOperation operation : ArithmeticOperationUtil::All)
    {
      if (!m_services[ToIndex(operation)])
      {
        throw std::invalid_argument(
          fmt::format("CalculatorService: no service registered for operation '{}'", ArithmeticOperationUtil::ToRouteName(operation)));
      }
    }
  }


  double CalculatorService::Compute(const ArithmeticOperation operation, const double a, const double b) const
  {
    const auto index = ToIndex(operation);
    if (index >= m_services.size())
    {
      throw std::invalid_argument("CalculatorService: unknown operation");
    }

    const double result = m_services[index]->Compute(a, b);
    if (!std::isfinite(result))
    {
      spdlog::debug("[CalculatorService] {} {} {} is not finite", a, ArithmeticOperationUtil::ToSymbol(operation), b);
      throw ResultOutOfRangeException(ArithmeticOperationUtil::ToRouteName(operation));
    }
    return result;
  }
}
