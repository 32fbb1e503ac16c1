#ifndef CALC_SERVER_SERVICES_CALCULATOR_CALCULATORSERVICE_HPP
#define CALC_SERVER_SERVICES_CALCULATOR_CALCULATORSERVICE_HPP
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

#include <CalcServer/Services/ArithmeticOperation.hpp>
#include <CalcServer/Services/IArithmeticService.hpp>
#include <array>
#include <memory>
#include <vector>

namespace CalcServer
{
  /// @brief Calculator Service - dispatches an arithmetic operation to the service implementing it.
  ///
  /// The set of services is fixed at construction, so a CalculatorService can be shared between
  /// request handlers running on different threads without synchronization.
  class CalculatorService final
  {
    std::array<std::shared_ptr<const IArithmeticService>, ArithmeticOperationUtil::All.size()> m_services;

  public:
    /// @brief Creates a calculator backed by the default Add, Subtract, Multiply and Divide services.
    CalculatorService();

    /// @brief Creates a calculator backed by the supplied services.
    /// @param services Exactly one service per ArithmeticOperation.
    /// @throws std::invalid_argument if a service is null, an operation is provided twice or one is missing.
    explicit CalculatorService(const std::vector<std::shared_ptr<const IArithmeticService>>& services);

    /// @brief Applies the operation to the operands.
    /// @throws DivisionByZeroException when dividing by zero.
    /// @throws ResultOutOfRangeException when the result is not a finite number.
    double Compute(ArithmeticOperation operation, double a, double b) const;
  };
}

#endif
