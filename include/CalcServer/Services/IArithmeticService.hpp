#ifndef CALC_SERVER_SERVICES_IARITHMETICSERVICE_HPP
#define CALC_SERVER_SERVICES_IARITHMETICSERVICE_HPP
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

namespace CalcServer
{
  /// @brief Interface for a service implementing a single binary arithmetic operation.
  ///
  /// Implementations are stateless and may be called concurrently from any thread.
  class IArithmeticService
  {
  public:
    virtual ~IArithmeticService() = default;

    /// @brief The operation this service implements.
    virtual ArithmeticOperation GetOperation() const noexcept = 0;

    /// @brief Applies the operation.
    /// @param a The first operand.
    /// @param b The second operand.
    /// @return The IEEE-754 result of the operation.
    virtual double Compute(double a, double b) const = 0;
  };
}

#endif
