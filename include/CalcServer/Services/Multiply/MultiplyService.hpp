#ifndef CALC_SERVER_SERVICES_MULTIPLY_MULTIPLYSERVICE_HPP
#define CALC_SERVER_SERVICES_MULTIPLY_MULTIPLYSERVICE_HPP
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

#include <CalcServer/Services/IArithmeticService.hpp>
#include <spdlog/spdlog.h>

namespace CalcServer
{
  /// @brief Multiply Service implementation.
  class MultiplyService final : public IArithmeticService
  {
  public:
    MultiplyService()
    {
      spdlog::debug("MultiplyService: constructed");
    }

    ArithmeticOperation GetOperation() const noexcept override
    {
      return ArithmeticOperation::Multiply;
    }

    double Compute(const double a, const double b) const override
    {
      spdlog::debug("[MultiplyService] {} * {}", a, b);
      return a * b;
    }
  };
}

#endif
