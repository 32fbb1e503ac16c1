#ifndef CALC_SERVER_SERVICES_ARITHMETICOPERATION_HPP
#define CALC_SERVER_SERVICES_ARITHMETICOPERATION_HPP
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

#include <array>
#include <optional>
#include <string_view>

namespace CalcServer
{
  /// @brief The closed set of operations exposed by the calculator.
  enum class ArithmeticOperation
  {
    Add = 0,
    Subtract = 1,
    Multiply = 2,
    Divide = 3
  };

  namespace ArithmeticOperationUtil
  {
    /// @brief All operations, in route registration order.
    constexpr std::array<ArithmeticOperation, 4> All{ArithmeticOperation::Add, ArithmeticOperation::Subtract, ArithmeticOperation::Multiply,
                                                     ArithmeticOperation::Divide};

    /// @brief The last path segment of the operation's route, e.g. "sub" for /calculator/sub.
    [[nodiscard]] constexpr std::string_view ToRouteName(const ArithmeticOperation operation) noexcept
    {
      switch (operation)
      {
      case ArithmeticOperation::Add:
        return "add";
      case ArithmeticOperation::Subtract:
        return "sub";
      case ArithmeticOperation::Multiply:
        return "mul";
      case ArithmeticOperation::Divide:
        return "div";
      }
      return "unknown";
    }

    /// @brief The infix symbol used when logging the operation.
    [[nodiscard]] constexpr std::string_view ToSymbol(const ArithmeticOperation operation) noexcept
    {
      switch (operation)
      {
      case ArithmeticOperation::Add:
        return "+";
      case ArithmeticOperation::Subtract:
        return "-";
      case ArithmeticOperation::Multiply:
        return "*";
      case ArithmeticOperation::Divide:
        return "/";
      }
      return "?";
    }

    [[nodiscard]] constexpr std::optional<ArithmeticOperation> TryParseRouteName(const std::string_view routeName) noexcept
    {
      for (const ArithmeticOperation operation : All)
      {
        if (ToRouteName(operation) == routeName)
        {
          return operation;
        }
      }
      return std::nullopt;
    }
  }
}

#endif
