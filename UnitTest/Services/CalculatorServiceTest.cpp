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

#include <CalcServer/Exception/DivisionByZeroException.hpp>
#include <CalcServer/Exception/ResultOutOfRangeException.hpp>
#include <CalcServer/Services/Add/AddService.hpp>
#include <CalcServer/Services/Calculator/CalculatorService.hpp>
#include <CalcServer/Services/Divide/DivideService.hpp>
#include <CalcServer/Services/Multiply/MultiplyService.hpp>
#include <CalcServer/Services/Subtract/SubtractService.hpp>
#include <gtest/gtest.h>
#include <atomic>
#include <limits>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

namespace CalcServer
{
  namespace
  {
    /// Records calls so the dispatch can be observed.
    class CountingAddService final : public IArithmeticService
    {
    public:
      mutable std::atomic<int> Calls{0};

      ArithmeticOperation GetOperation() const noexcept override
      {
        return ArithmeticOperation::Add;
      }

      double Compute(const double a, const double b) const override
      {
        ++Calls;
        return a + b;
      }
    };
  }

  TEST(CalculatorService, DefaultServices_ComputeAllOperations)
  {
    const CalculatorService calculator;
    EXPECT_DOUBLE_EQ(calculator.Compute(ArithmeticOperation::Add, 2, 3), 5.0);
    EXPECT_NEAR(calculator.Compute(ArithmeticOperation::Subtract, 3.4, 1.4), 2.0, 1e-12);
    EXPECT_DOUBLE_EQ(calculator.Compute(ArithmeticOperation::Multiply, 7, 3), 21.0);
    EXPECT_DOUBLE_EQ(calculator.Compute(ArithmeticOperation::Divide, 10, 4), 2.5);
  }

  TEST(CalculatorService, DivideByZero_Throws)
  {
    const CalculatorService calculator;
    EXPECT_THROW(static_cast<void>(calculator.Compute(ArithmeticOperation::Divide, 10, 0)), DivisionByZeroException);
  }

  TEST(CalculatorService, Overflow_ThrowsResultOutOfRange)
  {
    const CalculatorService calculator;
    const double max = std::numeric_limits<double>::max();
    EXPECT_THROW(static_cast<void>(calculator.Compute(ArithmeticOperation::Multiply, 1e200, 1e200)), ResultOutOfRangeException);
    EXPECT_THROW(static_cast<void>(calculator.Compute(ArithmeticOperation::Add, max, max)), ResultOutOfRangeException);
    EXPECT_THROW(static_cast<void>(calculator.Compute(ArithmeticOperation::Subtract, -max, max)), ResultOutOfRangeException);
    EXPECT_THROW(static_cast<void>(calculator.Compute(ArithmeticOperation::Divide, max, 1e-10)), ResultOutOfRangeException);
  }

  TEST(CalculatorService, InjectedServices_AreUsed)
  {
    auto add = std::make_shared<CountingAddService>();
    const std::vector<std::shared_ptr<const IArithmeticService>> services{add, std::make_shared<SubtractService>(),
                                                                          std::make_shared<MultiplyService>(), std::make_shared<DivideService>()};
    const CalculatorService calculator(services);
    EXPECT_DOUBLE_EQ(calculator.Compute(ArithmeticOperation::Add, 1, 1), 2.0);
    EXPECT_DOUBLE_EQ(calculator.Compute(ArithmeticOperation::Multiply, 2, 2), 4.0);
    EXPECT_EQ(add->Calls.load(), 1);
  }

  TEST(CalculatorService, InjectedServices_OrderDoesNotMatter)
  {
    const std::vector<std::shared_ptr<const IArithmeticService>> services{std::make_shared<DivideService>(), std::make_shared<MultiplyService>(),
                                                                          std::make_shared<SubtractService>(), std::make_shared<AddService>()};
    const CalculatorService calculator(services);
    EXPECT_DOUBLE_EQ(calculator.Compute(ArithmeticOperation::Subtract, 5, 1), 4.0);
    EXPECT_DOUBLE_EQ(calculator.Compute(ArithmeticOperation::Divide, 9, 3), 3.0);
  }

  TEST(CalculatorService, MissingService_Throws)
  {
    const std::vector<std::shared_ptr<const IArithmeticService>> services{std::make_shared<AddService>(), std::make_shared<SubtractService>(),
                                                                          std::make_shared<MultiplyService>()};
    EXPECT_THROW(CalculatorService{services}, std::invalid_argument);
  }

  TEST(CalculatorService, DuplicateService_Throws)
  {
    const std::vector<std::shared_ptr<const IArithmeticService>> services{std::make_shared<AddService>(), std::make_shared<AddService>(),
                                                                          std::make_shared<SubtractService>(), std::make_shared<MultiplyService>(),
                                                                          std::make_shared<DivideService>()};
    EXPECT_THROW(CalculatorService{services}, std::invalid_argument);
  }

  TEST(CalculatorService, NullService_Throws)
  {
    const std::vector<std::shared_ptr<const IArithmeticService>> services(1);
    EXPECT_THROW(CalculatorService{services}, std::invalid_argument);
  }

  TEST(CalculatorService, ConcurrentCompute_IsIndependent)
  {
    const CalculatorService calculator;
    constexpr int ThreadCount = 8;
    constexpr int Iterations = 1000;
    std::atomic<int> failures{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < ThreadCount; ++t)
    {
      threads.emplace_back(
        [&calculator, &failures, t]()
        {
          for (int i = 0; i < Iterations; ++i)
          {
            const double a = t * 1000.0 + i;
            if (calculator.Compute(ArithmeticOperation::Add, a, 1.0) != a + 1.0)
            {
              ++failures;
            }
          }
        });
    }
    for (auto& thread : threads)
    {
      thread.join();
    }
    EXPECT_EQ(failures.load(), 0);
  }
}
