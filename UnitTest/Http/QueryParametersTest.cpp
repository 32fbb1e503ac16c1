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

#include <CalcServer/Http/QueryParameters.hpp>
#include <gtest/gtest.h>

namespace CalcServer
{
  TEST(QueryParameters, Parse_Empty)
  {
    const auto parameters = QueryParameters::Parse("");
    EXPECT_TRUE(parameters.Empty());
    EXPECT_FALSE(parameters.TryGet("first").has_value());
  }

  TEST(QueryParameters, Parse_TwoParameters)
  {
    const auto parameters = QueryParameters::Parse("first=2&second=3");
    EXPECT_EQ(parameters.Size(), 2u);
    EXPECT_EQ(parameters.TryGet("first"), "2");
    EXPECT_EQ(parameters.TryGet("second"), "3");
  }

  TEST(QueryParameters, Parse_NameWithoutValue_IsPresentAndEmpty)
  {
    const auto parameters = QueryParameters::Parse("first&second=");
    ASSERT_TRUE(parameters.Contains("first"));
    ASSERT_TRUE(parameters.Contains("second"));
    EXPECT_EQ(parameters.TryGet("first"), "");
    EXPECT_EQ(parameters.TryGet("second"), "");
  }

  TEST(QueryParameters, Parse_SkipsEmptyPairs)
  {
    const auto parameters = QueryParameters::Parse("&&first=1&&");
    EXPECT_EQ(parameters.Size(), 1u);
    EXPECT_EQ(parameters.TryGet("first"), "1");
  }

  TEST(QueryParameters, Parse_FirstOccurrenceWins)
  {
    const auto parameters = QueryParameters::Parse("first=1&first=2");
    EXPECT_EQ(parameters.Size(), 1u);
    EXPECT_EQ(parameters.TryGet("first"), "1");
  }

  TEST(QueryParameters, Parse_ValueMayContainEquals)
  {
    const auto parameters = QueryParameters::Parse("first=a=b");
    EXPECT_EQ(parameters.TryGet("first"), "a=b");
  }

  TEST(QueryParameters, Parse_DecodesNamesAndValues)
  {
    const auto parameters = QueryParameters::Parse("fir%73t=%2D1.5e%2B2&second=+4");
    EXPECT_EQ(parameters.TryGet("first"), "-1.5e+2");
    EXPECT_EQ(parameters.TryGet("second"), " 4");
  }

  TEST(QueryParameters, Parse_IsCaseSensitive)
  {
    const auto parameters = QueryParameters::Parse("First=1");
    EXPECT_FALSE(parameters.Contains("first"));
    EXPECT_TRUE(parameters.Contains("First"));
  }

  TEST(QueryParameters, Decode_PercentEscapes)
  {
    EXPECT_EQ(QueryParameters::Decode("%41%62%63"), "Abc");
    EXPECT_EQ(QueryParameters::Decode("a%2fb%2Fc"), "a/b/c");
    EXPECT_EQ(QueryParameters::Decode("a+b"), "a b");
  }

  TEST(QueryParameters, Decode_MalformedEscapesAreKept)
  {
    EXPECT_EQ(QueryParameters::Decode("%"), "%");
    EXPECT_EQ(QueryParameters::Decode("%4"), "%4");
    EXPECT_EQ(QueryParameters::Decode("%zz1"), "%zz1");
    EXPECT_EQ(QueryParameters::Decode("100%"), "100%");
  }
}
