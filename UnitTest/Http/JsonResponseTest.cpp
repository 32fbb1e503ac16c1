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

#include <CalcServer/Http/JsonResponse.hpp>
#include <gtest/gtest.h>
#include <json/json.h>
#include <memory>
#include <string>

namespace CalcServer
{
  namespace
  {
    Json::Value ParseJson(const std::string& text)
    {
      Json::CharReaderBuilder builder;
      std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
      Json::Value root;
      std::string errors;
      EXPECT_TRUE(reader->parse(text.data(), text.data() + text.size(), &root, &errors)) << errors;
      return root;
    }
  }

  TEST(JsonResponse, ResultBody_HasOnlyResult)
  {
    const auto json = ParseJson(JsonResponse::CreateResultBody(5.0));
    ASSERT_TRUE(json.isObject());
    EXPECT_EQ(json.size(), 1u);
    ASSERT_TRUE(json["result"].isDouble());
    EXPECT_DOUBLE_EQ(json["result"].asDouble(), 5.0);
  }

  TEST(JsonResponse, ResultBody_KeepsFullPrecision)
  {
    const double value = 3.4 - 1.4;
    const auto json = ParseJson(JsonResponse::CreateResultBody(value));
    EXPECT_EQ(json["result"].asDouble(), value);
  }

  TEST(JsonResponse, ResultBody_IsCompact)
  {
    const std::string body = JsonResponse::CreateResultBody(1.5);
    EXPECT_EQ(body.find('\n'), std::string::npos);
  }

  TEST(JsonResponse, ErrorBody_EscapesMessage)
  {
    const std::string message = "Invalid number for parameter 'first': '\"x\\y'";
    const auto json = ParseJson(JsonResponse::CreateErrorBody(message));
    ASSERT_TRUE(json.isObject());
    EXPECT_EQ(json.size(), 1u);
    EXPECT_EQ(json["error"].asString(), message);
  }

  TEST(JsonResponse, ErrorBody_InvalidUtf8IsEscaped)
  {
    const std::string body = JsonResponse::CreateErrorBody("a\xff");
    for (const char ch : body)
    {
      EXPECT_LT(static_cast<unsigned char>(ch), 0x80u) << body;
    }
    EXPECT_NE(body.find("\\ufffd"), std::string::npos) << body;
  }

  TEST(JsonResponse, ErrorBody_NonAsciiIsEscapedAndRoundTrips)
  {
    const std::string message = "caf\xc3\xa9";
    const std::string body = JsonResponse::CreateErrorBody(message);
    EXPECT_NE(body.find("\\u00e9"), std::string::npos) << body;
    EXPECT_EQ(ParseJson(body)["error"].asString(), message);
  }

  TEST(JsonResponse, StatusBody)
  {
    const auto json = ParseJson(JsonResponse::CreateStatusBody("ok"));
    EXPECT_EQ(json["status"].asString(), "ok");
  }
}
