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
#include <json/json.h>

namespace CalcServer::JsonResponse
{
  namespace
  {
    std::string Write(const Json::Value& value)
    {
      Json::StreamWriterBuilder builder;
      builder["indentation"] = "";
      return Json::writeString(builder, value);
    }

    std::string CreateSingleFieldBody(const char* key, const std::string_view text)
    {
      Json::Value body(Json::objectValue);
      body[key] = Json::Value(text.data(), text.data() + text.size());
      return Write(body);
    }
  }


  std::string CreateResultBody(const double value)
  {
    Json::Value body(Json::objectValue);
    body["result"] = value;
    return Write(body);
  }


  std::string CreateErrorBody(const std::string_view message)
  {
    return CreateSingleFieldBody("error", message);
  }


  std::string CreateStatusBody(const std::string_view status)
  {
    return CreateSingleFieldBody("status", status);
  }
}
