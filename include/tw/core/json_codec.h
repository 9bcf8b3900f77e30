#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include <json/json.h>

#include "tw/error.h"

namespace tw::core {

  // Compact single-line rendering; never contains a newline.
  std::string ToJsonLine(const Json::Value& value);

  // Tab-indented rendering with sorted object keys, stable across runs.
  std::string ToIndentedJson(const Json::Value& value);

  // Strict parse of exactly one JSON value. Throws tw::Error with |code| in the
  // Protocol domain, prefixed by |what|.
  Json::Value ParseJson(std::string_view text, int code, std::string_view what);

  [[noreturn]] void ThrowPayloadMismatch(std::string_view expected, const Json::Value& got);

  // Conversion between C++ values and JSON. Specialise Encode/Decode for every
  // payload type carried over an event stream or persisted to disk. Decode
  // throws tw::Error (Protocol, kPayloadMismatch) when the shape is wrong.
  template <typename T>
  struct JsonCodec;

  template <>
  struct JsonCodec<Json::Value> {
    static Json::Value Encode(const Json::Value& value) { return value; }
    static Json::Value Decode(const Json::Value& value) { return value; }
  };

  template <>
  struct JsonCodec<std::string> {
    static Json::Value Encode(const std::string& value) { return Json::Value(value); }
    static std::string Decode(const Json::Value& value) {
      if (!value.isString()) {
        ThrowPayloadMismatch("string", value);
      }
      return value.asString();
    }
  };

  template <>
  struct JsonCodec<bool> {
    static Json::Value Encode(bool value) { return Json::Value(value); }
    static bool Decode(const Json::Value& value) {
      if (!value.isBool()) {
        ThrowPayloadMismatch("boolean", value);
      }
      return value.asBool();
    }
  };

  template <>
  struct JsonCodec<std::int64_t> {
    static Json::Value Encode(std::int64_t value) { return Json::Value(static_cast<Json::Int64>(value)); }
    static std::int64_t Decode(const Json::Value& value) {
      if (!value.isInt64()) {
        ThrowPayloadMismatch("integer", value);
      }
      return value.asInt64();
    }
  };

  template <typename T>
  struct JsonCodec<std::vector<T>> {
    static Json::Value Encode(const std::vector<T>& values) {
      Json::Value out(Json::arrayValue);
      for (const auto& value : values) {
        out.append(JsonCodec<T>::Encode(value));
      }
      return out;
    }
    static std::vector<T> Decode(const Json::Value& value) {
      std::vector<T> out;
      if (value.isNull()) {
        return out;
      }
      if (!value.isArray()) {
        ThrowPayloadMismatch("array", value);
      }
      out.reserve(value.size());
      for (const auto& element : value) {
        out.push_back(JsonCodec<T>::Decode(element));
      }
      return out;
    }
  };

  template <typename T>
  struct JsonCodec<std::map<std::string, T>> {
    static Json::Value Encode(const std::map<std::string, T>& values) {
      Json::Value out(Json::objectValue);
      for (const auto& [key, value] : values) {
        out[key] = JsonCodec<T>::Encode(value);
      }
      return out;
    }
    static std::map<std::string, T> Decode(const Json::Value& value) {
      std::map<std::string, T> out;
      if (value.isNull()) {
        return out;
      }
      if (!value.isObject()) {
        ThrowPayloadMismatch("object", value);
      }
      for (const auto& key : value.getMemberNames()) {
        out.emplace(key, JsonCodec<T>::Decode(value[key]));
      }
      return out;
    }
  };

  // Reads an optional string member; absent or null members give "".
  std::string StringMember(const Json::Value& object, const char* key);

} // namespace tw::core
