#include "tw/core/json_codec.h"

#include <memory>
#include <sstream>

namespace tw::core {
namespace {

const char* TypeName(const Json::Value& value) {
  switch (value.type()) {
  case Json::nullValue:
    return "null";
  case Json::intValue:
  case Json::uintValue:
  case Json::realValue:
    return "number";
  case Json::stringValue:
    return "string";
  case Json::booleanValue:
    return "boolean";
  case Json::arrayValue:
    return "array";
  case Json::objectValue:
    return "object";
  }
  return "unknown";
}

} // namespace

std::string ToJsonLine(const Json::Value& value) {
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "";
  builder["emitUTF8"] = true;
  return Json::writeString(builder, value);
}

std::string ToIndentedJson(const Json::Value& value) {
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "\t";
  builder["emitUTF8"] = true;
  return Json::writeString(builder, value);
}

Json::Value ParseJson(std::string_view text, int code, std::string_view what) {
  Json::CharReaderBuilder builder;
  Json::CharReaderBuilder::strictMode(&builder.settings_);
  builder["strictRoot"] = false;  // event names are bare JSON strings
  builder["rejectDupKeys"] = false; // log records may repeat a bound key; the last one wins
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  Json::Value out;
  std::string errs;
  if (!reader->parse(text.data(), text.data() + text.size(), &out, &errs)) {
    std::string message(what);
    message.append(": ");
    message.append(errs);
    while (!message.empty() && (message.back() == '\n' || message.back() == ' ')) {
      message.pop_back();
    }
    throw Error{ErrorDomain::Protocol, code, message};
  }
  return out;
}

void ThrowPayloadMismatch(std::string_view expected, const Json::Value& got) {
  std::ostringstream oss;
  oss << "Cannot decode JSON " << TypeName(got) << " as " << expected;
  throw Error{ErrorDomain::Protocol, errors::protocol::kPayloadMismatch, oss.str()};
}

std::string StringMember(const Json::Value& object, const char* key) {
  if (!object.isObject()) {
    ThrowPayloadMismatch("object", object);
  }
  const Json::Value& member = object[key];
  if (member.isNull()) {
    return {};
  }
  if (!member.isString()) {
    ThrowPayloadMismatch(std::string("string member ") + key, member);
  }
  return member.asString();
}

} // namespace tw::core
