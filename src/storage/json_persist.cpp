#include "tw/storage/json_persist.h"

#include "tw/common.h"
#include "tw/errors.h"

namespace tw::storage::detail {

RenderedDocument RenderDocument(const Json::Value& value) {
  RenderedDocument out;
  out.text = core::ToIndentedJson(value);
  out.text.push_back('\n');
  out.hash = crypto::SHA256_Hash(std::string_view(out.text));
  return out;
}

std::optional<Json::Value> LoadDocument(const std::filesystem::path& path) {
  auto contents = ReadWholeFile(path);
  if (!contents || contents->find_first_not_of(" \t\r\n") == std::string::npos) {
    return std::nullopt;
  }
  try {
    return core::ParseJson(*contents, errors::protocol::kMalformedFrame, "JSON");
  } catch (const Error& err) {
    ThrowDecodeFailed(path, err);
  }
}

void ThrowNoFile() {
  throw Error{ErrorDomain::State, errors::state::kNoFile, std::string(errors::msg::kNoFileConfigured)};
}

void ThrowDecodeFailed(const std::filesystem::path& path, const Error& cause) {
  throw Error{ErrorDomain::State, errors::state::kDocumentDecodeFailed,
              std::string(errors::msg::kDocumentDecodeFailed) + " " + PathToUtf8String(path) + ": " +
                  cause.what(),
              cause.native_code, Retryability::kFatal, cause.context};
}

} // namespace tw::storage::detail
