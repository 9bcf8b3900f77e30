#pragma once

#include <string_view>

namespace tw::errors::msg {
inline constexpr std::string_view kStreamClosed{"Stream closed"};
inline constexpr std::string_view kPipeClosed{"Read/write on closed pipe"};
inline constexpr std::string_view kListenerClosed{"Listener closed"};
inline constexpr std::string_view kNameNotString{"Event name is not a JSON string"};
inline constexpr std::string_view kTruncatedMessage{"Stream ended between event name and payload"};
inline constexpr std::string_view kInvalidPayloadJson{"Event payload is not valid JSON"};
inline constexpr std::string_view kFrameTooLong{"Event frame exceeds maximum line length"};
inline constexpr std::string_view kLogRecordNotObject{"Log record is not a JSON object"};
inline constexpr std::string_view kLogRecordMissingMsg{"Log record has no string msg field"};
inline constexpr std::string_view kNoFileConfigured{"No file configured"};
inline constexpr std::string_view kDocumentDecodeFailed{"Unable to decode persisted document"};
inline constexpr std::string_view kIdMissing{"ID missing"};
inline constexpr std::string_view kEmptyTask{"Empty task"};
inline constexpr std::string_view kNameTimeout{"timeout"};
inline constexpr std::string_view kEndOfStream{"EOF"};
inline constexpr std::string_view kUnexpectedEvent{"unexpected event"};
}  // namespace tw::errors::msg
