#pragma once
#include <cerrno>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace tw {
  enum class ErrorDomain : std::uint16_t {
    Protocol = 0x01,
    IO = 0x02,
    Crypto = 0x03,
    Validation = 0x04,
    Config = 0x05,
    State = 0x07,
    Internal = 0x7F
  };

  // Each domain reserves a span of codes to avoid collisions with propagated
  // platform error numbers. Codes inside the reserved range are stable.
  inline constexpr int kErrorDomainSpan = 0x0100;

  inline constexpr int ErrorDomainBase(ErrorDomain domain) {
    switch (domain) {
    case ErrorDomain::Protocol:
      return 0x0100;
    case ErrorDomain::IO:
      return 0x0200;
    case ErrorDomain::Crypto:
      return 0x0300;
    case ErrorDomain::Validation:
      return 0x0400;
    case ErrorDomain::Config:
      return 0x0500;
    case ErrorDomain::State:
      return 0x0700;
    case ErrorDomain::Internal:
      return 0x7F00;
    }
    return 0; // unreachable but placates compilers without warnings enabled
  }

  inline constexpr const char* ErrorDomainName(ErrorDomain domain) {
    switch (domain) {
    case ErrorDomain::Protocol:
      return "protocol";
    case ErrorDomain::IO:
      return "io";
    case ErrorDomain::Crypto:
      return "crypto";
    case ErrorDomain::Validation:
      return "validation";
    case ErrorDomain::Config:
      return "config";
    case ErrorDomain::State:
      return "state";
    case ErrorDomain::Internal:
      return "internal";
    }
    return "unknown";
  }

  inline constexpr int ErrorDomainMax(ErrorDomain domain) {
    return ErrorDomainBase(domain) + kErrorDomainSpan - 1;
  }

  inline constexpr bool IsFrameworkErrorCode(ErrorDomain domain, int code) {
    return code >= ErrorDomainBase(domain) && code <= ErrorDomainMax(domain);
  }

  enum class Retryability : std::uint8_t {
    kFatal = 0,
    kTransient,
    kRetryable
  };

  namespace errors {
    inline constexpr int Make(ErrorDomain domain, int offset) {
      return ErrorDomainBase(domain) + offset;
    }

    namespace protocol {
      inline constexpr int kMalformedFrame = Make(ErrorDomain::Protocol, 0x01);
      inline constexpr int kPayloadMismatch = Make(ErrorDomain::Protocol, 0x02);
      inline constexpr int kUnexpectedEvent = Make(ErrorDomain::Protocol, 0x03);
      inline constexpr int kFrameTooLong = Make(ErrorDomain::Protocol, 0x04);
    } // namespace protocol

    namespace io {
      inline constexpr int kStreamClosed = Make(ErrorDomain::IO, 0x01);
      inline constexpr int kPipeClosed = Make(ErrorDomain::IO, 0x02);
      inline constexpr int kListenerClosed = Make(ErrorDomain::IO, 0x03);
      inline constexpr int kAcceptFailed = Make(ErrorDomain::IO, 0x04);
      inline constexpr int kSocketFailed = Make(ErrorDomain::IO, 0x05);
      inline constexpr int kReadFailed = Make(ErrorDomain::IO, 0x06);
      inline constexpr int kWriteFailed = Make(ErrorDomain::IO, 0x07);
      inline constexpr int kFileOpenFailed = Make(ErrorDomain::IO, 0x08);
    } // namespace io

    namespace validation {
      inline constexpr int kIdMissing = Make(ErrorDomain::Validation, 0x01);
      inline constexpr int kEmptyTask = Make(ErrorDomain::Validation, 0x02);
    } // namespace validation

    namespace state {
      inline constexpr int kNoFile = Make(ErrorDomain::State, 0x01);
      inline constexpr int kDocumentDecodeFailed = Make(ErrorDomain::State, 0x02);
    } // namespace state

    namespace internal {
      inline constexpr int kUnexpected = Make(ErrorDomain::Internal, 0x01);
    } // namespace internal

  } // namespace errors

  struct Error : public std::runtime_error {
    ErrorDomain domain;
    int code;
    std::optional<int> native_code;
    Retryability retryability{Retryability::kFatal};
    std::vector<std::string> context;
    explicit Error(ErrorDomain d, int c, std::string msg,
                   std::optional<int> native = std::nullopt,
                   Retryability retry = Retryability::kFatal,
                   std::vector<std::string> ctx = {})
        : std::runtime_error(std::move(msg)),
          domain(d),
          code(c),
          native_code(native),
          retryability(retry),
          context(std::move(ctx)) {}
  };

  // True for the conditions that end a connection without indicating a fault
  // on our side: peer went away, stream or pipe closed underneath us.
  inline bool IsDisconnect(const Error& err) noexcept {
    if (err.domain != ErrorDomain::IO) {
      return false;
    }
    if (err.code == errors::io::kStreamClosed || err.code == errors::io::kPipeClosed) {
      return true;
    }
    return err.native_code.has_value() && (*err.native_code == EPIPE ||
                                           *err.native_code == ECONNRESET);
  }
} // namespace tw
