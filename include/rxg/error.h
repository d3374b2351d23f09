#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace rxg {
enum class ErrorDomain : std::uint16_t {
  Security = 0x01,
  IO = 0x02,
  Crypto = 0x03,
  Validation = 0x04,
  Config = 0x05,
  State = 0x07,
  Internal = 0x7F
};

// Each domain reserves a span of codes to avoid collisions with propagated
// platform error numbers. Codes inside the reserved range are stable across
// releases.
inline constexpr int kErrorDomainSpan = 0x0100;

inline constexpr int ErrorDomainBase(ErrorDomain domain) {
  switch (domain) {
  case ErrorDomain::Security:
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

namespace io {
inline constexpr int kNotFound = Make(ErrorDomain::IO, 0x01);
inline constexpr int kReadFailed = Make(ErrorDomain::IO, 0x02);
inline constexpr int kWriteFailed = Make(ErrorDomain::IO, 0x03);
inline constexpr int kPartialRestore = Make(ErrorDomain::IO, 0x04);
inline constexpr int kWatchFailed = Make(ErrorDomain::IO, 0x05);
}  // namespace io

namespace validation {
inline constexpr int kCorruptManifest = Make(ErrorDomain::Validation, 0x01);
inline constexpr int kPathEscape = Make(ErrorDomain::Validation, 0x02);
}  // namespace validation

namespace security {
inline constexpr int kInvalidMasterKey = Make(ErrorDomain::Security, 0x01);
}  // namespace security

namespace crypto {
inline constexpr int kIntegrityFailure = Make(ErrorDomain::Crypto, 0x01);
inline constexpr int kProviderFailure = Make(ErrorDomain::Crypto, 0x02);
}  // namespace crypto

namespace config {
inline constexpr int kMalformed = Make(ErrorDomain::Config, 0x01);
inline constexpr int kInvalidValue = Make(ErrorDomain::Config, 0x02);
}  // namespace config

}  // namespace errors

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

// Missing or malformed master key. Fatal at startup.
struct KeyError : public Error {
  explicit KeyError(std::string msg)
      : Error(ErrorDomain::Security, errors::security::kInvalidMasterKey, std::move(msg)) {}
};

// AEAD tag verification failed: tampered ciphertext or wrong key. Never
// accompanied by plaintext.
struct IntegrityError : public Error {
  explicit IntegrityError(std::string msg)
      : Error(ErrorDomain::Crypto, errors::crypto::kIntegrityFailure, std::move(msg)) {}
};

struct NotFoundError : public Error {
  explicit NotFoundError(std::string msg, std::optional<int> native = std::nullopt)
      : Error(ErrorDomain::IO, errors::io::kNotFound, std::move(msg), native) {}
};

struct CorruptManifestError : public Error {
  explicit CorruptManifestError(std::string msg)
      : Error(ErrorDomain::Validation, errors::validation::kCorruptManifest, std::move(msg)) {}
};

struct FileFailure {
  std::string path;
  std::string message;
};

struct PartialRestoreError : public Error {
  std::vector<FileFailure> failures;
  PartialRestoreError(std::string msg, std::vector<FileFailure> failed)
      : Error(ErrorDomain::IO, errors::io::kPartialRestore, std::move(msg)),
        failures(std::move(failed)) {}
};
}  // namespace rxg
