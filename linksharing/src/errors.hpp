#pragma once

#include <string>
#include <string_view>

namespace sharing {

enum class Errc {
  None,
  InvalidCredential,
  NonPublicCredential,
  UnsupportedCredentialVersion,
  MissingCredential,
  MissingBucket,
  InvalidHost,
  DNSResolutionFailed,
  CustomDomainNotConfigured,
  MethodNotAllowed,
  ObjectNotFound,
  BucketNotFound,
  Timeout,
  InternalFailure,
};

constexpr int kErrcCount = static_cast<int>(Errc::InternalFailure) + 1;

struct Error {
  Errc code = Errc::None;
  std::string message; // server side detail, never sent to clients

  bool ok() const { return code == Errc::None; }
};

const char* errc_name(Errc code);

// Fill *err when it is non-null; always returns false so callers can
// `return fail(err, ...)`.
bool fail(Error* err, Errc code, std::string message);

// Map a storage layer error string ("NoSuchBucket", "NoSuchKey", ...) to a code.
Errc errc_from_storage(std::string_view storage_err);

// Parsing stage failures are the client's fault and map to 4xx.
bool is_client_error(Errc code);

} // namespace sharing
