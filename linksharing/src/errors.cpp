#include "errors.hpp"

#include <utility>

namespace sharing {

const char* errc_name(Errc code) {
  switch (code) {
    case Errc::None: return "none";
    case Errc::InvalidCredential: return "invalid_credential";
    case Errc::NonPublicCredential: return "non_public_credential";
    case Errc::UnsupportedCredentialVersion: return "unsupported_credential_version";
    case Errc::MissingCredential: return "missing_credential";
    case Errc::MissingBucket: return "missing_bucket";
    case Errc::InvalidHost: return "invalid_host";
    case Errc::DNSResolutionFailed: return "dns_resolution_failed";
    case Errc::CustomDomainNotConfigured: return "custom_domain_not_configured";
    case Errc::MethodNotAllowed: return "method_not_allowed";
    case Errc::ObjectNotFound: return "object_not_found";
    case Errc::BucketNotFound: return "bucket_not_found";
    case Errc::Timeout: return "timeout";
    case Errc::InternalFailure: return "internal_failure";
  }
  return "unknown";
}

bool fail(Error* err, Errc code, std::string message) {
  if (err) {
    err->code = code;
    err->message = std::move(message);
  }
  return false;
}

Errc errc_from_storage(std::string_view storage_err) {
  if (storage_err == "NoSuchBucket") return Errc::BucketNotFound;
  if (storage_err == "NoSuchKey") return Errc::ObjectNotFound;
  if (storage_err == "Timeout") return Errc::Timeout;
  if (storage_err == "AccessExpired") return Errc::InvalidCredential;
  return Errc::InternalFailure;
}

bool is_client_error(Errc code) {
  switch (code) {
    case Errc::InvalidCredential:
    case Errc::NonPublicCredential:
    case Errc::UnsupportedCredentialVersion:
    case Errc::MissingCredential:
    case Errc::MissingBucket:
    case Errc::InvalidHost:
    case Errc::MethodNotAllowed:
    case Errc::ObjectNotFound:
    case Errc::BucketNotFound:
      return true;
    default:
      return false;
  }
}

} // namespace sharing
