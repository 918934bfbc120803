#include "credentials.hpp"
#include "util.hpp"

#include <string>

namespace auth {

bool decode_access(const util::Context& ctx,
                   std::string_view token,
                   Resolver* resolver,
                   bool require_public,
                   storage::Access* out,
                   sharing::Error* err) {
  using sharing::Errc;

  auto decoded = util::base58_check_decode(token);
  if (!decoded) {
    return sharing::fail(err, Errc::InvalidCredential, "invalid access");
  }

  std::string serialized;
  if (decoded->version == kAccessKeyIdVersion) {
    if (!resolver) {
      return sharing::fail(err, Errc::InternalFailure, "access key id given but no auth service is configured");
    }
    Response resp;
    if (!resolver->resolve(ctx, token, &resp, err)) {
      return false;
    }
    if (require_public && !resp.is_public) {
      return sharing::fail(err, Errc::NonPublicCredential, "non-public access key id");
    }
    serialized = std::move(resp.access_grant);
  } else if (decoded->version == storage::kAccessGrantVersion) {
    // 0 could be any number of things, but we just assume an access grant
    serialized = std::string(token);
  } else {
    return sharing::fail(err, Errc::UnsupportedCredentialVersion,
                         "invalid access version " + std::to_string(decoded->version));
  }

  std::string perr;
  if (!storage::parse_access(serialized, out, &perr)) {
    return sharing::fail(err, Errc::InvalidCredential, perr);
  }
  return true;
}

} // namespace auth
