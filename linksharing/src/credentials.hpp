#pragma once

#include "access.hpp"
#include "auth_service.hpp"
#include "context.hpp"
#include "errors.hpp"

#include <cstdint>
#include <string_view>

namespace auth {

// Version byte of a base-58 check encoded access key id.
constexpr std::uint8_t kAccessKeyIdVersion = 1;

// Decode a credential token into an access grant.
//
// The token is either a serialized access grant (version 0) or an access key
// id (version 1) that `resolver` turns into one. With `require_public`, a key id
// the resolver reports as private fails NonPublicCredential. `resolver` may be
// null, in which case key ids fail InternalFailure.
bool decode_access(const util::Context& ctx,
                   std::string_view token,
                   Resolver* resolver,
                   bool require_public,
                   storage::Access* out,
                   sharing::Error* err);

} // namespace auth
