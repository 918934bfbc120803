#include "access.hpp"
#include "credentials.hpp"
#include "util.hpp"

#include <cassert>
#include <iostream>
#include <map>
#include <string>

namespace {

class FakeResolver final : public auth::Resolver {
public:
  bool resolve(const util::Context& ctx,
               std::string_view access_key_id,
               auth::Response* out,
               sharing::Error* err) override {
    calls++;
    if (ctx.done()) {
      return sharing::fail(err, sharing::Errc::Timeout, "deadline");
    }
    auto it = known.find(std::string(access_key_id));
    if (it == known.end()) {
      return sharing::fail(err, sharing::Errc::InvalidCredential, "unknown key id");
    }
    if (out) *out = it->second;
    return true;
  }

  std::map<std::string, auth::Response> known;
  int calls = 0;
};

} // namespace

int main() {
  storage::Access grant;
  grant.project = "proj";
  grant.buckets = {"photos", "docs"};
  grant.expires = 4102444800; // 2100-01-01
  const std::string serialized = storage::serialize_access(grant);

  util::Context ctx;
  storage::Access out;
  sharing::Error err;

  // version 0: the token is the access grant
  FakeResolver resolver;
  assert(auth::decode_access(ctx, serialized, &resolver, true, &out, &err));
  assert(resolver.calls == 0);
  assert(out.project == "proj");
  assert(out.buckets.size() == 2);
  assert(out.allows_bucket("photos") && out.allows_bucket("docs") && !out.allows_bucket("other"));
  assert(out.expires == 4102444800);

  // version 1: resolved through the authorization service
  const std::string public_id = util::base58_check_encode("public-key-id", auth::kAccessKeyIdVersion);
  const std::string private_id = util::base58_check_encode("private-key-id", auth::kAccessKeyIdVersion);
  const std::string unknown_id = util::base58_check_encode("unknown-key-id", auth::kAccessKeyIdVersion);
  resolver.known[public_id] = auth::Response{serialized, "secret", true};
  resolver.known[private_id] = auth::Response{serialized, "secret", false};

  out = storage::Access{};
  assert(auth::decode_access(ctx, public_id, &resolver, true, &out, &err));
  assert(out.project == "proj");
  assert(resolver.calls == 1);

  assert(!auth::decode_access(ctx, private_id, &resolver, true, &out, &err));
  assert(err.code == sharing::Errc::NonPublicCredential);

  // private grants are accepted when the caller allows them
  err = sharing::Error{};
  assert(auth::decode_access(ctx, private_id, &resolver, false, &out, &err));
  assert(err.ok());

  assert(!auth::decode_access(ctx, unknown_id, &resolver, true, &out, &err));
  assert(err.code == sharing::Errc::InvalidCredential);

  assert(!auth::decode_access(ctx, public_id, nullptr, true, &out, &err));
  assert(err.code == sharing::Errc::InternalFailure);

  auto cancelled = util::Context::with_timeout(std::chrono::milliseconds(0));
  assert(!auth::decode_access(cancelled, public_id, &resolver, true, &out, &err));
  assert(err.code == sharing::Errc::Timeout);

  // the resolver handing back garbage is an invalid credential
  const std::string bad_id = util::base58_check_encode("bad-grant", auth::kAccessKeyIdVersion);
  resolver.known[bad_id] = auth::Response{"not-a-grant", "", true};
  assert(!auth::decode_access(ctx, bad_id, &resolver, true, &out, &err));
  assert(err.code == sharing::Errc::InvalidCredential);

  // any other version fails regardless of payload
  for (int v = 2; v < 256; v += 17) {
    const std::string token = util::base58_check_encode("project=proj", static_cast<std::uint8_t>(v));
    err = sharing::Error{};
    assert(!auth::decode_access(ctx, token, &resolver, true, &out, &err));
    assert(err.code == sharing::Errc::UnsupportedCredentialVersion);
  }

  // not base58 check encoded at all
  assert(!auth::decode_access(ctx, "0OIl", &resolver, true, &out, &err));
  assert(err.code == sharing::Errc::InvalidCredential);
  std::string corrupted = serialized;
  corrupted.back() = corrupted.back() == '2' ? '3' : '2';
  assert(!auth::decode_access(ctx, corrupted, &resolver, true, &out, &err));
  assert(err.code == sharing::Errc::InvalidCredential);

  // grant payload validation
  std::string perr;
  storage::Access parsed;
  assert(!storage::parse_access(util::base58_check_encode("bucket=b", 0), &parsed, &perr));
  assert(!storage::parse_access(util::base58_check_encode("project=p&expires=soon", 0), &parsed, &perr));
  assert(storage::parse_access(util::base58_check_encode("project=p&unknown=1", 0), &parsed, &perr));
  assert(parsed.project == "p" && parsed.buckets.empty() && parsed.expires == 0);
  assert(parsed.allows_bucket("anything"));
  assert(!parsed.expired(util::unix_now_seconds()));

  storage::Access old;
  old.project = "p";
  old.expires = 1000;
  assert(old.expired(2000));
  assert(!old.expired(999));

  std::cout << "test_credentials passed\n";
  return 0;
}
