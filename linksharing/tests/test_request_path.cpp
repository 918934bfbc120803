#include "access.hpp"
#include "credentials.hpp"
#include "routing.hpp"
#include "util.hpp"

#include <cassert>
#include <iostream>
#include <string>

static sharing::Errc parse_error(const std::string& path) {
  routing::RequestPath rp;
  sharing::Error err;
  bool ok = routing::parse_request_path(util::Context{}, path, nullptr, &rp, &err);
  assert(!ok);
  return err.code;
}

int main() {
  storage::Access grant;
  grant.project = "p1";
  const std::string token = storage::serialize_access(grant);

  util::Context ctx;
  routing::RequestPath rp;
  sharing::Error err;

  assert(routing::parse_request_path(ctx, "/" + token + "/bucket/a/b.jpg", nullptr, &rp, &err));
  assert(!rp.raw);
  assert(rp.serialized_access == token);
  assert(rp.bucket == "bucket");
  assert(rp.key == "a/b.jpg");
  assert(rp.access.project == "p1");

  assert(routing::parse_request_path(ctx, "/raw/" + token + "/bucket/a/b.jpg", nullptr, &rp, &err));
  assert(rp.raw);
  assert(rp.bucket == "bucket");
  assert(rp.key == "a/b.jpg");

  // deeper keys keep every slash
  assert(routing::parse_request_path(ctx, "/" + token + "/bucket/a/b/c/d.txt", nullptr, &rp, &err));
  assert(rp.key == "a/b/c/d.txt");
  assert(routing::parse_request_path(ctx, "/raw/" + token + "/bucket/a/b/c", nullptr, &rp, &err));
  assert(rp.raw && rp.key == "a/b/c");

  assert(routing::parse_request_path(ctx, "/" + token + "/bucket/obj", nullptr, &rp, &err));
  assert(!rp.raw && rp.key == "obj");

  assert(routing::parse_request_path(ctx, "/" + token + "/bucket", nullptr, &rp, &err));
  assert(rp.key.empty());

  assert(routing::parse_request_path(ctx, "/" + token + "/bucket/", nullptr, &rp, &err));
  assert(rp.key.empty());

  assert(routing::parse_request_path(ctx, "/" + token + "/bucket/dir/", nullptr, &rp, &err));
  assert(rp.key == "dir/");

  // "raw" only marks raw mode with four segments
  assert(parse_error("/raw/" + token) == sharing::Errc::InvalidCredential);

  assert(parse_error("/") == sharing::Errc::MissingCredential);
  assert(parse_error("") == sharing::Errc::MissingCredential);
  assert(parse_error("/ACCESS") == sharing::Errc::MissingBucket);
  assert(parse_error("/" + token) == sharing::Errc::MissingBucket);
  assert(parse_error("/" + token + "/") == sharing::Errc::MissingBucket);
  assert(parse_error("/ACCESS/bucket/key") == sharing::Errc::InvalidCredential);
  assert(parse_error("/" + util::base58_check_encode("project=p1", 7) + "/bucket") ==
         sharing::Errc::UnsupportedCredentialVersion);

  // access key ids need a resolver
  const std::string key_id = util::base58_check_encode("id", auth::kAccessKeyIdVersion);
  assert(parse_error("/" + key_id + "/bucket") == sharing::Errc::InternalFailure);

  std::cout << "test_request_path passed\n";
  return 0;
}
