#pragma once

#include "access.hpp"
#include "auth_service.hpp"
#include "context.hpp"
#include "errors.hpp"
#include "txt_records.hpp"

#include <string>
#include <string_view>

namespace routing {

enum class SplitResult {
  Ok,
  MissingPort,
  Malformed,
};

// Split "host:port", "[v6]:port". Brackets are removed from the host.
SplitResult split_host_port(std::string_view hostport, std::string* host, std::string* port, std::string* err);

// The host without its port; a missing port leaves hostport unchanged.
bool strip_port(std::string_view hostport, std::string* host, std::string* err);

// Equality of the bare hostnames of two Host values. Ports are never compared.
bool compare_hosts(std::string_view a, std::string_view b, bool* equal, std::string* err);

struct RequestPath {
  bool raw = false;
  storage::Access access;
  std::string serialized_access;
  std::string bucket;
  std::string key;
};

// Parse "/[raw/]<access>/<bucket>[/<key...>]" and decode the access.
bool parse_request_path(const util::Context& ctx,
                        std::string_view path,
                        auth::Resolver* resolver,
                        RequestPath* out,
                        sharing::Error* err);

struct BucketKey {
  std::string bucket;
  std::string key;
};

// Map a custom domain's storage root and a URL path to bucket and key.
BucketKey determine_bucket_and_object_key(std::string_view root, std::string_view url_path);

// Public base URL of the gateway.
struct UrlBase {
  std::string scheme;
  std::string host; // may carry a port
  std::string path;

  std::string to_string() const;
};

bool parse_url_base(std::string_view s, UrlBase* out, std::string* err);

// Absolute URL of `request_path` below the base.
std::string make_location(const UrlBase& base, std::string_view request_path);

enum class Mode {
  Traditional,
  Raw,
  CustomDomain,
};

constexpr int kModeCount = 3;

const char* mode_name(Mode mode);

struct RoutingResult {
  Mode mode = Mode::Traditional;
  storage::Access access;
  std::string serialized_access; // traditional modes only
  std::string bucket;
  std::string key;
  std::string host;               // bare request host
  bool location_only = false;     // HEAD in traditional modes
};

class Router {
public:
  // `resolver` and `txt_records` may be null: access key ids and custom
  // domains are then rejected.
  //
  // Only GET and HEAD are routed, on the gateway host and on custom domains
  // alike. Hosted sites are read-only, so other methods fail MethodNotAllowed
  // before any DNS lookup.
  Router(UrlBase base, auth::Resolver* resolver, dns::TxtRecords* txt_records);

  bool route(const util::Context& ctx,
             std::string_view method,
             std::string_view host,
             std::string_view path,
             RoutingResult* out,
             sharing::Error* err) const;

  const UrlBase& base() const { return base_; }

private:
  bool route_traditional(const util::Context& ctx, std::string_view path,
                         RoutingResult* out, sharing::Error* err) const;
  bool route_custom_domain(const util::Context& ctx, std::string_view host, std::string_view path,
                           RoutingResult* out, sharing::Error* err) const;

  UrlBase base_;
  auth::Resolver* resolver_;
  dns::TxtRecords* txt_records_;
};

} // namespace routing
