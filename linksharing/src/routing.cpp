#include "routing.hpp"
#include "credentials.hpp"
#include "logging.hpp"
#include "util.hpp"

#include <vector>

namespace routing {

namespace {

// At most n parts; the last one keeps the remainder.
std::vector<std::string_view> split_n(std::string_view s, char sep, size_t n) {
  std::vector<std::string_view> parts;
  size_t pos = 0;
  while (parts.size() + 1 < n) {
    size_t idx = s.find(sep, pos);
    if (idx == std::string_view::npos) break;
    parts.push_back(s.substr(pos, idx - pos));
    pos = idx + 1;
  }
  parts.push_back(s.substr(pos));
  return parts;
}

} // namespace

SplitResult split_host_port(std::string_view hostport, std::string* host, std::string* port, std::string* err) {
  auto malformed = [err](const char* msg) {
    if (err) *err = msg;
    return SplitResult::Malformed;
  };
  auto missing_port = [err]() {
    if (err) *err = "missing port in address";
    return SplitResult::MissingPort;
  };

  size_t i = hostport.rfind(':');
  if (i == std::string_view::npos) return missing_port();

  size_t j = 0;
  size_t k = 0;
  std::string_view h;
  if (!hostport.empty() && hostport.front() == '[') {
    size_t end = hostport.find(']');
    if (end == std::string_view::npos) return malformed("missing ']' in address");
    if (end + 1 == hostport.size()) return missing_port();
    if (end + 1 != i) {
      if (hostport[end + 1] == ':') return malformed("too many colons in address");
      return missing_port();
    }
    h = hostport.substr(1, end - 1);
    j = 1;
    k = end + 1;
  } else {
    h = hostport.substr(0, i);
    if (h.find(':') != std::string_view::npos) return malformed("too many colons in address");
  }
  if (hostport.find('[', j) != std::string_view::npos) return malformed("unexpected '[' in address");
  if (hostport.find(']', k) != std::string_view::npos) return malformed("unexpected ']' in address");

  if (host) *host = std::string(h);
  if (port) *port = std::string(hostport.substr(i + 1));
  return SplitResult::Ok;
}

bool strip_port(std::string_view hostport, std::string* host, std::string* err) {
  switch (split_host_port(hostport, host, nullptr, err)) {
    case SplitResult::Ok:
      return true;
    case SplitResult::MissingPort:
      // a bare "[v6]" literal compares like the bracketless host of "[v6]:port"
      if (hostport.size() >= 2 && hostport.front() == '[' && hostport.back() == ']') {
        hostport = hostport.substr(1, hostport.size() - 2);
      }
      if (host) *host = std::string(hostport);
      return true;
    case SplitResult::Malformed:
      break;
  }
  return false;
}

bool compare_hosts(std::string_view a, std::string_view b, bool* equal, std::string* err) {
  std::string host_a;
  std::string host_b;
  if (!strip_port(a, &host_a, err)) return false;
  if (!strip_port(b, &host_b, err)) return false;
  if (equal) *equal = host_a == host_b;
  return true;
}

bool parse_request_path(const util::Context& ctx,
                        std::string_view path,
                        auth::Resolver* resolver,
                        RequestPath* out,
                        sharing::Error* err) {
  using sharing::Errc;

  // Drop the leading slash, if necessary.
  if (!path.empty() && path.front() == '/') path.remove_prefix(1);

  RequestPath rp;
  auto segments = split_n(path, '/', 4);
  std::string key;
  if (segments.size() == 4) {
    if (segments[0] == "raw") {
      rp.raw = true;
      segments.erase(segments.begin());
      key = std::string(segments[2]);
    } else {
      // the last two entries are both part of the key
      key = std::string(segments[2]) + "/" + std::string(segments[3]);
      segments.pop_back();
    }
  } else if (segments.size() == 3) {
    key = std::string(segments[2]);
  }

  if (segments.size() == 1) {
    if (segments[0].empty()) {
      return sharing::fail(err, Errc::MissingCredential, "missing access");
    }
    return sharing::fail(err, Errc::MissingBucket, "missing bucket");
  }
  if (segments[1].empty()) {
    return sharing::fail(err, Errc::MissingBucket, "missing bucket");
  }

  rp.serialized_access = std::string(segments[0]);
  rp.bucket = std::string(segments[1]);
  rp.key = std::move(key);

  if (!auth::decode_access(ctx, rp.serialized_access, resolver, true, &rp.access, err)) {
    return false;
  }

  if (out) *out = std::move(rp);
  return true;
}

BucketKey determine_bucket_and_object_key(std::string_view root, std::string_view url_path) {
  BucketKey bk;
  std::string prefix;
  size_t slash = root.find('/');
  if (slash == std::string_view::npos) {
    bk.bucket = std::string(root);
  } else {
    bk.bucket = std::string(root.substr(0, slash));
    prefix = std::string(root.substr(slash + 1));
  }
  // a non-empty prefix always ends in '/' so it cannot match sibling keys
  if (!prefix.empty() && prefix.back() != '/') {
    prefix.push_back('/');
  }
  if (!url_path.empty() && url_path.front() == '/') url_path.remove_prefix(1);
  bk.key = prefix + std::string(url_path);
  return bk;
}

std::string UrlBase::to_string() const {
  return scheme + "://" + host + path;
}

bool parse_url_base(std::string_view s, UrlBase* out, std::string* err) {
  auto bad = [err](const char* msg) {
    if (err) *err = msg;
    return false;
  };

  size_t sep = s.find("://");
  if (sep == std::string_view::npos) return bad("URL base must be http:// or https://");
  UrlBase u;
  u.scheme = util::to_lower(s.substr(0, sep));
  if (u.scheme != "http" && u.scheme != "https") return bad("URL base must be http:// or https://");

  std::string_view rest = s.substr(sep + 3);
  if (rest.find('#') != std::string_view::npos) return bad("URL base must not contain a fragment");
  if (rest.find('?') != std::string_view::npos) return bad("URL base must not contain query values");

  size_t slash = rest.find('/');
  std::string_view authority = (slash == std::string_view::npos) ? rest : rest.substr(0, slash);
  if (authority.find('@') != std::string_view::npos) return bad("URL base must not contain user info");
  if (authority.empty()) return bad("URL base must contain host");

  std::string bare;
  std::string herr;
  if (!strip_port(authority, &bare, &herr) || bare.empty()) return bad("URL base must contain host");

  u.host = std::string(authority);
  if (slash != std::string_view::npos) {
    u.path = std::string(rest.substr(slash));
  }

  if (out) *out = std::move(u);
  return true;
}

std::string make_location(const UrlBase& base, std::string_view request_path) {
  std::string joined = base.path;
  joined.push_back('/');
  joined.append(request_path.data(), request_path.size());
  return base.scheme + "://" + base.host + util::percent_encode(util::clean_path(joined), false);
}

const char* mode_name(Mode mode) {
  switch (mode) {
    case Mode::Traditional: return "traditional";
    case Mode::Raw: return "raw";
    case Mode::CustomDomain: return "custom_domain";
  }
  return "unknown";
}

Router::Router(UrlBase base, auth::Resolver* resolver, dns::TxtRecords* txt_records)
  : base_(std::move(base)), resolver_(resolver), txt_records_(txt_records) {}

bool Router::route(const util::Context& ctx,
                   std::string_view method,
                   std::string_view host,
                   std::string_view path,
                   RoutingResult* out,
                   sharing::Error* err) const {
  using sharing::Errc;

  if (ctx.done()) {
    return sharing::fail(err, Errc::Timeout, "request deadline exceeded before routing");
  }

  bool same = false;
  std::string herr;
  if (!compare_hosts(host, base_.host, &same, &herr)) {
    return sharing::fail(err, Errc::InvalidHost, "invalid host " + std::string(host) + ": " + herr);
  }

  const bool head = method == "HEAD";
  if (!head && method != "GET") {
    return sharing::fail(err, Errc::MethodNotAllowed, "method not allowed");
  }

  RoutingResult res;
  if (same) {
    if (!route_traditional(ctx, path, &res, err)) return false;
    res.location_only = head;
  } else {
    if (!route_custom_domain(ctx, host, path, &res, err)) return false;
  }

  if (out) *out = std::move(res);
  return true;
}

bool Router::route_traditional(const util::Context& ctx, std::string_view path,
                               RoutingResult* out, sharing::Error* err) const {
  RequestPath rp;
  if (!parse_request_path(ctx, path, resolver_, &rp, err)) return false;

  out->mode = rp.raw ? Mode::Raw : Mode::Traditional;
  out->access = std::move(rp.access);
  out->serialized_access = std::move(rp.serialized_access);
  out->bucket = std::move(rp.bucket);
  out->key = std::move(rp.key);
  std::string herr;
  if (!strip_port(base_.host, &out->host, &herr)) {
    out->host = base_.host;
  }
  return true;
}

bool Router::route_custom_domain(const util::Context& ctx, std::string_view host, std::string_view path,
                                 RoutingResult* out, sharing::Error* err) const {
  using sharing::Errc;

  std::string bare;
  std::string herr;
  if (!strip_port(host, &bare, &herr)) {
    return sharing::fail(err, Errc::InvalidHost, "invalid host " + std::string(host) + ": " + herr);
  }
  if (!txt_records_) {
    return sharing::fail(err, Errc::CustomDomainNotConfigured, "custom domains are disabled, host " + bare);
  }

  std::shared_ptr<const dns::TxtRecords::Record> rec;
  if (!txt_records_->fetch_access_for_host(ctx, bare, &rec, err)) return false;

  BucketKey bk = determine_bucket_and_object_key(rec->root, path);
  if (bk.bucket.empty()) {
    return sharing::fail(err, Errc::CustomDomainNotConfigured, "storage root without bucket for " + bare);
  }

  out->mode = Mode::CustomDomain;
  out->access = rec->access;
  out->bucket = std::move(bk.bucket);
  out->key = std::move(bk.key);
  out->host = std::move(bare);
  return true;
}

} // namespace routing
