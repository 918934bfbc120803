#include "handler.hpp"
#include "logging.hpp"
#include "metrics.hpp"
#include "util.hpp"

#include <atomic>
#include <charconv>
#include <optional>
#include <sstream>
#include <utility>
#include <vector>

namespace sharing {

namespace {

constexpr const char* kServerName = "linksharing";

std::atomic<std::uint64_t> g_reqid{1};

std::string new_request_id() {
  auto v = g_reqid.fetch_add(1, std::memory_order_relaxed);
  std::ostringstream oss;
  oss << std::hex << v;
  return oss.str();
}

struct ByteRange {
  std::int64_t start = 0;
  std::int64_t end = 0; // inclusive
};

// A single range: bytes=start-end | bytes=start- | bytes=-suffix
std::optional<ByteRange> parse_single_range(std::string_view header_value, std::int64_t size) {
  if (size <= 0) return std::nullopt;
  std::string normalized = util::trim_and_collapse_ws(header_value);
  std::string_view v = normalized;
  if (!util::starts_with(v, "bytes=")) return std::nullopt;
  v.remove_prefix(6);
  if (v.find(',') != std::string_view::npos) return std::nullopt;

  auto dash = v.find('-');
  if (dash == std::string_view::npos) return std::nullopt;

  std::string_view left = v.substr(0, dash);
  std::string_view right = v.substr(dash + 1);

  auto parse_i64 = [](std::string_view s, std::int64_t* out) -> bool {
    if (s.empty()) return false;
    std::int64_t val = 0;
    auto res = std::from_chars(s.data(), s.data() + s.size(), val);
    if (res.ec != std::errc{} || res.ptr != s.data() + s.size()) return false;
    *out = val;
    return true;
  };

  ByteRange br{};
  if (left.empty()) {
    std::int64_t suffix = 0;
    if (!parse_i64(right, &suffix) || suffix <= 0) return std::nullopt;
    br.start = suffix >= size ? 0 : size - suffix;
    br.end = size - 1;
    return br;
  }

  if (!parse_i64(left, &br.start)) return std::nullopt;
  if (right.empty()) {
    br.end = size - 1;
  } else if (!parse_i64(right, &br.end)) {
    return std::nullopt;
  }

  if (br.start < 0 || br.start >= size) return std::nullopt;
  if (br.end < br.start) return std::nullopt;
  if (br.end >= size) br.end = size - 1;
  return br;
}

std::string last_segment(std::string_view key) {
  size_t slash = key.rfind('/');
  if (slash == std::string_view::npos) return std::string(key);
  return std::string(key.substr(slash + 1));
}

const char* page_head() {
  return "<!DOCTYPE html>\n<html>\n<head>\n<meta charset=\"utf-8\">\n"
         "<meta name=\"viewport\" content=\"width=device-width, initial-scale=1\">\n";
}

std::string not_found_page(std::string_view message) {
  std::ostringstream oss;
  oss << page_head()
      << "<title>Not found</title>\n</head>\n<body>\n"
      << "<h1>" << util::html_escape(message) << "</h1>\n"
      << "</body>\n</html>\n";
  return oss.str();
}

std::string single_object_page(std::string_view key, std::int64_t size) {
  const std::string name = util::html_escape(key);
  std::ostringstream oss;
  oss << page_head()
      << "<title>" << name << "</title>\n</head>\n<body>\n"
      << "<h1>" << name << "</h1>\n"
      << "<p>Size: " << util::format_size_base10(size) << "</p>\n"
      << "<p><a href=\"?view\">View</a> | <a href=\"?download\">Download</a></p>\n"
      << "</body>\n</html>\n";
  return oss.str();
}

} // namespace

// Per-request state shared by the serving helpers.
struct Handler::Exchange {
  const Request& req;
  const util::Context& ctx;
  std::string request_id;
  bool head = false;
  std::string raw_path;     // as received, still escaped
  std::string path;         // decoded
  std::vector<std::pair<std::string, std::string>> query;

  bool has_query(std::string_view name) const {
    for (const auto& kv : query) {
      if (kv.first == name) return true;
    }
    return false;
  }

  Response make(http::status st) const {
    Response res{st, req.version()};
    res.set(http::field::server, kServerName);
    res.keep_alive(req.keep_alive());
    return res;
  }

  Response text(http::status st, std::string_view body) const {
    Response res = make(st);
    res.set(http::field::content_type, "text/plain; charset=utf-8");
    res.set("X-Content-Type-Options", "nosniff");
    res.body().assign(body.begin(), body.end());
    res.body().push_back('\n');
    res.content_length(res.body().size());
    return res;
  }

  Response html(http::status st, const std::string& body) const {
    Response res = make(st);
    res.set(http::field::content_type, "text/html; charset=utf-8");
    res.body().assign(body.begin(), body.end());
    res.content_length(res.body().size());
    return res;
  }

  Response redirect(http::status st, const std::string& location) const {
    Response res = make(st);
    res.set(http::field::location, location);
    res.content_length(0);
    return res;
  }
};

Handler::Handler(routing::Router* router, storage::Uplink* uplink, server::Metrics* metrics)
  : router_(router), uplink_(uplink), metrics_(metrics) {}

Response Handler::handle(const Request& req, const util::Context& ctx) {
  Exchange ex{req, ctx};
  ex.request_id = new_request_id();
  ex.head = req.method() == http::verb::head;

  std::string_view target(req.target().data(), req.target().size());
  size_t q = target.find('?');
  std::string_view path = (q == std::string_view::npos) ? target : target.substr(0, q);
  if (q != std::string_view::npos) {
    ex.query = util::parse_query(target.substr(q + 1));
  }
  if (path.empty()) path = "/";
  ex.raw_path = std::string(path);

  Response res;
  auto decoded = util::percent_decode(path);
  if (!decoded) {
    logging::get()->debug("request {} malformed escape in path {}", ex.request_id, ex.raw_path);
    res = ex.text(http::status::bad_request, "invalid request");
  } else {
    ex.path = std::move(*decoded);

    std::string_view host;
    if (auto it = req.find(http::field::host); it != req.end()) {
      host = std::string_view(it->value().data(), it->value().size());
    }
    std::string_view method(req.method_string().data(), req.method_string().size());

    routing::RoutingResult rr;
    Error err;
    if (!router_->route(ctx, method, host, ex.path, &rr, &err)) {
      res = error_response(ex, err, "route request");
    } else {
      if (metrics_) metrics_->ObserveRoute(rr.mode);
      logging::get()->debug("request {} routed {} bucket={} key={}",
                            ex.request_id, routing::mode_name(rr.mode), rr.bucket, rr.key);
      if (rr.mode == routing::Mode::CustomDomain) {
        res = serve_hosting(ex, rr);
      } else {
        res = serve_traditional(ex, rr);
      }
    }
  }

  // HEAD keeps the headers of the equivalent GET.
  if (ex.head && !res.body().empty()) {
    const auto size = res.body().size();
    res.body().clear();
    res.content_length(size);
  }
  return res;
}

Response Handler::serve_traditional(Exchange& ex, const routing::RoutingResult& rr) {
  std::string serr;
  auto project = uplink_->open_project(ex.ctx, rr.access, &serr);
  if (!project) return storage_error(ex, "open project", serr);

  if (rr.key.empty() || util::ends_with(rr.key, "/")) {
    if (!util::ends_with(ex.path, "/")) {
      // listed hyperlinks are relative and need the trailing '/'
      logging::get()->debug("request {} redirect to {}/", ex.request_id, ex.raw_path);
      return ex.redirect(http::status::moved_permanently, ex.raw_path + "/");
    }
    Breadcrumb root{rr.bucket, "/" + rr.serialized_access + "/" + rr.bucket + "/"};
    return serve_prefix(ex, *project, std::move(root), rr.bucket, rr.bucket, rr.key, rr.key);
  }

  storage::ObjectMeta meta;
  if (!project->stat_object(ex.ctx, rr.bucket, rr.key, &meta, &serr)) {
    return storage_error(ex, "stat object", serr);
  }

  if (rr.location_only) {
    const std::string location = routing::make_location(router_->base(), ex.path);
    logging::get()->debug("request {} redirect to {}", ex.request_id, location);
    return ex.redirect(http::status::found, location);
  }

  const bool download = ex.has_query("download");
  const bool view = ex.has_query("view");
  if (!download && !view && rr.mode != routing::Mode::Raw) {
    return ex.html(http::status::ok, single_object_page(rr.key, meta.size));
  }

  std::string disposition;
  if (download) {
    disposition = "attachment; filename=\"" + last_segment(rr.key) + "\"";
  }
  return serve_content(ex, *project, rr.bucket, rr.key, meta, disposition);
}

Response Handler::serve_hosting(Exchange& ex, const routing::RoutingResult& rr) {
  std::string serr;
  auto project = uplink_->open_project(ex.ctx, rr.access, &serr);
  if (!project) return storage_error(ex, "open project", serr);

  storage::ObjectMeta meta;
  // there are no objects with the empty key
  if (!rr.key.empty()) {
    if (project->stat_object(ex.ctx, rr.bucket, rr.key, &meta, &serr)) {
      return serve_content(ex, *project, rr.bucket, rr.key, meta, std::string());
    }
    if (!util::ends_with(rr.key, "/") || serr != storage::kNoSuchKey) {
      return storage_error(ex, "stat object", serr);
    }
  }

  // key is "" or ends in '/'
  const std::string index = rr.key + "index.html";
  serr.clear();
  if (project->stat_object(ex.ctx, rr.bucket, index, &meta, &serr)) {
    return serve_content(ex, *project, rr.bucket, index, meta, std::string());
  }
  if (serr != storage::kNoSuchKey) {
    return storage_error(ex, "stat object", serr);
  }

  std::string visible = ex.path;
  if (!visible.empty() && visible.front() == '/') visible.erase(0, 1);
  return serve_prefix(ex, *project, Breadcrumb{rr.host, "/"}, rr.host, rr.bucket, rr.key, visible);
}

Response Handler::serve_content(Exchange& ex, storage::Project& project,
                                const std::string& bucket, const std::string& key,
                                const storage::ObjectMeta& meta,
                                const std::string& disposition) {
  const std::int64_t size = meta.size;

  std::optional<ByteRange> range;
  if (auto it = ex.req.find(http::field::range); it != ex.req.end()) {
    range = parse_single_range(std::string_view(it->value().data(), it->value().size()), size);
    if (!range) {
      Response res = ex.text(http::status::range_not_satisfiable, "invalid range");
      res.set(http::field::content_range, "bytes */" + std::to_string(size));
      return res;
    }
  }

  Response res = ex.make(range ? http::status::partial_content : http::status::ok);
  res.set(http::field::content_type,
          meta.content_type.empty() ? util::content_type_for_key(key) : meta.content_type);
  if (!meta.etag.empty()) res.set(http::field::etag, "\"" + meta.etag + "\"");
  res.set(http::field::last_modified, util::rfc1123_gmt(meta.mtime));
  res.set(http::field::accept_ranges, "bytes");
  if (!disposition.empty()) res.set(http::field::content_disposition, disposition);

  std::int64_t offset = 0;
  std::int64_t length = size;
  if (range) {
    offset = range->start;
    length = range->end - range->start + 1;
    res.set(http::field::content_range,
            "bytes " + std::to_string(range->start) + "-" + std::to_string(range->end) +
            "/" + std::to_string(size));
  }

  if (ex.head) {
    res.content_length(static_cast<std::uint64_t>(length));
    return res;
  }

  std::string data;
  std::string serr;
  if (length > 0 && !project.read_range(ex.ctx, bucket, key, offset, length, &data, &serr)) {
    return storage_error(ex, "read object", serr);
  }
  res.body().assign(data.begin(), data.end());
  res.content_length(res.body().size());
  return res;
}

Response Handler::serve_prefix(Exchange& ex, storage::Project& project,
                               Breadcrumb root, const std::string& title,
                               const std::string& bucket,
                               const std::string& real_prefix,
                               const std::string& visible_prefix) {
  std::vector<Breadcrumb> crumbs;
  crumbs.push_back(std::move(root));
  if (!visible_prefix.empty()) {
    std::string_view trimmed = visible_prefix;
    while (!trimmed.empty() && trimmed.back() == '/') trimmed.remove_suffix(1);
    size_t pos = 0;
    while (true) {
      size_t slash = trimmed.find('/', pos);
      std::string segment(trimmed.substr(pos, slash == std::string_view::npos ? std::string_view::npos : slash - pos));
      crumbs.push_back(Breadcrumb{segment, crumbs.back().url + segment + "/"});
      if (slash == std::string_view::npos) break;
      pos = slash + 1;
    }
  }

  std::vector<storage::ListItem> items;
  std::string token;
  do {
    std::string serr;
    auto page = project.list_objects(ex.ctx, bucket, real_prefix, token, &serr);
    if (!serr.empty()) return storage_error(ex, "list prefix", serr);
    for (auto& item : page.items) items.push_back(std::move(item));
    token = page.is_truncated ? page.next_continuation_token : std::string();
  } while (!token.empty());

  std::ostringstream oss;
  oss << page_head()
      << "<title>" << util::html_escape(title) << "</title>\n</head>\n<body>\n"
      << "<nav>";
  for (size_t i = 0; i < crumbs.size(); ++i) {
    if (i > 0) oss << " / ";
    oss << "<a href=\"" << util::html_escape(util::percent_encode(crumbs[i].url, false)) << "\">"
        << util::html_escape(crumbs[i].label) << "</a>";
  }
  oss << "</nav>\n<table>\n<tr><th>Name</th><th>Size</th></tr>\n";
  for (const auto& item : items) {
    const std::string name = item.key.substr(real_prefix.size());
    oss << "<tr><td><a href=\"" << util::html_escape(util::percent_encode(name, false)) << "\">"
        << util::html_escape(name) << "</a></td><td>";
    if (!item.is_prefix) oss << util::format_size_base10(item.meta.size);
    oss << "</td></tr>\n";
  }
  oss << "</table>\n</body>\n</html>\n";
  return ex.html(http::status::ok, oss.str());
}

Response Handler::storage_error(Exchange& ex, std::string_view action, const std::string& storage_err) {
  Error err;
  fail(&err, errc_from_storage(storage_err), storage_err);
  return error_response(ex, err, action);
}

Response Handler::error_response(Exchange& ex, const Error& err, std::string_view action) {
  if (metrics_) metrics_->ObserveFailure(err.code);

  switch (err.code) {
    case Errc::InvalidCredential:
    case Errc::NonPublicCredential:
    case Errc::UnsupportedCredentialVersion:
    case Errc::MissingCredential:
    case Errc::MissingBucket:
    case Errc::InvalidHost:
      logging::get()->debug("request {} {}: {}: {}", ex.request_id, action, errc_name(err.code), err.message);
      return ex.text(http::status::bad_request, "invalid request");
    case Errc::MethodNotAllowed:
      return ex.text(http::status::method_not_allowed, "method not allowed");
    case Errc::BucketNotFound:
      return ex.html(http::status::not_found, not_found_page("Oops! Bucket not found."));
    case Errc::ObjectNotFound:
      return ex.html(http::status::not_found, not_found_page("Oops! Object not found."));
    case Errc::Timeout:
      logging::get()->error("request {} {}: timed out: {}", ex.request_id, action, err.message);
      return ex.text(http::status::gateway_timeout, "request timed out");
    default:
      break;
  }
  logging::get()->error("request {} unable to handle request, action={} code={}: {}",
                        ex.request_id, action, errc_name(err.code), err.message);
  return ex.text(http::status::internal_server_error, "unable to handle request");
}

} // namespace sharing
