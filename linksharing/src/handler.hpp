#pragma once

#include "context.hpp"
#include "errors.hpp"
#include "routing.hpp"
#include "storage.hpp"

#include <cstdint>
#include <string>
#include <string_view>

#include <boost/beast/http.hpp>

namespace server {
class Metrics;
} // namespace server

namespace sharing {

namespace http = boost::beast::http;

using Request = http::request<http::vector_body<char>>;
using Response = http::response<http::vector_body<char>>;

// Turns a routed request into an HTTP response: share pages, prefix
// listings, object bytes or an error page.
class Handler {
public:
  Handler(routing::Router* router, storage::Uplink* uplink, server::Metrics* metrics = nullptr);

  Response handle(const Request& req, const util::Context& ctx);

private:
  struct Exchange;
  struct Breadcrumb {
    std::string label;
    std::string url;
  };

  Response serve_traditional(Exchange& ex, const routing::RoutingResult& rr);
  Response serve_hosting(Exchange& ex, const routing::RoutingResult& rr);

  Response serve_content(Exchange& ex, storage::Project& project,
                         const std::string& bucket, const std::string& key,
                         const storage::ObjectMeta& meta,
                         const std::string& disposition);

  Response serve_prefix(Exchange& ex, storage::Project& project,
                        Breadcrumb root, const std::string& title,
                        const std::string& bucket,
                        const std::string& real_prefix,
                        const std::string& visible_prefix);

  Response storage_error(Exchange& ex, std::string_view action, const std::string& storage_err);
  Response error_response(Exchange& ex, const Error& err, std::string_view action);

  routing::Router* router_;
  storage::Uplink* uplink_;
  server::Metrics* metrics_;
};

} // namespace sharing
