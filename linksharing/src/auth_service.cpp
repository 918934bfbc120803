#include "auth_service.hpp"
#include "logging.hpp"
#include "util.hpp"

#include <algorithm>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <curl/curl.h>

namespace auth {

namespace {

size_t WriteCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* out = static_cast<std::string*>(userdata);
  size_t total = size * nmemb;
  out->append(ptr, total);
  return total;
}

// Aborts the transfer once the request context is cancelled.
int ProgressCallback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
  const auto* ctx = static_cast<const util::Context*>(clientp);
  return ctx->cancelled() ? 1 : 0;
}

std::string TrimTrailingSlash(const std::string& s) {
  if (!s.empty() && s.back() == '/') {
    return s.substr(0, s.size() - 1);
  }
  return s;
}

} // namespace

ServiceClient::ServiceClient(ServiceConfig cfg) : cfg_(std::move(cfg)) {
  if (cfg_.base_url.empty()) {
    throw std::invalid_argument("auth service base url must not be empty");
  }
  static std::once_flag init_flag;
  std::call_once(init_flag, [] { curl_global_init(CURL_GLOBAL_ALL); });
}

ServiceClient::~ServiceClient() = default;

std::string ServiceClient::BuildAccessUrl(std::string_view access_key_id) const {
  return TrimTrailingSlash(cfg_.base_url) + "/v1/access/" + util::percent_encode(access_key_id, true);
}

bool ServiceClient::resolve(const util::Context& ctx,
                            std::string_view access_key_id,
                            Response* out,
                            sharing::Error* err) {
  using sharing::Errc;

  const auto timeout = ctx.bound(std::chrono::milliseconds(cfg_.timeout_ms));
  if (ctx.done() || timeout.count() <= 0) {
    return sharing::fail(err, Errc::Timeout, "auth service: deadline exceeded before request");
  }

  CURL* curl = curl_easy_init();
  if (!curl) {
    return sharing::fail(err, Errc::InternalFailure, "auth service: curl_easy_init failed");
  }

  const std::string url = BuildAccessUrl(access_key_id);
  struct curl_slist* headers = nullptr;
  headers = curl_slist_append(headers, ("Authorization: Bearer " + cfg_.token).c_str());
  headers = curl_slist_append(headers, "Accept: application/json");

  std::string body;
  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, std::min<long>(cfg_.connect_timeout_ms, static_cast<long>(timeout.count())));
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
  curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, ProgressCallback);
  curl_easy_setopt(curl, CURLOPT_XFERINFODATA, const_cast<util::Context*>(&ctx));
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);

  if (!cfg_.verify_tls) {
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 0L);
  }

  logging::get()->debug("auth service: resolving access key id via {}", TrimTrailingSlash(cfg_.base_url));

  CURLcode res = curl_easy_perform(curl);
  long code = 0;
  if (res == CURLE_OK) {
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code);
  }
  curl_slist_free_all(headers);
  curl_easy_cleanup(curl);

  if (res == CURLE_OPERATION_TIMEDOUT || res == CURLE_ABORTED_BY_CALLBACK) {
    return sharing::fail(err, Errc::Timeout, std::string("auth service: ") + curl_easy_strerror(res));
  }
  if (res != CURLE_OK) {
    return sharing::fail(err, Errc::InternalFailure, std::string("auth service: ") + curl_easy_strerror(res));
  }
  if (code >= 400 && code < 500) {
    return sharing::fail(err, Errc::InvalidCredential,
                         "auth service: access key id rejected with status " + std::to_string(code));
  }
  if (code != 200) {
    return sharing::fail(err, Errc::InternalFailure,
                         "auth service: unexpected status " + std::to_string(code));
  }

  std::string perr;
  Response parsed;
  if (!parse_service_response(body, &parsed, &perr)) {
    return sharing::fail(err, Errc::InternalFailure, "auth service: " + perr);
  }
  if (out) *out = std::move(parsed);
  return true;
}

bool parse_service_response(std::string_view body, Response* out, std::string* err) {
  namespace pt = boost::property_tree;

  pt::ptree tree;
  try {
    std::istringstream in{std::string(body)};
    pt::read_json(in, tree);
  } catch (const pt::json_parser_error& e) {
    if (err) *err = std::string("invalid response body: ") + e.what();
    return false;
  }

  Response r;
  r.access_grant = tree.get<std::string>("access_grant", "");
  r.secret_key = tree.get<std::string>("secret_key", "");
  auto is_public = tree.get_optional<bool>("public");
  if (r.access_grant.empty()) {
    if (err) *err = "response has no access_grant";
    return false;
  }
  r.is_public = is_public.value_or(false);

  if (out) *out = std::move(r);
  return true;
}

} // namespace auth
