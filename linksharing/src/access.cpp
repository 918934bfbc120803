#include "access.hpp"
#include "util.hpp"

#include <algorithm>
#include <charconv>

namespace storage {

bool Access::allows_bucket(std::string_view bucket) const {
  if (buckets.empty()) return true;
  return std::find(buckets.begin(), buckets.end(), bucket) != buckets.end();
}

bool Access::expired(std::int64_t now_seconds) const {
  return expires != 0 && now_seconds >= expires;
}

bool parse_access(std::string_view serialized, Access* out, std::string* err) {
  auto decoded = util::base58_check_decode(serialized);
  if (!decoded) {
    if (err) *err = "invalid access grant encoding";
    return false;
  }
  if (decoded->version != kAccessGrantVersion) {
    if (err) *err = "invalid access grant version " + std::to_string(decoded->version);
    return false;
  }

  Access a;
  for (auto& kv : util::parse_query(decoded->payload)) {
    if (kv.first == "project") {
      a.project = std::move(kv.second);
    } else if (kv.first == "bucket") {
      if (kv.second.empty() || kv.second.find('\0') != std::string::npos) {
        if (err) *err = "invalid bucket restriction";
        return false;
      }
      a.buckets.push_back(std::move(kv.second));
    } else if (kv.first == "expires") {
      const std::string& v = kv.second;
      auto res = std::from_chars(v.data(), v.data() + v.size(), a.expires);
      if (v.empty() || res.ec != std::errc{} || res.ptr != v.data() + v.size() || a.expires < 0) {
        if (err) *err = "invalid access expiry";
        return false;
      }
    }
    // unknown fields are ignored so newer grants stay readable
  }

  if (a.project.empty() || a.project.find('\0') != std::string::npos) {
    if (err) *err = "access grant has no project";
    return false;
  }

  if (out) *out = std::move(a);
  return true;
}

std::string serialize_access(const Access& access) {
  std::vector<std::pair<std::string, std::string>> fields;
  fields.emplace_back("project", access.project);
  for (const auto& b : access.buckets) {
    fields.emplace_back("bucket", b);
  }
  if (access.expires != 0) {
    fields.emplace_back("expires", std::to_string(access.expires));
  }
  return util::base58_check_encode(util::build_query(fields), kAccessGrantVersion);
}

} // namespace storage
