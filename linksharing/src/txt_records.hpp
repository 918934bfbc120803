#pragma once

#include "access.hpp"
#include "auth_service.hpp"
#include "context.hpp"
#include "dns_client.hpp"
#include "errors.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace server {
class Metrics;
} // namespace server

namespace dns {

constexpr const char* kAccessKey = "storj-access";
constexpr const char* kRootKey = "storj-root";

// Tagged TXT strings of one name, "key:value" or "key=value".
class TxtRecordSet {
public:
  static TxtRecordSet parse(const std::vector<std::string>& records);

  // Value of `key` (case-insensitive). Without a plain entry, numbered parts
  // "key-1", "key-2", ... are joined in numeric order.
  std::optional<std::string> lookup(std::string_view key) const;

private:
  std::map<std::string, std::string> values_;
  std::map<std::string, std::map<long, std::string>> parts_;
};

// Caches, per host, the access grant and storage root configured in DNS.
class TxtRecords {
public:
  using Clock = std::chrono::steady_clock;
  using NowFn = std::function<Clock::time_point()>;

  struct Config {
    std::chrono::milliseconds ttl{std::chrono::hours(1)};
    std::string lookup_prefix = "txt-";
    bool require_public = false;
  };

  struct Record {
    storage::Access access;
    std::string root;
    Clock::time_point fetched_at;
  };

  TxtRecords(Config cfg, Client* dns, auth::Resolver* resolver,
             server::Metrics* metrics = nullptr, NowFn now = &Clock::now);

  // A live cache entry, or a fresh DNS lookup stored as the new entry.
  bool fetch_access_for_host(const util::Context& ctx,
                             std::string_view host,
                             std::shared_ptr<const Record>* out,
                             sharing::Error* err);

  std::size_t size() const;

private:
  bool query_access_from_dns(const util::Context& ctx,
                             const std::string& host,
                             Record* out,
                             sharing::Error* err);

  Config cfg_;
  Client* dns_;
  auth::Resolver* resolver_;
  server::Metrics* metrics_;
  NowFn now_;

  mutable std::shared_mutex mu_;
  std::unordered_map<std::string, std::shared_ptr<const Record>> cache_;
};

} // namespace dns
