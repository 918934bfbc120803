#include "txt_records.hpp"
#include "credentials.hpp"
#include "logging.hpp"
#include "metrics.hpp"
#include "util.hpp"

#include <cctype>
#include <charconv>
#include <mutex>
#include <stdexcept>

namespace dns {

namespace {

// "storj-access-2" -> ("storj-access", 2)
bool split_part_index(std::string_view key, std::string* base, long* index) {
  size_t dash = key.rfind('-');
  if (dash == std::string_view::npos || dash == 0 || dash + 1 == key.size()) return false;
  std::string_view digits = key.substr(dash + 1);
  long idx = 0;
  auto res = std::from_chars(digits.data(), digits.data() + digits.size(), idx);
  if (res.ec != std::errc{} || res.ptr != digits.data() + digits.size() || idx < 0) return false;
  *base = std::string(key.substr(0, dash));
  *index = idx;
  return true;
}

} // namespace

TxtRecordSet TxtRecordSet::parse(const std::vector<std::string>& records) {
  TxtRecordSet set;
  for (const auto& rec : records) {
    size_t sep = rec.find_first_of(":=");
    if (sep == std::string::npos) continue;

    std::string key = util::to_lower(util::trim_and_collapse_ws(std::string_view(rec).substr(0, sep)));
    // values are storage roots and grants; their inside is kept byte for byte
    std::string value = util::trim_ws(std::string_view(rec).substr(sep + 1));
    if (key.empty()) continue;

    // first value wins
    set.values_.emplace(key, value);

    std::string base;
    long index = 0;
    if (split_part_index(key, &base, &index)) {
      set.parts_[base].emplace(index, std::move(value));
    }
  }
  return set;
}

std::optional<std::string> TxtRecordSet::lookup(std::string_view key) const {
  const std::string k = util::to_lower(key);
  if (auto it = values_.find(k); it != values_.end()) {
    return it->second;
  }
  auto pit = parts_.find(k);
  if (pit == parts_.end()) return std::nullopt;

  std::string joined;
  for (const auto& part : pit->second) {
    joined += part.second;
  }
  return joined;
}

TxtRecords::TxtRecords(Config cfg, Client* dns, auth::Resolver* resolver,
                       server::Metrics* metrics, NowFn now)
  : cfg_(std::move(cfg)), dns_(dns), resolver_(resolver), metrics_(metrics), now_(std::move(now)) {
  if (!dns_) {
    throw std::invalid_argument("dns client must not be null");
  }
}

bool TxtRecords::fetch_access_for_host(const util::Context& ctx,
                                       std::string_view host,
                                       std::shared_ptr<const Record>* out,
                                       sharing::Error* err) {
  const std::string h(host);
  {
    std::shared_lock<std::shared_mutex> lock(mu_);
    auto it = cache_.find(h);
    if (it != cache_.end() && now_() < it->second->fetched_at + cfg_.ttl) {
      if (metrics_) metrics_->ObserveTxtCache(true);
      if (out) *out = it->second;
      return true;
    }
  }
  if (metrics_) metrics_->ObserveTxtCache(false);

  // No lock is held across the lookup; concurrent misses may both query.
  auto rec = std::make_shared<Record>();
  if (!query_access_from_dns(ctx, h, rec.get(), err)) {
    return false;
  }
  rec->fetched_at = now_();

  std::shared_ptr<const Record> stored = rec;
  {
    std::unique_lock<std::shared_mutex> lock(mu_);
    cache_[h] = stored;
  }
  logging::get()->debug("txt records: refreshed {} (root {})", h, stored->root);

  if (out) *out = std::move(stored);
  return true;
}

std::size_t TxtRecords::size() const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  return cache_.size();
}

bool TxtRecords::query_access_from_dns(const util::Context& ctx,
                                       const std::string& host,
                                       Record* out,
                                       sharing::Error* err) {
  using sharing::Errc;

  std::vector<std::string> records;
  sharing::Error lerr;
  if (!dns_->lookup_txt(ctx, cfg_.lookup_prefix + host, &records, &lerr)) {
    if (lerr.code == Errc::Timeout) {
      return sharing::fail(err, Errc::Timeout, lerr.message);
    }
    return sharing::fail(err, Errc::DNSResolutionFailed, lerr.message);
  }

  const TxtRecordSet set = TxtRecordSet::parse(records);
  auto serialized = set.lookup(kAccessKey);
  auto root = set.lookup(kRootKey);
  if (!serialized || serialized->empty()) {
    return sharing::fail(err, Errc::CustomDomainNotConfigured, "missing " + std::string(kAccessKey) + " for " + host);
  }
  if (!root || root->empty()) {
    return sharing::fail(err, Errc::CustomDomainNotConfigured, "missing " + std::string(kRootKey) + " for " + host);
  }
  if (root->front() == '/') {
    return sharing::fail(err, Errc::CustomDomainNotConfigured, "root without bucket for " + host);
  }

  if (!auth::decode_access(ctx, *serialized, resolver_, cfg_.require_public, &out->access, err)) {
    return false;
  }
  out->root = std::move(*root);
  return true;
}

} // namespace dns
