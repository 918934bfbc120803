#include "access.hpp"
#include "credentials.hpp"
#include "txt_records.hpp"
#include "util.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace {

class FakeDns final : public dns::Client {
public:
  bool lookup_txt(const util::Context& ctx,
                  std::string_view name,
                  std::vector<std::string>* out,
                  sharing::Error* err) override {
    queries++;
    if (ctx.done()) {
      return sharing::fail(err, sharing::Errc::Timeout, "deadline");
    }
    std::lock_guard<std::mutex> lock(mu);
    last_name = std::string(name);
    auto it = zones.find(last_name);
    if (it == zones.end()) {
      return sharing::fail(err, sharing::Errc::DNSResolutionFailed, "NXDOMAIN " + last_name);
    }
    if (out) *out = it->second;
    return true;
  }

  std::mutex mu;
  std::map<std::string, std::vector<std::string>> zones;
  std::string last_name;
  std::atomic<int> queries{0};
};

class PrivateResolver final : public auth::Resolver {
public:
  explicit PrivateResolver(std::string grant) : grant_(std::move(grant)) {}

  bool resolve(const util::Context&, std::string_view, auth::Response* out, sharing::Error*) override {
    if (out) *out = auth::Response{grant_, "", false};
    return true;
  }

private:
  std::string grant_;
};

} // namespace

int main() {
  using Clock = dns::TxtRecords::Clock;

  storage::Access grant;
  grant.project = "site-project";
  const std::string serialized = storage::serialize_access(grant);

  // Record set parsing
  {
    auto set = dns::TxtRecordSet::parse({
      "storj-root:bucket/prefix",
      "STORJ-ACCESS = " + serialized,
      "storj-root:ignored",
      "unrelated",
      "other=value",
    });
    assert(set.lookup("storj-root") == std::optional<std::string>("bucket/prefix"));
    assert(set.lookup("storj-access") == std::optional<std::string>(serialized));
    assert(set.lookup("Other") == std::optional<std::string>("value"));
    assert(!set.lookup("missing"));

    // only the ends of a value are trimmed
    auto spaced = dns::TxtRecordSet::parse({"storj-root:  bucket/my  site\t", "  Storj-Access =  a b  "});
    assert(spaced.lookup("storj-root") == std::optional<std::string>("bucket/my  site"));
    assert(spaced.lookup("storj-access") == std::optional<std::string>("a b"));

    auto parts = dns::TxtRecordSet::parse({
      "storj-access-2:" + serialized.substr(10),
      "storj-access-1:" + serialized.substr(0, 10),
      "storj-root:b",
    });
    assert(parts.lookup("storj-access") == std::optional<std::string>(serialized));

    // numeric, not lexical, order
    std::vector<std::string> many;
    std::string expected;
    for (int i = 12; i >= 1; --i) {
      many.push_back("k-" + std::to_string(i) + ":" + std::string(1, static_cast<char>('a' + i)));
    }
    for (int i = 1; i <= 12; ++i) expected.push_back(static_cast<char>('a' + i));
    assert(dns::TxtRecordSet::parse(many).lookup("k") == std::optional<std::string>(expected));
  }

  FakeDns fake;
  fake.zones["txt-site.example.test"] = {"storj-root:website/public", "storj-access:" + serialized};
  fake.zones["txt-bucket-only.example.test"] = {"storj-root:website", "storj-access:" + serialized};
  fake.zones["txt-no-root.example.test"] = {"storj-access:" + serialized};
  fake.zones["txt-no-access.example.test"] = {"storj-root:website"};
  fake.zones["txt-bad-root.example.test"] = {"storj-root:/website", "storj-access:" + serialized};
  fake.zones["txt-bad-access.example.test"] = {"storj-root:website", "storj-access:garbage"};

  Clock::time_point now = Clock::now();
  std::mutex now_mu;
  auto clock = [&]() {
    std::lock_guard<std::mutex> lock(now_mu);
    return now;
  };

  dns::TxtRecords::Config cfg;
  cfg.ttl = std::chrono::seconds(60);
  dns::TxtRecords records(cfg, &fake, nullptr, nullptr, clock);

  util::Context ctx;
  std::shared_ptr<const dns::TxtRecords::Record> rec;
  sharing::Error err;

  // miss, then hits until the TTL elapses
  assert(records.fetch_access_for_host(ctx, "site.example.test", &rec, &err));
  assert(fake.last_name == "txt-site.example.test");
  assert(fake.queries == 1);
  assert(rec->root == "website/public");
  assert(rec->access.project == "site-project");
  const auto first = rec;

  {
    std::lock_guard<std::mutex> lock(now_mu);
    now += std::chrono::seconds(59);
  }
  assert(records.fetch_access_for_host(ctx, "site.example.test", &rec, &err));
  assert(fake.queries == 1);
  assert(rec == first);

  {
    std::lock_guard<std::mutex> lock(now_mu);
    now += std::chrono::seconds(1);
  }
  fake.zones["txt-site.example.test"] = {"storj-root:website/v2", "storj-access:" + serialized};
  assert(records.fetch_access_for_host(ctx, "site.example.test", &rec, &err));
  assert(fake.queries == 2);
  assert(rec != first);
  assert(rec->root == "website/v2");
  // the replaced entry is untouched
  assert(first->root == "website/public");
  assert(records.size() == 1);

  assert(records.fetch_access_for_host(ctx, "bucket-only.example.test", &rec, &err));
  assert(rec->root == "website");
  assert(records.size() == 2);

  // failures are not cached
  const int before = fake.queries;
  assert(!records.fetch_access_for_host(ctx, "nowhere.example.test", &rec, &err));
  assert(err.code == sharing::Errc::DNSResolutionFailed);
  assert(!records.fetch_access_for_host(ctx, "nowhere.example.test", &rec, &err));
  assert(fake.queries == before + 2);
  assert(records.size() == 2);

  assert(!records.fetch_access_for_host(ctx, "no-root.example.test", &rec, &err));
  assert(err.code == sharing::Errc::CustomDomainNotConfigured);
  assert(!records.fetch_access_for_host(ctx, "no-access.example.test", &rec, &err));
  assert(err.code == sharing::Errc::CustomDomainNotConfigured);
  assert(!records.fetch_access_for_host(ctx, "bad-root.example.test", &rec, &err));
  assert(err.code == sharing::Errc::CustomDomainNotConfigured);
  assert(!records.fetch_access_for_host(ctx, "bad-access.example.test", &rec, &err));
  assert(err.code == sharing::Errc::InvalidCredential);

  auto expired = util::Context::with_timeout(std::chrono::milliseconds(0));
  assert(!records.fetch_access_for_host(expired, "bad-root.example.test", &rec, &err));
  assert(err.code == sharing::Errc::Timeout);

  // access key ids: private ones are allowed unless configured otherwise
  const std::string key_id = util::base58_check_encode("site-key", auth::kAccessKeyIdVersion);
  fake.zones["txt-keyid.example.test"] = {"storj-root:website", "storj-access:" + key_id};
  PrivateResolver resolver(serialized);
  {
    dns::TxtRecords lenient(cfg, &fake, &resolver, nullptr, clock);
    assert(lenient.fetch_access_for_host(ctx, "keyid.example.test", &rec, &err));
    assert(rec->access.project == "site-project");
  }
  {
    dns::TxtRecords::Config strict_cfg = cfg;
    strict_cfg.require_public = true;
    dns::TxtRecords strict(strict_cfg, &fake, &resolver, nullptr, clock);
    assert(!strict.fetch_access_for_host(ctx, "keyid.example.test", &rec, &err));
    assert(err.code == sharing::Errc::NonPublicCredential);
  }

  // concurrent readers and refreshers
  {
    dns::TxtRecords shared(cfg, &fake, nullptr, nullptr, clock);
    std::atomic<int> ok{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
      threads.emplace_back([&, t]() {
        for (int i = 0; i < 200; ++i) {
          std::shared_ptr<const dns::TxtRecords::Record> r;
          sharing::Error e;
          const char* host = (i + t) % 2 ? "site.example.test" : "bucket-only.example.test";
          if (shared.fetch_access_for_host(util::Context{}, host, &r, &e) && r && !r->root.empty()) {
            ok++;
          }
          if (t == 0 && i % 50 == 0) {
            std::lock_guard<std::mutex> lock(now_mu);
            now += std::chrono::seconds(61);
          }
        }
      });
    }
    for (auto& th : threads) th.join();
    assert(ok == 8 * 200);
    assert(shared.size() == 2);
  }

  std::cout << "test_txt_records passed\n";
  return 0;
}
