#include "dns_client.hpp"
#include "logging.hpp"

#include <algorithm>
#include <charconv>
#include <cstring>
#include <stdexcept>

#include <arpa/inet.h>
#include <arpa/nameser.h>
#include <netdb.h>
#include <resolv.h>

namespace dns {

namespace {

class ResolverState {
public:
  ResolverState() { std::memset(&state_, 0, sizeof(state_)); }
  ~ResolverState() {
    if (initialized_) res_nclose(&state_);
  }
  ResolverState(const ResolverState&) = delete;
  ResolverState& operator=(const ResolverState&) = delete;

  bool init() {
    initialized_ = res_ninit(&state_) == 0;
    return initialized_;
  }

  res_state get() { return &state_; }

private:
  struct __res_state state_;
  bool initialized_ = false;
};

const char* h_errno_name(int code) {
  switch (code) {
    case HOST_NOT_FOUND: return "NXDOMAIN";
    case TRY_AGAIN: return "server failure or timeout";
    case NO_RECOVERY: return "non-recoverable server failure";
    case NO_DATA: return "no data";
    default: return "unknown resolver error";
  }
}

} // namespace

QueryBudget query_budget(std::chrono::milliseconds timeout, int nscount) {
  const long secs = std::max<long>(1, static_cast<long>(timeout.count() / 1000));
  QueryBudget b;
  b.servers = static_cast<int>(std::clamp<long>(nscount, 1, secs));
  b.retrans_s = static_cast<int>(std::max<long>(1, secs / b.servers));
  return b;
}

ResolvClient::ResolvClient(Config cfg) : cfg_(std::move(cfg)) {
  if (cfg_.server.empty()) return;

  std::string_view s = cfg_.server;
  std::string_view host = s;
  unsigned port = 53;
  size_t colon = s.rfind(':');
  if (colon != std::string_view::npos) {
    host = s.substr(0, colon);
    std::string_view p = s.substr(colon + 1);
    auto res = std::from_chars(p.data(), p.data() + p.size(), port);
    if (p.empty() || res.ec != std::errc{} || res.ptr != p.data() + p.size() || port == 0 || port > 65535) {
      throw std::invalid_argument("invalid dns server port: " + cfg_.server);
    }
  }

  server_.sin_family = AF_INET;
  server_.sin_port = htons(static_cast<uint16_t>(port));
  if (inet_pton(AF_INET, std::string(host).c_str(), &server_.sin_addr) != 1) {
    throw std::invalid_argument("invalid dns server address: " + cfg_.server);
  }
  has_server_ = true;
}

bool ResolvClient::lookup_txt(const util::Context& ctx,
                              std::string_view name,
                              std::vector<std::string>* out,
                              sharing::Error* err) {
  using sharing::Errc;

  const auto timeout = ctx.bound(std::chrono::milliseconds(cfg_.timeout_ms));
  if (ctx.done() || timeout.count() <= 0) {
    return sharing::fail(err, Errc::Timeout, "dns: deadline exceeded before lookup");
  }

  ResolverState state;
  if (!state.init()) {
    return sharing::fail(err, Errc::DNSResolutionFailed, "dns: res_ninit failed");
  }

  res_state rs = state.get();
  if (has_server_) {
    rs->nsaddr_list[0] = server_;
    rs->nscount = 1;
  }
  const QueryBudget budget = query_budget(timeout, rs->nscount);
  rs->nscount = budget.servers;
  rs->retrans = budget.retrans_s;
  rs->retry = 1;

  const std::string qname(name);
  std::vector<unsigned char> answer(NS_MAXMSG);
  int len = res_nquery(rs, qname.c_str(), ns_c_in, ns_t_txt, answer.data(), static_cast<int>(answer.size()));
  if (len < 0) {
    if (rs->res_h_errno == NO_DATA) {
      if (out) out->clear();
      return true;
    }
    if (ctx.done()) {
      return sharing::fail(err, Errc::Timeout, "dns: deadline exceeded during lookup of " + qname);
    }
    return sharing::fail(err, Errc::DNSResolutionFailed,
                         "dns: TXT lookup of " + qname + " failed: " + h_errno_name(rs->res_h_errno));
  }

  ns_msg msg;
  if (ns_initparse(answer.data(), len, &msg) < 0) {
    return sharing::fail(err, Errc::DNSResolutionFailed, "dns: malformed response for " + qname);
  }

  std::vector<std::string> records;
  const int count = ns_msg_count(msg, ns_s_an);
  for (int i = 0; i < count; ++i) {
    ns_rr rr;
    if (ns_parserr(&msg, ns_s_an, i, &rr) < 0) {
      return sharing::fail(err, Errc::DNSResolutionFailed, "dns: malformed answer record for " + qname);
    }
    if (ns_rr_type(rr) != ns_t_txt) continue;

    const unsigned char* rd = ns_rr_rdata(rr);
    const size_t rdlen = ns_rr_rdlen(rr);
    std::string value;
    size_t pos = 0;
    while (pos < rdlen) {
      size_t n = rd[pos++];
      if (pos + n > rdlen) {
        return sharing::fail(err, Errc::DNSResolutionFailed, "dns: truncated TXT string for " + qname);
      }
      value.append(reinterpret_cast<const char*>(rd + pos), n);
      pos += n;
    }
    records.push_back(std::move(value));
  }

  logging::get()->debug("dns: {} TXT records for {}", records.size(), qname);
  if (out) *out = std::move(records);
  return true;
}

} // namespace dns
