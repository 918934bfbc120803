#pragma once

#include "context.hpp"
#include "errors.hpp"

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

#include <netinet/in.h>

namespace dns {

class Client {
public:
  virtual ~Client() = default;

  // TXT strings of `name`, each record's character-strings joined. A name with
  // no TXT data yields an empty list; lookup failures fail DNSResolutionFailed.
  virtual bool lookup_txt(const util::Context& ctx,
                          std::string_view name,
                          std::vector<std::string>* out,
                          sharing::Error* err) = 0;
};

// How a lookup spends its time: res_nquery waits up to retrans_s on each of
// `servers` name servers in turn.
struct QueryBudget {
  int servers = 1;
  int retrans_s = 1;
};

// Fit the name servers and per-server wait into `timeout` (whole seconds, at
// least one server and one second).
QueryBudget query_budget(std::chrono::milliseconds timeout, int nscount);

// libresolv backed client with per-call resolver state.
class ResolvClient final : public Client {
public:
  struct Config {
    std::string server; // "ip[:port]", IPv4 only; empty uses /etc/resolv.conf
    long timeout_ms = 5000;
  };

  // Throws std::invalid_argument for an unparsable server address.
  explicit ResolvClient(Config cfg);

  bool lookup_txt(const util::Context& ctx,
                  std::string_view name,
                  std::vector<std::string>* out,
                  sharing::Error* err) override;

private:
  Config cfg_;
  bool has_server_ = false;
  sockaddr_in server_{};
};

} // namespace dns
