#include "dns_client.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>

using std::chrono::milliseconds;

static long worst_case_ms(const dns::QueryBudget& b) {
  return static_cast<long>(b.servers) * b.retrans_s * 1000;
}

static bool rejects(const std::string& server) {
  try {
    dns::ResolvClient client(dns::ResolvClient::Config{server, 1000});
  } catch (const std::invalid_argument&) {
    return true;
  }
  return false;
}

int main() {
  // a single server gets the whole budget
  auto b = dns::query_budget(milliseconds(5000), 1);
  assert(b.servers == 1 && b.retrans_s == 5);

  // several servers share it
  b = dns::query_budget(milliseconds(6000), 3);
  assert(b.servers == 3 && b.retrans_s == 2);
  b = dns::query_budget(milliseconds(5000), 3);
  assert(b.servers == 3 && b.retrans_s == 1);

  // a budget shorter than one wait per server drops servers
  b = dns::query_budget(milliseconds(2500), 3);
  assert(b.servers == 2 && b.retrans_s == 1);
  b = dns::query_budget(milliseconds(300), 3);
  assert(b.servers == 1 && b.retrans_s == 1);

  b = dns::query_budget(milliseconds(5000), 0);
  assert(b.servers == 1);

  // the total wait never exceeds the budget once it is a second or more
  for (long ms = 1000; ms <= 30000; ms += 700) {
    for (int ns = 1; ns <= 3; ++ns) {
      auto q = dns::query_budget(milliseconds(ms), ns);
      assert(q.servers >= 1 && q.servers <= ns);
      assert(q.retrans_s >= 1);
      assert(worst_case_ms(q) <= ms);
    }
  }

  assert(!rejects(""));
  assert(!rejects("127.0.0.1"));
  assert(!rejects("127.0.0.1:5353"));
  assert(rejects("not-an-ip"));
  assert(rejects("127.0.0.1:0"));
  assert(rejects("127.0.0.1:99999"));
  assert(rejects("127.0.0.1:"));
  assert(rejects("::1"));

  std::cout << "test_dns_client passed\n";
  return 0;
}
