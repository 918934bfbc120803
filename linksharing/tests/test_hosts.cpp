#include "routing.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

static bool same(const std::string& a, const std::string& b) {
  bool equal = false;
  std::string err;
  bool ok = routing::compare_hosts(a, b, &equal, &err);
  assert(ok);
  return equal;
}

static bool fails(const std::string& a, const std::string& b) {
  bool equal = false;
  std::string err;
  bool ok = routing::compare_hosts(a, b, &equal, &err);
  if (!ok) assert(!err.empty());
  return !ok;
}

int main() {
  const std::vector<std::string> hosts = {
    "localhost", "link.example.test", "127.0.0.1", "[::1]", "[2001:db8::1]",
  };
  for (const auto& h : hosts) {
    assert(same(h, h));
    assert(same(h + ":443", h));
    assert(same(h, h + ":443"));
    assert(same(h + ":443", h + ":880"));
  }

  assert(!same("link.example.test", "www.example.test"));
  assert(!same("link.example.test:8080", "www.example.test:8080"));
  assert(!same("[::1]:80", "[::2]:80"));
  assert(!same("[2001:db8::1]", "[2001:db8::2]"));
  assert(!same("localhost", "LOCALHOST"));
  assert(!same("", "localhost"));
  assert(same("", ""));

  // Failures other than a missing port propagate.
  assert(fails("a:b:c", "localhost"));
  assert(fails("localhost", "[::1"));
  assert(fails("[::1]:80]", "localhost"));
  assert(fails("localhost", "host]:80"));

  // Brackets are removed; an empty host is allowed.
  std::string host;
  std::string port;
  std::string err;
  assert(routing::split_host_port("example.test:8080", &host, &port, &err) == routing::SplitResult::Ok);
  assert(host == "example.test" && port == "8080");
  assert(routing::split_host_port("[::1]:443", &host, &port, &err) == routing::SplitResult::Ok);
  assert(host == "::1" && port == "443");
  assert(routing::split_host_port(":80", &host, &port, &err) == routing::SplitResult::Ok);
  assert(host.empty() && port == "80");
  assert(routing::split_host_port("example.test", &host, &port, &err) == routing::SplitResult::MissingPort);
  assert(routing::split_host_port("[::1]", &host, &port, &err) == routing::SplitResult::MissingPort);
  assert(routing::split_host_port("::1", &host, &port, &err) == routing::SplitResult::Malformed);

  assert(routing::strip_port("[::1]", &host, &err));
  assert(host == "::1");
  assert(routing::strip_port("example.test", &host, &err));
  assert(host == "example.test");

  std::cout << "test_hosts passed\n";
  return 0;
}
