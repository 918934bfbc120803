#include "util.hpp"

#include <cassert>
#include <iostream>
#include <string>

static std::string from_hex(const std::string& hex) {
  std::string out;
  for (size_t i = 0; i + 1 < hex.size(); i += 2) {
    out.push_back(static_cast<char>(std::stoi(hex.substr(i, 2), nullptr, 16)));
  }
  return out;
}

int main() {
  // Base-58
  assert(util::base58_encode("") == "");
  assert(util::base58_encode("hello world") == "StV1DL6CwTryKyV");
  assert(util::base58_encode(std::string("\0\0\x28\x7f\xb4\xcd", 6)) == "11233QC4");
  assert(util::base58_encode("a") == "2g");
  assert(util::base58_encode("bbb") == "a3gV");
  assert(util::base58_encode(std::string(1, '\0')) == "1");
  assert(*util::base58_decode("StV1DL6CwTryKyV") == "hello world");
  assert(*util::base58_decode("11233QC4") == std::string("\0\0\x28\x7f\xb4\xcd", 6));
  assert(!util::base58_decode("0"));
  assert(!util::base58_decode("hello world"));

  // a well known version 0 check encoding
  auto addr = util::base58_check_decode("1NS17iag9jJgTHD1VXjvLCEnZuQ3rJED9L");
  assert(addr);
  assert(addr->version == 0);
  assert(addr->payload == from_hex("eb15231dfceb60925886b67d065299925915aeb1"));
  assert(util::base58_check_encode(addr->payload, 0) == "1NS17iag9jJgTHD1VXjvLCEnZuQ3rJED9L");

  auto enc = util::base58_check_encode("payload", 1);
  auto dec = util::base58_check_decode(enc);
  assert(dec && dec->version == 1 && dec->payload == "payload");
  std::string corrupted = enc;
  corrupted[corrupted.size() / 2] = corrupted[corrupted.size() / 2] == 'a' ? 'b' : 'a';
  assert(!util::base58_check_decode(corrupted));
  assert(!util::base58_check_decode("1111"));
  assert(!util::base58_check_decode(""));

  // Sizes
  assert(util::format_size_base10(0) == "0 B");
  assert(util::format_size_base10(512) == "512 B");
  assert(util::format_size_base10(700) == "0.7 KB");
  assert(util::format_size_base10(1500) == "1.5 KB");
  assert(util::format_size_base10(2000000) == "2.0 MB");
  assert(util::format_size_base10(3500000000LL) == "3.5 GB");

  // Paths
  assert(util::clean_path("") == "/");
  assert(util::clean_path("/a/b/../c/./d") == "/a/c/d");
  assert(util::clean_path("//a//b/") == "/a/b");
  assert(util::clean_path("/../..") == "/");

  // Whitespace
  assert(util::trim_ws("  bucket/my  site \t") == "bucket/my  site");
  assert(util::trim_ws(" \n ").empty());
  assert(util::trim_and_collapse_ws("  a   b ") == "a b");

  // Escaping
  assert(util::html_escape("<a href=\"x\">'&'</a>") ==
         "&lt;a href=&#34;x&#34;&gt;&#39;&amp;&#39;&lt;/a&gt;");
  assert(util::percent_encode("a b/c~", false) == "a%20b/c~");
  assert(util::percent_encode("a/b", true) == "a%2Fb");
  assert(*util::percent_decode("a%20b%2Fc") == "a b/c");
  assert(!util::percent_decode("%zz"));
  assert(!util::percent_decode("abc%2"));

  auto q = util::parse_query("download&x=1&y=a%20b");
  assert(q.size() == 3);
  assert(q[0].first == "download" && q[0].second.empty());
  assert(q[2].second == "a b");
  assert(util::build_query({{"project", "p 1"}, {"bucket", "b"}}) == "project=p%201&bucket=b");

  // Content types
  assert(util::content_type_for_key("site/index.HTML") == "text/html; charset=utf-8");
  assert(util::content_type_for_key("a/b.png") == "image/png");
  assert(util::content_type_for_key("dir.d/noext") == "application/octet-stream");

  assert(util::md5_hex("") == "d41d8cd98f00b204e9800998ecf8427e");
  assert(util::base64_encode("abc") == "YWJj");
  assert(*util::base64_decode("YWJj") == "abc");

  std::cout << "test_util passed\n";
  return 0;
}
