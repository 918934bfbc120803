#include "routing.hpp"

#include <cassert>
#include <iostream>
#include <string>

struct Case {
  const char* root;
  const char* url_path;
  const char* bucket;
  const char* key;
};

int main() {
  const Case cases[] = {
    {"bucket/prefix/", "/images/pic.jpg", "bucket", "prefix/images/pic.jpg"},
    {"bucket", "/images/pic.jpg", "bucket", "images/pic.jpg"},
    {"bucket/", "/images/pic.jpg", "bucket", "images/pic.jpg"},
    {"bucket//", "/images/pic.jpg", "bucket", "/images/pic.jpg"},
    {"bucket//prefix", "/images/pic.jpg", "bucket", "/prefix/images/pic.jpg"},
    {"bucket/prefix//", "/images/pic.jpg", "bucket", "prefix//images/pic.jpg"},
    {"bucket/prefix", "/images/pic.jpg", "bucket", "prefix/images/pic.jpg"},
    {"bucket/prefix/", "//images/pic.jpg", "bucket", "prefix//images/pic.jpg"},
    // bucket root and directory requests
    {"bucket", "/", "bucket", ""},
    {"bucket/site", "/", "bucket", "site/"},
    {"bucket/site", "/docs/", "bucket", "site/docs/"},
    {"bucket", "", "bucket", ""},
  };

  for (const auto& c : cases) {
    auto bk = routing::determine_bucket_and_object_key(c.root, c.url_path);
    if (bk.bucket != c.bucket || bk.key != c.key) {
      std::cerr << "root=" << c.root << " path=" << c.url_path
                << " got " << bk.bucket << " / " << bk.key << "\n";
    }
    assert(bk.bucket == c.bucket);
    assert(bk.key == c.key);

    // same inputs, same outputs
    auto again = routing::determine_bucket_and_object_key(c.root, c.url_path);
    assert(again.bucket == bk.bucket && again.key == bk.key);
  }

  std::cout << "test_bucket_key passed\n";
  return 0;
}
