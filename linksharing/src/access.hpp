#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace storage {

// Version byte of a base-58 check encoded access grant.
constexpr std::uint8_t kAccessGrantVersion = 0;

// Decoded access grant: the project it opens and the buckets it is scoped to.
struct Access {
  std::string project;
  std::vector<std::string> buckets; // empty: every bucket of the project
  std::int64_t expires = 0;         // unix seconds, 0: never

  bool allows_bucket(std::string_view bucket) const;
  bool expired(std::int64_t now_seconds) const;
};

// Parse a serialized access grant. On failure returns false and fills *err.
bool parse_access(std::string_view serialized, Access* out, std::string* err);

std::string serialize_access(const Access& access);

} // namespace storage
