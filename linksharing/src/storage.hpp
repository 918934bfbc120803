#pragma once

#include "access.hpp"
#include "context.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace storage {

// Error strings reported through the `std::string* err` out-parameters.
constexpr const char* kNoSuchBucket = "NoSuchBucket";
constexpr const char* kNoSuchKey = "NoSuchKey";
constexpr const char* kTimeout = "Timeout";
constexpr const char* kAccessExpired = "AccessExpired";

struct ObjectMeta {
  std::string etag;        // hex md5
  std::int64_t mtime = 0;  // epoch seconds
  std::int64_t size = 0;
  std::string content_type;
};

struct ListItem {
  std::string key;       // full key; for prefixes it ends in '/'
  bool is_prefix = false;
  ObjectMeta meta;       // zero for prefixes
};

struct ListResult {
  std::vector<ListItem> items;
  bool is_truncated = false;
  std::string next_continuation_token;
};

// An opened project. Closed when destroyed.
class Project {
public:
  virtual ~Project() = default;

  virtual bool stat_object(const util::Context& ctx,
                           std::string_view bucket, std::string_view key,
                           ObjectMeta* out_meta,
                           std::string* err) = 0;

  // One level of the key space under `prefix`: objects directly below it and
  // collapsed sub-prefixes. Pages are continued with next_continuation_token.
  virtual ListResult list_objects(const util::Context& ctx,
                                  std::string_view bucket, std::string_view prefix,
                                  std::string_view continuation_token,
                                  std::string* err) = 0;

  virtual bool read_range(const util::Context& ctx,
                          std::string_view bucket, std::string_view key,
                          std::int64_t offset, std::int64_t length,
                          std::string* out_data,
                          std::string* err) = 0;
};

class Uplink {
public:
  virtual ~Uplink() = default;

  virtual std::unique_ptr<Project> open_project(const util::Context& ctx,
                                                const Access& access,
                                                std::string* err) = 0;
};

} // namespace storage
