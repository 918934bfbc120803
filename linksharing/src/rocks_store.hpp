#pragma once

#include "storage.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include <rocksdb/db.h>

namespace server {
class Metrics;
} // namespace server

namespace storage {

// Buckets, object metadata and object data in one RocksDB, namespaced by project.
class RocksObjectStore {
public:
  explicit RocksObjectStore(rocksdb::DB* db,
                            rocksdb::WriteOptions write_opts = rocksdb::WriteOptions{},
                            server::Metrics* metrics = nullptr);

  // Buckets
  bool bucket_exists(std::string_view project, std::string_view bucket, std::string* err);
  bool create_bucket(std::string_view project, std::string_view bucket, std::string* err);

  // Objects
  bool put_object(std::string_view project, std::string_view bucket, std::string_view key,
                  std::string_view data,
                  std::string_view content_type,
                  ObjectMeta* out_meta,
                  std::string* err);

  bool head_object(std::string_view project, std::string_view bucket, std::string_view key,
                   ObjectMeta* out_meta,
                   std::string* err);

  // Reads [offset, offset + length) clamped to the object size.
  bool read_object(std::string_view project, std::string_view bucket, std::string_view key,
                   std::int64_t offset, std::int64_t length,
                   std::string* out_data,
                   std::string* err);

  ListResult list_objects(std::string_view project, std::string_view bucket,
                          std::string_view prefix,
                          std::int64_t max_keys,
                          std::string_view continuation_token,
                          std::string* err);

private:
  rocksdb::DB* db_;
  rocksdb::WriteOptions wo_;
  server::Metrics* metrics_;
};

// storage::Uplink over a RocksObjectStore. Projects enforce the access grant.
class RocksUplink final : public Uplink {
public:
  explicit RocksUplink(RocksObjectStore* store, std::int64_t list_page_size = 1000);

  std::unique_ptr<Project> open_project(const util::Context& ctx,
                                        const Access& access,
                                        std::string* err) override;

private:
  RocksObjectStore* store_;
  std::int64_t list_page_size_;
};

} // namespace storage
