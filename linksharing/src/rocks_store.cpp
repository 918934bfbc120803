#include "rocks_store.hpp"
#include "metrics.hpp"
#include "util.hpp"

#include <chrono>
#include <rocksdb/write_batch.h>

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <optional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace storage {

namespace {

using Clock = std::chrono::steady_clock;

void observe_rocksdb(server::Metrics* metrics,
                     std::string_view op,
                     const rocksdb::Status& st,
                     std::size_t bytes,
                     Clock::time_point start) {
  if (!metrics) return;
  auto end = Clock::now();
  double ms = std::chrono::duration<double, std::milli>(end - start).count();
  bool ok = st.ok() || st.IsNotFound();
  metrics->ObserveStorage(op, ok, bytes, ms);
}

} // namespace

static bool contains_nul(std::string_view s) {
  return s.find('\0') != std::string_view::npos;
}

// project\0bucket
static std::string scope(std::string_view project, std::string_view bucket) {
  std::string s;
  s.reserve(project.size() + 1 + bucket.size());
  s.append(project.data(), project.size());
  s.push_back('\0');
  s.append(bucket.data(), bucket.size());
  return s;
}

static std::string bucket_key(std::string_view project, std::string_view bucket) {
  std::string k;
  k.push_back('B');
  k.push_back('\0');
  k += scope(project, bucket);
  return k;
}

static std::string meta_prefix(std::string_view project, std::string_view bucket) {
  std::string k;
  k.push_back('M');
  k.push_back('\0');
  k += scope(project, bucket);
  k.push_back('\0');
  return k;
}

static std::string meta_key(std::string_view project, std::string_view bucket, std::string_view key) {
  std::string k = meta_prefix(project, bucket);
  k.append(key.data(), key.size());
  return k;
}

static std::string data_key(std::string_view project, std::string_view bucket, std::string_view key) {
  std::string k;
  k.push_back('D');
  k.push_back('\0');
  k += scope(project, bucket);
  k.push_back('\0');
  k.append(key.data(), key.size());
  return k;
}

static std::string encode_meta(const ObjectMeta& m) {
  // size\0mtime\0etag\0content_type
  std::string out;
  out.reserve(64 + m.etag.size() + m.content_type.size());
  out += std::to_string(m.size);
  out.push_back('\0');
  out += std::to_string(m.mtime);
  out.push_back('\0');
  out += m.etag;
  out.push_back('\0');
  out += m.content_type;
  return out;
}

static std::optional<ObjectMeta> decode_meta(std::string_view v) {
  ObjectMeta m;
  size_t p1 = v.find('\0');
  if (p1 == std::string_view::npos) return std::nullopt;
  size_t p2 = v.find('\0', p1 + 1);
  if (p2 == std::string_view::npos) return std::nullopt;
  size_t p3 = v.find('\0', p2 + 1);
  if (p3 == std::string_view::npos) return std::nullopt;

  auto parse_i64 = [](std::string_view s, std::int64_t* out) -> bool {
    std::int64_t val = 0;
    auto res = std::from_chars(s.data(), s.data() + s.size(), val);
    if (res.ec != std::errc{}) return false;
    *out = val;
    return true;
  };

  if (!parse_i64(v.substr(0, p1), &m.size)) return std::nullopt;
  if (!parse_i64(v.substr(p1 + 1, p2 - (p1 + 1)), &m.mtime)) return std::nullopt;

  m.etag = std::string(v.substr(p2 + 1, p3 - (p2 + 1)));
  m.content_type = std::string(v.substr(p3 + 1));
  return m;
}

RocksObjectStore::RocksObjectStore(rocksdb::DB* db,
                                   rocksdb::WriteOptions write_opts,
                                   server::Metrics* metrics)
    : db_(db), wo_(write_opts), metrics_(metrics) {}

bool RocksObjectStore::bucket_exists(std::string_view project, std::string_view bucket, std::string* err) {
  if (contains_nul(project) || contains_nul(bucket)) {
    if (err) *err = "Invalid bucket";
    return false;
  }
  std::string value;
  auto start = Clock::now();
  auto st = db_->Get(rocksdb::ReadOptions{}, bucket_key(project, bucket), &value);
  observe_rocksdb(metrics_, "get", st, value.size(), start);
  if (st.ok()) return true;
  if (st.IsNotFound()) return false;
  if (err) *err = st.ToString();
  return false;
}

bool RocksObjectStore::create_bucket(std::string_view project, std::string_view bucket, std::string* err) {
  if (bucket.empty() || contains_nul(project) || contains_nul(bucket) || bucket.find('/') != std::string_view::npos) {
    if (err) *err = "Invalid bucket";
    return false;
  }
  // Idempotent
  std::string value;
  auto start = Clock::now();
  auto st = db_->Get(rocksdb::ReadOptions{}, bucket_key(project, bucket), &value);
  observe_rocksdb(metrics_, "get", st, value.size(), start);
  if (st.ok()) return true;
  if (!st.IsNotFound()) {
    if (err) *err = st.ToString();
    return false;
  }
  start = Clock::now();
  st = db_->Put(wo_, bucket_key(project, bucket), "");
  observe_rocksdb(metrics_, "put", st, 0, start);
  if (!st.ok()) {
    if (err) *err = st.ToString();
    return false;
  }
  return true;
}

bool RocksObjectStore::put_object(std::string_view project, std::string_view bucket, std::string_view key,
                                  std::string_view data,
                                  std::string_view content_type,
                                  ObjectMeta* out_meta,
                                  std::string* err) {
  if (key.empty() || contains_nul(key)) {
    if (err) *err = "Invalid bucket/key";
    return false;
  }
  if (!bucket_exists(project, bucket, err)) {
    if (err && err->empty()) *err = kNoSuchBucket;
    return false;
  }

  ObjectMeta m;
  m.size = static_cast<std::int64_t>(data.size());
  m.mtime = util::unix_now_seconds();
  m.etag = util::md5_hex(data);
  m.content_type = content_type.empty() ? util::content_type_for_key(key) : std::string(content_type);

  rocksdb::WriteBatch batch;
  batch.Put(data_key(project, bucket, key), rocksdb::Slice(data.data(), data.size()));
  const std::string meta_val = encode_meta(m);
  batch.Put(meta_key(project, bucket, key), meta_val);

  auto start = Clock::now();
  auto st = db_->Write(wo_, &batch);
  observe_rocksdb(metrics_, "write", st, data.size(), start);
  if (!st.ok()) {
    if (err) *err = st.ToString();
    return false;
  }

  if (out_meta) *out_meta = m;
  return true;
}

bool RocksObjectStore::head_object(std::string_view project, std::string_view bucket, std::string_view key,
                                   ObjectMeta* out_meta,
                                   std::string* err) {
  if (contains_nul(key)) {
    if (err) *err = "Invalid bucket/key";
    return false;
  }
  if (!bucket_exists(project, bucket, err)) {
    if (err && err->empty()) *err = kNoSuchBucket;
    return false;
  }

  std::string meta_val;
  auto start = Clock::now();
  auto st = db_->Get(rocksdb::ReadOptions{}, meta_key(project, bucket, key), &meta_val);
  observe_rocksdb(metrics_, "get", st, meta_val.size(), start);
  if (st.IsNotFound()) {
    if (err) *err = kNoSuchKey;
    return false;
  }
  if (!st.ok()) {
    if (err) *err = st.ToString();
    return false;
  }
  auto m = decode_meta(meta_val);
  if (!m) {
    if (err) *err = "Corrupt metadata";
    return false;
  }
  if (out_meta) *out_meta = *m;
  return true;
}

bool RocksObjectStore::read_object(std::string_view project, std::string_view bucket, std::string_view key,
                                   std::int64_t offset, std::int64_t length,
                                   std::string* out_data,
                                   std::string* err) {
  if (offset < 0 || length < 0) {
    if (err) *err = "Invalid range";
    return false;
  }
  ObjectMeta m;
  if (!head_object(project, bucket, key, &m, err)) return false;

  std::string data_val;
  auto start = Clock::now();
  auto st = db_->Get(rocksdb::ReadOptions{}, data_key(project, bucket, key), &data_val);
  observe_rocksdb(metrics_, "get", st, data_val.size(), start);
  if (st.IsNotFound()) {
    if (err) *err = kNoSuchKey;
    return false;
  }
  if (!st.ok()) {
    if (err) *err = st.ToString();
    return false;
  }

  const auto size = static_cast<std::int64_t>(data_val.size());
  if (offset > size) offset = size;
  if (length > size - offset) length = size - offset;
  if (out_data) {
    if (offset == 0 && length == size) {
      *out_data = std::move(data_val);
    } else {
      out_data->assign(data_val, static_cast<size_t>(offset), static_cast<size_t>(length));
    }
  }
  return true;
}

ListResult RocksObjectStore::list_objects(std::string_view project, std::string_view bucket,
                                          std::string_view prefix,
                                          std::int64_t max_keys,
                                          std::string_view continuation_token,
                                          std::string* err) {
  ListResult res;
  if (contains_nul(prefix) || contains_nul(continuation_token)) {
    if (err) *err = "Invalid bucket/prefix/token";
    return res;
  }
  if (!bucket_exists(project, bucket, err)) {
    if (err && err->empty()) *err = kNoSuchBucket;
    return res;
  }

  if (max_keys <= 0) max_keys = 1000;
  if (max_keys > 1000) max_keys = 1000;

  const std::string mp = meta_prefix(project, bucket);
  std::string first = mp;
  first.append(prefix.data(), prefix.size());

  // Tokens are inclusive seek positions inside mp + prefix.
  std::string seek_key;
  if (!continuation_token.empty()) {
    auto decoded = util::base64_decode(continuation_token);
    if (!decoded || !util::starts_with(*decoded, first)) {
      if (err) *err = "Invalid continuation-token";
      return res;
    }
    seek_key = *decoded;
  } else {
    seek_key = first;
  }

  rocksdb::ReadOptions ro;
  auto start = Clock::now();
  std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(ro));

  std::int64_t count = 0;
  it->Seek(seek_key);
  while (it->Valid()) {
    auto k = it->key();
    std::string_view ks(k.data(), k.size());
    if (!util::starts_with(ks, first)) break;

    std::string_view rest = ks.substr(first.size());
    size_t slash = rest.find('/');

    if (count >= max_keys) {
      std::string resume = (slash == std::string_view::npos)
        ? std::string(ks)
        : first + std::string(rest.substr(0, slash + 1));
      res.is_truncated = true;
      res.next_continuation_token = util::base64_encode(resume);
      break;
    }

    if (slash != std::string_view::npos) {
      ListItem item;
      item.key = std::string(prefix) + std::string(rest.substr(0, slash + 1));
      item.is_prefix = true;
      res.items.push_back(std::move(item));
      count++;

      // '0' sorts right after '/', so this skips everything below the sub-prefix.
      std::string skip = first + std::string(rest.substr(0, slash + 1));
      skip.back() = '0';
      it->Seek(skip);
      continue;
    }

    auto v = it->value();
    auto meta = decode_meta(std::string_view(v.data(), v.size()));
    if (meta) {
      ListItem item;
      item.key = std::string(prefix) + std::string(rest);
      item.meta = *meta;
      res.items.push_back(std::move(item));
      count++;
    }
    it->Next();
  }

  auto st = it->status();
  observe_rocksdb(metrics_, "iter", st, 0, start);
  if (!st.ok()) {
    if (err) *err = st.ToString();
  }

  return res;
}

namespace {

class RocksProject final : public Project {
public:
  RocksProject(RocksObjectStore* store, Access access, std::int64_t page_size)
    : store_(store), access_(std::move(access)), page_size_(page_size) {}

  bool stat_object(const util::Context& ctx,
                   std::string_view bucket, std::string_view key,
                   ObjectMeta* out_meta,
                   std::string* err) override {
    if (!check(ctx, bucket, err)) return false;
    return store_->head_object(access_.project, bucket, key, out_meta, err);
  }

  ListResult list_objects(const util::Context& ctx,
                          std::string_view bucket, std::string_view prefix,
                          std::string_view continuation_token,
                          std::string* err) override {
    if (!check(ctx, bucket, err)) return {};
    return store_->list_objects(access_.project, bucket, prefix, page_size_, continuation_token, err);
  }

  bool read_range(const util::Context& ctx,
                  std::string_view bucket, std::string_view key,
                  std::int64_t offset, std::int64_t length,
                  std::string* out_data,
                  std::string* err) override {
    if (!check(ctx, bucket, err)) return false;
    return store_->read_object(access_.project, bucket, key, offset, length, out_data, err);
  }

private:
  bool check(const util::Context& ctx, std::string_view bucket, std::string* err) const {
    if (ctx.done()) {
      if (err) *err = kTimeout;
      return false;
    }
    // Buckets outside the grant are indistinguishable from missing ones.
    if (!access_.allows_bucket(bucket)) {
      if (err) *err = kNoSuchBucket;
      return false;
    }
    return true;
  }

  RocksObjectStore* store_;
  Access access_;
  std::int64_t page_size_;
};

} // namespace

RocksUplink::RocksUplink(RocksObjectStore* store, std::int64_t list_page_size)
  : store_(store), list_page_size_(list_page_size) {}

std::unique_ptr<Project> RocksUplink::open_project(const util::Context& ctx,
                                                   const Access& access,
                                                   std::string* err) {
  if (ctx.done()) {
    if (err) *err = kTimeout;
    return nullptr;
  }
  if (access.expired(util::unix_now_seconds())) {
    if (err) *err = kAccessExpired;
    return nullptr;
  }
  return std::make_unique<RocksProject>(store_, access, list_page_size_);
}

} // namespace storage
