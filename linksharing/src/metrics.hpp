#pragma once

#include "errors.hpp"
#include "routing.hpp"

#include <array>
#include <atomic>
#include <cstdint>
#include <string>
#include <string_view>

namespace server {

class Metrics {
public:
  Metrics();

  void IncInFlight();
  void DecInFlight();

  void Observe(std::string_view method,
               unsigned status,
               std::size_t req_bytes,
               std::size_t resp_bytes,
               double latency_ms);

  void ObserveRoute(routing::Mode mode);
  void ObserveFailure(sharing::Errc code);
  void ObserveTxtCache(bool hit);

  void ObserveStorage(std::string_view op,
                      bool ok,
                      std::size_t bytes,
                      double latency_ms);

  std::string RenderPrometheus() const;

private:
  enum MethodIndex {
    kGet = 0,
    kHead = 1,
    kOther = 2,
    kMethodCount = 3,
  };

  static MethodIndex method_index(std::string_view method);
  static const char* method_name(MethodIndex idx);

  static constexpr std::size_t kBucketCount = 13;

  std::array<std::atomic<std::uint64_t>, kMethodCount> req_counts_{};
  std::array<std::atomic<std::uint64_t>, kMethodCount> err_counts_{};
  std::array<std::atomic<std::uint64_t>, kMethodCount> req_bytes_{};
  std::array<std::atomic<std::uint64_t>, kMethodCount> resp_bytes_{};

  std::atomic<std::uint64_t> latency_count_{0};
  std::atomic<std::uint64_t> latency_sum_us_{0};
  std::array<double, kBucketCount> buckets_ms_{};
  std::array<std::atomic<std::uint64_t>, kBucketCount> bucket_counts_{};

  std::atomic<std::int64_t> inflight_{0};

  std::array<std::atomic<std::uint64_t>, routing::kModeCount> route_counts_{};
  std::array<std::atomic<std::uint64_t>, sharing::kErrcCount> failure_counts_{};
  std::atomic<std::uint64_t> txt_hits_{0};
  std::atomic<std::uint64_t> txt_misses_{0};

  enum StorageOpIndex {
    kStGet = 0,
    kStPut = 1,
    kStWrite = 2,
    kStIter = 3,
    kStOther = 4,
    kStOpCount = 5,
  };

  static StorageOpIndex storage_op_index(std::string_view op);
  static const char* storage_op_name(StorageOpIndex idx);

  std::array<std::atomic<std::uint64_t>, kStOpCount> st_counts_{};
  std::array<std::atomic<std::uint64_t>, kStOpCount> st_err_counts_{};
  std::array<std::atomic<std::uint64_t>, kStOpCount> st_bytes_{};

  std::atomic<std::uint64_t> st_latency_count_{0};
  std::atomic<std::uint64_t> st_latency_sum_us_{0};
  std::array<std::atomic<std::uint64_t>, kBucketCount> st_bucket_counts_{};
};

} // namespace server
