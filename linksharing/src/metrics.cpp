#include "metrics.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace server {

Metrics::Metrics() {
  buckets_ms_ = {1, 2, 5, 10, 25, 50, 100, 250, 500, 1000, 2500, 5000, 10000};
  for (auto& c : bucket_counts_) {
    c.store(0);
  }
  for (auto& c : st_bucket_counts_) {
    c.store(0);
  }
}

void Metrics::IncInFlight() {
  inflight_.fetch_add(1, std::memory_order_relaxed);
}

void Metrics::DecInFlight() {
  inflight_.fetch_sub(1, std::memory_order_relaxed);
}

Metrics::MethodIndex Metrics::method_index(std::string_view method) {
  if (method == "GET") return kGet;
  if (method == "HEAD") return kHead;
  return kOther;
}

const char* Metrics::method_name(MethodIndex idx) {
  switch (idx) {
    case kGet: return "GET";
    case kHead: return "HEAD";
    default: return "OTHER";
  }
}

void Metrics::Observe(std::string_view method,
                      unsigned status,
                      std::size_t req_bytes,
                      std::size_t resp_bytes,
                      double latency_ms) {
  MethodIndex idx = method_index(method);
  req_counts_[idx].fetch_add(1, std::memory_order_relaxed);
  req_bytes_[idx].fetch_add(req_bytes, std::memory_order_relaxed);
  resp_bytes_[idx].fetch_add(resp_bytes, std::memory_order_relaxed);
  if (status >= 400) {
    err_counts_[idx].fetch_add(1, std::memory_order_relaxed);
  }

  latency_count_.fetch_add(1, std::memory_order_relaxed);
  std::uint64_t us = static_cast<std::uint64_t>(std::llround(latency_ms * 1000.0));
  latency_sum_us_.fetch_add(us, std::memory_order_relaxed);

  for (std::size_t i = 0; i < buckets_ms_.size(); ++i) {
    if (latency_ms <= buckets_ms_[i]) {
      bucket_counts_[i].fetch_add(1, std::memory_order_relaxed);
      break;
    }
  }
}

void Metrics::ObserveRoute(routing::Mode mode) {
  route_counts_[static_cast<std::size_t>(mode)].fetch_add(1, std::memory_order_relaxed);
}

void Metrics::ObserveFailure(sharing::Errc code) {
  failure_counts_[static_cast<std::size_t>(code)].fetch_add(1, std::memory_order_relaxed);
}

void Metrics::ObserveTxtCache(bool hit) {
  if (hit) {
    txt_hits_.fetch_add(1, std::memory_order_relaxed);
  } else {
    txt_misses_.fetch_add(1, std::memory_order_relaxed);
  }
}

Metrics::StorageOpIndex Metrics::storage_op_index(std::string_view op) {
  if (op == "get") return kStGet;
  if (op == "put") return kStPut;
  if (op == "write") return kStWrite;
  if (op == "iter") return kStIter;
  return kStOther;
}

const char* Metrics::storage_op_name(StorageOpIndex idx) {
  switch (idx) {
    case kStGet: return "get";
    case kStPut: return "put";
    case kStWrite: return "write";
    case kStIter: return "iter";
    default: return "other";
  }
}

void Metrics::ObserveStorage(std::string_view op,
                             bool ok,
                             std::size_t bytes,
                             double latency_ms) {
  StorageOpIndex idx = storage_op_index(op);
  st_counts_[idx].fetch_add(1, std::memory_order_relaxed);
  st_bytes_[idx].fetch_add(bytes, std::memory_order_relaxed);
  if (!ok) {
    st_err_counts_[idx].fetch_add(1, std::memory_order_relaxed);
  }

  st_latency_count_.fetch_add(1, std::memory_order_relaxed);
  std::uint64_t us = static_cast<std::uint64_t>(std::llround(latency_ms * 1000.0));
  st_latency_sum_us_.fetch_add(us, std::memory_order_relaxed);

  for (std::size_t i = 0; i < buckets_ms_.size(); ++i) {
    if (latency_ms <= buckets_ms_[i]) {
      st_bucket_counts_[i].fetch_add(1, std::memory_order_relaxed);
      break;
    }
  }
}

std::string Metrics::RenderPrometheus() const {
  std::ostringstream oss;

  oss << "# HELP linksharing_requests_total Total HTTP requests.\n";
  oss << "# TYPE linksharing_requests_total counter\n";
  for (int i = 0; i < kMethodCount; ++i) {
    oss << "linksharing_requests_total{method=\"" << method_name(static_cast<MethodIndex>(i))
        << "\"} " << req_counts_[i].load() << "\n";
  }

  oss << "# HELP linksharing_request_errors_total HTTP requests with status >= 400.\n";
  oss << "# TYPE linksharing_request_errors_total counter\n";
  for (int i = 0; i < kMethodCount; ++i) {
    oss << "linksharing_request_errors_total{method=\"" << method_name(static_cast<MethodIndex>(i))
        << "\"} " << err_counts_[i].load() << "\n";
  }

  oss << "# HELP linksharing_request_bytes_total Request body bytes.\n";
  oss << "# TYPE linksharing_request_bytes_total counter\n";
  for (int i = 0; i < kMethodCount; ++i) {
    oss << "linksharing_request_bytes_total{method=\"" << method_name(static_cast<MethodIndex>(i))
        << "\"} " << req_bytes_[i].load() << "\n";
  }

  oss << "# HELP linksharing_response_bytes_total Response body bytes.\n";
  oss << "# TYPE linksharing_response_bytes_total counter\n";
  for (int i = 0; i < kMethodCount; ++i) {
    oss << "linksharing_response_bytes_total{method=\"" << method_name(static_cast<MethodIndex>(i))
        << "\"} " << resp_bytes_[i].load() << "\n";
  }

  oss << "# HELP linksharing_inflight_requests In-flight HTTP requests.\n";
  oss << "# TYPE linksharing_inflight_requests gauge\n";
  oss << "linksharing_inflight_requests " << inflight_.load() << "\n";

  oss << "# HELP linksharing_request_latency_ms Request latency in milliseconds.\n";
  oss << "# TYPE linksharing_request_latency_ms histogram\n";

  std::uint64_t cumulative = 0;
  for (std::size_t i = 0; i < buckets_ms_.size(); ++i) {
    cumulative += bucket_counts_[i].load();
    oss << "linksharing_request_latency_ms_bucket{le=\"" << buckets_ms_[i] << "\"} "
        << cumulative << "\n";
  }
  std::uint64_t count = latency_count_.load();
  oss << "linksharing_request_latency_ms_bucket{le=\"+Inf\"} " << count << "\n";
  double sum_ms = static_cast<double>(latency_sum_us_.load()) / 1000.0;
  oss << "linksharing_request_latency_ms_sum " << sum_ms << "\n";
  oss << "linksharing_request_latency_ms_count " << count << "\n";

  oss << "# HELP linksharing_routed_total Requests routed, by mode.\n";
  oss << "# TYPE linksharing_routed_total counter\n";
  for (int i = 0; i < routing::kModeCount; ++i) {
    oss << "linksharing_routed_total{mode=\"" << routing::mode_name(static_cast<routing::Mode>(i))
        << "\"} " << route_counts_[i].load() << "\n";
  }

  oss << "# HELP linksharing_failures_total Failed requests, by error class.\n";
  oss << "# TYPE linksharing_failures_total counter\n";
  for (int i = 1; i < sharing::kErrcCount; ++i) {
    oss << "linksharing_failures_total{code=\"" << sharing::errc_name(static_cast<sharing::Errc>(i))
        << "\"} " << failure_counts_[i].load() << "\n";
  }

  oss << "# HELP linksharing_txt_cache_total TXT record cache lookups.\n";
  oss << "# TYPE linksharing_txt_cache_total counter\n";
  oss << "linksharing_txt_cache_total{result=\"hit\"} " << txt_hits_.load() << "\n";
  oss << "linksharing_txt_cache_total{result=\"miss\"} " << txt_misses_.load() << "\n";

  oss << "# HELP linksharing_storage_ops_total Storage backend operations.\n";
  oss << "# TYPE linksharing_storage_ops_total counter\n";
  for (int i = 0; i < kStOpCount; ++i) {
    oss << "linksharing_storage_ops_total{op=\"" << storage_op_name(static_cast<StorageOpIndex>(i))
        << "\"} " << st_counts_[i].load() << "\n";
  }

  oss << "# HELP linksharing_storage_errors_total Storage backend operations with non-OK status.\n";
  oss << "# TYPE linksharing_storage_errors_total counter\n";
  for (int i = 0; i < kStOpCount; ++i) {
    oss << "linksharing_storage_errors_total{op=\"" << storage_op_name(static_cast<StorageOpIndex>(i))
        << "\"} " << st_err_counts_[i].load() << "\n";
  }

  oss << "# HELP linksharing_storage_bytes_total Storage backend bytes read/written.\n";
  oss << "# TYPE linksharing_storage_bytes_total counter\n";
  for (int i = 0; i < kStOpCount; ++i) {
    oss << "linksharing_storage_bytes_total{op=\"" << storage_op_name(static_cast<StorageOpIndex>(i))
        << "\"} " << st_bytes_[i].load() << "\n";
  }

  oss << "# HELP linksharing_storage_latency_ms Storage backend operation latency in milliseconds.\n";
  oss << "# TYPE linksharing_storage_latency_ms histogram\n";
  std::uint64_t st_cumulative = 0;
  for (std::size_t i = 0; i < buckets_ms_.size(); ++i) {
    st_cumulative += st_bucket_counts_[i].load();
    oss << "linksharing_storage_latency_ms_bucket{le=\"" << buckets_ms_[i] << "\"} "
        << st_cumulative << "\n";
  }
  std::uint64_t st_count = st_latency_count_.load();
  oss << "linksharing_storage_latency_ms_bucket{le=\"+Inf\"} " << st_count << "\n";
  double st_sum_ms = static_cast<double>(st_latency_sum_us_.load()) / 1000.0;
  oss << "linksharing_storage_latency_ms_sum " << st_sum_ms << "\n";
  oss << "linksharing_storage_latency_ms_count " << st_count << "\n";

  return oss.str();
}

} // namespace server
