#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>

namespace util {

// Per-request cancellation: an optional deadline plus a flag shared by copies.
class Context {
public:
  using Clock = std::chrono::steady_clock;

  Context() : cancelled_(std::make_shared<std::atomic<bool>>(false)) {}

  static Context with_timeout(std::chrono::milliseconds timeout) {
    Context ctx;
    ctx.deadline_ = Clock::now() + timeout;
    return ctx;
  }

  static Context with_deadline(Clock::time_point deadline) {
    Context ctx;
    ctx.deadline_ = deadline;
    return ctx;
  }

  void cancel() const { cancelled_->store(true, std::memory_order_relaxed); }

  bool cancelled() const { return cancelled_->load(std::memory_order_relaxed); }

  bool done() const {
    if (cancelled()) return true;
    return deadline_ && Clock::now() >= *deadline_;
  }

  // Time left before the deadline; std::nullopt when there is none.
  std::optional<std::chrono::milliseconds> remaining() const {
    if (!deadline_) return std::nullopt;
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline_ - Clock::now());
    if (left.count() < 0) left = std::chrono::milliseconds(0);
    return left;
  }

  // Clamp a collaborator timeout to the time left.
  std::chrono::milliseconds bound(std::chrono::milliseconds timeout) const {
    auto left = remaining();
    if (left && *left < timeout) return *left;
    return timeout;
  }

private:
  std::optional<Clock::time_point> deadline_;
  std::shared_ptr<std::atomic<bool>> cancelled_;
};

} // namespace util
