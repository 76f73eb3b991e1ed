#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>

#include "internal/util/time.hpp"

namespace booking::util {

/*
  Cooperative cancellation flag shared between a caller and a long-running
  query. Copies observe the same flag.
*/
class CancellationToken {
 public:
  CancellationToken() : state_(std::make_shared<std::atomic<bool>>(false)) {
  }

  void Cancel() const {
    state_->store(true, std::memory_order_release);
  }

  bool IsCancelled() const {
    return state_->load(std::memory_order_acquire);
  }

 private:
  std::shared_ptr<std::atomic<bool>> state_;
};

/*
  Per-call knobs accepted by every query operation.

  timeout bounds each individual store read; cancellation is polled between
  bounded units of work.
*/
struct CallOptions {
  std::optional<std::chrono::milliseconds> timeout;
  CancellationToken                        cancellation;

  std::optional<TimePoint> DeadlineFromNow() const {
    if (!timeout) return std::nullopt;
    return Now() + *timeout;
  }
};

} // namespace booking::util
