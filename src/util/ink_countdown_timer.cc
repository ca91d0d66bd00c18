#include "util/ink_countdown_timer.h"
#include <algorithm>

namespace ink {

CountdownTimer::CountdownTimer(int64_t budget_ms)
    : budget_ms_(std::max<int64_t>(0, budget_ms)) {}

void CountdownTimer::Start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_ == State::kRunning) {
    return;
  }
  started_at_ = std::chrono::steady_clock::now();
  state_ = State::kRunning;
}

void CountdownTimer::Stop() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_ == State::kPaused) {
    return;
  }
  accumulated_ += std::chrono::steady_clock::now() - started_at_;
  state_ = State::kPaused;
}

int64_t CountdownTimer::ElapsedMsLocked() const {
  auto elapsed = accumulated_;
  if (state_ == State::kRunning) {
    elapsed += std::chrono::steady_clock::now() - started_at_;
  }
  return std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
}

int64_t CountdownTimer::RemainingMs() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::max<int64_t>(0, budget_ms_ - ElapsedMsLocked());
}

CountdownTimer::State CountdownTimer::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

int64_t CombinedTimeoutMs(int64_t timeout_ms, const CountdownTimer* timer) {
  if (!timer) {
    return timeout_ms;
  }
  int64_t remaining = timer->RemainingMs();
  if (timeout_ms < 0) {
    return remaining;
  }
  return std::min(timeout_ms, remaining);
}

}  // namespace ink
