#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>

namespace ink {

// Pausable deadline shared by every blocking wait of one conversion.
//
// The timer never runs a callback. Elapsed time is accumulated from
// steady_clock reads whenever the timer is paused or queried, so a paused
// timer costs nothing and RemainingMs() is constant while paused.
class CountdownTimer {
 public:
  enum class State {
    kPaused,   // Not counting; initial state
    kRunning
  };

  explicit CountdownTimer(int64_t budget_ms);

  // Starts counting, or resumes from the stored elapsed time.
  void Start();

  // Pauses, keeping the elapsed time.
  void Stop();

  // Budget minus elapsed, clamped at zero.
  int64_t RemainingMs() const;

  bool IsExpired() const { return RemainingMs() == 0; }
  State state() const;
  int64_t budget_ms() const { return budget_ms_; }

 private:
  int64_t ElapsedMsLocked() const;

  const int64_t budget_ms_;
  mutable std::mutex mutex_;
  State state_ = State::kPaused;
  std::chrono::steady_clock::duration accumulated_{0};
  std::chrono::steady_clock::time_point started_at_;
};

// Bound for a wait that has its own timeout and may also be limited by a
// countdown. A negative timeout means "no own limit". Returns a negative
// value when neither limits the wait.
int64_t CombinedTimeoutMs(int64_t timeout_ms, const CountdownTimer* timer);

}  // namespace ink
