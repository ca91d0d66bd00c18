#pragma once

#include "network/ink_endpoint.h"
#include "util/ink_countdown_timer.h"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <sys/types.h>
#include <thread>
#include <vector>

namespace ink {

// Marker file written by the browser into a named profile directory
constexpr const char* kDevToolsActivePortFile = "DevToolsActivePort";

// Marker file poll interval and default budget
constexpr int kMarkerPollIntervalMs = 5;
constexpr int64_t kMarkerDefaultTimeoutMs = 10000;

// Grace period between SIGTERM and SIGKILL on disposal
constexpr int kTerminateGraceMs = 2000;

struct ChromeProcessOptions {
  std::string executable;
  std::vector<std::string> arguments;  // argv[1..], already in execv form

  // When set the browser uses this profile and announces its endpoint in
  // the DevToolsActivePort file; otherwise the endpoint is read from stderr.
  std::string user_profile_dir;

  // Switch to this account in the child when running as root
  std::string run_as_user;
};

// A supervised headless browser process.
//
// The child runs in its own process group so Dispose() can take down the
// renderer and helper processes with it. A reader thread drains stderr for
// the whole lifetime of the child.
class ChromeProcess {
 public:
  explicit ChromeProcess(ChromeProcessOptions options);
  ~ChromeProcess();

  ChromeProcess(const ChromeProcess&) = delete;
  ChromeProcess& operator=(const ChromeProcess&) = delete;

  // Spawns the browser and waits until its control endpoint is known.
  // timeout_ms < 0 means no own limit (the marker file wait then uses its
  // default budget). Throws ProcessError or ProtocolTimeoutError.
  void Start(int64_t timeout_ms, const CountdownTimer* timer);

  // Non-blocking liveness check; reaps the child when it has exited.
  bool IsRunning();

  // Idempotent. SIGTERM to the group, SIGKILL after the grace period, reap.
  void Dispose();

  const Endpoint& endpoint() const { return endpoint_; }
  pid_t pid() const { return pid_; }

  // "exit code N" / "signal N" once the child has been reaped
  std::string ExitDescription() const;

 private:
  void Spawn();
  void ReadStderr();
  void HandleStderrLine(const std::string& line);
  void WaitForStderrEndpoint(int64_t timeout_ms, const CountdownTimer* timer);
  void WaitForMarkerFile(int64_t timeout_ms, const CountdownTimer* timer);
  bool ReapNonBlocking();
  void StopReader();

  ChromeProcessOptions options_;
  std::string marker_path_;

  pid_t pid_ = -1;
  bool reaped_ = false;
  int exit_status_ = 0;
  Endpoint endpoint_;

  int stderr_fd_ = -1;
  std::thread reader_thread_;
  std::atomic<bool> stop_reader_{false};

  std::mutex mutex_;  // Guards the discovery state below
  std::condition_variable discovery_cv_;
  std::string announced_url_;
  bool stderr_closed_ = false;
};

}  // namespace ink
