#include "core/ink_chrome_process.h"
#include "core/ink_errors.h"
#include "util/logger.h"
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <grp.h>
#include <poll.h>
#include <pwd.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace ink {

namespace {

const char* kListeningPrefix = "DevTools listening on ";

// Liveness re-check interval while waiting for the stderr announcement
const int kExitCheckIntervalMs = 50;

int64_t ElapsedMs(std::chrono::steady_clock::time_point since) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - since).count();
}

bool AllDigits(const std::string& text) {
  if (text.empty()) return false;
  for (char c : text) {
    if (c < '0' || c > '9') return false;
  }
  return true;
}

// leader_alive: the leader is unreaped, so its pid cannot have been reused
void SignalGroup(pid_t pid, int signal_number, bool leader_alive) {
  if (kill(-pid, signal_number) == 0 || errno != ESRCH || !leader_alive) {
    return;
  }
  // The group is gone; the leader may still be around on its own
  if (kill(pid, signal_number) != 0 && errno != ESRCH) {
    LOG_WARN("ChromeProcess", "kill(" + std::to_string(pid) + ") failed: " + strerror(errno));
  }
}

}  // namespace

ChromeProcess::ChromeProcess(ChromeProcessOptions options)
    : options_(std::move(options)) {
  if (!options_.user_profile_dir.empty()) {
    marker_path_ = options_.user_profile_dir + "/" + kDevToolsActivePortFile;
  }
}

ChromeProcess::~ChromeProcess() {
  Dispose();
}

void ChromeProcess::Start(int64_t timeout_ms, const CountdownTimer* timer) {
  if (pid_ > 0) {
    throw ProcessError("Browser process was already started");
  }

  if (!marker_path_.empty() && unlink(marker_path_.c_str()) != 0 && errno != ENOENT) {
    throw ProcessError("Could not delete '" + marker_path_ + "': " + strerror(errno));
  }

  Spawn();

  try {
    if (marker_path_.empty()) {
      WaitForStderrEndpoint(timeout_ms, timer);
    } else {
      WaitForMarkerFile(timeout_ms, timer);
    }
  } catch (const InkError&) {
    Dispose();
    throw;
  }

  LOG_INFO("ChromeProcess", "Browser " + std::to_string(pid_) + " listening on " + endpoint_.ToString());
}

void ChromeProcess::Spawn() {
  bool switch_user = false;
  uid_t uid = 0;
  gid_t gid = 0;
  if (!options_.run_as_user.empty()) {
    if (geteuid() != 0) {
      LOG_WARN("ChromeProcess", "Not running as root, ignoring run-as user '" + options_.run_as_user + "'");
    } else {
      struct passwd* entry = getpwnam(options_.run_as_user.c_str());
      if (!entry) {
        throw ProcessError("Unknown user '" + options_.run_as_user + "'");
      }
      uid = entry->pw_uid;
      gid = entry->pw_gid;
      switch_user = true;
    }
  }

  int stderr_pipe[2];
  int error_pipe[2];  // Carries errno from a failed exec
  if (pipe2(stderr_pipe, O_CLOEXEC) < 0) {
    throw ProcessError(std::string("Failed to create pipes: ") + strerror(errno));
  }
  if (pipe2(error_pipe, O_CLOEXEC) < 0) {
    int saved = errno;
    close(stderr_pipe[0]);
    close(stderr_pipe[1]);
    throw ProcessError(std::string("Failed to create pipes: ") + strerror(saved));
  }

  // Everything the child needs is prepared before fork()
  std::vector<std::string> args;
  args.push_back(options_.executable);
  args.insert(args.end(), options_.arguments.begin(), options_.arguments.end());
  std::vector<char*> argv;
  for (auto& arg : args) {
    argv.push_back(&arg[0]);
  }
  argv.push_back(nullptr);

  std::string command_line;
  for (const auto& arg : args) {
    command_line += (command_line.empty() ? "" : " ") + arg;
  }
  LOG_INFO("ChromeProcess", "Starting: " + command_line);

  pid_t pid = fork();
  if (pid < 0) {
    int saved = errno;
    close(stderr_pipe[0]);
    close(stderr_pipe[1]);
    close(error_pipe[0]);
    close(error_pipe[1]);
    throw ProcessError(std::string("Fork failed: ") + strerror(saved));
  }

  if (pid == 0) {
    // Child: only async-signal-safe calls from here on
    setpgid(0, 0);

    int devnull = open("/dev/null", O_RDWR);
    if (devnull >= 0) {
      dup2(devnull, STDIN_FILENO);
      dup2(devnull, STDOUT_FILENO);
      close(devnull);
    }
    dup2(stderr_pipe[1], STDERR_FILENO);

    int err = 0;
    if (switch_user) {
      if (setgroups(0, nullptr) != 0 || setgid(gid) != 0 || setuid(uid) != 0) {
        err = errno;
      }
    }
    if (err == 0) {
      execv(argv[0], argv.data());
      err = errno;
    }

    ssize_t ignored = write(error_pipe[1], &err, sizeof(err));
    (void)ignored;
    _exit(127);
  }

  // Parent
  setpgid(pid, pid);  // Also done in the child; whichever runs first wins
  close(stderr_pipe[1]);
  close(error_pipe[1]);

  int child_errno = 0;
  ssize_t n;
  do {
    n = read(error_pipe[0], &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);
  close(error_pipe[0]);

  if (n == static_cast<ssize_t>(sizeof(child_errno))) {
    close(stderr_pipe[0]);
    int status = 0;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
    throw ProcessError("Could not start '" + options_.executable + "': " + strerror(child_errno));
  }

  pid_ = pid;
  reaped_ = false;
  stderr_fd_ = stderr_pipe[0];
  stop_reader_ = false;
  reader_thread_ = std::thread(&ChromeProcess::ReadStderr, this);
}

void ChromeProcess::ReadStderr() {
  std::string pending;
  char buffer[4096];

  while (!stop_reader_) {
    struct pollfd pfd;
    pfd.fd = stderr_fd_;
    pfd.events = POLLIN;
    pfd.revents = 0;
    int ready = poll(&pfd, 1, 100);
    if (ready == 0) continue;
    if (ready < 0) {
      if (errno == EINTR) continue;
      break;
    }

    ssize_t n = read(stderr_fd_, buffer, sizeof(buffer));
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0) break;

    pending.append(buffer, static_cast<size_t>(n));
    size_t newline;
    while ((newline = pending.find('\n')) != std::string::npos) {
      HandleStderrLine(pending.substr(0, newline));
      pending.erase(0, newline + 1);
    }
  }

  if (!pending.empty()) {
    HandleStderrLine(pending);
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    stderr_closed_ = true;
  }
  discovery_cv_.notify_all();
}

void ChromeProcess::HandleStderrLine(const std::string& raw_line) {
  std::string line = raw_line;
  if (!line.empty() && line.back() == '\r') line.pop_back();
  if (line.empty() || line[0] == '[') {
    return;
  }

  bool parse = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    parse = marker_path_.empty() && announced_url_.empty();
  }

  if (!parse) {
    LOG_DEBUG("ChromeProcess", "stderr: " + line);
    return;
  }

  LOG_INFO("ChromeProcess", "Received Chrome error data: '" + line + "'");

  size_t prefix = line.find(kListeningPrefix);
  if (prefix == std::string::npos) {
    return;
  }

  std::string url = line.substr(prefix + strlen(kListeningPrefix));
  while (!url.empty() && (url.back() == ' ' || url.back() == '\t')) url.pop_back();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    announced_url_ = url;
  }
  discovery_cv_.notify_all();
}

void ChromeProcess::WaitForStderrEndpoint(int64_t timeout_ms, const CountdownTimer* timer) {
  int64_t bound = CombinedTimeoutMs(timeout_ms, timer);
  auto start = std::chrono::steady_clock::now();

  std::string url;
  while (true) {
    {
      std::unique_lock<std::mutex> lock(mutex_);
      discovery_cv_.wait_for(lock, std::chrono::milliseconds(kExitCheckIntervalMs), [this] {
        return !announced_url_.empty() || stderr_closed_;
      });
      if (!announced_url_.empty()) {
        url = announced_url_;
        break;
      }
    }

    if (!IsRunning()) {
      throw ProcessError("Browser exited with " + ExitDescription() +
                         " before announcing its DevTools endpoint");
    }
    if (bound >= 0 && ElapsedMs(start) >= bound) {
      bool countdown = timer != nullptr && timer->IsExpired();
      throw ProtocolTimeoutError("A timeout of '" + std::to_string(bound) +
                                 "' milliseconds exceeded waiting for the DevTools endpoint", countdown);
    }
  }

  if (!Endpoint::Parse(url, &endpoint_)) {
    throw ProcessError("Could not parse DevTools endpoint '" + url + "'");
  }
}

void ChromeProcess::WaitForMarkerFile(int64_t timeout_ms, const CountdownTimer* timer) {
  int64_t budget = CombinedTimeoutMs(timeout_ms, timer);
  if (budget < 0) {
    budget = kMarkerDefaultTimeoutMs;
  }
  auto start = std::chrono::steady_clock::now();
  bool seen = false;

  while (true) {
    std::ifstream marker(marker_path_);
    if (marker.is_open()) {
      seen = true;
      std::string port;
      std::string path;
      if (std::getline(marker, port) && std::getline(marker, path)) {
        if (!port.empty() && port.back() == '\r') port.pop_back();
        if (!path.empty() && path.back() == '\r') path.pop_back();
        if (AllDigits(port) && !path.empty() &&
            Endpoint::Parse("ws://127.0.0.1:" + port + path, &endpoint_)) {
          return;
        }
      }
    }

    if (!IsRunning()) {
      throw ProcessError("Browser exited with " + ExitDescription() +
                         " before writing '" + marker_path_ + "'");
    }
    if (ElapsedMs(start) >= budget) {
      bool countdown = timer != nullptr && timer->IsExpired();
      throw ProtocolTimeoutError("A timeout of '" + std::to_string(budget) + "' milliseconds exceeded, " +
                                 (seen ? "could not read the file '" : "the file '") + marker_path_ +
                                 (seen ? "'" : "' did not exist"), countdown);
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(kMarkerPollIntervalMs));
  }
}

bool ChromeProcess::ReapNonBlocking() {
  if (pid_ <= 0 || reaped_) {
    return true;
  }
  int status = 0;
  pid_t result = waitpid(pid_, &status, WNOHANG);
  if (result == pid_) {
    reaped_ = true;
    exit_status_ = status;
  } else if (result < 0 && errno == ECHILD) {
    reaped_ = true;
  }
  return reaped_;
}

bool ChromeProcess::IsRunning() {
  return pid_ > 0 && !ReapNonBlocking();
}

std::string ChromeProcess::ExitDescription() const {
  if (WIFSIGNALED(exit_status_)) {
    return "signal " + std::to_string(WTERMSIG(exit_status_));
  }
  return "exit code " + std::to_string(WEXITSTATUS(exit_status_));
}

void ChromeProcess::Dispose() {
  if (pid_ > 0) {
    if (!ReapNonBlocking()) {
      LOG_INFO("ChromeProcess", "Stopping browser " + std::to_string(pid_));
      SignalGroup(pid_, SIGTERM, true);

      auto start = std::chrono::steady_clock::now();
      while (!ReapNonBlocking() && ElapsedMs(start) < kTerminateGraceMs) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
      }
    }

    // Helpers left behind by the leader share its group
    SignalGroup(pid_, SIGKILL, !reaped_);
    while (!reaped_) {
      int status = 0;
      pid_t result = waitpid(pid_, &status, 0);
      if (result == pid_) {
        reaped_ = true;
        exit_status_ = status;
      } else if (result < 0 && errno != EINTR) {
        reaped_ = true;
      }
    }
    LOG_INFO("ChromeProcess", "Browser " + std::to_string(pid_) + " stopped (" + ExitDescription() + ")");
    pid_ = -1;
  }

  StopReader();
}

void ChromeProcess::StopReader() {
  stop_reader_ = true;
  if (reader_thread_.joinable()) {
    reader_thread_.join();
  }
  if (stderr_fd_ >= 0) {
    close(stderr_fd_);
    stderr_fd_ = -1;
  }
}

}  // namespace ink
