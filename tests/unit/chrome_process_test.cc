#include "core/ink_chrome_process.h"
#include "core/ink_errors.h"
#include "test_helpers.h"
#include "util/ink_file_util.h"
#include "util/ink_temp_directory.h"
#include <gtest/gtest.h>
#include <signal.h>
#include <sys/stat.h>
#include <unistd.h>

namespace ink {
namespace {

class ChromeProcessTest : public ::testing::Test {
 protected:
  ChromeProcessTest() : scratch_("") {}

  ChromeProcessOptions Options(const std::string& executable) {
    ChromeProcessOptions options;
    options.executable = executable;
    options.arguments = {"--headless", "--remote-debugging-port=0"};
    return options;
  }

  TempDirectory scratch_;
};

TEST_F(ChromeProcessTest, ReadsEndpointFromStderr) {
  ChromeProcess process(Options(test::WriteFakeChrome(scratch_.path())));
  process.Start(5000, nullptr);

  EXPECT_TRUE(process.IsRunning());
  EXPECT_GT(process.pid(), 0);
  EXPECT_EQ(process.endpoint().ToString(), "ws://127.0.0.1:9222/devtools/browser/fake");

  process.Dispose();
  EXPECT_FALSE(process.IsRunning());
  EXPECT_EQ(process.pid(), -1);
}

TEST_F(ChromeProcessTest, ReadsEndpointFromMarkerFile) {
  std::string profile = scratch_.path() + "/profile";
  ASSERT_EQ(mkdir(profile.c_str(), 0700), 0);
  // A stale marker from an earlier run must not be picked up
  ASSERT_TRUE(WriteFile(profile + "/" + kDevToolsActivePortFile, "1111\n/devtools/browser/stale\n"));

  ChromeProcessOptions options = Options(test::WriteFakeChrome(scratch_.path()));
  options.user_profile_dir = profile;
  options.arguments.push_back("--user-data-dir=" + profile);

  ChromeProcess process(options);
  process.Start(-1, nullptr);
  EXPECT_EQ(process.endpoint().ToString(), "ws://127.0.0.1:9333/devtools/browser/marker");
}

TEST_F(ChromeProcessTest, EarlyExitIsAProcessError) {
  ChromeProcess process(Options(test::WriteScript(scratch_.path(), "crash", "echo 'bad flag' >&2\nexit 3\n")));
  try {
    process.Start(5000, nullptr);
    FAIL() << "expected ProcessError";
  } catch (const ProcessError& e) {
    EXPECT_NE(std::string(e.what()).find("exit code 3"), std::string::npos);
  }
  EXPECT_FALSE(process.IsRunning());
}

TEST_F(ChromeProcessTest, MissingExecutableIsAProcessError) {
  ChromeProcess process(Options(scratch_.path() + "/does-not-exist"));
  EXPECT_THROW(process.Start(1000, nullptr), ProcessError);
}

TEST_F(ChromeProcessTest, SilentBrowserTimesOut) {
  ChromeProcess process(Options(test::WriteScript(scratch_.path(), "silent", "exec sleep 60\n")));
  try {
    process.Start(150, nullptr);
    FAIL() << "expected ProtocolTimeoutError";
  } catch (const ProtocolTimeoutError& e) {
    EXPECT_FALSE(e.countdown_expired());
    EXPECT_NE(std::string(e.what()).find("'150' milliseconds"), std::string::npos);
  }
  // The child was disposed on failure
  EXPECT_FALSE(process.IsRunning());
}

TEST_F(ChromeProcessTest, CountdownBoundsTheEndpointWait) {
  ChromeProcess process(Options(test::WriteScript(scratch_.path(), "silent", "exec sleep 60\n")));
  CountdownTimer timer(100);
  timer.Start();
  try {
    process.Start(-1, &timer);
    FAIL() << "expected ProtocolTimeoutError";
  } catch (const ProtocolTimeoutError& e) {
    EXPECT_TRUE(e.countdown_expired());
  }
}

TEST_F(ChromeProcessTest, MissingMarkerFileTimesOut) {
  std::string profile = scratch_.path() + "/empty-profile";
  ASSERT_EQ(mkdir(profile.c_str(), 0700), 0);

  ChromeProcessOptions options = Options(test::WriteScript(scratch_.path(), "silent", "exec sleep 60\n"));
  options.user_profile_dir = profile;

  ChromeProcess process(options);
  try {
    process.Start(100, nullptr);
    FAIL() << "expected ProtocolTimeoutError";
  } catch (const ProtocolTimeoutError& e) {
    EXPECT_NE(std::string(e.what()).find("did not exist"), std::string::npos);
  }
}

TEST_F(ChromeProcessTest, DisposeKillsProcessIgnoringSigterm) {
  std::string script = test::WriteScript(scratch_.path(), "stubborn",
      "trap '' TERM\n"
      "echo 'DevTools listening on ws://127.0.0.1:9222/devtools/browser/fake' >&2\n"
      "while true; do sleep 1; done\n");
  ChromeProcess process(Options(script));
  process.Start(5000, nullptr);
  pid_t pid = process.pid();

  process.Dispose();
  EXPECT_FALSE(process.IsRunning());
  EXPECT_NE(kill(pid, 0), 0);
  process.Dispose();
}

TEST_F(ChromeProcessTest, DetectsUnexpectedExit) {
  ChromeProcess process(Options(test::WriteFakeChrome(scratch_.path())));
  process.Start(5000, nullptr);
  ASSERT_EQ(kill(process.pid(), SIGKILL), 0);

  for (int i = 0; i < 100 && process.IsRunning(); ++i) {
    usleep(10000);
  }
  EXPECT_FALSE(process.IsRunning());
  EXPECT_EQ(process.ExitDescription(), "signal 9");
}

}  // namespace
}  // namespace ink
