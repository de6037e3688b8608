#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "sandbox/sandbox.hpp"
#include "util/file.hpp"

#include <limits.h>
#include <signal.h>
#include <stdlib.h>

#include <chrono>
#include <memory>
#include <thread>

namespace {

using ::testing::StartsWith;

using namespace sandbox;

class UnixTest : public ::testing::Test {
 protected:
  UnixTest() : tmp_("/tmp", "sandbox-test-") {}

  void SetUp() override {
    sandbox_ = Sandbox::Create();
    ASSERT_TRUE(sandbox_);
  }

  ExecutionOptions Shell(const std::string& script) {
    ExecutionOptions options(tmp_.Path(), "/bin/sh");
    options.args = {"-c", script};
    options.env = {"PATH=/usr/bin:/bin"};
    options.stdout_file = util::File::JoinPath(tmp_.Path(), "stdout");
    options.stderr_file = util::File::JoinPath(tmp_.Path(), "stderr");
    return options;
  }

  std::string Stdout() {
    return util::File::Read(util::File::JoinPath(tmp_.Path(), "stdout"));
  }
  std::string Stderr() {
    return util::File::Read(util::File::JoinPath(tmp_.Path(), "stderr"));
  }

  util::TempDir tmp_;
  std::unique_ptr<Sandbox> sandbox_;
};

// True if the process exists and is not a zombie.
bool IsRunning(const std::string& pid) {
  std::string stat;
  try {
    stat = util::File::Read("/proc/" + pid + "/stat");
  } catch (const std::system_error& e) {
    return false;
  }
  size_t pos = stat.rfind(')');
  return pos != std::string::npos && pos + 2 < stat.size() &&
         stat[pos + 2] != 'Z';
}

TEST_F(UnixTest, TestNoDir) {
  ExecutionOptions options("/no/such/dir", "/bin/sh");
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_FALSE(sandbox_->Execute(options, &info, &error_msg));
  EXPECT_THAT(error_msg, StartsWith("chdir:"));
}

TEST_F(UnixTest, TestNoFile) {
  ExecutionOptions options(tmp_.Path(), "/no/such/binary");
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_FALSE(sandbox_->Execute(options, &info, &error_msg));
  EXPECT_THAT(error_msg, StartsWith("exec:"));
}

TEST_F(UnixTest, TestExitCode) {
  ExecutionOptions options = Shell("exit 15");
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox_->Execute(options, &info, &error_msg));
  EXPECT_EQ(error_msg, "");
  EXPECT_EQ(info.status_code, 15);
  EXPECT_EQ(info.signal, 0);
  EXPECT_FALSE(info.wall_limit_exceeded);
}

TEST_F(UnixTest, TestSignal) {
  ExecutionOptions options = Shell("kill -6 $$");
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox_->Execute(options, &info, &error_msg));
  EXPECT_EQ(error_msg, "");
  EXPECT_EQ(info.signal, 6);
  EXPECT_EQ(info.status_code, 0);
}

TEST_F(UnixTest, TestOutputRedirection) {
  ExecutionOptions options = Shell("echo out; echo err >&2");
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox_->Execute(options, &info, &error_msg));
  EXPECT_EQ(Stdout(), "out\n");
  EXPECT_EQ(Stderr(), "err\n");
}

TEST_F(UnixTest, TestMergedStderr) {
  ExecutionOptions options = Shell("echo out; echo err >&2; echo out2");
  options.redirect_stderr_to_stdout = true;
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox_->Execute(options, &info, &error_msg));
  EXPECT_EQ(Stdout(), "out\nerr\nout2\n");
  EXPECT_FALSE(util::File::Exists(options.stderr_file));
}

TEST_F(UnixTest, TestStdinIsDevNull) {
  ExecutionOptions options = Shell("cat; echo done");
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox_->Execute(options, &info, &error_msg));
  EXPECT_EQ(Stdout(), "done\n");
}

TEST_F(UnixTest, TestEnvironmentReplaced) {
  ExecutionOptions options = Shell("echo \"$FOO|$HOME\"");
  options.env.push_back("FOO=bar");
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox_->Execute(options, &info, &error_msg));
  EXPECT_EQ(Stdout(), "bar|\n");
}

TEST_F(UnixTest, TestWorkingDirectory) {
  ExecutionOptions options = Shell("pwd -P");
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox_->Execute(options, &info, &error_msg));
  char real[PATH_MAX] = {};
  ASSERT_NE(realpath(tmp_.Path().c_str(), real), nullptr);
  EXPECT_EQ(Stdout(), std::string(real) + "\n");
}

TEST_F(UnixTest, TestWallLimitOk) {
  ExecutionOptions options = Shell("sleep 0.1");
  options.wall_limit_millis = 2000;
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox_->Execute(options, &info, &error_msg));
  EXPECT_EQ(error_msg, "");
  EXPECT_EQ(info.signal, 0);
  EXPECT_EQ(info.status_code, 0);
  EXPECT_FALSE(info.wall_limit_exceeded);
  EXPECT_GE(info.wall_time_millis, 90);
}

TEST_F(UnixTest, TestWallLimitNotOk) {
  ExecutionOptions options = Shell("sleep 5");
  options.wall_limit_millis = 200;
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox_->Execute(options, &info, &error_msg));
  EXPECT_EQ(error_msg, "");
  EXPECT_TRUE(info.wall_limit_exceeded);
  EXPECT_EQ(info.signal, SIGKILL);
  EXPECT_GE(info.wall_time_millis, 200);
  EXPECT_LE(info.wall_time_millis, 2000);
}

TEST_F(UnixTest, TestProcessGroupKilled) {
  ExecutionOptions options = Shell("sleep 30 & echo $! > bg.pid; wait");
  options.wall_limit_millis = 300;
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox_->Execute(options, &info, &error_msg));
  EXPECT_TRUE(info.wall_limit_exceeded);
  std::string pid =
      util::File::Read(util::File::JoinPath(tmp_.Path(), "bg.pid"));
  pid = pid.substr(0, pid.find('\n'));
  ASSERT_FALSE(pid.empty());
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  EXPECT_FALSE(IsRunning(pid));
}

TEST_F(UnixTest, TestFileSizeLimit) {
  ExecutionOptions options = Shell("exec head -c 100000 /dev/zero");
  options.max_file_size_kb = 10;
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox_->Execute(options, &info, &error_msg));
  EXPECT_EQ(info.signal, SIGXFSZ);
  EXPECT_LE(util::File::Size(options.stdout_file), 10 * 1024);
}

TEST_F(UnixTest, TestMemoryUsage) {
  ExecutionOptions options = Shell("sleep 0.1");
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox_->Execute(options, &info, &error_msg));
  EXPECT_GT(info.memory_usage_kb, 0);
}

}  // namespace
