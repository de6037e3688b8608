#include "executor/local_executor.hpp"

#include <stdlib.h>

#include <stdexcept>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/file.hpp"

namespace {

using ::testing::StartsWith;

class LocalExecutorTest : public ::testing::Test {
 protected:
  LocalExecutorTest() : tmp_("/tmp", "executor-test-") {}

  proto::Request Shell(const std::string& script) {
    proto::Request request;
    request.set_executable("/bin/sh");
    request.add_arg("-c");
    request.add_arg(script);
    request.mutable_resource_limit()->set_wall_time(5);
    return request;
  }

  util::TempDir tmp_;
  executor::LocalExecutor executor_;
};

TEST_F(LocalExecutorTest, Echo) {
  proto::Response response =
      executor_.Execute(Shell("echo hello; echo oops >&2"), tmp_.Path());
  EXPECT_EQ(response.status(), proto::Status::SUCCESS);
  EXPECT_EQ(response.standard_output(), "hello\n");
  EXPECT_EQ(response.standard_error(), "oops\n");
  EXPECT_FALSE(response.output_truncated());
  EXPECT_TRUE(util::File::Exists(util::File::JoinPath(tmp_.Path(), "box")));
}

TEST_F(LocalExecutorTest, RunsInBox) {
  proto::Request request = Shell("echo data > created.txt");
  proto::Response response = executor_.Execute(request, tmp_.Path());
  EXPECT_EQ(response.status(), proto::Status::SUCCESS);
  EXPECT_EQ(util::File::Read(
                util::File::JoinPath(tmp_.Path(), "box/created.txt")),
            "data\n");
}

TEST_F(LocalExecutorTest, MergedStderr) {
  proto::Request request = Shell("echo a; echo b >&2");
  request.set_merge_stderr(true);
  proto::Response response = executor_.Execute(request, tmp_.Path());
  EXPECT_EQ(response.standard_output(), "a\nb\n");
  EXPECT_EQ(response.standard_error(), "");
}

TEST_F(LocalExecutorTest, NonZero) {
  proto::Response response = executor_.Execute(Shell("exit 3"), tmp_.Path());
  EXPECT_EQ(response.status(), proto::Status::NONZERO);
  EXPECT_EQ(response.status_code(), 3);
}

TEST_F(LocalExecutorTest, Signal) {
  proto::Response response =
      executor_.Execute(Shell("kill -15 $$"), tmp_.Path());
  EXPECT_EQ(response.status(), proto::Status::SIGNAL);
  EXPECT_EQ(response.signal(), 15);
}

TEST_F(LocalExecutorTest, Truncation) {
  proto::Request request = Shell("head -c 5000 /dev/zero | tr '\\0' x");
  request.set_output_limit(100);
  proto::Response response = executor_.Execute(request, tmp_.Path());
  EXPECT_EQ(response.status(), proto::Status::SUCCESS);
  EXPECT_EQ(response.standard_output(), std::string(100, 'x'));
  EXPECT_TRUE(response.output_truncated());
}

TEST_F(LocalExecutorTest, Timeout) {
  proto::Request request = Shell("sleep 10");
  request.mutable_resource_limit()->set_wall_time(0.2);
  proto::Response response = executor_.Execute(request, tmp_.Path());
  EXPECT_EQ(response.status(), proto::Status::TIME_LIMIT);
  EXPECT_LT(response.resource_usage().wall_time(), 5);
}

TEST_F(LocalExecutorTest, FileSizeLimit) {
  proto::Request request = Shell("exec head -c 100000 /dev/zero");
  request.mutable_resource_limit()->set_fsize(8);
  proto::Response response = executor_.Execute(request, tmp_.Path());
  EXPECT_EQ(response.status(), proto::Status::OUTPUT_LIMIT);
}

TEST_F(LocalExecutorTest, EnvironmentStripped) {
  setenv("RUNBOX_TEST_SECRET", "hidden", 1);
  setenv("RUNBOX_TEST_KEPT", "visible", 1);
  proto::Request request =
      Shell("echo \"[$RUNBOX_TEST_SECRET][$RUNBOX_TEST_KEPT]\"");
  request.add_unset_env("RUNBOX_TEST_SECRET");
  proto::Response response = executor_.Execute(request, tmp_.Path());
  EXPECT_EQ(response.standard_output(), "[][visible]\n");
  unsetenv("RUNBOX_TEST_SECRET");
  unsetenv("RUNBOX_TEST_KEPT");
}

TEST_F(LocalExecutorTest, MissingBinaryThrows) {
  proto::Request request;
  request.set_executable("/no/such/binary");
  try {
    executor_.Execute(request, tmp_.Path());
    FAIL() << "Expected std::runtime_error";
  } catch (const std::runtime_error& e) {
    EXPECT_THAT(e.what(), StartsWith("exec:"));
  }
}

}  // namespace
