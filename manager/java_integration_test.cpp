#include <memory>
#include <string>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "manager/pipeline.hpp"
#include "util/file.hpp"
#include "util/which.hpp"

namespace {

using ::testing::HasSubstr;
using ::testing::StartsWith;

// Runs real programs through javac and java.
class JavaIntegrationTest : public ::testing::Test {
 protected:
  JavaIntegrationTest() : base_("/tmp", "java-test-") {}

  void SetUp() override {
    if (util::which("javac").empty() || util::which("java").empty()) {
      GTEST_SKIP() << "No JDK in PATH";
    }
    manager::PipelineOptions options;
    options.temp_directory = base_.Path();
    options.compile_timeout_ms = 60000;
    options.execution_timeout_ms = 3000;
    pipeline_.reset(new manager::Pipeline(options));
  }

  util::TempDir base_;
  std::unique_ptr<manager::Pipeline> pipeline_;
};

TEST_F(JavaIntegrationTest, HelloWorld) {
  const char* source =
      "public class Hello {\n"
      "  public static void main(String[] args) {\n"
      "    System.out.println(\"Hello World\");\n"
      "  }\n"
      "}\n";
  proto::SubmissionResult first = pipeline_->CompileAndRun(source);
  EXPECT_TRUE(first.compilation_success()) << first.compilation_output();
  EXPECT_TRUE(first.execution_success()) << first.execution_output();
  EXPECT_EQ(first.execution_output(), "Hello World");
  EXPECT_GT(first.peak_memory_bytes(), 0);
  EXPECT_GT(first.resident_memory_kb(), 0);

  proto::SubmissionResult second = pipeline_->CompileAndRun(source);
  EXPECT_TRUE(second.cached());
  EXPECT_EQ(second.execution_output(), "Hello World");
  EXPECT_TRUE(util::File::ListFiles(base_.Path()).empty());
}

TEST_F(JavaIntegrationTest, SyntaxError) {
  proto::SubmissionResult result =
      pipeline_->CompileAndRun("public class Broken { int x }\n");
  EXPECT_FALSE(result.compilation_success());
  EXPECT_THAT(result.compilation_output(), HasSubstr("error"));
  EXPECT_EQ(result.execution_output(), "Compilation failed, execution skipped.");
}

TEST_F(JavaIntegrationTest, InfiniteLoop) {
  proto::SubmissionResult result = pipeline_->CompileAndRun(
      "public class Spin {\n"
      "  public static void main(String[] args) { while (true) {} }\n"
      "}\n");
  EXPECT_TRUE(result.compilation_success());
  EXPECT_FALSE(result.execution_success());
  EXPECT_THAT(result.execution_output(),
              HasSubstr("Execution timed out after 3 seconds."));
  EXPECT_EQ(result.status(), proto::SubmissionStatus::EXECUTE_TIMEOUT);
  EXPECT_LT(result.execution_time_ms(), 10000);
}

TEST_F(JavaIntegrationTest, PathologicalAllocation) {
  proto::SubmissionResult result = pipeline_->CompileAndRun(
      "import java.util.*;\n"
      "public class Hog {\n"
      "  public static void main(String[] args) {\n"
      "    List<long[]> hog = new ArrayList<>();\n"
      "    while (true) hog.add(new long[1 << 20]);\n"
      "  }\n"
      "}\n");
  EXPECT_TRUE(result.compilation_success());
  EXPECT_FALSE(result.execution_success());
  EXPECT_THAT(result.execution_output(), HasSubstr("OutOfMemoryError"));

  // The pipeline keeps working afterwards.
  proto::SubmissionResult next = pipeline_->CompileAndRun(
      "public class Ok { public static void main(String[] a) {"
      " System.out.print(42); } }\n");
  EXPECT_EQ(next.execution_output(), "42");
}

TEST_F(JavaIntegrationTest, UncaughtExceptionThroughProbe) {
  proto::SubmissionResult result = pipeline_->CompileAndRun(
      "public class Boom {\n"
      "  public static void main(String[] args) {\n"
      "    System.out.println(\"before\");\n"
      "    throw new IllegalStateException(\"boom\");\n"
      "  }\n"
      "}\n");
  EXPECT_FALSE(result.execution_success());
  EXPECT_THAT(result.execution_output(), StartsWith("before\n--- stderr ---"));
  EXPECT_THAT(result.execution_output(),
              HasSubstr("java.lang.IllegalStateException: boom"));
  EXPECT_THAT(result.execution_output(),
              HasSubstr("Process exited with code 1"));
}

TEST_F(JavaIntegrationTest, SystemExit) {
  proto::SubmissionResult result = pipeline_->CompileAndRun(
      "public class Quit {\n"
      "  public static void main(String[] args) { System.exit(3); }\n"
      "}\n");
  EXPECT_FALSE(result.execution_success());
  EXPECT_EQ(result.execution_output(), "Process exited with code 3");
  EXPECT_GT(result.peak_memory_bytes(), 0);
}

TEST_F(JavaIntegrationTest, NoMain) {
  proto::SubmissionResult result = pipeline_->CompileAndRun(
      "public class Lib { static int f() { return 1; } }\n");
  EXPECT_TRUE(result.compilation_success());
  EXPECT_TRUE(result.execution_success());
  EXPECT_THAT(result.execution_output(), HasSubstr("no main method found"));
}

}  // namespace
