#ifndef SANDBOX_SANDBOX_HPP
#define SANDBOX_SANDBOX_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace sandbox {

// Settings to execute the program in the sandbox.
struct ExecutionOptions {
  // Optional values, 0 means no limit.
  int64_t cpu_limit_millis = 0;
  int64_t wall_limit_millis = 0;
  int64_t memory_limit_kb = 0;
  int32_t max_procs = 0;
  int32_t max_files = 0;
  int64_t max_file_size_kb = 0;
  int64_t max_stack_kb = 0;

  // An empty stdin_file means /dev/null. Empty stdout/stderr files leave the
  // stream untouched.
  std::string stdin_file = "";
  std::string stdout_file = "";
  std::string stderr_file = "";
  bool redirect_stderr_to_stdout = false;
  std::vector<std::string> args;

  // Complete environment of the child, as NAME=value entries.
  std::vector<std::string> env;

  // Required values
  std::string root = "";
  std::string executable = "";
  ExecutionOptions(std::string root, std::string executable)
      : root(std::move(root)), executable(std::move(executable)) {}
};

// Results of the execution.
struct ExecutionInfo {
  int64_t cpu_time_millis = 0;
  int64_t sys_time_millis = 0;
  int64_t wall_time_millis = 0;
  int64_t memory_usage_kb = 0;
  int32_t status_code = 0;
  int32_t signal = 0;
  bool wall_limit_exceeded = false;
};

// Runs a single program with the given limits. Instances are obtained from
// Create and are not thread safe; each thread needs its own.
class Sandbox {
 public:
  // Returns a sandbox usable on this machine, or nullptr if the host lacks
  // what the sandbox needs (for instance a mounted /proc).
  static std::unique_ptr<Sandbox> Create();

  // Runs the program described by options. Returns true if the program was
  // started and fills info, otherwise returns false and sets error_msg.
  virtual bool Execute(const ExecutionOptions& options, ExecutionInfo* info,
                       std::string* error_msg) = 0;

  virtual ~Sandbox() = default;
  Sandbox() = default;
  Sandbox(const Sandbox&) = delete;
  Sandbox& operator=(const Sandbox&) = delete;
};

}  // namespace sandbox

#endif
