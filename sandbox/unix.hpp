#ifndef SANDBOX_UNIX_HPP
#define SANDBOX_UNIX_HPP

#include <vector>

#include "sandbox/sandbox.hpp"

namespace sandbox {

// Sandbox for UNIX-like systems, based on fork, setrlimit and process groups.
class Unix : public Sandbox {
 public:
  bool Execute(const ExecutionOptions& options, ExecutionInfo* info,
               std::string* error_msg) override;

 private:
  // Executed before creating the child process. Returns false and sets
  // error_msg if setup fails.
  bool Setup(std::string* error_msg);

  // Creates a child process and saves its PID in child_pid_. The child process
  // executes Child and does not return.
  bool DoFork(std::string* error_msg);

  // Function that is executed in the child process. Must not allocate.
  [[noreturn]] void Child();

  // Waits for the termination of the child, killing its process group if it
  // exceeds the wall time or memory limits.
  bool Wait(ExecutionInfo* info, std::string* error_msg);

  int pipe_fds_[2] = {-1, -1};
  int child_pid_ = 0;
  const ExecutionOptions* options_ = nullptr;

  // Null-terminated argv and envp, built before forking.
  std::vector<std::vector<char>> arg_storage_;
  std::vector<std::vector<char>> env_storage_;
  std::vector<char*> args_;
  std::vector<char*> env_;
};

}  // namespace sandbox
#endif
