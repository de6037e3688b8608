#ifndef EXECUTOR_LOCAL_EXECUTOR_HPP
#define EXECUTOR_LOCAL_EXECUTOR_HPP

#include <string>
#include <vector>

#include "executor/executor.hpp"
#include "sandbox/sandbox.hpp"

namespace executor {

// Runs requests as local processes through the best available sandbox.
class LocalExecutor : public Executor {
 public:
  static const constexpr char* kBoxDir = "box";
  static const constexpr char* kStdoutFile = "stdout";
  static const constexpr char* kStderrFile = "stderr";

  std::string Id() const override { return "LOCAL"; }
  proto::Response Execute(const proto::Request& request,
                          const std::string& workspace_root) override;

  LocalExecutor() = default;
  ~LocalExecutor() override = default;
  LocalExecutor(const LocalExecutor&) = delete;
  LocalExecutor& operator=(const LocalExecutor&) = delete;
  LocalExecutor(LocalExecutor&&) = delete;
  LocalExecutor& operator=(LocalExecutor&&) = delete;

 private:
  // The current environment, minus the variables the request unsets.
  static std::vector<std::string> ChildEnvironment(
      const proto::Request& request);

  static void RetrieveOutput(const std::string& path, int64_t limit,
                             std::string* contents, bool* truncated);
};

}  // namespace executor

#endif
