#ifndef MANAGER_COMPILATION_HPP
#define MANAGER_COMPILATION_HPP

#include <string>
#include <vector>

#include "core/workspace.hpp"
#include "executor/executor.hpp"
#include "manager/options.hpp"
#include "proto/submission.pb.h"

namespace manager {

// Runs javac on source files inside a workspace box, writing the classes in
// the box itself.
class Compilation {
 public:
  Compilation(executor::Executor* executor, const PipelineOptions& options)
      : executor_(executor), options_(options) {}

  // Compiles the given sources, relative to the box. Never throws: failures
  // to start the compiler are reported as an ERROR result.
  proto::StageResult Compile(const std::vector<std::string>& sources,
                             const core::Workspace& workspace);

 private:
  proto::Request BuildRequest(const std::vector<std::string>& sources,
                              const core::Workspace& workspace) const;

  executor::Executor* executor_;
  const PipelineOptions& options_;
};

}  // namespace manager

#endif
