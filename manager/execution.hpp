#ifndef MANAGER_EXECUTION_HPP
#define MANAGER_EXECUTION_HPP

#include <string>

#include "core/workspace.hpp"
#include "executor/executor.hpp"
#include "manager/options.hpp"
#include "proto/submission.pb.h"

namespace manager {

// Runs a compiled class with the JVM inside a workspace box, under heap,
// stack, metaspace and wall time ceilings.
class Execution {
 public:
  Execution(executor::Executor* executor, const PipelineOptions& options)
      : executor_(executor), options_(options) {}

  // Runs the main method of entry_point. Never throws: failures to start the
  // runtime are reported as an ERROR result.
  proto::StageResult Execute(const std::string& entry_point,
                             const core::Workspace& workspace);

 private:
  proto::Request BuildRequest(const std::string& entry_point,
                              const core::Workspace& workspace) const;

  executor::Executor* executor_;
  const PipelineOptions& options_;
};

}  // namespace manager

#endif
