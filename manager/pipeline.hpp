#ifndef MANAGER_PIPELINE_HPP
#define MANAGER_PIPELINE_HPP

#include <memory>
#include <string>

#include "core/artifact_cache.hpp"
#include "core/workspace.hpp"
#include "executor/executor.hpp"
#include "manager/compilation.hpp"
#include "manager/execution.hpp"
#include "manager/options.hpp"
#include "proto/submission.pb.h"

namespace manager {

// Compiles and runs a single-file Java submission in a fresh workspace,
// reusing compiled classes of previously seen sources. Safe to call from
// multiple threads.
class Pipeline {
 public:
  enum class State {
    RECEIVED,
    WORKSPACE_CREATED,
    CACHE_HIT,
    COMPILING,
    COMPILE_DONE,
    EXECUTING,
    DONE,
    ERRORED
  };

  // Uses a LocalExecutor.
  explicit Pipeline(PipelineOptions options);
  Pipeline(PipelineOptions options,
           std::unique_ptr<executor::Executor> executor);

  // Never throws: every failure is reported in the returned result.
  proto::SubmissionResult CompileAndRun(const std::string& source);

  const PipelineOptions& Options() const { return options_; }
  core::ArtifactCache* Cache() { return &cache_; }

  Pipeline(const Pipeline&) = delete;
  Pipeline& operator=(const Pipeline&) = delete;
  Pipeline(Pipeline&&) = delete;
  Pipeline& operator=(Pipeline&&) = delete;

 private:
  // Fails fast on inputs that need no subprocess. Returns false and fills
  // result if the source is rejected.
  bool Validate(const std::string& source, proto::SubmissionResult* result);

  // Fills the box with compiled classes, from the cache or from javac.
  proto::StageResult Build(const std::string& source,
                           const std::string& entry_point,
                           const std::string& fingerprint,
                           core::Workspace* workspace, State* state);

  void Run(const std::string& source, proto::SubmissionResult* result,
           State* state);

  PipelineOptions options_;
  std::unique_ptr<executor::Executor> executor_;
  core::WorkspaceManager workspaces_;
  core::ArtifactCache cache_;
  Compilation compilation_;
  Execution execution_;
};

const char* StateName(Pipeline::State state);

}  // namespace manager

#endif
