#include "manager/pipeline.hpp"

#include <exception>
#include <vector>

#include "absl/memory/memory.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/types/optional.h"
#include "core/source_analyzer.hpp"
#include "core/workspace.hpp"
#include "executor/local_executor.hpp"
#include "glog/logging.h"
#include "manager/memory_probe.hpp"
#include "manager/stage.hpp"
#include "util/misc.hpp"

namespace manager {

namespace {
PipelineOptions WithDefaults(PipelineOptions options) {
  if (options.temp_directory.empty()) {
    options.temp_directory = util::SystemTempDirectory();
  }
  return options;
}

void Transition(Pipeline::State* state, Pipeline::State next,
                const std::string& fingerprint) {
  VLOG(1) << fingerprint.substr(0, 12) << ": " << StateName(*state) << " -> "
          << StateName(next);
  *state = next;
}
}  // namespace

const char* StateName(Pipeline::State state) {
  switch (state) {
    case Pipeline::State::RECEIVED:
      return "RECEIVED";
    case Pipeline::State::WORKSPACE_CREATED:
      return "WORKSPACE_CREATED";
    case Pipeline::State::CACHE_HIT:
      return "CACHE_HIT";
    case Pipeline::State::COMPILING:
      return "COMPILING";
    case Pipeline::State::COMPILE_DONE:
      return "COMPILE_DONE";
    case Pipeline::State::EXECUTING:
      return "EXECUTING";
    case Pipeline::State::DONE:
      return "DONE";
    case Pipeline::State::ERRORED:
      return "ERRORED";
  }
  return "UNKNOWN";
}

Pipeline::Pipeline(PipelineOptions options)
    : Pipeline(std::move(options),
               absl::make_unique<executor::LocalExecutor>()) {}

Pipeline::Pipeline(PipelineOptions options,
                   std::unique_ptr<executor::Executor> executor)
    : options_(WithDefaults(std::move(options))),
      executor_(std::move(executor)),
      workspaces_(options_.temp_directory),
      cache_(options_.cache_entries, options_.cache_size_mb << 20,
             options_.low_memory_mb * 1024),
      compilation_(executor_.get(), options_),
      execution_(executor_.get(), options_) {}

bool Pipeline::Validate(const std::string& source,
                        proto::SubmissionResult* result) {
  std::string error;
  absl::optional<std::string> entry_point;
  if (core::IsBlank(source)) {
    error = "Error: Source code cannot be empty";
  } else if (source.size() >
             static_cast<uint64_t>(options_.max_source_kb) * 1024) {
    error = absl::StrCat("Error: Source code exceeds maximum size of ",
                         options_.max_source_kb, " KB");
  } else if (!(entry_point = core::ExtractEntryPoint(source))) {
    error =
        "No class found: ensure your code contains a class declaration like "
        "'public class YourClassName {...}'";
  } else if (*entry_point == MemoryProbe::kClassName ||
             !core::IsValidRelativePath(*entry_point + ".java")) {
    error = absl::StrCat("Error: '", *entry_point,
                         "' cannot be used as a class name");
  }
  if (error.empty()) {
    result->set_entry_point(*entry_point);
    return true;
  }
  LOG(INFO) << "Rejected submission: " << error;
  result->set_status(proto::SubmissionStatus::INPUT_ERROR);
  result->set_compilation_output(error);
  result->set_compilation_success(false);
  result->set_execution_success(false);
  return false;
}

proto::SubmissionResult Pipeline::CompileAndRun(const std::string& source) {
  proto::SubmissionResult result;
  State state = State::RECEIVED;
  try {
    if (!Validate(source, &result)) return result;
    result.set_fingerprint(core::Fingerprint(source));
    LOG(INFO) << "Submission " << result.fingerprint().substr(0, 12)
              << " with entry point " << result.entry_point();
    Run(source, &result, &state);
  } catch (const std::exception& e) {
    LOG(ERROR) << "Server error: " << e.what();
    Transition(&state, State::ERRORED, result.fingerprint());
    result.set_status(proto::SubmissionStatus::INFRASTRUCTURE_ERROR);
    result.set_compilation_output(absl::StrCat("Server error: ", e.what()));
    result.set_compilation_success(false);
    result.set_execution_success(false);
  }
  return result;
}

void Pipeline::Run(const std::string& source, proto::SubmissionResult* result,
                   State* state) {
  const std::string& fingerprint = result->fingerprint();
  const std::string& entry_point = result->entry_point();
  core::Workspace workspace = workspaces_.Create();
  Transition(state, State::WORKSPACE_CREATED, fingerprint);

  proto::StageResult compile =
      Build(source, entry_point, fingerprint, &workspace, state);
  result->set_compilation_output(compile.output());
  result->set_compilation_success(compile.success());
  result->set_compilation_time_ms(compile.elapsed_millis());
  result->set_cached(compile.cached());

  if (!compile.success()) {
    result->set_execution_output("Compilation failed, execution skipped.");
    result->set_execution_success(false);
    switch (compile.status()) {
      case proto::StageResult::TIMED_OUT:
        result->set_status(proto::SubmissionStatus::COMPILE_TIMEOUT);
        break;
      case proto::StageResult::ERROR:
        result->set_status(proto::SubmissionStatus::INFRASTRUCTURE_ERROR);
        break;
      default:
        result->set_status(proto::SubmissionStatus::COMPILE_FAILURE);
    }
    Transition(state,
               compile.status() == proto::StageResult::ERROR ? State::ERRORED
                                                             : State::DONE,
               fingerprint);
    workspace.Destroy();
    return;
  }

  if (!core::HasRunnableEntryPoint(source)) {
    result->set_execution_output(absl::StrCat(
        "Class '", entry_point,
        "' compiled successfully, but no main method found.\n"
        "To run this code, add: public static void main(String[] args) "
        "{...}"));
    result->set_execution_success(true);
    result->set_status(proto::SubmissionStatus::OK);
    Transition(state, State::DONE, fingerprint);
    workspace.Destroy();
    return;
  }

  Transition(state, State::EXECUTING, fingerprint);
  proto::StageResult execute = execution_.Execute(entry_point, workspace);
  result->set_execution_output(execute.output());
  result->set_execution_success(execute.success());
  result->set_execution_time_ms(execute.elapsed_millis());
  result->set_peak_memory_bytes(execute.peak_memory_bytes());
  result->set_resident_memory_kb(execute.resident_memory_kb());
  switch (execute.status()) {
    case proto::StageResult::OK:
      result->set_status(proto::SubmissionStatus::OK);
      break;
    case proto::StageResult::TIMED_OUT:
      result->set_status(proto::SubmissionStatus::EXECUTE_TIMEOUT);
      break;
    case proto::StageResult::ERROR:
      result->set_status(proto::SubmissionStatus::INFRASTRUCTURE_ERROR);
      break;
    default:
      result->set_status(proto::SubmissionStatus::EXECUTE_FAILURE);
  }
  Transition(state,
             execute.status() == proto::StageResult::ERROR ? State::ERRORED
                                                           : State::DONE,
             fingerprint);
  workspace.Destroy();
}

proto::StageResult Pipeline::Build(const std::string& source,
                                   const std::string& entry_point,
                                   const std::string& fingerprint,
                                   core::Workspace* workspace, State* state) {
  Stopwatch stopwatch;
  proto::CompiledArtifact artifact;
  if (cache_.Get(fingerprint, &artifact) &&
      artifact.fingerprint() == fingerprint) {
    Transition(state, State::CACHE_HIT, fingerprint);
    for (const proto::ClassFile& class_file : artifact.class_file()) {
      workspace->WriteBytes(class_file.name(), class_file.contents());
    }
    proto::StageResult result;
    result.set_status(proto::StageResult::OK);
    result.set_success(true);
    result.set_cached(true);
    result.set_output("Compilation successful (cached)");
    result.set_elapsed_millis(stopwatch.ElapsedMillis());
    Transition(state, State::COMPILE_DONE, fingerprint);
    return result;
  }

  Transition(state, State::COMPILING, fingerprint);
  std::string source_file = absl::StrCat(entry_point, ".java");
  workspace->WriteText(source_file, source);
  std::vector<std::string> sources{source_file};
  if (options_.memory_probe) {
    MemoryProbe::WriteSource(workspace);
    sources.emplace_back(MemoryProbe::kSourceFile);
  }
  proto::StageResult result = compilation_.Compile(sources, *workspace);
  Transition(state, State::COMPILE_DONE, fingerprint);
  if (!result.success()) return result;

  artifact.Clear();
  artifact.set_fingerprint(fingerprint);
  for (const std::string& name : workspace->ListFiles()) {
    if (!absl::EndsWith(name, ".class")) continue;
    proto::ClassFile* class_file = artifact.add_class_file();
    class_file->set_name(name);
    class_file->set_contents(workspace->ReadBytes(name));
  }
  cache_.Put(fingerprint, artifact);
  VLOG(1) << "Cached " << artifact.class_file_size() << " class file(s), "
          << cache_.Hits() << " hits / " << cache_.Misses() << " misses";
  return result;
}

}  // namespace manager
