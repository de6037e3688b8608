#include "manager/compilation.hpp"

#include <exception>

#include "absl/strings/str_cat.h"
#include "glog/logging.h"
#include "manager/stage.hpp"

namespace manager {

proto::Request Compilation::BuildRequest(
    const std::vector<std::string>& sources,
    const core::Workspace& workspace) const {
  proto::Request request;
  request.set_executable(ResolveBinary(options_.javac));
  request.add_arg(absl::StrCat("-J-Xmx", options_.javac_heap_mb, "m"));
  request.add_arg("-d");
  request.add_arg(workspace.BoxPath());
  request.add_arg("-encoding");
  request.add_arg("UTF-8");
  request.add_arg("-nowarn");
  request.add_arg("-g:none");
  for (const std::string& source : sources) request.add_arg(source);

  request.mutable_resource_limit()->set_wall_time(
      options_.compile_timeout_ms / 1000.0);
  request.mutable_resource_limit()->set_fsize(options_.max_file_size_kb);
  StripJvmEnvironment(&request);
  request.set_merge_stderr(true);
  request.set_output_limit(options_.max_output_kb * 1024);
  return request;
}

proto::StageResult Compilation::Compile(const std::vector<std::string>& sources,
                                        const core::Workspace& workspace) {
  proto::StageResult result;
  Stopwatch stopwatch;
  try {
    proto::Request request = BuildRequest(sources, workspace);
    LOG(INFO) << "Compiling " << sources.size() << " file(s) in "
              << workspace.Path();
    proto::Response response = executor_->Execute(request, workspace.Path());
    result.set_elapsed_millis(stopwatch.ElapsedMillis());

    std::string output = FilterJvmNoise(response.standard_output());
    if (response.output_truncated()) output += "\n[output truncated]";

    if (response.status() == proto::Status::TIME_LIMIT) {
      result.set_status(proto::StageResult::TIMED_OUT);
      result.set_success(false);
      result.set_output(absl::StrCat(
          output, output.empty() ? "" : "\n", "Compilation timed out after ",
          FormatSeconds(options_.compile_timeout_ms),
          " seconds.\nYour code might be too complex or contain an error."));
      return result;
    }
    bool success = response.status() == proto::Status::SUCCESS;
    if (success && output.empty()) output = "Compilation successful";
    if (response.status() == proto::Status::OUTPUT_LIMIT) {
      output += "\nOutput limit exceeded";
    }
    result.set_status(success ? proto::StageResult::OK
                              : proto::StageResult::FAILED);
    result.set_success(success);
    result.set_output(output);
  } catch (const std::exception& e) {
    LOG(ERROR) << "Compilation error: " << e.what();
    result.set_status(proto::StageResult::ERROR);
    result.set_success(false);
    result.set_output(absl::StrCat("Compilation error: ", e.what()));
    result.set_elapsed_millis(stopwatch.ElapsedMillis());
  }
  return result;
}

}  // namespace manager
