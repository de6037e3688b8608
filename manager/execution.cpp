#include "manager/execution.hpp"

#include <exception>

#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "glog/logging.h"
#include "manager/memory_probe.hpp"
#include "manager/stage.hpp"

namespace manager {

namespace {
// Joins the captured streams, keeping stderr visibly apart from stdout.
std::string CombineOutput(const proto::Response& response) {
  std::string out(absl::StripAsciiWhitespace(
      FilterJvmNoise(response.standard_output())));
  std::string err(absl::StripAsciiWhitespace(
      FilterJvmNoise(response.standard_error())));
  if (err.empty()) return out;
  if (out.empty()) return absl::StrCat("--- stderr ---\n", err);
  return absl::StrCat(out, "\n--- stderr ---\n", err);
}
}  // namespace

proto::Request Execution::BuildRequest(const std::string& entry_point,
                                       const core::Workspace& workspace) const {
  proto::Request request;
  request.set_executable(ResolveBinary(options_.java));
  request.add_arg("-Xms8m");
  request.add_arg(absl::StrCat("-Xmx", options_.max_heap_mb, "m"));
  request.add_arg(absl::StrCat("-Xss", options_.max_stack_kb, "k"));
  request.add_arg(
      absl::StrCat("-XX:MaxMetaspaceSize=", options_.max_metaspace_mb, "m"));
  request.add_arg("-XX:+UseSerialGC");
  request.add_arg("-XX:TieredStopAtLevel=1");
  request.add_arg("-XX:-UsePerfData");
  request.add_arg("-XX:+DisableAttachMechanism");
  request.add_arg("-Djava.awt.headless=true");
  if (options_.memory_probe) {
    request.add_arg(absl::StrCat("-D", MemoryProbe::kIntervalProperty, "=",
                                 options_.memory_probe_interval_ms));
  }
  request.add_arg("-cp");
  request.add_arg(workspace.BoxPath());
  if (options_.memory_probe) request.add_arg(MemoryProbe::kClassName);
  request.add_arg(entry_point);

  // No address space or process limits: the JVM reserves much more virtual
  // memory than it uses and starts several threads. -Xmx bounds the heap.
  request.mutable_resource_limit()->set_wall_time(
      options_.execution_timeout_ms / 1000.0);
  request.mutable_resource_limit()->set_fsize(options_.max_file_size_kb);
  StripJvmEnvironment(&request);
  request.set_output_limit(options_.max_output_kb * 1024);
  return request;
}

proto::StageResult Execution::Execute(const std::string& entry_point,
                                      const core::Workspace& workspace) {
  proto::StageResult result;
  Stopwatch stopwatch;
  try {
    proto::Request request = BuildRequest(entry_point, workspace);
    LOG(INFO) << "Executing " << entry_point << " in " << workspace.Path();
    proto::Response response = executor_->Execute(request, workspace.Path());
    result.set_elapsed_millis(stopwatch.ElapsedMillis());
    result.set_resident_memory_kb(response.resource_usage().memory());
    result.set_peak_memory_bytes(
        options_.memory_probe
            ? MemoryProbe::ReadPeak(workspace,
                                    int64_t{options_.max_heap_mb} << 20)
            : MemoryProbe::kPlaceholderBytes);

    std::string output = CombineOutput(response);
    if (response.output_truncated()) output += "\n[output truncated]";

    if (response.status() == proto::Status::TIME_LIMIT) {
      result.set_status(proto::StageResult::TIMED_OUT);
      result.set_success(false);
      result.set_output(absl::StrCat(
          output, output.empty() ? "" : "\n", "Execution timed out after ",
          FormatSeconds(options_.execution_timeout_ms),
          " seconds.\nCheck for infinite loops or optimize your code."));
      return result;
    }

    bool success = response.status() == proto::Status::SUCCESS;
    if (success && output.empty()) {
      output = "Program executed successfully with no output.";
    }
    std::string trailer;
    if (response.status() == proto::Status::OUTPUT_LIMIT) {
      trailer = "Output limit exceeded";
    } else if (response.signal() != 0) {
      trailer = absl::StrCat("Process killed by signal ", response.signal());
    } else if (response.status_code() != 0) {
      trailer = absl::StrCat("Process exited with code ",
                             response.status_code());
    }
    if (!trailer.empty()) {
      output = output.empty() ? trailer : absl::StrCat(output, "\n", trailer);
    }
    result.set_status(success ? proto::StageResult::OK
                              : proto::StageResult::FAILED);
    result.set_success(success);
    result.set_output(output);
  } catch (const std::exception& e) {
    LOG(ERROR) << "Execution error: " << e.what();
    result.set_status(proto::StageResult::ERROR);
    result.set_success(false);
    result.set_output(absl::StrCat("Execution error: ", e.what()));
    result.set_elapsed_millis(stopwatch.ElapsedMillis());
    result.set_peak_memory_bytes(MemoryProbe::kPlaceholderBytes);
  }
  return result;
}

}  // namespace manager
