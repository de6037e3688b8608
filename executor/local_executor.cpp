#include "executor/local_executor.hpp"

#include <signal.h>
#include <unistd.h>

#include <algorithm>
#include <limits>
#include <memory>
#include <stdexcept>

#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "glog/logging.h"
#include "util/file.hpp"

extern char** environ;

namespace executor {

constexpr const char* LocalExecutor::kBoxDir;
constexpr const char* LocalExecutor::kStdoutFile;
constexpr const char* LocalExecutor::kStderrFile;

proto::Response LocalExecutor::Execute(const proto::Request& request,
                                       const std::string& workspace_root) {
  sandbox::ExecutionInfo result;
  std::string sandbox_dir = util::File::JoinPath(workspace_root, kBoxDir);
  util::File::MakeDirs(sandbox_dir);

  // Folder and arguments.
  sandbox::ExecutionOptions exec_options(sandbox_dir, request.executable());
  for (const std::string& arg : request.arg()) {
    exec_options.args.push_back(arg);
  }
  exec_options.env = ChildEnvironment(request);

  // Limits.
  const proto::Resources& limits = request.resource_limit();
  exec_options.cpu_limit_millis = limits.cpu_time() * 1000;
  exec_options.wall_limit_millis = limits.wall_time() * 1000;
  exec_options.memory_limit_kb = limits.memory();
  exec_options.max_files = limits.nfiles();
  exec_options.max_procs = limits.processes();
  exec_options.max_file_size_kb = limits.fsize();
  exec_options.max_stack_kb = limits.stack();

  // Stdout/err files, outside of the box.
  std::string stdout_file = util::File::JoinPath(workspace_root, kStdoutFile);
  std::string stderr_file = util::File::JoinPath(workspace_root, kStderrFile);
  exec_options.stdout_file = stdout_file;
  exec_options.stderr_file = stderr_file;
  exec_options.redirect_stderr_to_stdout = request.merge_stderr();

  std::string error_msg;
  std::unique_ptr<sandbox::Sandbox> sb = sandbox::Sandbox::Create();
  if (!sb) throw std::runtime_error("No sandbox available");

  VLOG(1) << "Running " << request.executable() << " in " << sandbox_dir;
  if (!sb->Execute(exec_options, &result, &error_msg)) {
    throw std::runtime_error(error_msg);
  }

  proto::Response response;

  // Resource usage.
  response.mutable_resource_usage()->set_cpu_time(result.cpu_time_millis /
                                                  1000.0);
  response.mutable_resource_usage()->set_sys_time(result.sys_time_millis /
                                                  1000.0);
  response.mutable_resource_usage()->set_wall_time(result.wall_time_millis /
                                                   1000.0);
  response.mutable_resource_usage()->set_memory(result.memory_usage_kb);

  // Termination status.
  response.set_status_code(result.status_code);
  response.set_signal(result.signal);
  if (result.wall_limit_exceeded) {
    response.set_status(proto::Status::TIME_LIMIT);
    response.set_error_message("Wall limit exceeded");
  } else if (limits.memory() &&
             response.resource_usage().memory() >= limits.memory()) {
    response.set_status(proto::Status::MEMORY_LIMIT);
    response.set_error_message("Memory limit exceeded");
  } else if (response.signal() == SIGXCPU ||
             (limits.cpu_time() &&
              response.resource_usage().sys_time() +
                      response.resource_usage().cpu_time() >=
                  limits.cpu_time())) {
    response.set_status(proto::Status::TIME_LIMIT);
    response.set_error_message("CPU limit exceeded");
  } else if (response.signal() == SIGXFSZ) {
    response.set_status(proto::Status::OUTPUT_LIMIT);
    response.set_error_message("Output limit exceeded");
  } else if (response.signal()) {
    response.set_status(proto::Status::SIGNAL);
    response.set_error_message(
        absl::StrCat("Killed by signal ", response.signal()));
  } else if (response.status_code()) {
    response.set_status(proto::Status::NONZERO);
    response.set_error_message(
        absl::StrCat("Exited with status ", response.status_code()));
  } else {
    response.set_status(proto::Status::SUCCESS);
  }

  // Output files.
  bool stdout_truncated = false;
  bool stderr_truncated = false;
  RetrieveOutput(stdout_file, request.output_limit(),
                 response.mutable_standard_output(), &stdout_truncated);
  if (!request.merge_stderr()) {
    RetrieveOutput(stderr_file, request.output_limit(),
                   response.mutable_standard_error(), &stderr_truncated);
  }
  response.set_output_truncated(stdout_truncated || stderr_truncated);
  return response;
}

std::vector<std::string> LocalExecutor::ChildEnvironment(
    const proto::Request& request) {
  std::vector<std::string> env;
  for (char** var = environ; var != nullptr && *var != nullptr; var++) {
    std::string entry = *var;
    bool removed = std::any_of(
        request.unset_env().begin(), request.unset_env().end(),
        [&entry](const std::string& name) {
          return absl::StartsWith(entry, absl::StrCat(name, "="));
        });
    if (!removed) env.push_back(std::move(entry));
  }
  return env;
}

void LocalExecutor::RetrieveOutput(const std::string& path, int64_t limit,
                                   std::string* contents, bool* truncated) {
  // A program killed before opening its output leaves no file behind.
  if (!util::File::Exists(path)) return;
  uint64_t max_bytes = limit > 0 ? static_cast<uint64_t>(limit)
                                 : std::numeric_limits<uint64_t>::max();
  *contents = util::File::Read(path, max_bytes, truncated);
}

}  // namespace executor
