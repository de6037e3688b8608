#ifndef EXECUTOR_EXECUTOR_HPP
#define EXECUTOR_EXECUTOR_HPP

#include <string>

#include "proto/request.pb.h"
#include "proto/response.pb.h"

namespace executor {

class Executor {
 public:
  // A string that identifies this executor.
  virtual std::string Id() const = 0;

  // Executes a request inside the given workspace and returns the response.
  // The process runs in workspace_root/box; captured streams are kept in
  // workspace_root. Throws std::runtime_error if the process could not be
  // started.
  virtual proto::Response Execute(const proto::Request& request,
                                  const std::string& workspace_root) = 0;

  Executor() = default;
  virtual ~Executor() = default;
  Executor(const Executor&) = delete;
  Executor& operator=(const Executor&) = delete;
  Executor(Executor&&) = delete;
  Executor& operator=(Executor&&) = delete;
};

}  // namespace executor

#endif
