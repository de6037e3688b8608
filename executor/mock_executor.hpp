#ifndef EXECUTOR_MOCK_EXECUTOR_HPP
#define EXECUTOR_MOCK_EXECUTOR_HPP

#include <string>

#include "executor/executor.hpp"
#include "gmock/gmock.h"

namespace executor {

class MockExecutor : public Executor {
 public:
  MOCK_CONST_METHOD0(Id, std::string());
  MOCK_METHOD2(Execute, proto::Response(const proto::Request& request,
                                        const std::string& workspace_root));
};

MATCHER_P(RunsBinary, path, "runs " + std::string(path)) {
  return arg.executable() == path;
}

}  // namespace executor

#endif
