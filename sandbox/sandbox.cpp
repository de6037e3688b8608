#include "sandbox/sandbox.hpp"

#include <unistd.h>

#include "absl/memory/memory.h"
#include "glog/logging.h"
#include "sandbox/unix.hpp"

namespace sandbox {

std::unique_ptr<Sandbox> Sandbox::Create() {
  // Memory usage is sampled from /proc.
  if (access("/proc/self/statm", R_OK) != 0) {
    LOG(ERROR) << "No sandbox could be found: /proc is not available";
    return nullptr;
  }
  return absl::make_unique<Unix>();
}

}  // namespace sandbox
