#ifndef MANAGER_MEMORY_PROBE_HPP
#define MANAGER_MEMORY_PROBE_HPP

#include <cstdint>
#include <string>

#include "core/workspace.hpp"

namespace manager {

// Java launcher that runs the entry point given as its first argument while
// sampling the used heap, and writes the peak value, in bytes, to the
// kPeakMemoryFile file of its working directory.
class MemoryProbe {
 public:
  static const constexpr char* kClassName = "__SandboxMemoryProbe";
  static const constexpr char* kSourceFile = "__SandboxMemoryProbe.java";
  static const constexpr char* kPeakMemoryFile = "peak_memory";
  static const constexpr char* kIntervalProperty = "probe.interval";

  // Value reported when no measurement is available.
  static const constexpr int64_t kPlaceholderBytes = 150000;

  // Source code of the launcher.
  static const std::string& Source();

  // Writes the launcher source in the workspace box.
  static void WriteSource(core::Workspace* workspace);

  // Returns the peak heap usage written by the launcher, or kPlaceholderBytes
  // if the value is missing, malformed, not positive or above max_bytes.
  static int64_t ReadPeak(const core::Workspace& workspace, int64_t max_bytes);
};

}  // namespace manager

#endif
