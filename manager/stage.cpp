#include "manager/stage.hpp"

#include <stdexcept>
#include <vector>

#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_split.h"
#include "util/which.hpp"

namespace manager {

namespace {
const char* const kJvmEnvironment[] = {"JAVA_TOOL_OPTIONS", "_JAVA_OPTIONS",
                                       "JDK_JAVA_OPTIONS", "CLASSPATH"};
}  // namespace

std::string ResolveBinary(const std::string& name) {
  if (name.find('/') != std::string::npos) return name;
  std::string path = util::which(name);
  if (path.empty()) {
    throw std::runtime_error("Cannot find " + name + " in PATH");
  }
  return path;
}

void StripJvmEnvironment(proto::Request* request) {
  for (const char* var : kJvmEnvironment) request->add_unset_env(var);
}

std::string FormatSeconds(int64_t millis) {
  if (millis % 1000 == 0) return absl::StrCat(millis / 1000);
  return absl::StrCat(millis / 1000.0);
}

std::string FilterJvmNoise(const std::string& output) {
  if (!absl::StartsWith(output, "Picked up ") &&
      !absl::StrContains(output, "\nPicked up ")) {
    return output;
  }
  std::vector<absl::string_view> kept;
  for (absl::string_view line : absl::StrSplit(output, '\n')) {
    if (absl::StartsWith(line, "Picked up ")) continue;
    kept.push_back(line);
  }
  return absl::StrJoin(kept, "\n");
}

}  // namespace manager
