#include "util/misc.hpp"

#include <cstdlib>
#include <vector>

#include "absl/strings/numbers.h"
#include "absl/strings/match.h"
#include "absl/strings/str_split.h"
#include "util/file.hpp"

namespace util {

int64_t AvailableMemoryKb(const std::string& meminfo) {
  std::string contents;
  try {
    contents = File::Read(meminfo, kChunkSize);
  } catch (const std::system_error& e) {
    return -1;
  }
  for (absl::string_view line : absl::StrSplit(contents, '\n')) {
    if (!absl::StartsWith(line, "MemAvailable:")) continue;
    std::vector<absl::string_view> fields =
        absl::StrSplit(line, ' ', absl::SkipEmpty());
    int64_t value = 0;
    if (fields.size() >= 2 && absl::SimpleAtoi(fields[1], &value)) {
      return value;
    }
    return -1;
  }
  return -1;
}

std::string SystemTempDirectory() {
  const char* tmpdir = std::getenv("TMPDIR");
  if (tmpdir != nullptr && tmpdir[0] != '\0') return tmpdir;
  return "/tmp";
}

}  // namespace util
