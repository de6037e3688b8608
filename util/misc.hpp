#ifndef UTIL_MISC_HPP
#define UTIL_MISC_HPP
#include <cstdint>
#include <string>

namespace util {

// Returns the MemAvailable value of /proc/meminfo, in KiB, or a negative
// number if it cannot be determined.
int64_t AvailableMemoryKb(const std::string& meminfo = "/proc/meminfo");

// Returns the directory where temporary files go: $TMPDIR or /tmp.
std::string SystemTempDirectory();

}  // namespace util
#endif
