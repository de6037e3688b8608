#ifndef MANAGER_STAGE_HPP
#define MANAGER_STAGE_HPP

#include <chrono>
#include <string>

#include "proto/request.pb.h"
#include "proto/response.pb.h"

namespace manager {

// Returns the path of a binary: names containing a slash are used as they
// are, other names are looked up in $PATH. Throws std::runtime_error if the
// lookup fails.
std::string ResolveBinary(const std::string& name);

// Removes from the child environment the variables that inject options into
// the JVM or change its classpath.
void StripJvmEnvironment(proto::Request* request);

// Formats a duration in milliseconds as seconds, e.g. "10" or "0.5".
std::string FormatSeconds(int64_t millis);

// Drops the banner lines the JVM prints when it picks up options from the
// environment.
std::string FilterJvmNoise(const std::string& output);

// Measures the wall time of a stage.
class Stopwatch {
 public:
  Stopwatch() : start_(std::chrono::steady_clock::now()) {}
  int64_t ElapsedMillis() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now() - start_)
        .count();
  }

 private:
  std::chrono::steady_clock::time_point start_;
};

}  // namespace manager

#endif
