#ifndef SANDBOX_MEMORY_WATCHER_HPP
#define SANDBOX_MEMORY_WATCHER_HPP

#include <sys/types.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace sandbox {

// Reads the resident set size of a process from /proc, in KiB. Returns false
// if the process is gone or /proc is not readable.
bool GetProcessMemoryUsage(pid_t pid, int64_t* memory_usage_kb);

// Periodically samples the memory usage of a process in a background thread,
// keeping the maximum value seen.
class MemoryWatcher {
 public:
  explicit MemoryWatcher(
      pid_t pid,
      std::chrono::microseconds interval = std::chrono::milliseconds(1));

  // Stops sampling and waits for the background thread. Idempotent.
  void Stop();

  int64_t PeakKb() const { return peak_kb_; }

  ~MemoryWatcher();
  MemoryWatcher(const MemoryWatcher&) = delete;
  MemoryWatcher& operator=(const MemoryWatcher&) = delete;
  MemoryWatcher(MemoryWatcher&&) = delete;
  MemoryWatcher& operator=(MemoryWatcher&&) = delete;

 private:
  void Sample();

  pid_t pid_;
  std::chrono::microseconds interval_;
  std::atomic<int64_t> peak_kb_{0};
  std::mutex mutex_;
  std::condition_variable stop_cv_;
  bool stopping_ = false;
  std::thread thread_;
};

}  // namespace sandbox

#endif
