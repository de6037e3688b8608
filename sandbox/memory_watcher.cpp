#include "sandbox/memory_watcher.hpp"

#include <fcntl.h>
#include <stdio.h>
#include <unistd.h>

#include <string>

namespace sandbox {

bool GetProcessMemoryUsage(pid_t pid, int64_t* memory_usage_kb) {
  int fd = open(("/proc/" + std::to_string(pid) + "/statm").c_str(),
                O_RDONLY | O_CLOEXEC);
  if (fd == -1) return false;
  char buf[256] = {};
  int num_read = 0;
  int cur = 0;
  do {
    cur = read(fd, buf + num_read, sizeof(buf) - 1 - num_read);
    if (cur < 0) {
      close(fd);
      return false;
    }
    num_read += cur;
  } while (cur > 0 && num_read < static_cast<int>(sizeof(buf)) - 1);
  close(fd);
  long long size_pages = 0;
  long long resident_pages = 0;
  if (sscanf(buf, "%lld %lld", &size_pages, &resident_pages) != 2) {
    return false;
  }
  *memory_usage_kb = resident_pages * (sysconf(_SC_PAGESIZE) / 1024);
  return true;
}

MemoryWatcher::MemoryWatcher(pid_t pid, std::chrono::microseconds interval)
    : pid_(pid), interval_(interval) {
  thread_ = std::thread(&MemoryWatcher::Sample, this);
}

void MemoryWatcher::Sample() {
  std::unique_lock<std::mutex> lck(mutex_);
  while (!stopping_) {
    int64_t mem = 0;
    if (GetProcessMemoryUsage(pid_, &mem) && mem > peak_kb_) peak_kb_ = mem;
    stop_cv_.wait_for(lck, interval_, [this]() { return stopping_; });
  }
}

void MemoryWatcher::Stop() {
  {
    std::lock_guard<std::mutex> lck(mutex_);
    stopping_ = true;
  }
  stop_cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

MemoryWatcher::~MemoryWatcher() { Stop(); }

}  // namespace sandbox
