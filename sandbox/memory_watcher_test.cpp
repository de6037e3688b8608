#include "sandbox/memory_watcher.hpp"

#include <unistd.h>

#include <chrono>
#include <thread>
#include <vector>

#include "gtest/gtest.h"

namespace {

TEST(MemoryWatcherTest, ReadsOwnUsage) {
  int64_t kb = 0;
  EXPECT_TRUE(sandbox::GetProcessMemoryUsage(getpid(), &kb));
  EXPECT_GT(kb, 0);
}

TEST(MemoryWatcherTest, NoSuchProcess) {
  int64_t kb = 42;
  EXPECT_FALSE(sandbox::GetProcessMemoryUsage(-1, &kb));
  EXPECT_EQ(kb, 42);
}

TEST(MemoryWatcherTest, TracksPeak) {
  sandbox::MemoryWatcher watcher(getpid());
  int64_t before = 0;
  {
    std::vector<char> data(32 * 1024 * 1024, 'x');
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    ASSERT_TRUE(sandbox::GetProcessMemoryUsage(getpid(), &before));
  }
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  watcher.Stop();
  EXPECT_GE(watcher.PeakKb(), 32 * 1024);
  int64_t peak = watcher.PeakKb();
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  EXPECT_EQ(watcher.PeakKb(), peak);
}

TEST(MemoryWatcherTest, StopIsIdempotent) {
  sandbox::MemoryWatcher watcher(getpid());
  watcher.Stop();
  watcher.Stop();
  SUCCEED();
}

}  // namespace
