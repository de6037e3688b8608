#ifndef MANAGER_DISPATCHER_HPP
#define MANAGER_DISPATCHER_HPP

#include <condition_variable>
#include <future>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

#include "manager/pipeline.hpp"
#include "proto/submission.pb.h"

namespace manager {

// Runs submissions on a fixed pool of worker threads, one submission per
// worker at a time. On destruction the queued submissions are completed and
// the workers joined.
class Dispatcher {
 public:
  // Uses num_threads workers, or one per core if num_threads is 0.
  Dispatcher(Pipeline* pipeline, size_t num_threads = 0);
  ~Dispatcher();

  std::future<proto::SubmissionResult> Submit(std::string source);

  size_t NumThreads() const { return threads_.size(); }

  Dispatcher(const Dispatcher&) = delete;
  Dispatcher& operator=(const Dispatcher&) = delete;
  Dispatcher(Dispatcher&&) = delete;
  Dispatcher& operator=(Dispatcher&&) = delete;

 private:
  void ThreadBody();

  Pipeline* pipeline_;
  std::mutex task_mutex_;
  std::condition_variable task_ready_;
  std::queue<std::packaged_task<proto::SubmissionResult()>> tasks_;
  bool quitting_ = false;
  std::vector<std::thread> threads_;
};

}  // namespace manager

#endif
