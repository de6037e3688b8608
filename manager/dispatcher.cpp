#include "manager/dispatcher.hpp"

#include <stdexcept>

#include "glog/logging.h"

namespace manager {

Dispatcher::Dispatcher(Pipeline* pipeline, size_t num_threads)
    : pipeline_(pipeline) {
  if (num_threads == 0) num_threads = std::thread::hardware_concurrency();
  if (num_threads == 0) num_threads = 1;
  LOG(INFO) << "Starting " << num_threads << " worker(s)";
  for (size_t i = 0; i < num_threads; i++) {
    threads_.emplace_back(&Dispatcher::ThreadBody, this);
  }
}

Dispatcher::~Dispatcher() {
  {
    std::lock_guard<std::mutex> lck(task_mutex_);
    quitting_ = true;
  }
  task_ready_.notify_all();
  for (std::thread& thread : threads_) thread.join();
}

std::future<proto::SubmissionResult> Dispatcher::Submit(std::string source) {
  Pipeline* pipeline = pipeline_;
  std::packaged_task<proto::SubmissionResult()> task(
      [pipeline, source = std::move(source)]() {
        return pipeline->CompileAndRun(source);
      });
  std::future<proto::SubmissionResult> result = task.get_future();
  {
    std::lock_guard<std::mutex> lck(task_mutex_);
    if (quitting_) throw std::logic_error("Dispatcher is shutting down");
    tasks_.push(std::move(task));
  }
  task_ready_.notify_one();
  return result;
}

void Dispatcher::ThreadBody() {
  while (true) {
    std::unique_lock<std::mutex> lck(task_mutex_);
    while (!quitting_ && tasks_.empty()) {
      task_ready_.wait(lck);
    }
    // Queued submissions are still run when quitting.
    if (tasks_.empty()) break;
    std::packaged_task<proto::SubmissionResult()> task =
        std::move(tasks_.front());
    tasks_.pop();
    lck.unlock();
    task();
  }
}

}  // namespace manager
