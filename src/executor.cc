#include "executor.hh"
#include "log.hh"

namespace chunkview {

WorkerExecutor::WorkerExecutor() : worker_([this] { worker_loop(); }) {}

WorkerExecutor::~WorkerExecutor() {
  stop();
}

void WorkerExecutor::post(Task task) {
  {
    std::lock_guard lock(mutex_);
    if (stopping_) {
      CV_WARNF("executor stopped, task dropped");
      return;
    }
    queue_.push_back(std::move(task));
  }
  cv_.notify_one();
}

void WorkerExecutor::stop() {
  {
    std::lock_guard lock(mutex_);
    if (stopping_) {
      return;
    }
    stopping_ = true;
    if (!queue_.empty()) {
      CV_DEBUGF("dropping {} queued tasks", queue_.size());
      queue_.clear();
    }
  }
  cv_.notify_all();
  if (worker_.joinable()) {
    worker_.join();
  }
}

std::size_t WorkerExecutor::pending() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

void WorkerExecutor::worker_loop() {
  while (true) {
    Task task;
    {
      std::unique_lock lock(mutex_);
      cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
      if (stopping_) {
        return;
      }
      task = std::move(queue_.front());
      queue_.pop_front();
    }
    task();
  }
}

}  // namespace chunkview
