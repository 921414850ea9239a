#pragma once

#include "noncopyable.hh"

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>

namespace chunkview {

struct Executor {  // NOLINT
  using Task = std::function<void()>;

  virtual ~Executor() = default;
  virtual void post(Task task) = 0;
};

// Runs tasks in FIFO order on a single background thread. Tasks still queued
// when the executor is destroyed are dropped.
class WorkerExecutor final : public Executor, Pinned {
public:
  WorkerExecutor();
  ~WorkerExecutor() final;

  void post(Task task) final;
  void stop();

  std::size_t pending() const;

private:
  void worker_loop();

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<Task> queue_;
  bool stopping_ = false;
  std::thread worker_;
};

}  // namespace chunkview
