#pragma once

#include "executor.hh"

#include <deque>

namespace chunkview {

// Test double: queues tasks until the test runs them.
class ManualExecutor final : public Executor {
public:
  void post(Task task) final {
    tasks_.push_back(std::move(task));
  }

  std::size_t pending() const {
    return tasks_.size();
  }

  bool run_one() {
    if (tasks_.empty()) {
      return false;
    }
    auto task = std::move(tasks_.front());
    tasks_.pop_front();
    task();
    return true;
  }

  // Runs the newest task first, so tests can land reloads out of order.
  bool run_last() {
    if (tasks_.empty()) {
      return false;
    }
    auto task = std::move(tasks_.back());
    tasks_.pop_back();
    task();
    return true;
  }

  std::size_t run_all() {
    std::size_t n = 0;
    while (run_one()) {
      n++;
    }
    return n;
  }

private:
  std::deque<Task> tasks_;
};

}  // namespace chunkview
