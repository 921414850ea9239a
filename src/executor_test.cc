#include "executor.hh"

#include <gtest/gtest.h>

#include <future>

using namespace chunkview;

TEST(WorkerExecutor, runs_tasks_in_order) {
  WorkerExecutor executor;
  std::vector<int> seen;
  std::promise<void> done;
  for (int i = 0; i < 100; i++) {
    executor.post([&seen, i] { seen.push_back(i); });
  }
  executor.post([&done] { done.set_value(); });
  done.get_future().wait();

  ASSERT_EQ(seen.size(), 100u);
  for (int i = 0; i < 100; i++) {
    EXPECT_EQ(seen[i], i);
  }
}

TEST(WorkerExecutor, stop_drops_queued_tasks) {
  WorkerExecutor executor;
  std::promise<void> started;
  std::promise<void> release;
  auto gate = release.get_future().share();
  int ran = 0;

  executor.post([&started, gate] {
    started.set_value();
    gate.wait();
  });
  started.get_future().wait();
  for (int i = 0; i < 5; i++) {
    executor.post([&ran] { ran++; });
  }
  EXPECT_EQ(executor.pending(), 5u);

  std::thread stopper([&executor] { executor.stop(); });
  // stop() clears the queue before it waits for the running task
  while (executor.pending() != 0) {
    std::this_thread::yield();
  }
  release.set_value();
  stopper.join();

  EXPECT_EQ(ran, 0);
  executor.post([&ran] { ran++; });
  EXPECT_EQ(executor.pending(), 0u);
  EXPECT_EQ(ran, 0);
}
