#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <thread>

#include "hitl/proxy/worker_pool.h"

namespace hitl {
namespace proxy {
namespace {

TEST(WorkerPoolTest, RunsAllTasks) {
  std::atomic<int> done{0};
  {
    WorkerPool pool(4);
    for (int i = 0; i < 100; ++i) {
      EXPECT_TRUE(pool.submit([&done]() { ++done; }));
    }
  }
  EXPECT_EQ(done.load(), 100);
}

TEST(WorkerPoolTest, ShutdownDrainsQueueAndRejectsNewWork) {
  std::atomic<int> done{0};
  WorkerPool pool(1);
  for (int i = 0; i < 10; ++i) {
    pool.submit([&done]() {
      std::this_thread::sleep_for(std::chrono::milliseconds(2));
      ++done;
    });
  }
  pool.shutdown();

  EXPECT_EQ(done.load(), 10);
  EXPECT_EQ(pool.pending(), 0u);
  EXPECT_FALSE(pool.submit([&done]() { ++done; }));
  pool.shutdown();
}

TEST(WorkerPoolTest, TasksRunConcurrently) {
  WorkerPool pool(2);
  std::mutex mutex;
  std::condition_variable cv;
  int arrived = 0;
  std::atomic<bool> both_met{false};

  // Each task waits for the other; one thread alone would time out
  auto rendezvous = [&]() {
    std::unique_lock<std::mutex> lock(mutex);
    ++arrived;
    cv.notify_all();
    if (cv.wait_for(lock, std::chrono::seconds(5),
                    [&]() { return arrived == 2; })) {
      both_met = true;
    }
  };
  pool.submit(rendezvous);
  pool.submit(rendezvous);
  pool.shutdown();

  EXPECT_TRUE(both_met.load());
}

TEST(WorkerPoolTest, ThrowingTaskDoesNotKillWorker) {
  std::atomic<int> done{0};
  {
    WorkerPool pool(1);
    pool.submit([]() { throw std::runtime_error("boom"); });
    pool.submit([&done]() { ++done; });
  }
  EXPECT_EQ(done.load(), 1);
}

TEST(WorkerPoolTest, ZeroThreadsMeansOne) {
  std::atomic<int> done{0};
  {
    WorkerPool pool(0);
    pool.submit([&done]() { ++done; });
  }
  EXPECT_EQ(done.load(), 1);
}

}  // namespace
}  // namespace proxy
}  // namespace hitl
