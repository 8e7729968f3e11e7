#ifndef HITL_PROXY_WORKER_POOL_H
#define HITL_PROXY_WORKER_POOL_H

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace hitl {
namespace proxy {

/**
 * @brief Fixed set of threads draining a FIFO of tasks
 */
class WorkerPool {
 public:
  using Task = std::function<void()>;

  explicit WorkerPool(size_t threads);
  ~WorkerPool();

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  // Returns false once shutdown() has been called
  bool submit(Task task);

  // Runs the queued tasks, then joins the threads
  void shutdown();

  size_t pending() const;

 private:
  void workerLoop();

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<Task> tasks_;
  std::vector<std::thread> threads_;
  bool stopping_{false};
};

}  // namespace proxy
}  // namespace hitl

#endif  // HITL_PROXY_WORKER_POOL_H
