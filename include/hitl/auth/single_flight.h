#ifndef HITL_AUTH_SINGLE_FLIGHT_H
#define HITL_AUTH_SINGLE_FLIGHT_H

#include <exception>
#include <future>
#include <mutex>

namespace hitl {
namespace auth {

/**
 * @brief Collapses concurrent calls into one execution
 *
 * While a call is in flight, later callers wait for and share its result
 * (or exception) instead of running the function again.
 */
template <typename T>
class SingleFlight {
 public:
  template <typename Fn>
  T run(Fn&& fn) {
    std::shared_future<T> future;
    std::promise<T> promise;
    bool leader = false;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (inflight_.valid()) {
        future = inflight_;
      } else {
        future = promise.get_future().share();
        inflight_ = future;
        leader = true;
      }
    }

    if (leader) {
      try {
        promise.set_value(fn());
      } catch (...) {
        promise.set_exception(std::current_exception());
      }
      std::lock_guard<std::mutex> lock(mutex_);
      inflight_ = std::shared_future<T>();
    }

    return future.get();
  }

 private:
  std::mutex mutex_;
  std::shared_future<T> inflight_;
};

}  // namespace auth
}  // namespace hitl

#endif  // HITL_AUTH_SINGLE_FLIGHT_H
