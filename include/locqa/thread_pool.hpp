#pragma once
#include <atomic>
#include <condition_variable>
#include <exception>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace locqa {

class ThreadPool {
  std::vector<std::thread> workers;
  std::queue<std::function<void()>> q;
  std::mutex m;
  std::condition_variable cv;
  std::condition_variable idle_cv;
  std::atomic<bool> stop{false};
  unsigned active = 0;
  std::exception_ptr failure;

public:
  // n == 0 picks hardware_concurrency().
  explicit ThreadPool(unsigned n);
  ~ThreadPool();

  ThreadPool(const ThreadPool &) = delete;
  ThreadPool &operator=(const ThreadPool &) = delete;

  unsigned size() const { return static_cast<unsigned>(workers.size()); }

  void submit(std::function<void()> fn);

  // Blocks until the queue is drained and no task is running. Rethrows the
  // first exception a task let escape since the last call.
  void wait_idle();
};

} // namespace locqa
