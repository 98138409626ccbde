#pragma once
// hmb/core/worker_pool.h
//
// Fixed-size worker pool with a single FIFO queue.
//
//   WorkerPool pool(4);
//   for (...) pool.Submit([&] { ... });
//   pool.Wait();   // every submitted task has finished
//
// The destructor drains the queue, then joins the workers.

#include "hmb/core/types.h"

#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace hmb {

class WorkerPool {
 public:
  explicit WorkerPool(usize num_threads);
  ~WorkerPool();

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  void Submit(std::function<void()> task);

  // Block until the queue is empty and no task is running.
  void Wait();

  usize Size() const noexcept { return workers_.size(); }

 private:
  void WorkerLoop();

  std::vector<std::thread> workers_;
  std::queue<std::function<void()>> tasks_;

  std::mutex mu_;
  std::condition_variable task_cv_;
  std::condition_variable idle_cv_;
  usize running_ = 0;
  bool stop_ = false;
};

// Run fn(i) for i in [0, n) on `pool` and wait for all of them.
template <class Fn>
void ParallelFor(WorkerPool& pool, usize n, Fn&& fn) {
  for (usize i = 0; i < n; ++i) {
    pool.Submit([&fn, i] { fn(i); });
  }
  pool.Wait();
}

}  // namespace hmb
