// src/core/worker_pool.cpp

#include "hmb/core/worker_pool.h"

#include "hmb/core/logging.h"

#include <exception>

namespace hmb {

WorkerPool::WorkerPool(usize num_threads) {
  if (num_threads == 0) num_threads = 1;
  workers_.reserve(num_threads);
  for (usize i = 0; i < num_threads; ++i) {
    workers_.emplace_back(&WorkerPool::WorkerLoop, this);
  }
}

WorkerPool::~WorkerPool() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    stop_ = true;
  }
  task_cv_.notify_all();
  for (auto& t : workers_) {
    if (t.joinable()) t.join();
  }
}

void WorkerPool::Submit(std::function<void()> task) {
  if (!task) return;
  {
    std::lock_guard<std::mutex> lk(mu_);
    tasks_.push(std::move(task));
  }
  task_cv_.notify_one();
}

void WorkerPool::Wait() {
  std::unique_lock<std::mutex> lk(mu_);
  idle_cv_.wait(lk, [&] { return tasks_.empty() && running_ == 0; });
}

void WorkerPool::WorkerLoop() {
  while (true) {
    std::function<void()> task;
    {
      std::unique_lock<std::mutex> lk(mu_);
      task_cv_.wait(lk, [&] { return stop_ || !tasks_.empty(); });
      if (stop_ && tasks_.empty()) return;
      task = std::move(tasks_.front());
      tasks_.pop();
      ++running_;
    }

    try {
      task();
    } catch (const std::exception& e) {
      HMB_LOG_ERROR("worker task threw:", e.what());
    }

    {
      std::lock_guard<std::mutex> lk(mu_);
      --running_;
      if (tasks_.empty() && running_ == 0) idle_cv_.notify_all();
    }
  }
}

}  // namespace hmb
