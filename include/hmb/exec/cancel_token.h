#pragma once
// hmb/exec/cancel_token.h
//
// Cooperative cancellation for blocking waits. Cancel() may be called from
// any thread; WaitFor() returns early (true) once cancelled.

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace hmb {
namespace exec {

class CancelToken {
 public:
  CancelToken() = default;
  CancelToken(const CancelToken&) = delete;
  CancelToken& operator=(const CancelToken&) = delete;

  void Cancel() {
    {
      std::lock_guard<std::mutex> lk(mu_);
      cancelled_ = true;
    }
    cv_.notify_all();
  }

  bool Cancelled() const {
    std::lock_guard<std::mutex> lk(mu_);
    return cancelled_;
  }

  // Sleep for `d` or until cancelled. Returns true when cancelled.
  template <class Rep, class Period>
  bool WaitFor(std::chrono::duration<Rep, Period> d) {
    std::unique_lock<std::mutex> lk(mu_);
    return cv_.wait_for(lk, d, [&] { return cancelled_; });
  }

 private:
  mutable std::mutex mu_;
  std::condition_variable cv_;
  bool cancelled_ = false;
};

}  // namespace exec
}  // namespace hmb
