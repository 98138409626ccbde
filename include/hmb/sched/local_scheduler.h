#pragma once
// hmb/sched/local_scheduler.h
//
// Local backend: runs the rendered script with /bin/sh on this host, to
// completion, inside Submit. Useful on machines without a batch system and
// for smoke-testing a plan. Handles are "local-<n>". A submission whose
// dependency did not complete successfully is rejected without running.

#include "hmb/sched/scheduler.h"

#include <atomic>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace hmb {
namespace sched {

class LocalScheduler final : public IScheduler {
 public:
  explicit LocalScheduler(std::string shell = "/bin/sh") : shell_(std::move(shell)) {}

  std::string_view Name() const noexcept override { return "local"; }

  bool Submit(const Submission& sub, JobHandle* handle, Error* err) override;

  bool QueryStatus(const std::vector<JobHandle>& handles,
                   std::unordered_map<JobHandle, RawStatus>* out, Error* err) override;

  // Jobs finish inside Submit, so there is never anything left to cancel.
  bool Cancel(const JobHandle& handle, Error* err) override;

 private:
  std::string shell_;
  std::atomic<u64> next_{0};

  std::mutex mu_;
  std::unordered_map<JobHandle, RawStatus> finished_;
};

}  // namespace sched
}  // namespace hmb
