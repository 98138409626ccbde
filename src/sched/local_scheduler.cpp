// src/sched/local_scheduler.cpp

#include "hmb/sched/local_scheduler.h"

#include "hmb/core/logging.h"
#include "hmb/sched/process.h"

namespace hmb {
namespace sched {

bool LocalScheduler::Submit(const Submission& sub, JobHandle* handle, Error* err) {
  if (!handle) {
    SetErr(err, ErrorKind::Submission, "Submit: handle is null");
    return false;
  }
  {
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& dep : sub.dependencies) {
      auto it = finished_.find(dep);
      if (it == finished_.end() || it->second != RawStatus::Completed) {
        SetErr(err, ErrorKind::Submission,
               "dependency " + dep + " of " + sub.id + " did not complete successfully");
        return false;
      }
    }
  }

  const std::string cmd = shell_ + " " + ShellQuote(sub.script_path) + " >" +
                          ShellQuote(sub.stdout_path) + " 2>" + ShellQuote(sub.stderr_path);
  CommandResult res;
  if (!RunCommand(cmd, &res, /*merge_stderr=*/false, err)) return false;

  *handle = "local-" + std::to_string(next_.fetch_add(1) + 1);
  const RawStatus st = (res.exit_code == 0) ? RawStatus::Completed : RawStatus::Failed;
  {
    std::lock_guard<std::mutex> lk(mu_);
    finished_[*handle] = st;
  }
  HMB_LOG_DEBUG("local:", sub.id, "->", *handle, "exit", res.exit_code);
  return true;
}

bool LocalScheduler::QueryStatus(const std::vector<JobHandle>& handles,
                                 std::unordered_map<JobHandle, RawStatus>* out, Error* err) {
  if (!out) {
    SetErr(err, ErrorKind::Submission, "QueryStatus: out is null");
    return false;
  }
  out->clear();
  std::lock_guard<std::mutex> lk(mu_);
  for (const auto& h : handles) {
    auto it = finished_.find(h);
    (*out)[h] = (it == finished_.end()) ? RawStatus::Unknown : it->second;
  }
  return true;
}

bool LocalScheduler::Cancel(const JobHandle& handle, Error* err) {
  (void)err;
  HMB_LOG_DEBUG("local: cancel", handle, "(already finished)");
  return true;
}

}  // namespace sched
}  // namespace hmb
