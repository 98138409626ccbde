// src/exec/tracker.cpp

#include "hmb/exec/tracker.h"

#include "hmb/core/assert.h"
#include "hmb/core/config.h"
#include "hmb/core/logging.h"
#include "hmb/core/timer.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <thread>
#include <unordered_map>

namespace hmb {
namespace exec {

namespace {

// NaN and negatives become zero; anything past kMaxSeconds is clamped.
Deadline::Clock::duration Seconds(double s) {
  if (!(s > 0.0)) return Deadline::Clock::duration::zero();
  return std::chrono::duration_cast<Deadline::Clock::duration>(
      std::chrono::duration<double>(std::min(s, kMaxSeconds)));
}

// Returns true when cancelled during the sleep.
bool SleepFor(Deadline::Clock::duration d, CancelToken* cancel) {
  if (cancel) return cancel->WaitFor(d);
  if (d > Deadline::Clock::duration::zero()) std::this_thread::sleep_for(d);
  return false;
}

RunStatus MapRaw(sched::RawStatus raw) {
  switch (raw) {
    case sched::RawStatus::Pending: return RunStatus::Submitted;
    case sched::RawStatus::Running: return RunStatus::Running;
    case sched::RawStatus::Completed: return RunStatus::Completed;
    case sched::RawStatus::Failed: return RunStatus::Failed;
    case sched::RawStatus::Unknown: break;
  }
  return RunStatus::Pending;  // caller resolves Unknown separately
}

}  // namespace

JobTracker::JobTracker(sched::IScheduler* scheduler, store::ResultStore* store,
                       TrackerOptions opts)
    : scheduler_(scheduler), store_(store), opts_(std::move(opts)) {
  HMB_ASSERT_MSG(scheduler_ != nullptr, "JobTracker needs a scheduler");
  if (opts_.poll_backoff_s.empty()) opts_.poll_backoff_s.push_back(5.0);
}

void JobTracker::Track(plan::RunInstance* inst) {
  if (!inst || inst->handle.empty() || IsTerminal(inst->status)) return;
  std::lock_guard<std::mutex> lk(mu_);
  if (std::find(tracked_.begin(), tracked_.end(), inst) != tracked_.end()) return;
  tracked_.push_back(inst);
}

RunStatus JobTracker::ResolveFromExitArtifact(const plan::RunInstance& inst) const {
  if (!store_) return RunStatus::Failed;
  const auto code = store_->ReadExitCode(inst);
  if (!code) return RunStatus::Failed;
  return (*code == 0) ? RunStatus::Completed : RunStatus::Failed;
}

void JobTracker::TransitionLocked(plan::RunInstance* inst, RunStatus next,
                                  const std::string& note) {
  if (inst->status == next) return;
  HMB_LOG_DEBUG("tracker:", inst->id, inst->status, "->", next, note);
  inst->status = next;
  if (!note.empty()) inst->last_error = note;
  if (store_) {
    Error serr;
    if (!store_->WriteStatus(*inst, &serr)) {
      HMB_LOG_WARN("tracker: status write failed for", inst->id, ":", serr.message);
    }
  }
}

bool JobTracker::Poll(Error* err, CancelToken* cancel) {
  std::vector<JobHandle> handles;
  {
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto* inst : tracked_) {
      if (!IsTerminal(inst->status)) handles.push_back(inst->handle);
    }
  }
  if (handles.empty()) return true;

  std::unordered_map<JobHandle, sched::RawStatus> raw;
  Error qerr;
  bool ok = false;
  for (u64 attempt = 0; attempt <= opts_.query_retries; ++attempt) {
    raw.clear();
    qerr.Clear();
    if (scheduler_->QueryStatus(handles, &raw, &qerr)) {
      ok = true;
      break;
    }
    HMB_LOG_WARN("tracker: status query failed (attempt", attempt + 1, "):", qerr.message);
    if (attempt == opts_.query_retries) break;
    const double delay = opts_.query_retry_base_s * std::pow(2.0, static_cast<double>(attempt));
    if (SleepFor(Seconds(delay), cancel)) break;
  }
  if (!ok) {
    SetErr(err, ErrorKind::Submission, "status query failed: " + qerr.message);
    return false;
  }

  std::lock_guard<std::mutex> lk(mu_);
  for (auto* inst : tracked_) {
    if (IsTerminal(inst->status)) continue;
    auto it = raw.find(inst->handle);
    const sched::RawStatus rs = (it == raw.end()) ? sched::RawStatus::Unknown : it->second;
    if (rs == sched::RawStatus::Unknown) {
      const RunStatus resolved = ResolveFromExitArtifact(*inst);
      TransitionLocked(inst, resolved,
                       resolved == RunStatus::Failed ? "job left the queue without success"
                                                     : std::string());
    } else {
      TransitionLocked(inst, MapRaw(rs), std::string());
    }
  }
  return true;
}

std::vector<std::string> JobTracker::WaitUntilTerminal(double timeout_s, CancelToken* cancel) {
  const Deadline deadline = (timeout_s > 0.0) ? Deadline::After(Seconds(timeout_s)) : Deadline();
  usize step = 0;
  while (true) {
    Error perr;
    if (!Poll(&perr, cancel)) HMB_LOG_WARN("tracker:", perr.message);
    if (AllTerminal()) return {};
    if (cancel && cancel->Cancelled()) break;
    if (deadline.Expired()) break;

    const double interval =
        opts_.poll_backoff_s[std::min(step, opts_.poll_backoff_s.size() - 1)];
    ++step;
    const auto nap = deadline.Remaining(Seconds(interval));
    HMB_LOG_INFO("waiting for", NonTerminalIds().size(), "job(s), next poll in",
                 std::chrono::duration<double>(nap).count(), "s");
    if (SleepFor(nap, cancel)) break;
  }
  return NonTerminalIds();
}

void JobTracker::Cancel() {
  std::lock_guard<std::mutex> lk(mu_);
  for (auto* inst : tracked_) {
    if (IsTerminal(inst->status)) continue;
    Error cerr;
    if (!scheduler_->Cancel(inst->handle, &cerr)) {
      HMB_LOG_WARN("tracker: cancel of", inst->handle, "failed:", cerr.message);
    }
    TransitionLocked(inst, RunStatus::Cancelled, "cancelled");
  }
}

usize JobTracker::TrackedCount() const {
  std::lock_guard<std::mutex> lk(mu_);
  return tracked_.size();
}

bool JobTracker::AllTerminal() const {
  std::lock_guard<std::mutex> lk(mu_);
  for (const auto* inst : tracked_) {
    if (!IsTerminal(inst->status)) return false;
  }
  return true;
}

std::vector<std::string> JobTracker::NonTerminalIds() const {
  std::vector<std::string> ids;
  std::lock_guard<std::mutex> lk(mu_);
  for (const auto* inst : tracked_) {
    if (!IsTerminal(inst->status)) ids.push_back(inst->id);
  }
  return ids;
}

}  // namespace exec
}  // namespace hmb
