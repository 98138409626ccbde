#pragma once
// hmb/exec/tracker.h
//
// Job lifecycle tracker.
//
//   Pending -> Submitted -> Running -> Completed | Failed | Cancelled
//
// The tracker does not own run instances: the record flow owns them and
// registers pointers with Track(). Every status change is written through to
// the result store (when one is attached).
//
// Raw scheduler states map as pending->Submitted, running->Running,
// completed->Completed, failed->Failed. A handle the scheduler reports as
// unknown, or leaves out of its answer, is resolved from the exit_code file
// in the run's slot: 0 -> Completed, non-zero -> Failed, absent -> Failed.

#include "hmb/core/error.h"
#include "hmb/core/types.h"
#include "hmb/exec/cancel_token.h"
#include "hmb/plan/matrix.h"
#include "hmb/sched/scheduler.h"
#include "hmb/store/result_store.h"

#include <mutex>
#include <string>
#include <vector>

namespace hmb {
namespace exec {

struct TrackerOptions {
  // Sleep between polls in WaitUntilTerminal; the last value repeats.
  std::vector<double> poll_backoff_s = {5.0, 10.0, 15.0, 30.0, 60.0};

  // A failed status query is retried this many times, sleeping
  // base * 2^attempt seconds in between.
  u64 query_retries = 3;
  double query_retry_base_s = 1.0;
};

class JobTracker {
 public:
  // `store` may be null (no write-through, exit artifacts unavailable).
  JobTracker(sched::IScheduler* scheduler, store::ResultStore* store, TrackerOptions opts = {});

  JobTracker(const JobTracker&) = delete;
  JobTracker& operator=(const JobTracker&) = delete;

  // Register an instance. Instances without a handle or already terminal are
  // ignored. The pointer must outlive the tracker.
  void Track(plan::RunInstance* inst);

  // One batched status query for every non-terminal tracked handle, then
  // apply transitions. Returns false (statuses unchanged) when the query
  // still fails after the retry budget.
  bool Poll(Error* err = nullptr, CancelToken* cancel = nullptr);

  // Poll until every tracked instance is terminal, the timeout elapses
  // (timeout_s <= 0 waits forever) or `cancel` fires. Returns the ids still
  // non-terminal (empty when everything finished).
  std::vector<std::string> WaitUntilTerminal(double timeout_s, CancelToken* cancel = nullptr);

  // Move every non-terminal instance to Cancelled and ask the scheduler to
  // cancel its job. Scheduler failures are logged, not returned.
  void Cancel();

  usize TrackedCount() const;
  bool AllTerminal() const;
  std::vector<std::string> NonTerminalIds() const;

 private:
  void TransitionLocked(plan::RunInstance* inst, RunStatus next, const std::string& note);
  RunStatus ResolveFromExitArtifact(const plan::RunInstance& inst) const;

  sched::IScheduler* scheduler_;
  store::ResultStore* store_;
  TrackerOptions opts_;

  mutable std::mutex mu_;
  std::vector<plan::RunInstance*> tracked_;
};

}  // namespace exec
}  // namespace hmb
