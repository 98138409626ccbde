#pragma once
// hmb/exec/dispatcher.h
//
// Job dispatcher: render, claim the store slot, submit.
//
// Per instance:
//   dry run      print the rendered script; no store or scheduler effects
//   no-clobber   an existing slot is skipped and its recorded status/handle
//                are adopted (a live job is never submitted twice); a slot
//                left with neither script, status nor exit code is reclaimed
//   overwrite    the slot is deleted, then reclaimed
//   submit error only that instance becomes Failed; the message lands in its
//                slot (stderr.txt and status.json), or the slot is removed
//                when even that cannot be written
//
// DispatchAll runs instances concurrently on a fixed worker pool; it returns
// once every instance has been fully dispatched.
//
// build_once: instances of a bench that share a run configuration with the
// same rendered build (directory, modules, environment, build commands) are
// built once. The first of them is dispatched alone; the rest are rendered
// pre-built and submitted with an afterok dependency on its job. When that
// first instance fails, the rest build for themselves.

#include "hmb/core/error.h"
#include "hmb/core/types.h"
#include "hmb/plan/matrix.h"
#include "hmb/plan/model.h"
#include "hmb/sched/scheduler.h"
#include "hmb/store/result_store.h"

#include <iosfwd>
#include <mutex>
#include <vector>

namespace hmb {
namespace exec {

enum class DispatchOutcome : u8 {
  Submitted = 0,
  Skipped = 1,
  DryRun = 2,
  Failed = 3,
};

struct DispatchOptions {
  bool dry_run = false;
  store::ClobberPolicy policy = store::ClobberPolicy::NoClobber;
  usize threads = 4;
  bool build_once = false;

  // Destination for dry-run scripts (defaults to std::cout when null).
  std::ostream* dry_run_out = nullptr;
};

struct DispatchSummary {
  usize submitted = 0;
  usize skipped = 0;
  usize dry_run = 0;
  usize failed = 0;

  usize Total() const noexcept { return submitted + skipped + dry_run + failed; }
};

class Dispatcher {
 public:
  // Dry runs only use the store to compute slot paths.
  Dispatcher(sched::IScheduler* scheduler, store::ResultStore* store, DispatchOptions opts);

  DispatchSummary DispatchAll(const plan::TestPlan& plan, std::vector<plan::RunInstance>* instances);

  DispatchOutcome DispatchOne(const plan::TestBench& bench, plan::RunInstance* inst,
                              const std::vector<JobHandle>& dependencies = {});

 private:
  void DispatchPhase(const std::vector<usize>& indices,
                     const std::vector<const plan::TestBench*>& bench_of,
                     const std::vector<std::vector<JobHandle>>& deps,
                     std::vector<plan::RunInstance>* instances,
                     std::vector<DispatchOutcome>* outcomes);
  bool IsAbandonedSlot(const plan::RunInstance& inst) const;
  DispatchOutcome AdoptExisting(plan::RunInstance* inst);
  DispatchOutcome MarkFailed(plan::RunInstance* inst, const Error& err, bool record_in_slot);

  sched::IScheduler* scheduler_;
  store::ResultStore* store_;
  DispatchOptions opts_;
  std::mutex out_mu_;
};

}  // namespace exec
}  // namespace hmb
