// src/exec/dispatcher.cpp

#include "hmb/exec/dispatcher.h"

#include "hmb/core/assert.h"
#include "hmb/core/logging.h"
#include "hmb/core/worker_pool.h"
#include "hmb/sched/submission.h"

#include <filesystem>
#include <iostream>
#include <string>
#include <unordered_map>

namespace hmb {
namespace exec {

Dispatcher::Dispatcher(sched::IScheduler* scheduler, store::ResultStore* store,
                       DispatchOptions opts)
    : scheduler_(scheduler), store_(store), opts_(opts) {
  HMB_ASSERT_MSG(scheduler_ != nullptr && store_ != nullptr,
                 "Dispatcher needs a scheduler and a store");
  if (!opts_.dry_run_out) opts_.dry_run_out = &std::cout;
}

namespace {

namespace fs = std::filesystem;

// Instances with equal keys run the same build.
std::string BuildKey(const plan::RunInstance& inst) {
  const plan::RunConfiguration& rc = inst.resolved;
  std::string key = inst.bench + '\n' + rc.name + '\n' + rc.directory + '\n';
  for (const auto& m : rc.module_loads) key += m + '\n';
  for (const auto& kv : rc.environment_variables) key += kv.first + '=' + kv.second + '\n';
  for (const auto& cmd : rc.build_commands) key += cmd + '\n';
  return key;
}

}  // namespace

DispatchOutcome Dispatcher::MarkFailed(plan::RunInstance* inst, const Error& err,
                                       bool record_in_slot) {
  inst->status = RunStatus::Failed;
  inst->last_error = err.ToString();
  HMB_LOG_ERROR("dispatch:", inst->id, "failed:", inst->last_error);
  if (record_in_slot) {
    store::RunArtifacts art;
    art.stderr_text = inst->last_error + "\n";
    Error serr;
    if (!store_->Persist(*inst, art, &serr) || !store_->WriteStatus(*inst, &serr)) {
      // A claimed slot without a status would be adopted as pending forever.
      HMB_LOG_WARN("dispatch: could not record failure for", inst->id, ":", serr.message,
                   "; removing its slot");
      Error rerr;
      if (!store_->Remove(*inst, &rerr)) {
        HMB_LOG_ERROR("dispatch:", rerr.message);
      }
    }
  }
  return DispatchOutcome::Failed;
}

bool Dispatcher::IsAbandonedSlot(const plan::RunInstance& inst) const {
  const fs::path slot = store_->SlotDir(inst);
  std::error_code ec;
  return !fs::exists(slot / std::string(store::kStatusFile), ec) &&
         !fs::exists(slot / std::string(store::kScriptFile), ec) &&
         !fs::exists(slot / std::string(store::kExitCodeFile), ec);
}

DispatchOutcome Dispatcher::AdoptExisting(plan::RunInstance* inst) {
  store::StatusRecord rec;
  Error rerr;
  if (store_->ReadStatus(*inst, &rec, &rerr)) {
    inst->status = rec.status;
    inst->handle = rec.handle;
    inst->last_error = rec.last_error;
  } else if (const auto code = store_->ReadExitCode(*inst)) {
    inst->status = (*code == 0) ? RunStatus::Completed : RunStatus::Failed;
  } else {
    // A script but no status: whether it was ever submitted is unknown.
    Error err;
    SetErr(&err, ErrorKind::Store,
           "slot has a submission script but no status record; rerun with --clobber");
    return MarkFailed(inst, err, true);
  }
  HMB_LOG_INFO("skip (no-clobber):", inst->id, "status", inst->status);
  return DispatchOutcome::Skipped;
}

DispatchOutcome Dispatcher::DispatchOne(const plan::TestBench& bench, plan::RunInstance* inst,
                                        const std::vector<JobHandle>& dependencies) {
  const std::string slot = store_->SlotDir(*inst).string();
  const std::string script = sched::RenderSubmissionScript(*inst, bench.metrics, slot);

  if (opts_.dry_run) {
    std::lock_guard<std::mutex> lk(out_mu_);
    (*opts_.dry_run_out) << "# ----- " << inst->id << " -----\n" << script << "\n";
    return DispatchOutcome::DryRun;
  }

  Error err;
  bool claimed = false;
  if (!store_->Claim(*inst, opts_.policy, &claimed, &err)) return MarkFailed(inst, err, false);
  if (!claimed && IsAbandonedSlot(*inst)) {
    HMB_LOG_WARN("dispatch: reclaiming", inst->id, "(slot left without script or status)");
    if (!store_->Claim(*inst, store::ClobberPolicy::Overwrite, &claimed, &err)) {
      return MarkFailed(inst, err, false);
    }
  }
  if (!claimed) return AdoptExisting(inst);

  if (!store_->WriteScript(*inst, script, &err)) return MarkFailed(inst, err, true);

  sched::Submission sub;
  sub.id = inst->id;
  sub.script = script;
  sub.slot_dir = slot;
  sub.script_path = (store_->SlotDir(*inst) / std::string(store::kScriptFile)).string();
  sub.stdout_path = (store_->SlotDir(*inst) / std::string(store::kStdoutFile)).string();
  sub.stderr_path = (store_->SlotDir(*inst) / std::string(store::kStderrFile)).string();
  sub.dependencies = dependencies;

  JobHandle handle;
  if (!scheduler_->Submit(sub, &handle, &err)) {
    if (err.Ok()) SetErr(&err, ErrorKind::Submission, "scheduler rejected the submission");
    return MarkFailed(inst, err, true);
  }

  inst->handle = handle;
  inst->status = RunStatus::Submitted;
  inst->last_error.clear();
  if (!store_->WriteStatus(*inst, &err)) {
    HMB_LOG_WARN("dispatch: status write failed for", inst->id, ":", err.message);
  }
  HMB_LOG_INFO("submitted", inst->id, "as", handle);
  return DispatchOutcome::Submitted;
}

void Dispatcher::DispatchPhase(const std::vector<usize>& indices,
                               const std::vector<const plan::TestBench*>& bench_of,
                               const std::vector<std::vector<JobHandle>>& deps,
                               std::vector<plan::RunInstance>* instances,
                               std::vector<DispatchOutcome>* outcomes) {
  if (indices.empty()) return;
  WorkerPool pool(opts_.dry_run ? 1 : opts_.threads);
  ParallelFor(pool, indices.size(), [&](usize k) {
    const usize i = indices[k];
    plan::RunInstance* inst = &(*instances)[i];
    if (!bench_of[i]) {
      Error err;
      SetErr(&err, ErrorKind::Config, "unknown bench '" + inst->bench + "'");
      (*outcomes)[i] = MarkFailed(inst, err, false);
      return;
    }
    (*outcomes)[i] = DispatchOne(*bench_of[i], inst, deps[i]);
  });
}

DispatchSummary Dispatcher::DispatchAll(const plan::TestPlan& plan,
                                        std::vector<plan::RunInstance>* instances) {
  DispatchSummary summary;
  if (!instances || instances->empty()) return summary;
  const usize n = instances->size();

  std::vector<const plan::TestBench*> bench_of(n, nullptr);
  for (usize i = 0; i < n; ++i) bench_of[i] = plan.FindBench((*instances)[i].bench);

  // builder[i] is the instance that builds for i (i itself when it builds).
  std::vector<usize> builder(n);
  for (usize i = 0; i < n; ++i) builder[i] = i;
  if (opts_.build_once) {
    std::unordered_map<std::string, usize> first;
    for (usize i = 0; i < n; ++i) {
      const plan::RunConfiguration& rc = (*instances)[i].resolved;
      if (!bench_of[i] || rc.pre_built || rc.build_commands.empty()) continue;
      builder[i] = first.emplace(BuildKey((*instances)[i]), i).first->second;
    }
  }

  std::vector<usize> builders;
  std::vector<usize> followers;
  for (usize i = 0; i < n; ++i) (builder[i] == i ? builders : followers).push_back(i);

  std::vector<std::vector<JobHandle>> deps(n);
  std::vector<DispatchOutcome> outcomes(n, DispatchOutcome::Failed);
  DispatchPhase(builders, bench_of, deps, instances, &outcomes);

  for (const usize i : followers) {
    const plan::RunInstance& b = (*instances)[builder[i]];
    const DispatchOutcome bo = outcomes[builder[i]];
    const bool built = bo == DispatchOutcome::DryRun || b.status == RunStatus::Completed ||
                       (!b.handle.empty() && !IsTerminal(b.status));
    if (!built) continue;
    (*instances)[i].resolved.pre_built = true;
    if (bo != DispatchOutcome::DryRun && !IsTerminal(b.status)) deps[i].push_back(b.handle);
  }
  DispatchPhase(followers, bench_of, deps, instances, &outcomes);

  for (const auto o : outcomes) {
    switch (o) {
      case DispatchOutcome::Submitted: ++summary.submitted; break;
      case DispatchOutcome::Skipped: ++summary.skipped; break;
      case DispatchOutcome::DryRun: ++summary.dry_run; break;
      case DispatchOutcome::Failed: ++summary.failed; break;
    }
  }
  HMB_LOG_INFO("dispatch: submitted", summary.submitted, "skipped", summary.skipped, "dry-run",
               summary.dry_run, "failed", summary.failed);
  return summary;
}

}  // namespace exec
}  // namespace hmb
