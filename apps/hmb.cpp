// apps/hmb.cpp
//
// Test plan engine:
//   record       expand the plan, submit every run instance, track its status
//   report       extract metrics from recorded results, aggregate reruns,
//                write CSV reports
//   interactive  as report, plus the JSON Lines presentation feed on stdout
//   all          record (waiting for completion), then report
//
// Examples:
//   ./hmb plans/sample_plan.json --dry_run
//   ./hmb plans/sample_plan.json --scheduler=local --mode=all --out_dir=out/demo
//   ./hmb plans/sample_plan.json --wait --timeout=3600 --poll_interval=5,10,30
//   ./hmb plans/sample_plan.json --mode=report --bench=stream

#include "hmb/analysis/aggregator.h"
#include "hmb/analysis/extractor.h"

#include "hmb/core/config.h"
#include "hmb/core/error.h"
#include "hmb/core/logging.h"
#include "hmb/core/timer.h"
#include "hmb/core/types.h"

#include "hmb/exec/cancel_token.h"
#include "hmb/exec/dispatcher.h"
#include "hmb/exec/tracker.h"

#include "hmb/plan/matrix.h"
#include "hmb/plan/plan_loader.h"

#include "hmb/report/write_report.h"
#include "hmb/sched/scheduler.h"
#include "hmb/store/result_store.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

namespace hmb {
namespace apps {

namespace {

constexpr int kExitOk = 0;
constexpr int kExitAllFailed = 1;
constexpr int kExitUsage = 2;
constexpr int kExitConfig = 3;
constexpr int kExitOutput = 5;
constexpr int kExitInterrupted = 130;

volatile std::sig_atomic_t g_stop = 0;
void HandleSignal(int) { g_stop = 1; }

inline bool IsHelpRequested(const ArgMap& args) {
  return args.Has("help") || args.Has("h");
}

inline void PrintUsage() {
  std::cerr
      << "hmb: HPC multi-bench test plan engine\n\n"
      << "Usage:\n"
      << "  hmb <plan.json> [flags]\n\n"
      << "Modes:\n"
      << "  --mode=<record|report|interactive|all>   (default: record)\n"
      << "  --interactive, -i                         same as --mode=interactive\n"
      << "  --bench=<name>          restrict to one bench (disabled benches allowed)\n"
      << "\nRecord flags:\n"
      << "  --dry_run               print rendered submissions, submit nothing\n"
      << "  --clobber               overwrite existing results\n"
      << "  --no_clobber            skip instances that already have results (default)\n"
      << "  --build_once            build each run configuration once; the rest depend on it\n"
      << "  --wait                  block until every instance is terminal\n"
      << "  --timeout=<s>           wait timeout in seconds, 0 = forever (default: 172800)\n"
      << "  --poll_interval=<list>  poll schedule in seconds, e.g. 5,10,15,30,60\n"
      << "  --query_retries=<n>     status query retries (default: 3)\n"
      << "  --threads=<n>           dispatch/extraction workers (default: 4)\n"
      << "\nOutput flags:\n"
      << "  --out_dir=<dir>         result store root (default: results)\n"
      << "  --log_level=<trace|debug|info|warn|error|off>\n"
      << "  --log_timestamp=0|1 --log_thread=0|1\n"
      << "\nScheduler backends:\n"
      << sched::SchedulerHelp()
      << "\nExit codes: 0 ok, 1 every instance failed, 2 usage, 3 invalid configuration,\n"
      << "            5 output directory failure, 130 interrupted\n";
}

// Forwards SIGINT/SIGTERM to a CancelToken while a blocking wait runs.
class InterruptWatcher {
 public:
  explicit InterruptWatcher(exec::CancelToken* token) : token_(token) {
    g_stop = 0;
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);
    th_ = std::thread([this] {
      while (!done_.load(std::memory_order_relaxed)) {
        if (g_stop) {
          HMB_LOG_WARN("interrupt received, cancelling");
          token_->Cancel();
          return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
      }
    });
  }

  ~InterruptWatcher() {
    done_.store(true, std::memory_order_relaxed);
    if (th_.joinable()) th_.join();
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
  }

  InterruptWatcher(const InterruptWatcher&) = delete;
  InterruptWatcher& operator=(const InterruptWatcher&) = delete;

 private:
  exec::CancelToken* token_;
  std::atomic<bool> done_{false};
  std::thread th_;
};

void LogStatusCounts(const std::vector<plan::RunInstance>& instances) {
  usize counts[6] = {};
  for (const auto& inst : instances) ++counts[static_cast<usize>(inst.status)];
  HMB_LOG_INFO("status:",
               "pending=", counts[static_cast<usize>(RunStatus::Pending)],
               "submitted=", counts[static_cast<usize>(RunStatus::Submitted)],
               "running=", counts[static_cast<usize>(RunStatus::Running)],
               "completed=", counts[static_cast<usize>(RunStatus::Completed)],
               "failed=", counts[static_cast<usize>(RunStatus::Failed)],
               "cancelled=", counts[static_cast<usize>(RunStatus::Cancelled)]);
}

bool AllFailed(const std::vector<plan::RunInstance>& instances) {
  if (instances.empty()) return false;
  for (const auto& inst : instances) {
    if (inst.status != RunStatus::Failed) return false;
  }
  return true;
}

int RunRecord(const EngineConfig& cfg, const plan::TestPlan& plan,
              std::vector<plan::RunInstance>* instances, bool force_wait) {
  Error err;
  store::ResultStore store(cfg.output.out_dir);
  if (!cfg.record.dry_run && !store.Init(&err)) {
    HMB_LOG_ERROR(err.ToString());
    return kExitOutput;
  }

  auto scheduler = sched::CreateScheduler(cfg.scheduler.backend, &err);
  if (!scheduler) {
    HMB_LOG_ERROR(err.ToString());
    return kExitConfig;
  }

  exec::DispatchOptions dopts;
  dopts.dry_run = cfg.record.dry_run;
  dopts.build_once = cfg.record.build_once;
  dopts.policy = cfg.record.clobber ? store::ClobberPolicy::Overwrite
                                    : store::ClobberPolicy::NoClobber;
  dopts.threads = static_cast<usize>(cfg.sys.threads);

  Stopwatch sw;
  exec::Dispatcher dispatcher(scheduler.get(), &store, dopts);
  const exec::DispatchSummary ds = dispatcher.DispatchAll(plan, instances);
  HMB_LOG_INFO("dispatch took", sw.ElapsedMillis(), "ms");

  if (cfg.record.dry_run) return kExitOk;

  exec::TrackerOptions topts;
  topts.poll_backoff_s = cfg.record.poll_backoff_s;
  topts.query_retries = cfg.record.query_retries;
  topts.query_retry_base_s = cfg.record.query_retry_base_s;

  exec::JobTracker tracker(scheduler.get(), &store, topts);
  for (auto& inst : *instances) tracker.Track(&inst);

  bool interrupted = false;
  if (tracker.TrackedCount() > 0) {
    if (cfg.record.wait || force_wait) {
      exec::CancelToken token;
      std::vector<std::string> remaining;
      {
        InterruptWatcher watcher(&token);
        remaining = tracker.WaitUntilTerminal(cfg.record.timeout_s, &token);
      }
      if (token.Cancelled()) {
        interrupted = true;
        tracker.Cancel();
      } else if (!remaining.empty()) {
        HMB_LOG_WARN("timeout:", remaining.size(), "instance(s) still not terminal");
        for (const auto& id : remaining) HMB_LOG_DEBUG("  pending:", id);
      }
    } else {
      // One refresh so the log reflects what the scheduler already knows.
      if (!tracker.Poll(&err)) HMB_LOG_WARN("status poll failed:", err.ToString());
    }
  }

  LogStatusCounts(*instances);
  if (interrupted) return kExitInterrupted;
  if (ds.Total() > 0 && AllFailed(*instances)) {
    HMB_LOG_ERROR("every run instance failed");
    return kExitAllFailed;
  }
  return kExitOk;
}

// Report path. When `from_store` is set, statuses are reloaded from the
// store; otherwise the in-memory statuses of a preceding record are used.
int RunReport(const EngineConfig& cfg, const plan::TestPlan& plan,
              std::vector<plan::RunInstance>* instances, bool from_store, bool feed) {
  store::ResultStore store(cfg.output.out_dir);
  if (from_store) {
    std::error_code ec;
    if (!fs::is_directory(store.Root(), ec)) {
      HMB_LOG_WARN("no recorded results under", store.Root().string());
    }
    store.LoadRecordedStatuses(instances);
  }

  const usize threads = static_cast<usize>(cfg.sys.threads);
  Stopwatch sw;
  const auto extracted = analysis::ExtractAll(plan, *instances, store, threads);
  const auto agg = analysis::Aggregate(plan, *instances, extracted);
  HMB_LOG_INFO("extracted", extracted.size(), "value(s),", agg.groups.size(), "group(s) in",
               sw.ElapsedMillis(), "ms");

  Error err;
  fs::path report_dir;
  if (!report::WriteReport(store.Root(), plan, *instances, extracted, agg, &report_dir, &err)) {
    HMB_LOG_ERROR(err.ToString());
    return kExitOutput;
  }

  if (feed) report::WriteFeed(std::cout, plan, agg);

  if (AllFailed(*instances)) {
    HMB_LOG_ERROR("every run instance failed");
    return kExitAllFailed;
  }
  return kExitOk;
}

}  // namespace

}  // namespace apps
}  // namespace hmb

int main(int argc, char** argv) {
  const hmb::ArgMap args = hmb::ArgMap::FromArgv(argc, argv);
  if (hmb::apps::IsHelpRequested(args)) {
    hmb::apps::PrintUsage();
    return hmb::apps::kExitOk;
  }

  for (const char* key : {"mode", "m"}) {
    hmb::Mode m;
    if (auto v = args.Get(key); v && !hmb::ParseMode(*v, &m)) {
      HMB_LOG_ERROR("unknown mode:", *v);
      hmb::apps::PrintUsage();
      return hmb::apps::kExitUsage;
    }
  }

  const hmb::EngineConfig cfg = hmb::EngineConfig::FromArgMap(args);
  hmb::Logger::Instance().SetConfig(cfg.logging);

  hmb::Error err;
  if (!cfg.Validate(&err)) {
    HMB_LOG_ERROR("Config validation failed:", err.ToString());
    hmb::apps::PrintUsage();
    return hmb::apps::kExitUsage;
  }
  for (const auto& kv : cfg.extra) HMB_LOG_WARN("ignoring unknown flag --" + kv.first);
  HMB_LOG_DEBUG("config:", cfg.ToJsonLite());

  hmb::plan::TestPlan plan;
  if (!hmb::plan::LoadTestPlan(cfg.plan_path, &plan, &err) || !plan.Validate(&err)) {
    HMB_LOG_ERROR(err.ToString());
    return hmb::apps::kExitConfig;
  }

  std::vector<hmb::plan::RunInstance> instances;
  if (!hmb::plan::ExpandPlan(plan, cfg.only_bench, &instances, &err)) {
    HMB_LOG_ERROR(err.ToString());
    return hmb::apps::kExitConfig;
  }
  HMB_LOG_INFO("plan", plan.name, "expanded to", instances.size(), "run instance(s)");

  switch (cfg.mode) {
    case hmb::Mode::Record:
      return hmb::apps::RunRecord(cfg, plan, &instances, /*force_wait=*/false);
    case hmb::Mode::Report:
      return hmb::apps::RunReport(cfg, plan, &instances, /*from_store=*/true, /*feed=*/false);
    case hmb::Mode::Interactive:
      return hmb::apps::RunReport(cfg, plan, &instances, /*from_store=*/true, /*feed=*/true);
    case hmb::Mode::All: {
      const int rc = hmb::apps::RunRecord(cfg, plan, &instances, /*force_wait=*/true);
      if (cfg.record.dry_run || (rc != hmb::apps::kExitOk && rc != hmb::apps::kExitAllFailed)) {
        return rc;
      }
      return hmb::apps::RunReport(cfg, plan, &instances, /*from_store=*/false, /*feed=*/false);
    }
  }
  return hmb::apps::kExitOk;
}
