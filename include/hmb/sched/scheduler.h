#pragma once
// hmb/sched/scheduler.h
//
// Batch scheduler boundary.
//
// The engine only needs three operations from a scheduler: submit a rendered
// script, query the state of a batch of handles, and cancel a handle. Backends
// implement IScheduler; apps obtain one through CreateScheduler so they never
// include a concrete backend header.

#include "hmb/core/error.h"
#include "hmb/core/types.h"

#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace hmb {
namespace sched {

enum class RawStatus : u8 {
  Pending = 0,
  Running = 1,
  Completed = 2,
  Failed = 3,
  Unknown = 4,
};

inline constexpr std::string_view ToString(RawStatus s) noexcept {
  switch (s) {
    case RawStatus::Pending: return "pending";
    case RawStatus::Running: return "running";
    case RawStatus::Completed: return "completed";
    case RawStatus::Failed: return "failed";
    case RawStatus::Unknown: return "unknown";
  }
  return "unknown";
}

// Everything a backend needs to submit one run instance.
struct Submission {
  std::string id;           // run instance identifier (also the job name)
  std::string script;       // rendered submission script
  std::string script_path;  // where the script has been written
  std::string slot_dir;     // run instance's result directory
  std::string stdout_path;
  std::string stderr_path;

  // Jobs that must finish successfully before this one may start (afterok).
  std::vector<JobHandle> dependencies;
};

class IScheduler {
 public:
  virtual ~IScheduler() = default;

  virtual std::string_view Name() const noexcept = 0;

  // SubmissionError on a non-zero submit exit or an unparsable response.
  virtual bool Submit(const Submission& sub, JobHandle* handle, Error* err) = 0;

  // One batched query. Handles the scheduler no longer knows about may be
  // omitted from `out` or reported as Unknown.
  virtual bool QueryStatus(const std::vector<JobHandle>& handles,
                           std::unordered_map<JobHandle, RawStatus>* out, Error* err) = 0;

  virtual bool Cancel(const JobHandle& handle, Error* err) = 0;
};

// Slurm job state name (e.g. "PENDING", "COMPLETING", "OUT_OF_MEMORY")
// -> RawStatus. Unrecognized names map to Unknown.
RawStatus MapSlurmState(std::string_view state);

// --------------------------
// Factory
// --------------------------
struct SchedulerSpec {
  std::string_view key;
  std::string_view desc;
};

const std::vector<SchedulerSpec>& SchedulerRegistry();

std::string SchedulerHelp();

// Returns nullptr on an unknown backend and sets *err (ErrorKind::Config).
std::unique_ptr<IScheduler> CreateScheduler(std::string_view backend, Error* err = nullptr);

}  // namespace sched
}  // namespace hmb
