#pragma once
// hmb/sched/slurm_scheduler.h
//
// Slurm backend: sbatch / squeue / scancel through the shell.
//
// Finished jobs drop out of squeue, so QueryStatus omits them; the tracker
// then resolves them from the exit-code file the script writes.

#include "hmb/sched/scheduler.h"

#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace hmb {
namespace sched {

class SlurmScheduler final : public IScheduler {
 public:
  SlurmScheduler() = default;

  // Command names are overridable for sites with wrappers.
  SlurmScheduler(std::string sbatch, std::string squeue, std::string scancel)
      : sbatch_(std::move(sbatch)), squeue_(std::move(squeue)), scancel_(std::move(scancel)) {}

  std::string_view Name() const noexcept override { return "slurm"; }

  bool Submit(const Submission& sub, JobHandle* handle, Error* err) override;

  bool QueryStatus(const std::vector<JobHandle>& handles,
                   std::unordered_map<JobHandle, RawStatus>* out, Error* err) override;

  bool Cancel(const JobHandle& handle, Error* err) override;

 private:
  std::string sbatch_ = "sbatch";
  std::string squeue_ = "squeue";
  std::string scancel_ = "scancel";
};

// sbatch [--dependency=afterok:<id>[:<id>...]] '<script_path>'
std::string SbatchCommand(const std::string& sbatch, const Submission& sub);

// "Submitted batch job 123456" -> "123456". False when no id is present.
bool ParseSbatchJobId(std::string_view output, JobHandle* out);

// Lines of "<jobid> <STATE>" (squeue -h -o "%i %T") -> handle -> RawStatus.
// Blank lines are skipped; malformed lines are errors.
bool ParseSqueueOutput(std::string_view output, std::unordered_map<JobHandle, RawStatus>* out,
                       Error* err = nullptr);

}  // namespace sched
}  // namespace hmb
