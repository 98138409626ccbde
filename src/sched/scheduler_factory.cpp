// src/sched/scheduler_factory.cpp
//
// Backend registry and factory. Apps only include hmb/sched/scheduler.h.

#include "hmb/sched/scheduler.h"

#include "hmb/sched/local_scheduler.h"
#include "hmb/sched/slurm_scheduler.h"

#include <sstream>

namespace hmb {
namespace sched {

const std::vector<SchedulerSpec>& SchedulerRegistry() {
  static const std::vector<SchedulerSpec> kRegistry = {
      {"slurm", "submit with sbatch, poll with squeue, cancel with scancel"},
      {"local", "run each script with /bin/sh on this host at submit time"},
  };
  return kRegistry;
}

std::string SchedulerHelp() {
  std::ostringstream oss;
  for (const auto& s : SchedulerRegistry()) {
    oss << "  " << s.key << "  " << s.desc << "\n";
  }
  return oss.str();
}

std::unique_ptr<IScheduler> CreateScheduler(std::string_view backend, Error* err) {
  if (detail::EqualsIgnoreCase(backend, "slurm")) return std::make_unique<SlurmScheduler>();
  if (detail::EqualsIgnoreCase(backend, "local")) return std::make_unique<LocalScheduler>();

  std::ostringstream oss;
  oss << "unsupported scheduler backend '" << backend << "'. Available:\n" << SchedulerHelp();
  SetErr(err, ErrorKind::Config, oss.str());
  return nullptr;
}

}  // namespace sched
}  // namespace hmb
