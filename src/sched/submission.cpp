// src/sched/submission.cpp

#include "hmb/sched/submission.h"

#include "hmb/core/logging.h"
#include "hmb/sched/process.h"

#include <set>
#include <sstream>

namespace hmb {
namespace sched {

namespace {

constexpr const char* kShebang = "#!/bin/sh\n";
constexpr const char* kTimeCommand = "time -p ";

bool IsReservedDirective(const std::string& key) {
  return key == "output" || key == "error" || key == "job-name";
}

}  // namespace

std::string RenderSubmissionScript(const plan::RunInstance& inst,
                                   const std::vector<plan::MetricDefinition>& metrics,
                                   const std::string& slot_dir) {
  const plan::RunConfiguration& rc = inst.resolved;
  std::ostringstream oss;
  oss << kShebang;

  for (const auto& kv : rc.sbatch_config) {
    if (IsReservedDirective(kv.first)) {
      HMB_LOG_WARN("run configuration", rc.name, ": sbatch directive", kv.first,
                   "is overridden for", inst.id);
      continue;
    }
    oss << "#SBATCH --" << kv.first << "=" << kv.second << "\n";
  }
  oss << "#SBATCH --job-name=" << inst.id << "\n";
  oss << "#SBATCH --output=" << slot_dir << "/stdout.txt\n";
  oss << "#SBATCH --error=" << slot_dir << "/stderr.txt\n";

  // ----- configuration -----
  oss << "\necho '===== CONFIGURATION ====='\n";
  if (!rc.module_loads.empty()) {
    oss << "echo '=== MODULE LOADS ==='\n";
    oss << "module purge\n";
    oss << "module load";
    for (const auto& m : rc.module_loads) oss << " " << m;
    oss << "\n";
  }

  // Declaration order: later variables may expand earlier ones.
  const plan::KeyValues& env = rc.environment_variables;
  if (!env.empty()) oss << "echo '=== ENVIRONMENT VARIABLES ==='\n";
  for (const auto& kv : env) {
    oss << "export " << kv.first << "=" << kv.second << "\n";
    oss << "echo " << ShellQuote(kv.first + "=" + kv.second) << "\n";
  }

  oss << "echo '=== CPU ARCHITECTURE ==='\n";
  oss << "command -v lscpu >/dev/null 2>&1 && lscpu\n";
  oss << "echo '=== SLURM CONFIG ==='\n";
  oss << "if [ -n \"$SLURM_JOB_ID\" ]; then scontrol show job \"$SLURM_JOB_ID\"; fi\n";
  oss << "echo '=== RUN INSTANTIATION ==='\n";
  oss << "echo " << ShellQuote(inst.AxesLabel()) << "\n";
  oss << "echo\n";

  // ----- build -----
  oss << "\necho '===== BUILD ====='\n";
  if (!rc.directory.empty()) oss << "cd " << rc.directory << "\n";
  if (rc.pre_built) {
    oss << "echo 'run configuration was pre-built'\n";
  } else {
    for (const auto& cmd : rc.build_commands) oss << cmd << "\n";
  }
  oss << "echo\n";

  // ----- run -----
  oss << "\necho '===== RUN ====='\n";
  oss << kTimeCommand << rc.run_command;
  if (!rc.args.empty()) oss << " " << rc.args;
  oss << "\n";
  oss << "hmb_rc=$?\n";

  // ----- post run -----
  if (!rc.post_commands.empty()) {
    oss << "\necho '===== POST RUN ====='\n";
    for (const auto& cmd : rc.post_commands) oss << cmd << "\n";
  }

  std::set<std::string> files;
  for (const auto& m : metrics) {
    if (m.target == MetricTarget::File) files.insert(m.file_name);
  }
  oss << "\n";
  if (!files.empty()) {
    oss << "mkdir -p " << ShellQuote(slot_dir + "/files") << "\n";
    for (const auto& f : files) {
      oss << "cp -f " << ShellQuote(f) << " " << ShellQuote(slot_dir + "/files/") << "\n";
    }
  }
  oss << "echo $hmb_rc > " << ShellQuote(slot_dir + "/exit_code") << "\n";
  oss << "exit $hmb_rc\n";
  return oss.str();
}

}  // namespace sched
}  // namespace hmb
