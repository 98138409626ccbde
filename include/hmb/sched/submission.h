#pragma once
// hmb/sched/submission.h
//
// Render a run instance into a batch submission script.
//
// Layout (sections are echoed so the captured stdout is self-describing):
//   #!/bin/sh
//   #SBATCH directives (declaration order), then job-name/output/error
//   ===== CONFIGURATION =====  module loads, environment, lscpu,
//                              scontrol show job, run instantiation
//   ===== BUILD =====          cd <directory>, build commands (or a note
//                              when the run configuration is pre-built)
//   ===== RUN =====            time -p <run_command> <args>; hmb_rc=$?
//   ===== POST RUN =====       post commands
//   copy of file-targeted metric artifacts into <slot>/files/
//   echo $hmb_rc > <slot>/exit_code; exit $hmb_rc

#include "hmb/plan/matrix.h"
#include "hmb/plan/model.h"

#include <string>
#include <vector>

namespace hmb {
namespace sched {

// `slot_dir` should be absolute: the job starts in the submit directory but
// changes into the run configuration's directory before building.
std::string RenderSubmissionScript(const plan::RunInstance& inst,
                                   const std::vector<plan::MetricDefinition>& metrics,
                                   const std::string& slot_dir);

}  // namespace sched
}  // namespace hmb
