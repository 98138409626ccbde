// src/sched/slurm_scheduler.cpp

#include "hmb/sched/slurm_scheduler.h"

#include "hmb/core/logging.h"
#include "hmb/sched/process.h"

#include <boost/regex.hpp>

#include <sstream>

namespace hmb {
namespace sched {

namespace {

constexpr std::string_view kUnqueuedMessage = "Invalid job id specified";

struct StateRow {
  std::string_view name;
  RawStatus status;
};

// squeue %T long-form state names.
constexpr StateRow kSlurmStates[] = {
    {"PENDING", RawStatus::Pending},
    {"CONFIGURING", RawStatus::Pending},
    {"REQUEUED", RawStatus::Pending},
    {"REQUEUE_FED", RawStatus::Pending},
    {"REQUEUE_HOLD", RawStatus::Pending},
    {"RESV_DEL_HOLD", RawStatus::Pending},
    {"SUSPENDED", RawStatus::Pending},
    {"STOPPED", RawStatus::Pending},
    {"RUNNING", RawStatus::Running},
    {"COMPLETING", RawStatus::Running},
    {"STAGE_OUT", RawStatus::Running},
    {"SIGNALING", RawStatus::Running},
    {"RESIZING", RawStatus::Running},
    {"COMPLETED", RawStatus::Completed},
    {"FAILED", RawStatus::Failed},
    {"CANCELLED", RawStatus::Failed},
    {"TIMEOUT", RawStatus::Failed},
    {"NODE_FAIL", RawStatus::Failed},
    {"OUT_OF_MEMORY", RawStatus::Failed},
    {"BOOT_FAIL", RawStatus::Failed},
    {"DEADLINE", RawStatus::Failed},
    {"PREEMPTED", RawStatus::Failed},
    {"REVOKED", RawStatus::Failed},
    {"SPECIAL_EXIT", RawStatus::Failed},
};

std::string Trimmed(std::string_view s) {
  while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ')) s.remove_suffix(1);
  return std::string(s);
}

}  // namespace

RawStatus MapSlurmState(std::string_view state) {
  // "CANCELLED by 1234" -> "CANCELLED"
  const usize sp = state.find(' ');
  if (sp != std::string_view::npos) state = state.substr(0, sp);
  for (const auto& row : kSlurmStates) {
    if (detail::EqualsIgnoreCase(row.name, state)) return row.status;
  }
  return RawStatus::Unknown;
}

bool ParseSbatchJobId(std::string_view output, JobHandle* out) {
  if (!out) return false;
  static const boost::regex kJobId(R"(Submitted batch job (\d+))");
  boost::match_results<std::string_view::const_iterator> m;
  if (!boost::regex_search(output.begin(), output.end(), m, kJobId)) return false;
  *out = m[1].str();
  return true;
}

bool ParseSqueueOutput(std::string_view output, std::unordered_map<JobHandle, RawStatus>* out,
                       Error* err) {
  if (!out) {
    SetErr(err, ErrorKind::Submission, "ParseSqueueOutput: out is null");
    return false;
  }
  std::istringstream iss{std::string(output)};
  std::string line;
  while (std::getline(iss, line)) {
    std::istringstream ls(line);
    std::string id;
    std::string state;
    if (!(ls >> id)) continue;  // blank
    if (!(ls >> state)) {
      SetErr(err, ErrorKind::Submission, "malformed squeue line: '" + line + "'");
      return false;
    }
    (*out)[id] = MapSlurmState(state);
  }
  return true;
}

std::string SbatchCommand(const std::string& sbatch, const Submission& sub) {
  std::vector<std::string> args;
  if (!sub.dependencies.empty()) {
    std::string dep = "--dependency=afterok";
    for (const auto& h : sub.dependencies) dep += ":" + h;
    args.push_back(std::move(dep));
  }
  args.push_back(sub.script_path);
  return sbatch + " " + JoinQuoted(args);
}

bool SlurmScheduler::Submit(const Submission& sub, JobHandle* handle, Error* err) {
  if (!handle) {
    SetErr(err, ErrorKind::Submission, "Submit: handle is null");
    return false;
  }
  CommandResult res;
  if (!RunCommand(SbatchCommand(sbatch_, sub), &res, true, err)) return false;
  if (res.exit_code != 0) {
    SetErr(err, ErrorKind::Submission,
           "sbatch exited with " + std::to_string(res.exit_code) + ": " + Trimmed(res.output));
    return false;
  }
  if (!ParseSbatchJobId(res.output, handle)) {
    SetErr(err, ErrorKind::Submission, "unexpected sbatch response: '" + Trimmed(res.output) + "'");
    return false;
  }
  HMB_LOG_DEBUG("sbatch:", sub.id, "->", *handle);
  return true;
}

bool SlurmScheduler::QueryStatus(const std::vector<JobHandle>& handles,
                                 std::unordered_map<JobHandle, RawStatus>* out, Error* err) {
  if (!out) {
    SetErr(err, ErrorKind::Submission, "QueryStatus: out is null");
    return false;
  }
  out->clear();
  if (handles.empty()) return true;

  std::string ids;
  for (const auto& h : handles) {
    if (!ids.empty()) ids.push_back(',');
    ids += h;
  }

  CommandResult res;
  const std::string cmd = squeue_ + " -h -o " + ShellQuote("%i %T") + " -j " + ShellQuote(ids);
  if (!RunCommand(cmd, &res, true, err)) return false;
  if (res.exit_code != 0) {
    // Every listed job has left the queue.
    if (res.output.find(kUnqueuedMessage) != std::string::npos) return true;
    SetErr(err, ErrorKind::Submission,
           "squeue exited with " + std::to_string(res.exit_code) + ": " + Trimmed(res.output));
    return false;
  }
  return ParseSqueueOutput(res.output, out, err);
}

bool SlurmScheduler::Cancel(const JobHandle& handle, Error* err) {
  CommandResult res;
  if (!RunCommand(scancel_ + " " + ShellQuote(handle), &res, true, err)) return false;
  if (res.exit_code != 0) {
    SetErr(err, ErrorKind::Submission,
           "scancel " + handle + " exited with " + std::to_string(res.exit_code) + ": " +
               Trimmed(res.output));
    return false;
  }
  return true;
}

}  // namespace sched
}  // namespace hmb
