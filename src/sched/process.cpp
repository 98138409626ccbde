// src/sched/process.cpp

#include "hmb/sched/process.h"

#include "hmb/core/logging.h"

#include <cstdio>
#include <sys/wait.h>

namespace hmb {
namespace sched {

bool RunCommand(const std::string& cmd, CommandResult* out, bool merge_stderr, Error* err) {
  if (!out) {
    SetErr(err, ErrorKind::Submission, "RunCommand: out is null");
    return false;
  }
  const std::string full = merge_stderr ? cmd + " 2>&1" : cmd;
  HMB_LOG_TRACE("exec:", full);

  FILE* pipe = popen(full.c_str(), "r");
  if (!pipe) {
    SetErr(err, ErrorKind::Submission, "failed to start command: " + cmd);
    return false;
  }

  out->output.clear();
  char buffer[256];
  while (std::fgets(buffer, sizeof(buffer), pipe) != nullptr) {
    out->output += buffer;
  }

  const int status = pclose(pipe);
  if (status == -1) {
    SetErr(err, ErrorKind::Submission, "failed to wait for command: " + cmd);
    return false;
  }
  out->exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
  return true;
}

std::string ShellQuote(std::string_view s) {
  std::string out;
  out.reserve(s.size() + 2);
  out.push_back('\'');
  for (char c : s) {
    if (c == '\'') {
      out += "'\\''";
    } else {
      out.push_back(c);
    }
  }
  out.push_back('\'');
  return out;
}

std::string JoinQuoted(const std::vector<std::string>& args) {
  std::string out;
  for (const auto& a : args) {
    if (!out.empty()) out.push_back(' ');
    out += ShellQuote(a);
  }
  return out;
}

}  // namespace sched
}  // namespace hmb
