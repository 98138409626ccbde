#pragma once
// hmb/sched/process.h
//
// Shell command helpers used by the scheduler backends.

#include "hmb/core/error.h"

#include <string>
#include <string_view>
#include <vector>

namespace hmb {
namespace sched {

struct CommandResult {
  int exit_code = -1;   // -1 when the process did not exit normally
  std::string output;   // captured stdout (stderr too when merged)
};

// Run `cmd` through /bin/sh, capturing stdout. With merge_stderr the command
// is suffixed with "2>&1". Fails (ErrorKind::Submission) only when the
// process cannot be started; a non-zero exit is reported via out->exit_code.
bool RunCommand(const std::string& cmd, CommandResult* out, bool merge_stderr = true,
                Error* err = nullptr);

// POSIX single-quote quoting: abc -> 'abc', it's -> 'it'\''s'.
std::string ShellQuote(std::string_view s);

std::string JoinQuoted(const std::vector<std::string>& args);

}  // namespace sched
}  // namespace hmb
