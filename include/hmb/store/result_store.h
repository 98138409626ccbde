#pragma once
// hmb/store/result_store.h
//
// Identifier-keyed result store on the local filesystem.
//
// Layout:
//   <root>/<bench>/<id>/stdout.txt
//                      stderr.txt
//                      files/<name>       (file-targeted metric artifacts)
//                      exit_code          (written by the submission script)
//                      submission.sh
//                      status.json        (lifecycle record)
//
// Each slot has a single writer at a time: the dispatcher task that claimed
// it, then the tracker. Claim() is the only check-and-take step; it relies on
// directory creation being atomic.

#include "hmb/core/error.h"
#include "hmb/core/types.h"
#include "hmb/plan/matrix.h"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hmb {
namespace store {

enum class ClobberPolicy : u8 {
  NoClobber = 0,
  Overwrite = 1,
};

inline constexpr std::string_view kStdoutFile = "stdout.txt";
inline constexpr std::string_view kStderrFile = "stderr.txt";
inline constexpr std::string_view kFilesDir = "files";
inline constexpr std::string_view kExitCodeFile = "exit_code";
inline constexpr std::string_view kScriptFile = "submission.sh";
inline constexpr std::string_view kStatusFile = "status.json";

// Captured outputs of one run. Absent members are not written / were not found.
struct RunArtifacts {
  std::optional<std::string> stdout_text;
  std::optional<std::string> stderr_text;
  std::map<std::string, std::string> files;
  std::optional<int> exit_code;
};

// Contents of status.json.
struct StatusRecord {
  std::string id;
  std::string bench;
  std::string group_key;
  u32 rerun = 0;
  plan::AxisValues axes;
  RunStatus status = RunStatus::Pending;
  JobHandle handle;
  std::string last_error;
  std::string updated_at;

  std::string ToJson() const;
  static bool FromJson(std::string_view text, StatusRecord* out, Error* err = nullptr);
  static StatusRecord FromInstance(const plan::RunInstance& inst);
};

class ResultStore {
 public:
  explicit ResultStore(std::filesystem::path root);

  const std::filesystem::path& Root() const noexcept { return root_; }

  // Create the root directory. StoreError when it cannot be created.
  bool Init(Error* err = nullptr);

  std::filesystem::path SlotDir(std::string_view bench, std::string_view id) const;
  std::filesystem::path SlotDir(const plan::RunInstance& inst) const {
    return SlotDir(inst.bench, inst.id);
  }

  bool Exists(const plan::RunInstance& inst) const;

  // NoClobber: *claimed=false when the slot already exists (left untouched).
  // Overwrite: the slot is deleted first, then created; *claimed=true.
  bool Claim(const plan::RunInstance& inst, ClobberPolicy policy, bool* claimed,
             Error* err = nullptr);

  // Write the present members of `art` into the slot (creating it if needed).
  bool Persist(const plan::RunInstance& inst, const RunArtifacts& art, Error* err = nullptr);

  bool WriteScript(const plan::RunInstance& inst, std::string_view script, Error* err = nullptr);

  // Atomic replace of status.json (write temp file, then rename).
  bool WriteStatus(const plan::RunInstance& inst, Error* err = nullptr);

  // StoreError only when the slot itself is missing; absent artifacts are
  // simply left empty in *out.
  bool Load(const plan::RunInstance& inst, RunArtifacts* out, Error* err = nullptr) const;

  bool ReadStatus(const plan::RunInstance& inst, StatusRecord* out, Error* err = nullptr) const;

  // Parsed exit_code file, or nullopt when absent or unparsable.
  std::optional<int> ReadExitCode(const plan::RunInstance& inst) const;

  bool Remove(const plan::RunInstance& inst, Error* err = nullptr);

  // Report path: set each instance's status/handle from what was recorded.
  // A recorded non-terminal status is settled by the exit_code file when one
  // exists; instances without a slot keep their in-memory status.
  void LoadRecordedStatuses(std::vector<plan::RunInstance>* instances) const;

 private:
  std::filesystem::path root_;
};

}  // namespace store
}  // namespace hmb
