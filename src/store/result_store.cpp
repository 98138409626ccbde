// src/store/result_store.cpp

#include "hmb/store/result_store.h"

#include "hmb/core/logging.h"
#include "hmb/io/fs_util.h"
#include "hmb/io/json.h"

#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace hmb {
namespace store {

namespace {

std::string Str(std::string_view s) { return std::string(s); }

bool ParseExitCode(const std::string& text, int* out) {
  std::istringstream iss(text);
  int v = 0;
  if (!(iss >> v)) return false;
  std::string rest;
  if (iss >> rest) return false;
  *out = v;
  return true;
}

}  // namespace

// --------------------------
// StatusRecord
// --------------------------
std::string StatusRecord::ToJson() const {
  std::ostringstream oss;
  oss << "{"
      << "\"id\":\"" << json::Escape(id) << "\","
      << "\"bench\":\"" << json::Escape(bench) << "\","
      << "\"group_key\":\"" << json::Escape(group_key) << "\","
      << "\"rerun\":" << rerun << ","
      << "\"axes\":[";
  for (usize i = 0; i < axes.size(); ++i) {
    if (i) oss << ",";
    oss << "{\"name\":\"" << json::Escape(axes[i].first) << "\",\"value\":\""
        << json::Escape(axes[i].second) << "\"}";
  }
  oss << "],"
      << "\"status\":\"" << ToString(status) << "\","
      << "\"handle\":\"" << json::Escape(handle) << "\","
      << "\"last_error\":\"" << json::Escape(last_error) << "\","
      << "\"updated_at\":\"" << json::Escape(updated_at) << "\""
      << "}\n";
  return oss.str();
}

bool StatusRecord::FromJson(std::string_view text, StatusRecord* out, Error* err) {
  if (!out) {
    SetErr(err, ErrorKind::Store, "StatusRecord::FromJson: out is null");
    return false;
  }
  json::Value root;
  Error perr;
  if (!json::Parse(text, &root, &perr) || !root.IsObject()) {
    SetErr(err, ErrorKind::Store, "malformed status record: " + perr.message);
    return false;
  }

  StatusRecord r;
  auto get_str = [&](std::string_view key, std::string* dst) {
    if (const json::Value* v = json::Get(root, key)) json::GetString(*v, dst);
  };
  get_str("id", &r.id);
  get_str("bench", &r.bench);
  get_str("group_key", &r.group_key);
  get_str("handle", &r.handle);
  get_str("last_error", &r.last_error);
  get_str("updated_at", &r.updated_at);

  if (const json::Value* v = json::Get(root, "rerun")) {
    u64 rr = 0;
    if (json::GetU64(*v, &rr)) r.rerun = static_cast<u32>(rr);
  }
  if (const json::Value* v = json::Get(root, "axes")) {
    if (v->IsArray()) {
      for (const auto& a : v->arr) {
        std::string name;
        std::string value;
        const json::Value* n = json::Get(a, "name");
        const json::Value* val = json::Get(a, "value");
        if (n && val && json::GetString(*n, &name) && json::GetString(*val, &value)) {
          r.axes.emplace_back(std::move(name), std::move(value));
        }
      }
    }
  }

  std::string status;
  get_str("status", &status);
  if (!ParseRunStatus(status, &r.status)) {
    SetErr(err, ErrorKind::Store, "status record has unknown status '" + status + "'");
    return false;
  }

  *out = std::move(r);
  return true;
}

StatusRecord StatusRecord::FromInstance(const plan::RunInstance& inst) {
  StatusRecord r;
  r.id = inst.id;
  r.bench = inst.bench;
  r.group_key = inst.group_key;
  r.rerun = inst.rerun;
  r.axes = inst.axes;
  r.status = inst.status;
  r.handle = inst.handle;
  r.last_error = inst.last_error;
  r.updated_at = io::NowIso8601Utc();
  return r;
}

// --------------------------
// ResultStore
// --------------------------
ResultStore::ResultStore(fs::path root) : root_(std::move(root)) {
  std::error_code ec;
  const fs::path abs = fs::absolute(root_, ec);
  if (!ec) root_ = abs.lexically_normal();
}

bool ResultStore::Init(Error* err) {
  if (!io::EnsureDirExists(root_, err)) {
    AddContext(err, "result store");
    return false;
  }
  return true;
}

fs::path ResultStore::SlotDir(std::string_view bench, std::string_view id) const {
  return root_ / io::SanitizeName(bench) / std::string(id);
}

bool ResultStore::Exists(const plan::RunInstance& inst) const {
  std::error_code ec;
  return fs::is_directory(SlotDir(inst), ec);
}

bool ResultStore::Claim(const plan::RunInstance& inst, ClobberPolicy policy, bool* claimed,
                        Error* err) {
  if (!claimed) {
    SetErr(err, ErrorKind::Store, "Claim: claimed is null");
    return false;
  }
  *claimed = false;
  const fs::path slot = SlotDir(inst);
  if (!io::EnsureDirExists(slot.parent_path(), err)) return false;

  std::error_code ec;
  if (policy == ClobberPolicy::Overwrite) {
    fs::remove_all(slot, ec);
    if (ec) {
      SetErr(err, ErrorKind::Store, "cannot remove " + slot.string() + " (" + ec.message() + ")");
      return false;
    }
  }

  const bool created = fs::create_directory(slot, ec);
  if (ec) {
    SetErr(err, ErrorKind::Store, "cannot create " + slot.string() + " (" + ec.message() + ")");
    return false;
  }
  if (!created) {
    HMB_LOG_DEBUG("store: slot exists, not claimed:", inst.id);
    return true;
  }
  *claimed = true;
  return true;
}

bool ResultStore::Persist(const plan::RunInstance& inst, const RunArtifacts& art, Error* err) {
  const fs::path slot = SlotDir(inst);
  if (!io::EnsureDirExists(slot, err)) return false;

  if (art.stdout_text && !io::WriteStringToFile(slot / Str(kStdoutFile), *art.stdout_text, err)) {
    return false;
  }
  if (art.stderr_text && !io::WriteStringToFile(slot / Str(kStderrFile), *art.stderr_text, err)) {
    return false;
  }
  if (!art.files.empty()) {
    const fs::path files_dir = slot / Str(kFilesDir);
    if (!io::EnsureDirExists(files_dir, err)) return false;
    for (const auto& kv : art.files) {
      const fs::path name = fs::path(kv.first).filename();
      if (!io::WriteStringToFile(files_dir / name, kv.second, err)) return false;
    }
  }
  if (art.exit_code) {
    if (!io::WriteStringToFile(slot / Str(kExitCodeFile), std::to_string(*art.exit_code) + "\n",
                               err)) {
      return false;
    }
  }
  return true;
}

bool ResultStore::WriteScript(const plan::RunInstance& inst, std::string_view script, Error* err) {
  const fs::path slot = SlotDir(inst);
  if (!io::EnsureDirExists(slot, err)) return false;
  const fs::path p = slot / Str(kScriptFile);
  if (!io::WriteStringToFile(p, script, err)) return false;
  std::error_code ec;
  fs::permissions(p, fs::perms::owner_exec | fs::perms::group_exec, fs::perm_options::add, ec);
  return true;
}

bool ResultStore::WriteStatus(const plan::RunInstance& inst, Error* err) {
  const fs::path slot = SlotDir(inst);
  if (!io::EnsureDirExists(slot, err)) return false;
  return io::ReplaceFileAtomic(slot / Str(kStatusFile), StatusRecord::FromInstance(inst).ToJson(),
                               err);
}

bool ResultStore::Load(const plan::RunInstance& inst, RunArtifacts* out, Error* err) const {
  if (!out) {
    SetErr(err, ErrorKind::Store, "Load: out is null");
    return false;
  }
  const fs::path slot = SlotDir(inst);
  std::error_code ec;
  if (!fs::is_directory(slot, ec)) {
    SetErr(err, ErrorKind::Store, "no result slot for " + inst.id);
    return false;
  }

  RunArtifacts art;
  art.stdout_text = io::ReadFileIfPresent(slot / Str(kStdoutFile));
  art.stderr_text = io::ReadFileIfPresent(slot / Str(kStderrFile));

  const fs::path files_dir = slot / Str(kFilesDir);
  if (fs::is_directory(files_dir, ec)) {
    for (const auto& entry : fs::directory_iterator(files_dir, ec)) {
      if (auto content = io::ReadFileIfPresent(entry.path())) {
        art.files.emplace(entry.path().filename().string(), std::move(*content));
      }
    }
  }

  art.exit_code = ReadExitCode(inst);
  *out = std::move(art);
  return true;
}

bool ResultStore::ReadStatus(const plan::RunInstance& inst, StatusRecord* out, Error* err) const {
  std::string text;
  if (!io::ReadFileToString(SlotDir(inst) / Str(kStatusFile), &text, err)) return false;
  if (!StatusRecord::FromJson(text, out, err)) {
    AddContext(err, inst.id);
    return false;
  }
  return true;
}

std::optional<int> ResultStore::ReadExitCode(const plan::RunInstance& inst) const {
  const auto text = io::ReadFileIfPresent(SlotDir(inst) / Str(kExitCodeFile));
  int code = 0;
  if (!text || !ParseExitCode(*text, &code)) return std::nullopt;
  return code;
}

bool ResultStore::Remove(const plan::RunInstance& inst, Error* err) {
  std::error_code ec;
  fs::remove_all(SlotDir(inst), ec);
  if (ec) {
    SetErr(err, ErrorKind::Store, "cannot remove slot for " + inst.id + " (" + ec.message() + ")");
    return false;
  }
  return true;
}

void ResultStore::LoadRecordedStatuses(std::vector<plan::RunInstance>* instances) const {
  if (!instances) return;
  for (auto& inst : *instances) {
    if (!Exists(inst)) continue;
    StatusRecord rec;
    Error err;
    if (ReadStatus(inst, &rec, &err)) {
      inst.status = rec.status;
      inst.handle = rec.handle;
      inst.last_error = rec.last_error;
    } else {
      HMB_LOG_DEBUG("store:", err.message);
    }
    if (!IsTerminal(inst.status)) {
      if (const auto code = ReadExitCode(inst)) {
        inst.status = (*code == 0) ? RunStatus::Completed : RunStatus::Failed;
      }
    }
  }
}

}  // namespace store
}  // namespace hmb
