// tests/test_result_store.cpp
//
// Result store tests:
//  - slot layout and artifact round trip
//  - no-clobber claim (idempotent), overwrite claim
//  - status.json round trip and settled statuses on reload

#include "hmb/core/error.h"
#include "hmb/core/types.h"
#include "hmb/plan/matrix.h"
#include "hmb/store/result_store.h"

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace {

struct TestContext {
  int fails = 0;

  void Check(bool ok, const char* expr, const char* file, int line) {
    if (ok) return;
    ++fails;
    std::cerr << "[FAIL] " << file << ":" << line << "  CHECK(" << expr << ")\n";
  }

  template <class A, class B>
  void CheckEq(const A& a, const B& b, const char* ea, const char* eb, const char* file, int line) {
    if (a == b) return;
    ++fails;
    std::cerr << "[FAIL] " << file << ":" << line << "  CHECK_EQ(" << ea << ", " << eb
              << ")  got " << a << " vs " << b << "\n";
  }
};

#define CHECK(ctx, expr) (ctx).Check((expr), #expr, __FILE__, __LINE__)
#define CHECK_EQ(ctx, a, b) (ctx).CheckEq((a), (b), #a, #b, __FILE__, __LINE__)

namespace fs = std::filesystem;
using hmb::Error;
using hmb::RunStatus;
using hmb::store::ClobberPolicy;
using hmb::store::ResultStore;
using hmb::store::RunArtifacts;

fs::path FreshDir(const std::string& name) {
  const fs::path dir = fs::temp_directory_path() / name;
  std::error_code ec;
  fs::remove_all(dir, ec);
  return dir;
}

hmb::plan::RunInstance MakeInstance(const std::string& bench, const std::string& threads,
                                    hmb::u32 rerun) {
  hmb::plan::RunInstance inst;
  inst.bench = bench;
  inst.axes = {{"threads", threads}};
  inst.rerun = rerun;
  inst.id = hmb::plan::MakeIdentifier(bench, inst.axes, rerun);
  inst.group_key = hmb::plan::MakeGroupKey(bench, inst.axes);
  return inst;
}

void TestRoundTrip(TestContext& t) {
  const fs::path root = FreshDir("hmb_test_store_roundtrip");
  ResultStore store(root);
  Error err;
  CHECK(t, store.Init(&err));
  CHECK(t, fs::is_directory(root));

  const auto inst = MakeInstance("my bench", "2", 0);
  CHECK(t, !store.Exists(inst));
  CHECK_EQ(t, store.SlotDir(inst).parent_path().filename().string(), std::string("my_bench"));

  RunArtifacts art;
  art.stdout_text = std::string("result: 42\n");
  art.stderr_text = std::string("real 1.50\n");
  art.files["out.log"] = "bw=12.5\n";
  art.exit_code = 0;
  CHECK(t, store.Persist(inst, art, &err));
  CHECK(t, store.Exists(inst));
  CHECK(t, fs::is_regular_file(store.SlotDir(inst) / std::string(hmb::store::kStdoutFile)));
  CHECK(t, fs::is_regular_file(store.SlotDir(inst) / std::string(hmb::store::kFilesDir) / "out.log"));

  RunArtifacts back;
  CHECK(t, store.Load(inst, &back, &err));
  CHECK(t, back.stdout_text.has_value());
  CHECK(t, back.stderr_text.has_value());
  if (back.stdout_text) CHECK_EQ(t, *back.stdout_text, std::string("result: 42\n"));
  if (back.stderr_text) CHECK_EQ(t, *back.stderr_text, std::string("real 1.50\n"));
  CHECK_EQ(t, back.files.size(), static_cast<std::size_t>(1));
  CHECK_EQ(t, back.files["out.log"], std::string("bw=12.5\n"));
  CHECK(t, back.exit_code.has_value() && *back.exit_code == 0);

  // Missing slot is a per-instance StoreError.
  const auto other = MakeInstance("my bench", "8", 0);
  RunArtifacts none;
  Error load_err;
  CHECK(t, !store.Load(other, &none, &load_err));
  CHECK(t, load_err.kind == hmb::ErrorKind::Store);

  CHECK(t, store.Remove(inst, &err));
  CHECK(t, !store.Exists(inst));

  std::error_code ec;
  fs::remove_all(root, ec);
}

void TestClaimPolicies(TestContext& t) {
  const fs::path root = FreshDir("hmb_test_store_claim");
  ResultStore store(root);
  Error err;
  CHECK(t, store.Init(&err));

  const auto inst = MakeInstance("b", "1", 0);

  bool claimed = false;
  CHECK(t, store.Claim(inst, ClobberPolicy::NoClobber, &claimed, &err));
  CHECK(t, claimed);

  RunArtifacts art;
  art.stdout_text = std::string("first\n");
  CHECK(t, store.Persist(inst, art, &err));

  // A second no-clobber claim is refused and leaves the slot untouched.
  for (int i = 0; i < 2; ++i) {
    bool again = true;
    CHECK(t, store.Claim(inst, ClobberPolicy::NoClobber, &again, &err));
    CHECK(t, !again);
  }
  RunArtifacts kept;
  CHECK(t, store.Load(inst, &kept, &err));
  CHECK(t, kept.stdout_text && *kept.stdout_text == "first\n");

  // Overwrite wipes the slot and claims it anew.
  bool over = false;
  CHECK(t, store.Claim(inst, ClobberPolicy::Overwrite, &over, &err));
  CHECK(t, over);
  RunArtifacts wiped;
  CHECK(t, store.Load(inst, &wiped, &err));
  CHECK(t, !wiped.stdout_text.has_value());
  CHECK(t, !wiped.exit_code.has_value());

  std::error_code ec;
  fs::remove_all(root, ec);
}

void TestStatusRecord(TestContext& t) {
  const fs::path root = FreshDir("hmb_test_store_status");
  ResultStore store(root);
  Error err;
  CHECK(t, store.Init(&err));

  auto inst = MakeInstance("b", "a\"b", 1);
  inst.status = RunStatus::Running;
  inst.handle = "777";
  inst.last_error = "line1\nline2";
  CHECK(t, store.WriteStatus(inst, &err));
  CHECK(t, !fs::exists(store.SlotDir(inst) / (std::string(hmb::store::kStatusFile) + ".tmp")));

  hmb::store::StatusRecord rec;
  CHECK(t, store.ReadStatus(inst, &rec, &err));
  CHECK_EQ(t, rec.id, inst.id);
  CHECK_EQ(t, rec.bench, std::string("b"));
  CHECK_EQ(t, rec.group_key, inst.group_key);
  CHECK_EQ(t, rec.rerun, 1u);
  CHECK(t, rec.status == RunStatus::Running);
  CHECK_EQ(t, rec.handle, std::string("777"));
  CHECK_EQ(t, rec.last_error, std::string("line1\nline2"));
  CHECK_EQ(t, rec.axes.size(), static_cast<std::size_t>(1));
  if (!rec.axes.empty()) CHECK_EQ(t, rec.axes[0].second, std::string("a\"b"));
  CHECK(t, !rec.updated_at.empty());

  hmb::store::StatusRecord junk;
  Error jerr;
  CHECK(t, !hmb::store::StatusRecord::FromJson("{\"status\":\"sleeping\"}", &junk, &jerr));
  CHECK(t, jerr.kind == hmb::ErrorKind::Store);

  std::error_code ec;
  fs::remove_all(root, ec);
}

void TestLoadRecordedStatuses(TestContext& t) {
  const fs::path root = FreshDir("hmb_test_store_reload");
  ResultStore store(root);
  Error err;
  CHECK(t, store.Init(&err));

  std::vector<hmb::plan::RunInstance> recorded = {
      MakeInstance("b", "1", 0), MakeInstance("b", "2", 0), MakeInstance("b", "3", 0),
      MakeInstance("b", "4", 0)};

  // [0] completed, status says so.
  recorded[0].status = RunStatus::Completed;
  recorded[0].handle = "10";
  CHECK(t, store.WriteStatus(recorded[0], &err));
  // [1] status still says submitted but the job wrote a failing exit code.
  recorded[1].status = RunStatus::Submitted;
  recorded[1].handle = "11";
  CHECK(t, store.WriteStatus(recorded[1], &err));
  RunArtifacts failed;
  failed.exit_code = 2;
  CHECK(t, store.Persist(recorded[1], failed, &err));
  // [2] running, no exit code yet.
  recorded[2].status = RunStatus::Running;
  recorded[2].handle = "12";
  CHECK(t, store.WriteStatus(recorded[2], &err));
  // [3] never recorded.

  std::vector<hmb::plan::RunInstance> fresh = {
      MakeInstance("b", "1", 0), MakeInstance("b", "2", 0), MakeInstance("b", "3", 0),
      MakeInstance("b", "4", 0)};
  store.LoadRecordedStatuses(&fresh);
  CHECK(t, fresh[0].status == RunStatus::Completed);
  CHECK_EQ(t, fresh[0].handle, std::string("10"));
  CHECK(t, fresh[1].status == RunStatus::Failed);
  CHECK(t, fresh[2].status == RunStatus::Running);
  CHECK(t, fresh[3].status == RunStatus::Pending);
  CHECK(t, fresh[3].handle.empty());

  std::error_code ec;
  fs::remove_all(root, ec);
}

}  // namespace

int main() {
  TestContext t;

  TestRoundTrip(t);
  TestClaimPolicies(t);
  TestStatusRecord(t);
  TestLoadRecordedStatuses(t);

  if (t.fails == 0) {
    std::cout << "[OK] test_result_store\n";
    return 0;
  }
  std::cerr << "[FAILED] test_result_store fails=" << t.fails << "\n";
  return 1;
}
