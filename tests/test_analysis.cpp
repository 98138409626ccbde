// tests/test_analysis.cpp
//
// Metric extraction and rerun aggregation:
//  - first match / capture group 1, typed coercion, missing reasons
//  - single output lines far longer than a recursive matcher's stack allows
//  - sample stdev over reruns, single rerun, all-missing groups
//  - text mode with first-seen tie break
//  - store -> ExtractAll -> Aggregate end to end

#include "hmb/analysis/aggregator.h"
#include "hmb/analysis/extractor.h"
#include "hmb/core/error.h"
#include "hmb/core/logging.h"
#include "hmb/plan/matrix.h"
#include "hmb/plan/model.h"
#include "hmb/plan/plan_loader.h"
#include "hmb/store/result_store.h"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <string>
#include <variant>
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

  void CheckNear(double a, double b, double eps, const char* ea, const char* eb, const char* file,
                 int line) {
    const double scale = std::max({1.0, std::fabs(a), std::fabs(b)});
    if (std::fabs(a - b) <= eps * scale) return;
    ++fails;
    std::cerr << "[FAIL] " << file << ":" << line << "  CHECK_NEAR(" << ea << ", " << eb
              << ")  got " << a << " vs " << b << "\n";
  }
};

#define CHECK(ctx, expr) (ctx).Check((expr), #expr, __FILE__, __LINE__)
#define CHECK_EQ(ctx, a, b) (ctx).CheckEq((a), (b), #a, #b, __FILE__, __LINE__)
#define CHECK_NEAR(ctx, a, b, eps) (ctx).CheckNear((a), (b), (eps), #a, #b, __FILE__, __LINE__)

namespace fs = std::filesystem;
using hmb::Error;
using hmb::RunStatus;
using hmb::analysis::ExtractedMetric;
using hmb::analysis::MetricValue;
using hmb::analysis::Missing;
using hmb::analysis::MissingReason;
using hmb::plan::MetricDefinition;
using hmb::store::RunArtifacts;

MetricDefinition MakeMetric(const std::string& name, const std::string& pattern,
                            hmb::MetricTarget target = hmb::MetricTarget::Stdout,
                            hmb::MetricType type = hmb::MetricType::Numeric) {
  MetricDefinition def;
  def.name = name;
  def.pattern = pattern;
  def.target = target;
  def.type = type;
  Error err;
  def.Compile(&err);
  return def;
}

bool IsMissing(const MetricValue& v, MissingReason reason) {
  const Missing* m = std::get_if<Missing>(&v);
  return m && m->reason == reason;
}

double AsNumber(const MetricValue& v) {
  const double* d = std::get_if<double>(&v);
  return d ? *d : std::nan("");
}

void TestCoerceNumeric(TestContext& t) {
  CHECK(t, hmb::analysis::CoerceNumeric("42").has_value());
  CHECK_NEAR(t, *hmb::analysis::CoerceNumeric(" 1.5e3\n"), 1500.0, 1e-12);
  CHECK_NEAR(t, *hmb::analysis::CoerceNumeric("-0.25"), -0.25, 1e-12);
  CHECK(t, !hmb::analysis::CoerceNumeric("").has_value());
  CHECK(t, !hmb::analysis::CoerceNumeric("12abc").has_value());
  CHECK(t, !hmb::analysis::CoerceNumeric("fast").has_value());
  CHECK(t, !hmb::analysis::CoerceNumeric("inf").has_value());
}

void TestExtractMetric(TestContext& t) {
  RunArtifacts art;
  art.stdout_text = std::string("warmup: 9.0\nGFLOPS: 12.5\nGFLOPS: 99\nflavor: avx2\n");
  art.stderr_text = std::string("real 3.25\nuser 2.00\n");
  art.files["bw.log"] = "bandwidth=7.75 GB/s\n";

  const auto gflops = MakeMetric("gflops", "GFLOPS: ([0-9.]+)");
  CHECK(t, gflops.re != nullptr);
  // First match wins.
  CHECK_NEAR(t, AsNumber(hmb::analysis::ExtractMetric(gflops, RunStatus::Completed, art)), 12.5,
             1e-12);

  const auto real = MakeMetric("real", "real ([0-9.]+)", hmb::MetricTarget::Stderr);
  CHECK_NEAR(t, AsNumber(hmb::analysis::ExtractMetric(real, RunStatus::Completed, art)), 3.25,
             1e-12);

  auto bw = MakeMetric("bw", "bandwidth=([0-9.]+)", hmb::MetricTarget::File);
  bw.file_name = "bw.log";
  CHECK_NEAR(t, AsNumber(hmb::analysis::ExtractMetric(bw, RunStatus::Completed, art)), 7.75, 1e-12);

  const auto flavor =
      MakeMetric("flavor", "flavor: (\\w+)", hmb::MetricTarget::Stdout, hmb::MetricType::Text);
  const MetricValue fv = hmb::analysis::ExtractMetric(flavor, RunStatus::Completed, art);
  CHECK(t, std::holds_alternative<std::string>(fv));
  CHECK_EQ(t, hmb::analysis::FormatValue(fv), std::string("avx2"));

  const auto absent = MakeMetric("absent", "LATENCY: ([0-9.]+)");
  CHECK(t, IsMissing(hmb::analysis::ExtractMetric(absent, RunStatus::Completed, art),
                     MissingReason::NoMatch));

  const auto word = MakeMetric("word", "flavor: (\\w+)");
  {
    hmb::ScopedLogCapture capture(hmb::LogLevel::Warn);
    CHECK(t, IsMissing(hmb::analysis::ExtractMetric(word, RunStatus::Completed, art),
                       MissingReason::CoercionFailed));
    const std::string logged = capture.Text();
    CHECK(t, logged.find("WARN") != std::string::npos);
    CHECK(t, logged.find("word") != std::string::npos);
    CHECK(t, logged.find("avx2") != std::string::npos);
    CHECK(t, logged.find("TypeCoercionError") != std::string::npos);
  }

  CHECK(t, IsMissing(hmb::analysis::ExtractMetric(gflops, RunStatus::Failed, art),
                     MissingReason::NotCompleted));
  CHECK(t, IsMissing(hmb::analysis::ExtractMetric(gflops, RunStatus::Running, art),
                     MissingReason::NotCompleted));

  auto other_file = MakeMetric("bw2", "bandwidth=([0-9.]+)", hmb::MetricTarget::File);
  other_file.file_name = "missing.log";
  CHECK(t, IsMissing(hmb::analysis::ExtractMetric(other_file, RunStatus::Completed, art),
                     MissingReason::NoArtifact));

  RunArtifacts empty;
  CHECK(t, IsMissing(hmb::analysis::ExtractMetric(gflops, RunStatus::Completed, empty),
                     MissingReason::NoArtifact));

  CHECK_EQ(t, hmb::analysis::FormatValue(MetricValue{Missing{MissingReason::NoMatch}}),
           std::string());
  CHECK_EQ(t, std::string(hmb::analysis::ToString(MissingReason::CoercionFailed)),
           std::string("coercion_failed"));
}

void TestLongOutputLine(TestContext& t) {
  const std::string payload(200000, 'x');
  RunArtifacts art;
  art.stdout_text = "warmup\nRESULT " + payload + "\nGFLOPS: 8.5\n";
  art.stderr_text = std::string(100000, 'n') + " real 2.5\n";

  const auto result =
      MakeMetric("result", "RESULT (.*)", hmb::MetricTarget::Stdout, hmb::MetricType::Text);
  const MetricValue rv = hmb::analysis::ExtractMetric(result, RunStatus::Completed, art);
  CHECK(t, std::holds_alternative<std::string>(rv));
  // '.' stops at the end of the line.
  CHECK_EQ(t, hmb::analysis::FormatValue(rv).size(), payload.size());

  // Later metrics on the same artifacts are still extracted.
  const auto gflops = MakeMetric("gflops", "GFLOPS: ([0-9.]+)");
  CHECK_NEAR(t, AsNumber(hmb::analysis::ExtractMetric(gflops, RunStatus::Completed, art)), 8.5,
             1e-12);
  const auto real = MakeMetric("real", "real ([0-9.]+)", hmb::MetricTarget::Stderr);
  CHECK_NEAR(t, AsNumber(hmb::analysis::ExtractMetric(real, RunStatus::Completed, art)), 2.5,
             1e-12);

  const auto absent = MakeMetric("absent", "LATENCY (.*)");
  CHECK(t, IsMissing(hmb::analysis::ExtractMetric(absent, RunStatus::Completed, art),
                     MissingReason::NoMatch));
}

constexpr const char* kPlan = R"json({
  "name": "analysis",
  "run_configurations": {"rc": {"run_command": "./app", "args": "-t {{threads}}"}},
  "benches": [{
    "name": "scaling",
    "run_configurations": ["rc"],
    "matrix": [{"threads": [1, 2, 4]}],
    "reruns": 3,
    "metrics": [
      {"name": "time_s", "pattern": "time=([0-9.]+)"},
      {"name": "flavor", "pattern": "flavor: (\\w+)", "type": "text"}
    ]
  }]
})json";

bool LoadPlan(hmb::plan::TestPlan* plan, std::vector<hmb::plan::RunInstance>* instances) {
  Error err;
  if (!hmb::plan::ParseTestPlan(kPlan, plan, &err)) return false;
  return hmb::plan::ExpandPlan(*plan, "", instances, &err);
}

void Put(std::vector<ExtractedMetric>* out, const hmb::plan::RunInstance& inst,
         const std::string& metric, MetricValue v) {
  out->push_back(ExtractedMetric{inst.id, inst.group_key, metric, std::move(v)});
}

void TestAggregate(TestContext& t) {
  hmb::plan::TestPlan plan;
  std::vector<hmb::plan::RunInstance> instances;
  CHECK(t, LoadPlan(&plan, &instances));
  CHECK_EQ(t, instances.size(), static_cast<std::size_t>(9));
  if (instances.size() != 9) return;

  std::vector<ExtractedMetric> ex;
  // threads=1: three numeric reruns, text tie between "a" and "b" -> "a".
  Put(&ex, instances[0], "time_s", 10.0);
  Put(&ex, instances[1], "time_s", 12.0);
  Put(&ex, instances[2], "time_s", 14.0);
  Put(&ex, instances[0], "flavor", std::string("a"));
  Put(&ex, instances[1], "flavor", std::string("b"));
  Put(&ex, instances[2], "flavor", Missing{MissingReason::NoMatch});
  // threads=2: one surviving rerun.
  Put(&ex, instances[3], "time_s", 5.0);
  Put(&ex, instances[4], "time_s", Missing{MissingReason::NotCompleted});
  Put(&ex, instances[5], "time_s", Missing{MissingReason::CoercionFailed});
  Put(&ex, instances[3], "flavor", std::string("x"));
  Put(&ex, instances[4], "flavor", std::string("y"));
  Put(&ex, instances[5], "flavor", std::string("y"));
  // threads=4: everything missing.
  for (int i = 6; i < 9; ++i) {
    Put(&ex, instances[i], "time_s", Missing{MissingReason::NotCompleted});
    Put(&ex, instances[i], "flavor", Missing{MissingReason::NotCompleted});
  }

  const auto agg = hmb::analysis::Aggregate(plan, instances, ex);
  CHECK_EQ(t, agg.groups.size(), static_cast<std::size_t>(3));
  if (agg.groups.size() != 3) return;
  CHECK_EQ(t, agg.groups[0].group_key, instances[0].group_key);
  CHECK_EQ(t, agg.groups[0].run_ids.size(), static_cast<std::size_t>(3));
  CHECK_EQ(t, agg.groups[2].axes.size(), static_cast<std::size_t>(1));

  const auto* t1 = agg.Find(agg.groups[0].group_key, "time_s");
  CHECK(t, t1 != nullptr);
  if (t1) {
    CHECK_EQ(t, t1->count, static_cast<hmb::usize>(3));
    CHECK_NEAR(t, t1->mean, 12.0, 1e-12);
    CHECK_NEAR(t, t1->stdev, 2.0, 1e-12);
    CHECK_NEAR(t, t1->min, 10.0, 1e-12);
    CHECK_NEAR(t, t1->max, 14.0, 1e-12);
    CHECK_EQ(t, t1->CentralText(), std::string("12"));
  }

  const auto* f1 = agg.Find(agg.groups[0].group_key, "flavor");
  CHECK(t, f1 != nullptr);
  if (f1) {
    CHECK_EQ(t, f1->count, static_cast<hmb::usize>(2));
    CHECK_EQ(t, f1->mode, std::string("a"));
    CHECK_EQ(t, f1->CentralText(), std::string("a"));
  }

  const auto* t2 = agg.Find(agg.groups[1].group_key, "time_s");
  CHECK(t, t2 != nullptr);
  if (t2) {
    CHECK_EQ(t, t2->count, static_cast<hmb::usize>(1));
    CHECK_NEAR(t, t2->mean, 5.0, 1e-12);
    CHECK_NEAR(t, t2->stdev, 0.0, 1e-12);
  }

  const auto* f2 = agg.Find(agg.groups[1].group_key, "flavor");
  CHECK(t, f2 != nullptr);
  if (f2) CHECK_EQ(t, f2->mode, std::string("y"));

  CHECK(t, agg.Find(agg.groups[2].group_key, "time_s") == nullptr);
  CHECK(t, agg.Find(agg.groups[2].group_key, "flavor") == nullptr);
  CHECK_EQ(t, agg.metrics.size(), static_cast<std::size_t>(4));
}

void TestExtractAllFromStore(TestContext& t) {
  hmb::plan::TestPlan plan;
  std::vector<hmb::plan::RunInstance> instances;
  CHECK(t, LoadPlan(&plan, &instances));
  if (instances.size() != 9) return;

  const fs::path root = fs::temp_directory_path() / "hmb_test_analysis_store";
  std::error_code ec;
  fs::remove_all(root, ec);
  hmb::store::ResultStore store(root);
  Error err;
  CHECK(t, store.Init(&err));

  // Every run writes time = 10 * threads + rerun; the last rerun of
  // threads=4 failed and the first rerun of threads=2 never printed a time.
  for (std::size_t i = 0; i < instances.size(); ++i) {
    auto& inst = instances[i];
    const int threads = std::stoi(inst.axes[0].second);
    RunArtifacts art;
    std::string out = "flavor: gcc\n";
    if (i != 3) out += "time=" + std::to_string(10 * threads + static_cast<int>(inst.rerun)) + "\n";
    art.stdout_text = out;
    art.exit_code = (i == 8) ? 1 : 0;
    inst.status = (i == 8) ? RunStatus::Failed : RunStatus::Completed;
    CHECK(t, store.Persist(inst, art, &err));
  }

  const auto ex = hmb::analysis::ExtractAll(plan, instances, store, 3);
  CHECK_EQ(t, ex.size(), static_cast<std::size_t>(18));
  if (ex.size() != 18) return;
  // Ordered by instance, then metric declaration order.
  CHECK_EQ(t, ex[0].run_id, instances[0].id);
  CHECK_EQ(t, ex[0].metric, std::string("time_s"));
  CHECK_EQ(t, ex[1].metric, std::string("flavor"));
  CHECK(t, IsMissing(ex[6].value, MissingReason::NoMatch));
  CHECK(t, IsMissing(ex[16].value, MissingReason::NotCompleted));

  const auto agg = hmb::analysis::Aggregate(plan, instances, ex);
  CHECK_EQ(t, agg.groups.size(), static_cast<std::size_t>(3));
  if (agg.groups.size() != 3) return;

  const auto* g1 = agg.Find(agg.groups[0].group_key, "time_s");
  CHECK(t, g1 != nullptr);
  if (g1) {
    CHECK_EQ(t, g1->count, static_cast<hmb::usize>(3));
    CHECK_NEAR(t, g1->mean, 11.0, 1e-12);
    CHECK_NEAR(t, g1->stdev, 1.0, 1e-12);
  }
  const auto* g2 = agg.Find(agg.groups[1].group_key, "time_s");
  CHECK(t, g2 != nullptr);
  if (g2) {
    CHECK_EQ(t, g2->count, static_cast<hmb::usize>(2));
    CHECK_NEAR(t, g2->mean, 21.5, 1e-12);
  }
  const auto* g4 = agg.Find(agg.groups[2].group_key, "time_s");
  CHECK(t, g4 != nullptr);
  if (g4) {
    CHECK_EQ(t, g4->count, static_cast<hmb::usize>(2));
    CHECK_NEAR(t, g4->min, 40.0, 1e-12);
    CHECK_NEAR(t, g4->max, 41.0, 1e-12);
  }
  const auto* f4 = agg.Find(agg.groups[2].group_key, "flavor");
  CHECK(t, f4 != nullptr);
  if (f4) CHECK_EQ(t, f4->mode, std::string("gcc"));

  fs::remove_all(root, ec);
}

}  // namespace

int main() {
  TestContext t;

  TestCoerceNumeric(t);
  TestExtractMetric(t);
  TestLongOutputLine(t);
  TestAggregate(t);
  TestExtractAllFromStore(t);

  if (t.fails == 0) {
    std::cout << "[OK] test_analysis\n";
    return 0;
  }
  std::cerr << "[FAILED] test_analysis fails=" << t.fails << "\n";
  return 1;
}
