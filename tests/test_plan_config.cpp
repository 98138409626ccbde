// tests/test_plan_config.cpp
//
// Plan document and configuration tests:
//  - JSON subset: number spelling, duplicate keys, sorted dump, document order
//  - Plan loader shapes (bench array/object, metric shorthand, analysis block,
//    plots pass-through, declaration-ordered environment, pre_built)
//  - TestPlan::Validate failures (all ConfigError)
//  - EngineConfig from command-line style arguments

#include "hmb/core/config.h"
#include "hmb/core/error.h"
#include "hmb/io/json.h"
#include "hmb/plan/model.h"
#include "hmb/plan/plan_loader.h"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
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
using hmb::ErrorKind;

constexpr const char* kBasePlan = R"json({
  "name": "demo",
  "run_configurations": {
    "gcc": {
      "sbatch_config": {"nodes": 1, "time": "00:10:00"},
      "module_loads": ["gcc/12"],
      "environment_variables": {"OMP_NUM_THREADS": "{{threads}}"},
      "directory": "/tmp",
      "build_commands": ["make"],
      "run_command": "./app",
      "args": "--size {{size}} --threads {{threads}}",
      "variables": {"size": 10}
    }
  },
  "benches": [
    {
      "name": "scaling",
      "run_configurations": ["gcc"],
      "matrix": [ {"threads": [1, 2, 4]} ],
      "reruns": 2,
      "metrics": [
        {"name": "time_s", "pattern": "real ([0-9.]+)", "target": "stderr"},
        {"name": "flavor", "pattern": "flavor: (\\w+)", "type": "text"}
      ],
      "plots": {"kind": "line", "x": "threads"}
    }
  ]
})json";

bool ParsePlan(const std::string& text, hmb::plan::TestPlan* plan, Error* err) {
  return hmb::plan::ParseTestPlan(text, plan, err);
}

// Parses kBasePlan with `from` replaced by `to`, then validates.
bool ValidateVariant(const std::string& from, const std::string& to, Error* err) {
  std::string text = kBasePlan;
  const auto pos = text.find(from);
  if (pos == std::string::npos) {
    err->kind = ErrorKind::None;
    err->message = "variant anchor not found: " + from;
    return true;
  }
  text.replace(pos, from.size(), to);
  hmb::plan::TestPlan plan;
  if (!ParsePlan(text, &plan, err)) return false;
  return plan.Validate(err);
}

void TestJsonSubset(TestContext& t) {
  hmb::json::Value v;
  Error err;
  CHECK(t, hmb::json::Parse(R"({"b": [1, 2.50, -3e2], "a": "x\ty", "c": null, "d": true})",
                            &v, &err));
  CHECK(t, v.IsObject());

  const hmb::json::Value* b = hmb::json::Get(v, "b");
  CHECK(t, b != nullptr && b->IsArray() && b->arr.size() == 3);
  if (b && b->arr.size() == 3) {
    std::string s;
    CHECK(t, hmb::json::GetScalarText(b->arr[0], &s));
    CHECK_EQ(t, s, std::string("1"));
    CHECK(t, hmb::json::GetScalarText(b->arr[1], &s));
    CHECK_EQ(t, s, std::string("2.50"));
    double x = 0.0;
    CHECK(t, hmb::json::GetNumber(b->arr[2], &x));
    CHECK(t, std::fabs(x + 300.0) < 1e-12);
  }

  std::string a;
  CHECK(t, hmb::json::GetString(*hmb::json::Get(v, "a"), &a));
  CHECK_EQ(t, a, std::string("x\ty"));

  // Dump is key-sorted and keeps number spelling.
  CHECK_EQ(t, hmb::json::Dump(v),
           std::string(R"({"a":"x\ty","b":[1,2.50,-3e2],"c":null,"d":true})"));

  Error dup;
  CHECK(t, !hmb::json::Parse(R"({"k": 1, "k": 2})", &v, &dup));
  CHECK(t, dup.kind == ErrorKind::Config);
  CHECK(t, dup.message.find("duplicate") != std::string::npos);

  Error trailing;
  CHECK(t, !hmb::json::Parse(R"({"k": 1} x)", &v, &trailing));
  CHECK(t, trailing.kind == ErrorKind::Config);

  // Members() walks keys as written; SortedMembers() by name.
  hmb::json::Value o;
  CHECK(t, hmb::json::Parse(R"({"zeta": 1, "alpha": 2, "mid": 3})", &o, &err));
  const auto in_order = hmb::json::Members(o);
  CHECK_EQ(t, in_order.size(), static_cast<std::size_t>(3));
  if (in_order.size() == 3) {
    CHECK_EQ(t, in_order[0].first, std::string("zeta"));
    CHECK_EQ(t, in_order[1].first, std::string("alpha"));
    CHECK_EQ(t, in_order[2].first, std::string("mid"));
  }
  const auto sorted = hmb::json::SortedMembers(o);
  CHECK(t, !sorted.empty() && sorted.front().first == "alpha");

  // A copied value keeps the order.
  const hmb::json::Value copy = o;
  const auto copied = hmb::json::Members(copy);
  CHECK(t, !copied.empty() && copied.front().first == "zeta");
}

void TestLoaderArrayShape(TestContext& t) {
  hmb::plan::TestPlan plan;
  Error err;
  CHECK(t, ParsePlan(kBasePlan, &plan, &err));
  CHECK(t, plan.Validate(&err));
  CHECK_EQ(t, plan.name, std::string("demo"));
  CHECK_EQ(t, plan.benches.size(), static_cast<std::size_t>(1));

  const hmb::plan::RunConfiguration* rc = plan.FindRunConfiguration("gcc");
  CHECK(t, rc != nullptr);
  if (rc) {
    CHECK_EQ(t, rc->sbatch_config.size(), static_cast<std::size_t>(2));
    CHECK_EQ(t, rc->sbatch_config[0].first, std::string("nodes"));
    CHECK_EQ(t, rc->sbatch_config[0].second, std::string("1"));
    CHECK_EQ(t, rc->variables.at("size"), std::string("10"));
    CHECK_EQ(t, rc->run_command, std::string("./app"));
    CHECK_EQ(t, rc->build_commands.size(), static_cast<std::size_t>(1));
  }

  const hmb::plan::TestBench* bench = plan.FindBench("scaling");
  CHECK(t, bench != nullptr);
  if (!bench) return;
  CHECK(t, bench->enabled);
  CHECK_EQ(t, bench->reruns, static_cast<hmb::i64>(2));
  CHECK_EQ(t, bench->axes.size(), static_cast<std::size_t>(1));
  CHECK_EQ(t, bench->axes[0].values.size(), static_cast<std::size_t>(3));
  CHECK_EQ(t, bench->axes[0].values[2], std::string("4"));

  CHECK_EQ(t, bench->metrics.size(), static_cast<std::size_t>(2));
  CHECK(t, bench->metrics[0].target == hmb::MetricTarget::Stderr);
  CHECK(t, bench->metrics[0].type == hmb::MetricType::Numeric);
  CHECK(t, bench->metrics[0].re != nullptr);
  CHECK(t, bench->metrics[1].target == hmb::MetricTarget::Stdout);
  CHECK(t, bench->metrics[1].type == hmb::MetricType::Text);

  CHECK_EQ(t, bench->plots_json, std::string(R"({"kind":"line","x":"threads"})"));
}

void TestLoaderDeclarationOrder(TestContext& t) {
  const std::string text = R"({
    "run_configurations": {
      "rc": {
        "sbatch_config": {"time": "01:00:00", "nodes": 2, "account": "hpc"},
        "environment_variables": {"ZROOT": "/opt/z", "BIN": "$ZROOT/bin", "A_FLAG": "1"},
        "build_commands": ["make -j"],
        "pre_built": true,
        "run_command": "$BIN/app"
      }
    },
    "benches": [{"name": "b", "run_configurations": ["rc"]}]
  })";
  hmb::plan::TestPlan plan;
  Error err;
  CHECK(t, ParsePlan(text, &plan, &err));
  CHECK(t, plan.Validate(&err));
  const hmb::plan::RunConfiguration* rc = plan.FindRunConfiguration("rc");
  CHECK(t, rc != nullptr);
  if (!rc) return;

  CHECK_EQ(t, rc->sbatch_config.size(), static_cast<std::size_t>(3));
  if (rc->sbatch_config.size() == 3) {
    CHECK_EQ(t, rc->sbatch_config[0].first, std::string("time"));
    CHECK_EQ(t, rc->sbatch_config[1].first, std::string("nodes"));
    CHECK_EQ(t, rc->sbatch_config[2].first, std::string("account"));
  }
  CHECK_EQ(t, rc->environment_variables.size(), static_cast<std::size_t>(3));
  if (rc->environment_variables.size() == 3) {
    CHECK_EQ(t, rc->environment_variables[0].first, std::string("ZROOT"));
    CHECK_EQ(t, rc->environment_variables[1].first, std::string("BIN"));
    CHECK_EQ(t, rc->environment_variables[1].second, std::string("$ZROOT/bin"));
    CHECK_EQ(t, rc->environment_variables[2].first, std::string("A_FLAG"));
  }
  CHECK(t, rc->pre_built);
  CHECK_EQ(t, rc->build_commands.size(), static_cast<std::size_t>(1));

  Error bad;
  CHECK(t, !ParsePlan(R"({"run_configurations": {"rc": {"run_command": "x", "pre_built": "yes"}},
                         "benches": []})",
                      &plan, &bad));
  CHECK(t, bad.kind == ErrorKind::Config);
  CHECK(t, bad.message.find("pre_built") != std::string::npos);
}

void TestLoaderObjectShape(TestContext& t) {
  const std::string text = R"json({
    "run_configurations": {"rc": {"run_command": "./bin"}},
    "benches": {
      "zeta": {"run_configurations": "rc",
               "analysis": {"metrics": {"gflops": "GFLOPS: ([0-9.]+)"},
                            "plots": [1, 2]}},
      "alpha": {"run_configurations": ["rc"], "enabled": false}
    }
  })json";
  hmb::plan::TestPlan plan;
  Error err;
  CHECK(t, ParsePlan(text, &plan, &err));
  CHECK(t, plan.Validate(&err));
  CHECK_EQ(t, plan.name, std::string("plan"));

  // Object-keyed benches come out ordered by name.
  CHECK_EQ(t, plan.benches.size(), static_cast<std::size_t>(2));
  if (plan.benches.size() != 2) return;
  CHECK_EQ(t, plan.benches[0].name, std::string("alpha"));
  CHECK(t, !plan.benches[0].enabled);
  CHECK_EQ(t, plan.benches[1].name, std::string("zeta"));
  CHECK_EQ(t, plan.benches[1].run_configurations.size(), static_cast<std::size_t>(1));
  CHECK_EQ(t, plan.benches[1].metrics.size(), static_cast<std::size_t>(1));
  CHECK_EQ(t, plan.benches[1].metrics[0].name, std::string("gflops"));
  CHECK_EQ(t, plan.benches[1].plots_json, std::string("[1,2]"));
}

void TestLoaderFileStem(TestContext& t) {
  const fs::path dir = fs::temp_directory_path() / "hmb_test_plan_config";
  std::error_code ec;
  fs::remove_all(dir, ec);
  fs::create_directories(dir, ec);
  const fs::path p = dir / "nightly.json";
  {
    std::ofstream out(p);
    out << R"({"run_configurations": {"rc": {"run_command": "true"}},
              "benches": [{"name": "b", "run_configurations": ["rc"]}]})";
  }
  hmb::plan::TestPlan plan;
  Error err;
  CHECK(t, hmb::plan::LoadTestPlan(p.string(), &plan, &err));
  CHECK_EQ(t, plan.name, std::string("nightly"));

  Error missing;
  CHECK(t, !hmb::plan::LoadTestPlan((dir / "absent.json").string(), &plan, &missing));
  CHECK(t, missing.kind == ErrorKind::Config);
  fs::remove_all(dir, ec);
}

void TestLoaderRejects(TestContext& t) {
  hmb::plan::TestPlan plan;

  Error no_cmd;
  CHECK(t, !ParsePlan(R"({"run_configurations": {"rc": {}}, "benches": []})", &plan, &no_cmd));
  CHECK(t, no_cmd.kind == ErrorKind::Config);
  CHECK(t, no_cmd.message.find("run_command") != std::string::npos);

  Error two_axes;
  CHECK(t, !ParsePlan(R"({"run_configurations": {"rc": {"run_command": "x"}},
                         "benches": [{"name": "b", "run_configurations": ["rc"],
                                      "matrix": [{"a": [1], "b": [2]}]}]})",
                      &plan, &two_axes));
  CHECK(t, two_axes.kind == ErrorKind::Config);

  Error bad_target;
  CHECK(t, !ParsePlan(R"json({"run_configurations": {"rc": {"run_command": "x"}},
                         "benches": [{"name": "b", "run_configurations": ["rc"],
                                      "metrics": [{"name": "m", "pattern": "(x)",
                                                   "target": "socket"}]}]})json",
                      &plan, &bad_target));
  CHECK(t, bad_target.kind == ErrorKind::Config);

  Error no_benches;
  CHECK(t, !ParsePlan(R"({"run_configurations": {}})", &plan, &no_benches));
  CHECK(t, no_benches.kind == ErrorKind::Config);
}

void TestValidationFailures(TestContext& t) {
  struct Case {
    const char* from;
    const char* to;
    const char* needle;
  };
  const std::vector<Case> cases = {
      {"\"reruns\": 2", "\"reruns\": 0", "reruns"},
      {"\"run_configurations\": [\"gcc\"]", "\"run_configurations\": []", "no run configuration"},
      {"\"run_configurations\": [\"gcc\"]", "\"run_configurations\": [\"clang\"]", "undefined"},
      {"\"run_configurations\": [\"gcc\"]", "\"run_configurations\": [\"gcc\", \"gcc\"]",
       "listed twice"},
      {"{\"threads\": [1, 2, 4]}", "{\"threads\": [1, 1]}", "duplicate value"},
      {"{\"threads\": [1, 2, 4]}", "{\"threads\": []}", "no values"},
      {"{\"threads\": [1, 2, 4]}", "{\"threads\": [1]}, {\"threads\": [2]}", "duplicate axis"},
      {"--size {{size}}", "--size {{sizes}}", "sizes"},
      {"--size {{size}}", "--size {{size}", "placeholder"},
      {"real ([0-9.]+)", "real [0-9.]+", "capture group"},
      {"real ([0-9.]+)", "real (([0-9.]+)", "time_s"},
      {"\"name\": \"flavor\"", "\"name\": \"time_s\"", "duplicate metric"},
      {"\"name\": \"scaling\"", "\"name\": \"report\"", "reserved"},
      {"\"reruns\": 2", "\"reruns\": 1e300", "out of range"},
      {"\"reruns\": 2", "\"reruns\": -1e300", "out of range"},
      {"\"reruns\": 2", "\"reruns\": 2.5", "expected an integer"},
  };

  for (const auto& c : cases) {
    Error err;
    const bool ok = ValidateVariant(c.from, c.to, &err);
    if (ok) {
      ++t.fails;
      std::cerr << "[FAIL] variant '" << c.to << "' unexpectedly valid " << err.message << "\n";
      continue;
    }
    CHECK(t, err.kind == ErrorKind::Config);
    if (err.message.find(c.needle) == std::string::npos) {
      ++t.fails;
      std::cerr << "[FAIL] variant '" << c.to << "': message '" << err.message
                << "' lacks '" << c.needle << "'\n";
    }
  }
}

void TestDuplicateBenchName(TestContext& t) {
  const std::string text = R"({
    "run_configurations": {"rc": {"run_command": "x"}},
    "benches": [{"name": "b", "run_configurations": ["rc"]},
                {"name": "b", "run_configurations": ["rc"]}]
  })";
  hmb::plan::TestPlan plan;
  Error err;
  CHECK(t, ParsePlan(text, &plan, &err));
  CHECK(t, !plan.Validate(&err));
  CHECK(t, err.message.find("duplicate bench") != std::string::npos);
}

void TestImplicitAxisPlaceholder(TestContext& t) {
  // {{run_configuration}} is known only when a bench lists several.
  const std::string multi = R"({
    "run_configurations": {"a": {"run_command": "echo {{run_configuration}}"},
                           "b": {"run_command": "echo {{run_configuration}}"}},
    "benches": [{"name": "x", "run_configurations": ["a", "b"]}]
  })";
  hmb::plan::TestPlan plan;
  Error err;
  CHECK(t, ParsePlan(multi, &plan, &err));
  CHECK(t, plan.Validate(&err));

  const std::string single = R"({
    "run_configurations": {"a": {"run_command": "echo {{run_configuration}}"}},
    "benches": [{"name": "x", "run_configurations": ["a"]}]
  })";
  Error err2;
  CHECK(t, ParsePlan(single, &plan, &err2));
  CHECK(t, !plan.Validate(&err2));
  CHECK(t, err2.kind == ErrorKind::Config);
}

void TestEngineConfig(TestContext& t) {
  std::vector<std::string> argv_s = {"hmb",          "plan.json",   "--mode=all",
                                     "--dry_run",    "--clobber",   "--timeout", "60",
                                     "--poll_interval=1,2", "--scheduler=local",
                                     "--threads=3",  "--bench=b1",  "--frobnicate=1"};
  std::vector<char*> argv;
  for (auto& s : argv_s) argv.push_back(&s[0]);

  const hmb::EngineConfig cfg =
      hmb::EngineConfig::FromArgs(static_cast<int>(argv.size()), argv.data());
  CHECK_EQ(t, cfg.plan_path, std::string("plan.json"));
  CHECK(t, cfg.mode == hmb::Mode::All);
  CHECK(t, cfg.record.dry_run);
  CHECK(t, cfg.record.clobber);
  CHECK(t, std::fabs(cfg.record.timeout_s - 60.0) < 1e-12);
  CHECK_EQ(t, cfg.record.poll_backoff_s.size(), static_cast<std::size_t>(2));
  CHECK_EQ(t, cfg.scheduler.backend, std::string("local"));
  CHECK_EQ(t, cfg.sys.threads, 3);
  CHECK_EQ(t, cfg.only_bench, std::string("b1"));
  CHECK(t, cfg.extra.count("frobnicate") == 1);

  Error err;
  CHECK(t, cfg.Validate(&err));

  hmb::EngineConfig bad = cfg;
  bad.scheduler.backend = "pbs";
  CHECK(t, !bad.Validate(&err));
  CHECK(t, err.kind == ErrorKind::Config);

  hmb::EngineConfig no_plan;
  CHECK(t, !no_plan.Validate(&err));

  CHECK(t, !cfg.record.build_once);
  {
    std::vector<std::string> more_s = {"hmb", "--build_once", "plan.json", "--timeout=inf"};
    std::vector<char*> more;
    for (auto& s : more_s) more.push_back(&s[0]);
    const hmb::EngineConfig c2 =
        hmb::EngineConfig::FromArgs(static_cast<int>(more.size()), more.data());
    CHECK(t, c2.record.build_once);
    CHECK_EQ(t, c2.plan_path, std::string("plan.json"));
    CHECK(t, std::isinf(c2.record.timeout_s));
    Error inf_err;
    CHECK(t, !c2.Validate(&inf_err));
    CHECK(t, inf_err.kind == ErrorKind::Config);
    CHECK(t, inf_err.message.find("timeout_s") != std::string::npos);
  }

  hmb::EngineConfig huge = cfg;
  huge.record.timeout_s = 1e300;
  CHECK(t, !huge.Validate(&err));

  hmb::EngineConfig nan_poll = cfg;
  nan_poll.record.poll_backoff_s = {5.0, std::nan("")};
  CHECK(t, !nan_poll.Validate(&err));
  CHECK(t, err.message.find("poll_backoff_s") != std::string::npos);

  hmb::EngineConfig bad_retry = cfg;
  bad_retry.record.query_retry_base_s = -1.0;
  CHECK(t, !bad_retry.Validate(&err));
}

}  // namespace

int main() {
  TestContext t;

  TestJsonSubset(t);
  TestLoaderArrayShape(t);
  TestLoaderDeclarationOrder(t);
  TestLoaderObjectShape(t);
  TestLoaderFileStem(t);
  TestLoaderRejects(t);
  TestValidationFailures(t);
  TestDuplicateBenchName(t);
  TestImplicitAxisPlaceholder(t);
  TestEngineConfig(t);

  if (t.fails == 0) {
    std::cout << "[OK] test_plan_config\n";
    return 0;
  }
  std::cerr << "[FAILED] test_plan_config fails=" << t.fails << "\n";
  return 1;
}
