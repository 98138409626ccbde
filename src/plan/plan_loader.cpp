// src/plan/plan_loader.cpp

#include "hmb/plan/plan_loader.h"

#include "hmb/core/logging.h"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <utility>

namespace hmb {
namespace plan {

namespace {

bool Fail(Error* err, const std::string& where, const std::string& what) {
  SetErr(err, ErrorKind::Config, where + ": " + what);
  return false;
}

bool ReadScalar(const json::Value& v, const std::string& where, std::string* out, Error* err) {
  if (!json::GetScalarText(v, out)) return Fail(err, where, "expected a string, number or bool");
  return true;
}

bool ReadOptionalString(const json::Value& obj, std::string_view key, const std::string& where,
                        std::string* out, Error* err) {
  const json::Value* v = json::Get(obj, key);
  if (!v || v->IsNull()) return true;
  return ReadScalar(*v, where + "." + std::string(key), out, err);
}

// Accepts a list of scalars or a single scalar (one-element list).
bool ReadStringList(const json::Value& obj, std::string_view key, const std::string& where,
                    std::vector<std::string>* out, Error* err) {
  out->clear();
  const json::Value* v = json::Get(obj, key);
  if (!v || v->IsNull()) return true;
  const std::string field = where + "." + std::string(key);
  if (!v->IsArray()) {
    std::string s;
    if (!ReadScalar(*v, field, &s, err)) return false;
    out->push_back(std::move(s));
    return true;
  }
  out->reserve(v->arr.size());
  for (usize i = 0; i < v->arr.size(); ++i) {
    std::string s;
    if (!ReadScalar(v->arr[i], field + "[" + std::to_string(i) + "]", &s, err)) return false;
    out->push_back(std::move(s));
  }
  return true;
}

// Object of scalars -> key/value pairs in document order.
bool ReadKeyValues(const json::Value& obj, std::string_view key, const std::string& where,
                   KeyValues* out, Error* err) {
  out->clear();
  const json::Value* v = json::Get(obj, key);
  if (!v || v->IsNull()) return true;
  const std::string field = where + "." + std::string(key);
  if (!v->IsObject()) return Fail(err, field, "expected an object");
  for (const auto& kv : json::Members(*v)) {
    std::string s;
    if (!ReadScalar(*kv.second, field + "." + kv.first, &s, err)) return false;
    out->emplace_back(kv.first, std::move(s));
  }
  return true;
}

bool ReadRunConfiguration(const std::string& name, const json::Value& v, RunConfiguration* rc,
                          Error* err) {
  const std::string where = "run_configurations." + name;
  if (!v.IsObject()) return Fail(err, where, "expected an object");

  rc->name = name;
  if (!ReadKeyValues(v, "sbatch_config", where, &rc->sbatch_config, err)) return false;
  if (!ReadStringList(v, "module_loads", where, &rc->module_loads, err)) return false;
  if (!ReadKeyValues(v, "environment_variables", where, &rc->environment_variables, err)) {
    return false;
  }
  if (!ReadOptionalString(v, "directory", where, &rc->directory, err)) return false;
  if (!ReadStringList(v, "build_commands", where, &rc->build_commands, err)) return false;
  if (const json::Value* pb = json::Get(v, "pre_built")) {
    if (!json::GetBool(*pb, &rc->pre_built)) return Fail(err, where + ".pre_built", "expected a bool");
  }
  if (!ReadOptionalString(v, "run_command", where, &rc->run_command, err)) return false;
  if (!ReadOptionalString(v, "args", where, &rc->args, err)) return false;
  if (!ReadStringList(v, "post_commands", where, &rc->post_commands, err)) return false;

  KeyValues vars;
  if (!ReadKeyValues(v, "variables", where, &vars, err)) return false;
  for (auto& kv : vars) rc->variables.emplace(std::move(kv.first), std::move(kv.second));

  if (rc->run_command.empty()) return Fail(err, where, "missing run_command");
  return true;
}

bool ReadMatrix(const json::Value& bench_obj, const std::string& where, TestBench* bench,
                Error* err) {
  const json::Value* m = json::Get(bench_obj, "matrix");
  if (!m || m->IsNull()) return true;
  const std::string field = where + ".matrix";
  if (!m->IsArray()) return Fail(err, field, "expected an array of {axis: [values]} objects");

  for (usize i = 0; i < m->arr.size(); ++i) {
    const json::Value& entry = m->arr[i];
    const std::string ef = field + "[" + std::to_string(i) + "]";
    if (!entry.IsObject() || entry.obj.size() != 1) {
      return Fail(err, ef, "each matrix entry must be an object with exactly one axis");
    }
    const auto& kv = *entry.obj.begin();
    VariableAxis axis;
    axis.name = kv.first;
    const json::Value& values = *kv.second;
    if (!values.IsArray()) return Fail(err, ef + "." + axis.name, "expected an array of values");
    for (usize k = 0; k < values.arr.size(); ++k) {
      std::string s;
      if (!ReadScalar(values.arr[k], ef + "." + axis.name + "[" + std::to_string(k) + "]", &s,
                      err)) {
        return false;
      }
      axis.values.push_back(std::move(s));
    }
    bench->axes.push_back(std::move(axis));
  }
  return true;
}

bool ReadMetric(const json::Value& v, const std::string& where, MetricDefinition* m, Error* err) {
  if (!v.IsObject()) return Fail(err, where, "expected an object");
  const json::Value* name = json::Get(v, "name");
  if (!name || !json::GetString(*name, &m->name)) return Fail(err, where, "missing metric name");
  const json::Value* pattern = json::Get(v, "pattern");
  if (!pattern || !json::GetString(*pattern, &m->pattern)) {
    return Fail(err, where, "metric '" + m->name + "' is missing a pattern");
  }

  std::string target = "stdout";
  if (!ReadOptionalString(v, "target", where, &target, err)) return false;
  if (!ParseMetricTarget(target, &m->target, &m->file_name)) {
    return Fail(err, where, "metric '" + m->name + "': unknown target '" + target +
                                "' (expected stdout|stderr|file:<name>)");
  }

  std::string type = "numeric";
  if (!ReadOptionalString(v, "type", where, &type, err)) return false;
  if (!ParseMetricType(type, &m->type)) {
    return Fail(err, where, "metric '" + m->name + "': unknown type '" + type +
                                "' (expected numeric|text)");
  }
  return true;
}

bool ReadMetrics(const json::Value& container, const std::string& where, TestBench* bench,
                 Error* err) {
  const json::Value* ms = json::Get(container, "metrics");
  if (!ms || ms->IsNull()) return true;
  const std::string field = where + ".metrics";

  if (ms->IsArray()) {
    for (usize i = 0; i < ms->arr.size(); ++i) {
      MetricDefinition m;
      if (!ReadMetric(ms->arr[i], field + "[" + std::to_string(i) + "]", &m, err)) return false;
      bench->metrics.push_back(std::move(m));
    }
  } else if (ms->IsObject()) {
    // Shorthand: {"<name>": "<pattern>"} (stdout, numeric), ordered by name.
    for (const auto& kv : json::SortedMembers(*ms)) {
      MetricDefinition m;
      m.name = kv.first;
      if (!json::GetString(*kv.second, &m.pattern)) {
        return Fail(err, field + "." + kv.first, "expected a pattern string");
      }
      bench->metrics.push_back(std::move(m));
    }
  } else {
    return Fail(err, field, "expected an array or an object");
  }

  // Bad patterns leave `re` null and are reported by TestPlan::Validate.
  for (auto& m : bench->metrics) {
    Error cerr;
    if (!m.Compile(&cerr)) HMB_LOG_DEBUG("plan:", cerr.message);
  }
  return true;
}

bool ReadBench(const json::Value& v, const std::string& where, TestBench* bench, Error* err) {
  if (!v.IsObject()) return Fail(err, where, "expected an object");

  if (const json::Value* e = json::Get(v, "enabled")) {
    if (!json::GetBool(*e, &bench->enabled)) return Fail(err, where + ".enabled", "expected a bool");
  }
  if (!ReadStringList(v, "run_configurations", where, &bench->run_configurations, err)) {
    return false;
  }
  if (!ReadMatrix(v, where, bench, err)) return false;

  if (const json::Value* r = json::Get(v, "reruns")) {
    double x = 0.0;
    if (!json::GetNumber(*r, &x)) return Fail(err, where + ".reruns", "expected an integer");
    if (!std::isfinite(x) || std::fabs(x) > 1e9) {
      return Fail(err, where + ".reruns", "out of range");
    }
    if (x != std::floor(x)) {
      return Fail(err, where + ".reruns", "expected an integer");
    }
    bench->reruns = static_cast<i64>(x);
  }

  const json::Value* analysis = json::Get(v, "analysis");
  const json::Value& container = (analysis && analysis->IsObject()) ? *analysis : v;
  if (!ReadMetrics(container, where, bench, err)) return false;
  if (const json::Value* plots = json::Get(container, "plots")) {
    if (!plots->IsNull()) bench->plots_json = json::Dump(*plots);
  }
  return true;
}

}  // namespace

bool TestPlanFromJson(const json::Value& root, TestPlan* out, Error* err) {
  if (!out) {
    SetErr(err, ErrorKind::Config, "TestPlanFromJson: out is null");
    return false;
  }
  if (!root.IsObject()) return Fail(err, "plan", "top level must be an object");

  TestPlan p;
  p.name = "plan";
  if (!ReadOptionalString(root, "name", "plan", &p.name, err)) return false;

  const json::Value* rcs = json::Get(root, "run_configurations");
  if (!rcs || !rcs->IsObject()) return Fail(err, "plan", "missing run_configurations object");
  for (const auto& kv : json::SortedMembers(*rcs)) {
    RunConfiguration rc;
    if (!ReadRunConfiguration(kv.first, *kv.second, &rc, err)) return false;
    p.run_configurations.emplace(kv.first, std::move(rc));
  }

  const json::Value* benches = json::Get(root, "benches");
  if (!benches) return Fail(err, "plan", "missing benches");
  if (benches->IsArray()) {
    for (usize i = 0; i < benches->arr.size(); ++i) {
      const json::Value& b = benches->arr[i];
      const std::string where = "benches[" + std::to_string(i) + "]";
      TestBench bench;
      const json::Value* name = b.IsObject() ? json::Get(b, "name") : nullptr;
      if (!name || !json::GetString(*name, &bench.name)) {
        return Fail(err, where, "missing bench name");
      }
      if (!ReadBench(b, where, &bench, err)) return false;
      p.benches.push_back(std::move(bench));
    }
  } else if (benches->IsObject()) {
    for (const auto& kv : json::SortedMembers(*benches)) {
      TestBench bench;
      bench.name = kv.first;
      if (!ReadBench(*kv.second, "benches." + kv.first, &bench, err)) return false;
      p.benches.push_back(std::move(bench));
    }
  } else {
    return Fail(err, "plan", "benches must be an array or an object");
  }

  *out = std::move(p);
  return true;
}

bool ParseTestPlan(std::string_view text, TestPlan* out, Error* err) {
  json::Value root;
  if (!json::Parse(text, &root, err)) return false;
  return TestPlanFromJson(root, out, err);
}

bool LoadTestPlan(const std::string& path, TestPlan* out, Error* err) {
  json::Value root;
  if (!json::ParseFile(path, &root, err)) return false;
  if (!TestPlanFromJson(root, out, err)) {
    AddContext(err, path);
    return false;
  }
  // Unnamed plans take the file stem.
  if (!json::Get(root, "name")) {
    const std::string stem = std::filesystem::path(path).stem().string();
    if (!stem.empty()) out->name = stem;
  }
  return true;
}

}  // namespace plan
}  // namespace hmb
