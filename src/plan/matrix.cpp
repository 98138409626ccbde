// src/plan/matrix.cpp

#include "hmb/plan/matrix.h"

#include "hmb/core/assert.h"
#include "hmb/core/logging.h"
#include "hmb/io/fs_util.h"
#include "hmb/plan/template.h"

#include <iomanip>
#include <iterator>
#include <sstream>

namespace hmb {
namespace plan {

namespace {

constexpr u32 kFnvPrime = 16777619u;
constexpr char kFieldSep = '\x1f';

std::string SanitizedAxes(const AxisValues& axes) {
  if (axes.empty()) return "base";
  std::string out;
  for (usize i = 0; i < axes.size(); ++i) {
    if (i) out.push_back(',');
    out += io::SanitizeName(axes[i].first);
    out.push_back('=');
    out += io::SanitizeName(axes[i].second);
  }
  return out;
}

std::string Hash8(std::string_view bench, const AxisValues& axes) {
  u32 h = Fnv1a32(bench);
  for (const auto& kv : axes) {
    h = Fnv1a32(std::string_view(&kFieldSep, 1), h);
    h = Fnv1a32(kv.first, h);
    h = Fnv1a32("=", h);
    h = Fnv1a32(kv.second, h);
  }
  std::ostringstream oss;
  oss << std::hex << std::setw(8) << std::setfill('0') << h;
  return oss.str();
}

bool ResolveConfiguration(const RunConfiguration& base, const AxisValues& axes,
                          RunConfiguration* out, Error* err) {
  Bindings vars;
  for (const auto& kv : base.variables) vars[kv.first] = kv.second;
  for (const auto& kv : axes) vars[kv.first] = kv.second;

  *out = base;
  return out->ForEachTemplate([&](const std::string& label, std::string& text) {
    std::string rendered;
    if (!RenderTemplate(text, vars, &rendered, err)) {
      AddContext(err, "run configuration '" + base.name + "', " + label);
      return false;
    }
    text = std::move(rendered);
    return true;
  });
}

}  // namespace

std::string RunInstance::AxesLabel() const {
  if (axes.empty()) return "base";
  std::string out;
  for (usize i = 0; i < axes.size(); ++i) {
    if (i) out.push_back(',');
    out += axes[i].first + "=" + axes[i].second;
  }
  return out;
}

u32 Fnv1a32(std::string_view data, u32 seed) {
  u32 h = seed;
  for (char c : data) {
    h ^= static_cast<u32>(static_cast<unsigned char>(c));
    h *= kFnvPrime;
  }
  return h;
}

std::string MakeGroupKey(std::string_view bench, const AxisValues& axes) {
  return io::SanitizeName(bench) + "__" + SanitizedAxes(axes) + "__" + Hash8(bench, axes);
}

std::string MakeIdentifier(std::string_view bench, const AxisValues& axes, u32 rerun) {
  return io::SanitizeName(bench) + "__" + SanitizedAxes(axes) + "__r" + std::to_string(rerun) +
         "__" + Hash8(bench, axes);
}

bool ExpandBench(const TestPlan& plan, const TestBench& bench, std::vector<RunInstance>* out,
                 Error* err) {
  if (!out) {
    SetErr(err, ErrorKind::Template, "ExpandBench: out is null");
    return false;
  }
  if (bench.reruns <= 0) {
    SetErr(err, ErrorKind::Config, "bench '" + bench.name + "': reruns must be > 0");
    return false;
  }

  // Axis list including the implicit run configuration axis.
  std::vector<VariableAxis> axes = bench.axes;
  if (bench.HasImplicitRunConfigurationAxis()) {
    axes.push_back(VariableAxis{std::string(kRunConfigurationAxis), bench.run_configurations});
  }
  for (const auto& a : axes) {
    if (a.values.empty()) return true;  // empty product
  }

  std::vector<RunInstance> res;
  std::vector<usize> odometer(axes.size(), 0);
  while (true) {
    AxisValues combo;
    combo.reserve(axes.size());
    for (usize i = 0; i < axes.size(); ++i) {
      combo.emplace_back(axes[i].name, axes[i].values[odometer[i]]);
    }

    std::string rc_name;
    if (bench.HasImplicitRunConfigurationAxis()) {
      rc_name = combo.back().second;
    } else if (!bench.run_configurations.empty()) {
      rc_name = bench.run_configurations.front();
    }
    const RunConfiguration* base = plan.FindRunConfiguration(rc_name);
    if (!base) {
      SetErr(err, ErrorKind::Config,
             "bench '" + bench.name + "': undefined run configuration '" + rc_name + "'");
      return false;
    }

    RunConfiguration resolved;
    if (!ResolveConfiguration(*base, combo, &resolved, err)) {
      AddContext(err, "bench '" + bench.name + "'");
      return false;
    }

    const std::string group_key = MakeGroupKey(bench.name, combo);
    for (i64 r = 0; r < bench.reruns; ++r) {
      RunInstance inst;
      inst.bench = bench.name;
      inst.axes = combo;
      inst.rerun = static_cast<u32>(r);
      inst.group_key = group_key;
      inst.id = MakeIdentifier(bench.name, combo, inst.rerun);
      inst.resolved = resolved;
      res.push_back(std::move(inst));
    }

    // Advance: last axis fastest.
    bool done = true;
    for (usize k = axes.size(); k-- > 0;) {
      if (++odometer[k] < axes[k].values.size()) {
        done = false;
        break;
      }
      odometer[k] = 0;
    }
    if (done) break;
  }

  usize combos = 1;
  for (const auto& a : axes) combos *= a.values.size();
  HMB_DASSERT(res.size() == combos * static_cast<usize>(bench.reruns));

  out->insert(out->end(), std::make_move_iterator(res.begin()), std::make_move_iterator(res.end()));
  return true;
}

bool ExpandPlan(const TestPlan& plan, std::string_view only_bench, std::vector<RunInstance>* out,
                Error* err) {
  if (!out) {
    SetErr(err, ErrorKind::Template, "ExpandPlan: out is null");
    return false;
  }
  bool found = only_bench.empty();
  for (const auto& bench : plan.benches) {
    if (!only_bench.empty()) {
      if (bench.name != only_bench) continue;
      found = true;
    } else if (!bench.enabled) {
      continue;
    }
    // A template error only drops its own bench.
    std::vector<RunInstance> expanded;
    Error local;
    if (!ExpandBench(plan, bench, &expanded, &local)) {
      if (local.kind != ErrorKind::Template) {
        if (err) *err = local;
        return false;
      }
      HMB_LOG_ERROR("bench", bench.name, "skipped:", local.ToString());
      continue;
    }
    out->insert(out->end(), std::make_move_iterator(expanded.begin()),
                std::make_move_iterator(expanded.end()));
  }
  if (!found) {
    SetErr(err, ErrorKind::Config, "no bench named '" + std::string(only_bench) + "'");
    return false;
  }
  return true;
}

}  // namespace plan
}  // namespace hmb
