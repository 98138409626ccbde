// src/plan/model.cpp
//
// Test plan validation. Every check reports ErrorKind::Config with a message
// naming the bench / run configuration / field involved.

#include "hmb/plan/model.h"

#include "hmb/io/fs_util.h"
#include "hmb/plan/template.h"

#include <set>
#include <unordered_set>

namespace hmb {
namespace plan {

bool MetricDefinition::Compile(Error* err) {
  re.reset();
  try {
    // '.' stops at line breaks.
    re = std::make_shared<const boost::regex>(pattern, boost::regex::perl | boost::regex::no_mod_s);
  } catch (const boost::regex_error& e) {
    SetErr(err, ErrorKind::Config,
           "metric '" + name + "': pattern '" + pattern + "' does not compile (" + e.what() + ")");
    return false;
  }
  return true;
}

std::string MetricDefinition::TargetLabel() const {
  if (target == MetricTarget::File) return "file:" + file_name;
  return std::string(ToString(target));
}

bool ParseMetricTarget(std::string_view s, MetricTarget* target, std::string* file_name) {
  if (!target || !file_name) return false;
  if (detail::EqualsIgnoreCase(s, "stdout")) {
    *target = MetricTarget::Stdout;
    file_name->clear();
    return true;
  }
  if (detail::EqualsIgnoreCase(s, "stderr")) {
    *target = MetricTarget::Stderr;
    file_name->clear();
    return true;
  }
  constexpr std::string_view kFilePrefix = "file:";
  if (s.size() > kFilePrefix.size() &&
      detail::EqualsIgnoreCase(s.substr(0, kFilePrefix.size()), kFilePrefix)) {
    *target = MetricTarget::File;
    *file_name = std::string(s.substr(kFilePrefix.size()));
    return true;
  }
  return false;
}

const MetricDefinition* TestBench::FindMetric(std::string_view metric) const {
  for (const auto& m : metrics) {
    if (m.name == metric) return &m;
  }
  return nullptr;
}

const TestBench* TestPlan::FindBench(std::string_view bench) const {
  for (const auto& b : benches) {
    if (b.name == bench) return &b;
  }
  return nullptr;
}

const RunConfiguration* TestPlan::FindRunConfiguration(std::string_view rc) const {
  auto it = run_configurations.find(std::string(rc));
  if (it == run_configurations.end()) return nullptr;
  return &it->second;
}

namespace {

bool ValidateMetrics(const TestBench& bench, Error* err) {
  auto fail = [&](const std::string& msg) {
    SetErr(err, ErrorKind::Config, "bench '" + bench.name + "': " + msg);
    return false;
  };

  std::unordered_set<std::string> seen;
  for (const auto& m : bench.metrics) {
    if (m.name.empty()) return fail("metric with empty name");
    if (!seen.insert(m.name).second) return fail("duplicate metric name '" + m.name + "'");
    if (!m.re) {
      // Re-compile on a copy so the message carries the regex diagnostic.
      MetricDefinition copy = m;
      Error cerr;
      if (!copy.Compile(&cerr)) return fail(cerr.message);
      return fail("metric '" + m.name + "': pattern was not compiled");
    }
    if (m.re->mark_count() != 1) {
      return fail("metric '" + m.name + "': pattern '" + m.pattern + "' must have exactly one "
                  "capture group (has " + std::to_string(m.re->mark_count()) + ")");
    }
    if (m.target == MetricTarget::File && m.file_name.empty()) {
      return fail("metric '" + m.name + "': file target without a file name");
    }
  }
  return true;
}

bool ValidatePlaceholders(const TestBench& bench, const RunConfiguration& rc, Error* err) {
  std::set<std::string> known;
  for (const auto& kv : rc.variables) known.insert(kv.first);
  for (const auto& axis : bench.axes) known.insert(axis.name);
  if (bench.HasImplicitRunConfigurationAxis()) known.insert(std::string(kRunConfigurationAxis));

  return rc.ForEachTemplate([&](const std::string& label, const std::string& text) {
    std::vector<std::string> names;
    Error terr;
    if (!ScanPlaceholders(text, &names, &terr)) {
      SetErr(err, ErrorKind::Config, "bench '" + bench.name + "', run configuration '" +
                                         rc.name + "', " + label + ": " + terr.message);
      return false;
    }
    for (const auto& n : names) {
      if (known.count(n) == 0) {
        SetErr(err, ErrorKind::Config,
               "bench '" + bench.name + "', run configuration '" + rc.name + "', " + label +
                   ": placeholder '{{" + n + "}}' is neither an axis nor a base variable");
        return false;
      }
    }
    return true;
  });
}

}  // namespace

bool TestPlan::Validate(Error* err) const {
  std::unordered_set<std::string> bench_names;
  for (const auto& bench : benches) {
    auto fail = [&](const std::string& msg) {
      SetErr(err, ErrorKind::Config, "bench '" + bench.name + "': " + msg);
      return false;
    };

    if (bench.name.empty()) {
      SetErr(err, ErrorKind::Config, "bench with empty name");
      return false;
    }
    if (!bench_names.insert(bench.name).second) return fail("duplicate bench name");
    if (io::SanitizeName(bench.name) == kReportDirName) {
      return fail("the name is reserved for the report directory");
    }
    if (bench.reruns <= 0) {
      return fail("reruns must be > 0 (got " + std::to_string(bench.reruns) + ")");
    }
    if (bench.run_configurations.empty()) return fail("no run configuration listed");

    std::unordered_set<std::string> axis_names;
    for (const auto& axis : bench.axes) {
      if (axis.name.empty()) return fail("axis with empty name");
      if (!axis_names.insert(axis.name).second) return fail("duplicate axis '" + axis.name + "'");
      if (bench.HasImplicitRunConfigurationAxis() && axis.name == kRunConfigurationAxis) {
        return fail("axis name '" + axis.name + "' is reserved when several run "
                    "configurations are listed");
      }
      if (axis.values.empty()) return fail("axis '" + axis.name + "' has no values");
      std::unordered_set<std::string> values;
      for (const auto& v : axis.values) {
        if (!values.insert(v).second) {
          return fail("axis '" + axis.name + "' has duplicate value '" + v + "'");
        }
      }
    }

    std::unordered_set<std::string> rc_names;
    for (const auto& rc_name : bench.run_configurations) {
      if (!rc_names.insert(rc_name).second) {
        return fail("run configuration '" + rc_name + "' listed twice");
      }
      const RunConfiguration* rc = FindRunConfiguration(rc_name);
      if (!rc) return fail("undefined run configuration '" + rc_name + "'");
      if (!ValidatePlaceholders(bench, *rc, err)) return false;
    }

    if (!ValidateMetrics(bench, err)) return false;
  }
  return true;
}

}  // namespace plan
}  // namespace hmb
