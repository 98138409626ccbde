#pragma once
// hmb/plan/model.h
//
// In-memory test plan: run configurations, test benches, variable axes and
// metric definitions. Built by the plan loader (hmb/plan/plan_loader.h) or
// directly in code, then checked once with TestPlan::Validate.

#include "hmb/core/error.h"
#include "hmb/core/types.h"

#include <boost/regex.hpp>

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace hmb {
namespace plan {

// Name of the implicit innermost axis used when a bench lists more than one
// run configuration.
inline constexpr std::string_view kRunConfigurationAxis = "run_configuration";

// Reports are written to <out_dir>/report, beside the per-bench result
// directories, so no bench may take this name.
inline constexpr const char* kReportDirName = "report";

using KeyValues = std::vector<std::pair<std::string, std::string>>;

struct RunConfiguration {
  std::string name;

  KeyValues sbatch_config;          // rendered in declaration order
  std::vector<std::string> module_loads;
  KeyValues environment_variables;  // rendered in declaration order
  std::string directory;
  std::vector<std::string> build_commands;
  bool pre_built = false;           // build commands are skipped
  std::string run_command;
  std::string args;
  std::vector<std::string> post_commands;

  // Base template variables; axis values of the same name take precedence.
  std::map<std::string, std::string> variables;

  // Visit every field that may carry placeholders as (field label, string).
  template <class Fn>
  bool ForEachTemplate(Fn&& fn) { return VisitTemplates(*this, fn); }

  template <class Fn>
  bool ForEachTemplate(Fn&& fn) const { return VisitTemplates(*this, fn); }

 private:
  template <class Self, class Fn>
  static bool VisitTemplates(Self& self, Fn& fn) {
    for (auto& kv : self.sbatch_config) {
      if (!fn("sbatch_config." + kv.first, kv.second)) return false;
    }
    for (usize i = 0; i < self.module_loads.size(); ++i) {
      if (!fn("module_loads[" + std::to_string(i) + "]", self.module_loads[i])) return false;
    }
    for (auto& kv : self.environment_variables) {
      if (!fn("environment_variables." + kv.first, kv.second)) return false;
    }
    if (!fn(std::string("directory"), self.directory)) return false;
    for (usize i = 0; i < self.build_commands.size(); ++i) {
      if (!fn("build_commands[" + std::to_string(i) + "]", self.build_commands[i])) return false;
    }
    if (!fn(std::string("run_command"), self.run_command)) return false;
    if (!fn(std::string("args"), self.args)) return false;
    for (usize i = 0; i < self.post_commands.size(); ++i) {
      if (!fn("post_commands[" + std::to_string(i) + "]", self.post_commands[i])) return false;
    }
    return true;
  }
};

struct VariableAxis {
  std::string name;
  std::vector<std::string> values;
};

struct MetricDefinition {
  std::string name;
  std::string pattern;
  MetricTarget target = MetricTarget::Stdout;
  std::string file_name;  // target == File only
  MetricType type = MetricType::Numeric;

  // Compiled pattern; null when `pattern` does not compile.
  std::shared_ptr<const boost::regex> re;

  // Compile `pattern` into `re`. Returns false (re stays null) on a bad pattern.
  bool Compile(Error* err = nullptr);

  // "stdout", "stderr" or "file:<name>".
  std::string TargetLabel() const;
};

// Parse "stdout" | "stderr" | "file:<name>".
bool ParseMetricTarget(std::string_view s, MetricTarget* target, std::string* file_name);

struct TestBench {
  std::string name;
  bool enabled = true;
  std::vector<std::string> run_configurations;
  std::vector<VariableAxis> axes;
  i64 reruns = 1;
  std::vector<MetricDefinition> metrics;

  // Plot specifications, kept as serialized JSON and passed through untouched.
  std::string plots_json;

  bool HasImplicitRunConfigurationAxis() const { return run_configurations.size() > 1; }

  const MetricDefinition* FindMetric(std::string_view metric) const;
};

struct TestPlan {
  std::string name;
  std::map<std::string, RunConfiguration> run_configurations;
  std::vector<TestBench> benches;

  const TestBench* FindBench(std::string_view bench) const;
  const RunConfiguration* FindRunConfiguration(std::string_view rc) const;

  // ConfigError on the first structural problem found. No side effects.
  bool Validate(Error* err = nullptr) const;
};

}  // namespace plan
}  // namespace hmb
