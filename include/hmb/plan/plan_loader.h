#pragma once
// hmb/plan/plan_loader.h
//
// Plan document (JSON) -> TestPlan.
//
// Schema (abridged):
//   {
//     "name": "plan",
//     "run_configurations": { "<rc>": { "sbatch_config": {...}, "module_loads": [...],
//                                       "environment_variables": {...}, "directory": "...",
//                                       "build_commands": [...], "pre_built": false,
//                                       "run_command": "...",
//                                       "args": "...", "post_commands": [...],
//                                       "variables": {...} } },
//     "benches": [ { "name": "...", "enabled": true, "run_configurations": ["<rc>"],
//                    "matrix": [ {"<axis>": [v, ...]} ], "reruns": 1,
//                    "metrics": [ {"name": "...", "pattern": "...",
//                                  "target": "stdout|stderr|file:<name>",
//                                  "type": "numeric|text"} ],
//                    "plots": {...} } ]
//   }
//
// "benches" may also be an object keyed by bench name (benches are then
// ordered by name), and metrics/plots may sit under an "analysis" object
// with metrics given as {"<name>": "<pattern>"}.
//
// Only the document shape is checked here (ConfigError); call
// TestPlan::Validate for the semantic checks.

#include "hmb/core/error.h"
#include "hmb/io/json.h"
#include "hmb/plan/model.h"

#include <string>
#include <string_view>

namespace hmb {
namespace plan {

bool ParseTestPlan(std::string_view text, TestPlan* out, Error* err = nullptr);

bool LoadTestPlan(const std::string& path, TestPlan* out, Error* err = nullptr);

bool TestPlanFromJson(const json::Value& root, TestPlan* out, Error* err = nullptr);

}  // namespace plan
}  // namespace hmb
