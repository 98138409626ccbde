#pragma once
// hmb/plan/matrix.h
//
// Matrix expansion: TestBench -> ordered RunInstances.
//
// Order: cartesian product of the axes in declaration order (first axis
// outermost), then the implicit run_configuration axis (when the bench lists
// several run configurations), then rerun index 0..reruns-1 innermost.
//
// Identifiers:
//   <bench>__<axis>=<value>,...__r<rerun>__<hash8>
// Names and values are sanitized ([A-Za-z0-9._-], others -> '_'); hash8 is
// FNV-1a (32-bit) over the unsanitized bench name, axis names and values, so
// two combinations that sanitize identically still get distinct identifiers.
// The group key is the identifier without the "__r<rerun>" component.

#include "hmb/core/error.h"
#include "hmb/core/types.h"
#include "hmb/plan/model.h"

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace hmb {
namespace plan {

using AxisValues = std::vector<std::pair<std::string, std::string>>;

struct RunInstance {
  std::string id;
  std::string bench;
  std::string group_key;
  AxisValues axes;  // ordered (axis, value)
  u32 rerun = 0;

  // Fully rendered configuration (every placeholder substituted).
  RunConfiguration resolved;

  // Mutable lifecycle state.
  RunStatus status = RunStatus::Pending;
  JobHandle handle;
  std::string last_error;

  // "a=1,b=2" (unsanitized), or "base" with no axes.
  std::string AxesLabel() const;
};

u32 Fnv1a32(std::string_view data, u32 seed = 2166136261u);

std::string MakeGroupKey(std::string_view bench, const AxisValues& axes);
std::string MakeIdentifier(std::string_view bench, const AxisValues& axes, u32 rerun);

// TemplateError when a placeholder has no value or is malformed.
bool ExpandBench(const TestPlan& plan, const TestBench& bench, std::vector<RunInstance>* out,
                 Error* err = nullptr);

// Expand every enabled bench (or only `only_bench` when non-empty, enabled or
// not). Instances of all benches are appended in plan order. A bench whose
// templates fail to render is logged and skipped; any other error aborts.
bool ExpandPlan(const TestPlan& plan, std::string_view only_bench, std::vector<RunInstance>* out,
                Error* err = nullptr);

}  // namespace plan
}  // namespace hmb
