// src/report/write_report.cpp

#include "hmb/report/write_report.h"

#include "hmb/core/logging.h"
#include "hmb/io/csv_io.h"
#include "hmb/io/fs_util.h"
#include "hmb/io/json.h"

#include <sstream>
#include <unordered_map>
#include <utility>

namespace hmb {
namespace report {

namespace {

std::string Num(double x) { return analysis::FormatValue(analysis::MetricValue{x}); }

std::string AxesText(const plan::AxisValues& axes) {
  if (axes.empty()) return "base";
  std::string s;
  for (usize i = 0; i < axes.size(); ++i) {
    if (i) s += ',';
    s += axes[i].first + "=" + axes[i].second;
  }
  return s;
}

// Groups of one bench, in expansion order.
std::vector<const analysis::GroupInfo*> GroupsOf(const analysis::AggregationResult& agg,
                                                 const std::string& bench) {
  std::vector<const analysis::GroupInfo*> out;
  for (const auto& g : agg.groups) {
    if (g.bench == bench) out.push_back(&g);
  }
  return out;
}

// Axis names of a bench as they appear on its instances.
std::vector<std::string> AxisNames(const plan::TestBench& bench) {
  std::vector<std::string> names;
  names.reserve(bench.axes.size() + 1);
  for (const auto& ax : bench.axes) names.push_back(ax.name);
  if (bench.HasImplicitRunConfigurationAxis()) names.emplace_back(plan::kRunConfigurationAxis);
  return names;
}

std::string AxisValue(const plan::AxisValues& axes, const std::string& name) {
  for (const auto& kv : axes) {
    if (kv.first == name) return kv.second;
  }
  return std::string();
}

}  // namespace

std::vector<std::string> RunsHeader() {
  return {"bench", "run_id", "group_key", "rerun", "axes", "status", "job_handle",
          "metric", "value", "missing_reason", "last_error"};
}

std::vector<std::string> SummaryHeader() {
  return {"bench", "group_key", "axes", "metric", "type", "count",
          "value", "stdev", "min", "max", "note"};
}

bool WriteRunsCSV(const std::filesystem::path& path,
                  const std::vector<plan::RunInstance>& instances,
                  const std::vector<analysis::ExtractedMetric>& extracted,
                  Error* err) {
  csv::Writer w;
  if (!w.Open(path, err)) return false;
  if (!w.WriteRow(RunsHeader(), err)) return false;

  std::unordered_map<std::string, std::vector<const analysis::ExtractedMetric*>> by_run;
  for (const auto& e : extracted) by_run[e.run_id].push_back(&e);

  for (const auto& inst : instances) {
    const std::vector<std::string> prefix = {
        inst.bench, inst.id, inst.group_key, std::to_string(inst.rerun), inst.AxesLabel(),
        std::string(ToString(inst.status)), inst.handle};

    auto it = by_run.find(inst.id);
    if (it == by_run.end()) {
      std::vector<std::string> row = prefix;
      row.insert(row.end(), {"", "", "", inst.last_error});
      if (!w.WriteRow(row, err)) return false;
      continue;
    }
    for (const analysis::ExtractedMetric* e : it->second) {
      std::vector<std::string> row = prefix;
      row.push_back(e->metric);
      row.push_back(analysis::FormatValue(e->value));
      if (const auto* miss = std::get_if<analysis::Missing>(&e->value)) {
        row.push_back(std::string(analysis::ToString(miss->reason)));
      } else {
        row.emplace_back();
      }
      row.push_back(inst.last_error);
      if (!w.WriteRow(row, err)) return false;
    }
  }
  return true;
}

bool WriteSummaryCSV(const std::filesystem::path& path, const plan::TestPlan& plan,
                     const analysis::AggregationResult& agg, Error* err) {
  csv::Writer w;
  if (!w.Open(path, err)) return false;
  if (!w.WriteRow(SummaryHeader(), err)) return false;

  for (const auto& g : agg.groups) {
    const plan::TestBench* bench = plan.FindBench(g.bench);
    if (!bench) continue;
    for (const auto& def : bench->metrics) {
      std::vector<std::string> row = {g.bench, g.group_key, AxesText(g.axes), def.name,
                                      std::string(ToString(def.type))};
      const analysis::AggregatedMetric* am = agg.Find(g.group_key, def.name);
      if (!am) {
        row.insert(row.end(), {"0", "", "", "", "", kNoData});
      } else if (am->type == MetricType::Text) {
        row.insert(row.end(), {std::to_string(am->count), am->mode, "0", "", "", ""});
      } else {
        row.insert(row.end(), {std::to_string(am->count), Num(am->mean), Num(am->stdev),
                               Num(am->min), Num(am->max), ""});
      }
      if (!w.WriteRow(row, err)) return false;
    }
  }
  return true;
}

bool WriteExportCSV(const std::filesystem::path& path, const plan::TestBench& bench,
                    const analysis::AggregationResult& agg, Error* err) {
  csv::Writer w;
  if (!w.Open(path, err)) return false;

  const std::vector<std::string> axis_names = AxisNames(bench);
  std::vector<std::string> header = axis_names;
  for (const auto& def : bench.metrics) {
    header.push_back(def.name);
    header.push_back(def.name + " error");
  }
  if (!w.WriteRow(header, err)) return false;

  for (const analysis::GroupInfo* g : GroupsOf(agg, bench.name)) {
    std::vector<std::string> row;
    row.reserve(header.size());
    for (const auto& name : axis_names) row.push_back(AxisValue(g->axes, name));
    for (const auto& def : bench.metrics) {
      const analysis::AggregatedMetric* am = agg.Find(g->group_key, def.name);
      if (!am) {
        row.emplace_back();
        row.emplace_back();
      } else if (am->type == MetricType::Text) {
        row.push_back(am->mode);
        row.push_back("0");
      } else {
        row.push_back(Num(am->mean));
        row.push_back(Num(am->stdev));
      }
    }
    if (!w.WriteRow(row, err)) return false;
  }
  return true;
}

void WriteFeed(std::ostream& os, const plan::TestPlan& plan,
               const analysis::AggregationResult& agg) {
  for (const auto& bench : plan.benches) {
    const auto groups = GroupsOf(agg, bench.name);
    if (groups.empty()) continue;

    std::ostringstream b;
    b << "{\"type\":\"bench\",\"name\":\"" << json::Escape(bench.name) << "\",\"axes\":[";
    const std::vector<std::string> axis_names = AxisNames(bench);
    for (usize i = 0; i < axis_names.size(); ++i) {
      if (i) b << ',';
      b << '"' << json::Escape(axis_names[i]) << '"';
    }
    b << "],\"metrics\":[";
    for (usize i = 0; i < bench.metrics.size(); ++i) {
      if (i) b << ',';
      b << '"' << json::Escape(bench.metrics[i].name) << '"';
    }
    b << "],\"plots\":" << (bench.plots_json.empty() ? "null" : bench.plots_json) << "}";
    os << b.str() << "\n";

    for (const analysis::GroupInfo* g : groups) {
      std::ostringstream axes;
      axes << '{';
      for (usize i = 0; i < g->axes.size(); ++i) {
        if (i) axes << ',';
        axes << '"' << json::Escape(g->axes[i].first) << "\":\""
             << json::Escape(g->axes[i].second) << '"';
      }
      axes << '}';

      for (const auto& def : bench.metrics) {
        std::ostringstream s;
        s << "{\"type\":\"series\",\"bench\":\"" << json::Escape(bench.name)
          << "\",\"group\":\"" << json::Escape(g->group_key)
          << "\",\"axes\":" << axes.str()
          << ",\"metric\":\"" << json::Escape(def.name) << "\",";
        const analysis::AggregatedMetric* am = agg.Find(g->group_key, def.name);
        if (!am) {
          s << "\"no_data\":true}";
        } else if (am->type == MetricType::Text) {
          s << "\"count\":" << am->count << ",\"value\":\"" << json::Escape(am->mode)
            << "\",\"stdev\":0}";
        } else {
          s << "\"count\":" << am->count << ",\"mean\":" << Num(am->mean)
            << ",\"stdev\":" << Num(am->stdev) << ",\"min\":" << Num(am->min)
            << ",\"max\":" << Num(am->max) << "}";
        }
        os << s.str() << "\n";
      }
    }
  }
  os.flush();
}

bool WriteReport(const std::filesystem::path& out_dir, const plan::TestPlan& plan,
                 const std::vector<plan::RunInstance>& instances,
                 const std::vector<analysis::ExtractedMetric>& extracted,
                 const analysis::AggregationResult& agg,
                 std::filesystem::path* out_dir_used, Error* err) {
  const std::filesystem::path dir = out_dir / kReportDir;
  if (!io::EnsureDirExists(dir, err)) return false;
  if (out_dir_used) *out_dir_used = dir;

  if (!WriteRunsCSV(dir / "runs.csv", instances, extracted, err)) return false;
  if (!WriteSummaryCSV(dir / "summary.csv", plan, agg, err)) return false;

  for (const auto& bench : plan.benches) {
    if (GroupsOf(agg, bench.name).empty()) continue;
    const auto path = dir / (io::SanitizeName(bench.name) + "_export.csv");
    if (!WriteExportCSV(path, bench, agg, err)) {
      AddContext(err, "bench " + bench.name);
      return false;
    }
  }

  HMB_LOG_INFO("report written to", dir.string());
  return true;
}

}  // namespace report
}  // namespace hmb
