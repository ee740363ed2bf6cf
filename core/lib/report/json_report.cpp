// defcheck/report/json_report.cpp
#include "defcheck/report/json_report.hpp"

namespace defcheck
{

using json = nlohmann::json;

void to_json(json & j, const Violation & v)
{
  j = json{
    {"file", v.file},
    {"line", v.line},
    {"column", v.column},
    {"type", std::string(to_string(v.type))},
    {"severity", std::string(to_string(v.severity))},
    {"description", v.description},
    {"snippet", v.snippet},
    {"suggestion", v.suggestion},
  };
}

void to_json(json & j, const PredictedFailure & f)
{
  j = json{
    {"failure_type", std::string(to_string(f.failure_type))},
    {"component_a", f.component_a},
    {"component_b", f.component_b},
    {"description", f.description},
    {"severity", std::string(to_string(f.severity))},
    {"fix_strategy", f.fix_strategy},
    {"test_generation", f.test_generation},
  };
}

void to_json(json & j, const AnalysisNote & n)
{
  j = json{
    {"file", n.file},
    {"kind", std::string(to_string(n.kind))},
    {"message", n.message},
  };
}

void to_json(json & j, const AnalysisReport & report)
{
  j = json::object();
  j["summary"] = {
    {"total", report.summary.total},
    {"critical", report.summary.critical},
    {"warning", report.summary.warning},
    {"info", report.summary.info},
  };
  j["by_type"] = report.by_type;
  j["violations"] = report.violations;
  j["predicted_failures"] = report.predicted_failures;
  j["notes"] = report.notes;
  j["files_analyzed"] = report.files_analyzed;
  j["files_skipped"] = report.files_skipped;
}

std::string render_json(const AnalysisReport & report)
{
  // nlohmann::json objects are std::map backed, so keys come out sorted.
  return json(report).dump(2);
}

}  // namespace defcheck
