// defcheck/report/json_report.hpp - JSON serialization of analysis reports
#pragma once

#include <nlohmann/json.hpp>

#include <string>

#include "defcheck/report/analysis_report.hpp"

namespace defcheck
{

void to_json(nlohmann::json & j, const Violation & v);
void to_json(nlohmann::json & j, const PredictedFailure & f);
void to_json(nlohmann::json & j, const AnalysisNote & n);
void to_json(nlohmann::json & j, const AnalysisReport & report);

/// Pretty-printed report (2-space indent, keys sorted)
[[nodiscard]] std::string render_json(const AnalysisReport & report);

}  // namespace defcheck
