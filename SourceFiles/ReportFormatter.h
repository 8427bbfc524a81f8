#pragma once
#include "StatisticsAnalyzer.h"
#include <string>

StructuredValue ReportToJson(const StatisticsReport& report);

// Human-readable report, one section per analysis.
std::string FormatReportText(const StatisticsReport& report, const AnalyzerOptions& options = AnalyzerOptions());

// "42.50%"
std::string FormatPercent(double ratio);
