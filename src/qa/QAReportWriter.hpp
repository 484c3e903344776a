#pragma once

#include "QAScorer.hpp"

#include <nlohmann/json_fwd.hpp>

#include <string>
#include <vector>

namespace qa
{

class QAReportWriter
{
public:
    static nlohmann::json toJson(const QAReport& report, const std::string& timestamp);

    // Category,Score,Issues,Summary
    static std::string toCsv(const QAReport& report);

    // Writes qa-report-<timestamp>.json and .csv into `directory`.
    static bool write(const QAReport& report, const std::string& directory, const std::string& timestamp,
                      std::vector<std::string>& outPaths, std::string& outError);
};

} // namespace qa
