#pragma once

#include "AuditEngine.hpp"

#include <nlohmann/json_fwd.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace audit
{

class AuditReportWriter
{
public:
    static nlohmann::json toJson(const AuditReport& report, const std::string& timestamp);

    // Category,Issues,Summary
    static std::string toCsv(const AuditReport& report);

    // Human-readable report listing the first `max_examples` issues per category.
    static std::string toText(const AuditReport& report, const dictionary::UnifiedDictionary& dictionary,
                              std::size_t max_examples = 10);

    // Writes audit-report-<ts>.json, audit-report-<ts>.csv and audit-detailed-<ts>.txt.
    static bool write(const AuditReport& report, const dictionary::UnifiedDictionary& dictionary,
                      const std::string& directory, const std::string& timestamp,
                      std::vector<std::string>& outPaths, std::string& outError);
};

} // namespace audit
