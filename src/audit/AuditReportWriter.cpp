#include "AuditReportWriter.hpp"

#include <plog/Log.h>
#include <nlohmann/json.hpp>

#include <cctype>
#include <filesystem>
#include <sstream>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace audit
{

json AuditReportWriter::toJson(const AuditReport& report, const std::string& timestamp)
{
    json categories = json::array();
    json detailed = json::array();
    for (const auto& category : report.categories)
    {
        categories.push_back({ { "category", category.category },
                               { "score", category.score },
                               { "issues", category.issues.size() },
                               { "summary", category.summary } });
        for (const auto& issue : category.issues)
        {
            json item = report::issueToJson(issue);
            item["category"] = category.category;
            detailed.push_back(std::move(item));
        }
    }

    json suppressions = json::array();
    for (const auto& event : report.suppressions)
    {
        suppressions.push_back(report::suppressionToJson(event));
    }

    json doc;
    doc["timestamp"] = timestamp;
    doc["totalEntries"] = report.total_entries;
    doc["auditScore"] = report.score;
    doc["totalIssues"] = report.totalIssues();
    doc["suspectEntries"] = report.suspectCount();
    doc["categories"] = std::move(categories);
    doc["detailedIssues"] = std::move(detailed);
    doc["suppressions"] = std::move(suppressions);
    return doc;
}

std::string AuditReportWriter::toCsv(const AuditReport& report)
{
    std::ostringstream csv;
    csv << "Category,Issues,Summary\n";
    for (const auto& category : report.categories)
    {
        csv << report::csvField(category.category) << ',' << category.issues.size() << ','
            << report::csvField(category.summary) << '\n';
    }
    return csv.str();
}

std::string AuditReportWriter::toText(const AuditReport& report, const dictionary::UnifiedDictionary& dictionary,
                                      std::size_t max_examples)
{
    std::ostringstream text;
    text << "DICTIONARY AUDIT REPORT\n";
    text << std::string(50, '=') << "\n\n";
    text << "Total Entries: " << report.total_entries << "\n";
    text << "Audit Score: " << report::formatScore(report.score) << "%\n";
    text << "Suppressed by exclusion list: " << report.suppressions.size() << "\n\n";

    for (const auto& category : report.categories)
    {
        if (category.issues.empty())
            continue;

        std::string heading = category.category;
        for (auto& c : heading)
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));

        text << heading << "\n";
        text << std::string(category.category.size(), '-') << "\n";
        text << category.summary << "\n\n";

        std::size_t shown = 0;
        for (const auto& issue : category.issues)
        {
            if (shown++ == max_examples)
                break;

            text << "* Entry #" << issue.index.value_or(0) << ": \"" << issue.subject << "\"\n";
            if (issue.index && *issue.index < dictionary.entries.size())
            {
                const auto& entry = dictionary.entries[*issue.index];
                text << "  Ancient: \"" << entry.ancientSurface() << "\"\n";
                text << "  Modern: \"" << entry.modernSurface() << "\"\n";
            }
            text << "  Issue: " << issue.message << "\n";
            text << "  Recommendation: " << issue.recommendation << "\n\n";
        }

        if (category.issues.size() > max_examples)
            text << "... and " << (category.issues.size() - max_examples) << " more issues\n\n";
    }

    return text.str();
}

bool AuditReportWriter::write(const AuditReport& report, const dictionary::UnifiedDictionary& dictionary,
                              const std::string& directory, const std::string& timestamp,
                              std::vector<std::string>& outPaths, std::string& outError)
{
    std::error_code ec;
    fs::create_directories(directory, ec);
    if (ec)
    {
        outError = "cannot create " + directory + ": " + ec.message();
        return false;
    }

    const fs::path dir(directory);
    const std::string json_path = (dir / ("audit-report-" + timestamp + ".json")).string();
    const std::string csv_path = (dir / ("audit-report-" + timestamp + ".csv")).string();
    const std::string txt_path = (dir / ("audit-detailed-" + timestamp + ".txt")).string();

    if (!report::writeTextFile(json_path, toJson(report, timestamp).dump(2), outError))
        return false;
    outPaths.push_back(json_path);

    if (!report::writeTextFile(csv_path, toCsv(report), outError))
        return false;
    outPaths.push_back(csv_path);

    if (!report::writeTextFile(txt_path, toText(report, dictionary), outError))
        return false;
    outPaths.push_back(txt_path);

    PLOG_INFO << "[AuditReportWriter] Reports generated in " << directory;
    return true;
}

} // namespace audit
