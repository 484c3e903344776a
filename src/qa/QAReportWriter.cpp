#include "QAReportWriter.hpp"
#include "QACategories.hpp"

#include <plog/Log.h>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <sstream>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace qa
{

namespace
{

double weightOf(const std::string& category)
{
    for (const auto& [name, weight] : kCategoryWeights)
    {
        if (category == name)
            return weight;
    }
    return 0.0;
}

json categoryToJson(const report::CategoryResult& category)
{
    return { { "category", category.category },
             { "score", category.score },
             { "issues", category.issues.size() },
             { "summary", category.summary } };
}

void appendIssues(json& detailed, const report::CategoryResult& category)
{
    for (const auto& issue : category.issues)
    {
        json item = report::issueToJson(issue);
        item["category"] = category.category;
        detailed.push_back(std::move(item));
    }
}

} // namespace

json QAReportWriter::toJson(const QAReport& report, const std::string& timestamp)
{
    json categories = json::array();
    json detailed = json::array();
    for (const auto& category : report.categories)
    {
        json item = categoryToJson(category);
        item["weight"] = weightOf(category.category);
        categories.push_back(std::move(item));
        appendIssues(detailed, category);
    }

    json doc;
    doc["timestamp"] = timestamp;
    doc["totalEntries"] = report.total_entries;
    doc["overallScore"] = report.overall;
    doc["passThreshold"] = report.pass_threshold;
    doc["passed"] = report.passed;
    doc["totalIssues"] = report.totalIssues();
    doc["categories"] = std::move(categories);

    if (report.baseline)
    {
        json baseline = categoryToJson(report.baseline->result);
        baseline["baselineCoverage"] = report.baseline->coverage;
        baseline["baselineMatches"] = report.baseline->matches;
        baseline["totalChecked"] = report.baseline->checked;
        doc["baselineConsistency"] = std::move(baseline);
        appendIssues(detailed, report.baseline->result);
    }

    doc["detailedIssues"] = std::move(detailed);

    json suppressions = json::array();
    for (const auto& event : report.suppressions)
        suppressions.push_back(report::suppressionToJson(event));
    doc["suppressions"] = std::move(suppressions);
    return doc;
}

std::string QAReportWriter::toCsv(const QAReport& report)
{
    std::ostringstream csv;
    csv << "Category,Score,Issues,Summary\n";
    for (const auto& category : report.categories)
    {
        csv << report::csvField(category.category) << ',' << report::formatScore(category.score) << ','
            << category.issues.size() << ',' << report::csvField(category.summary) << '\n';
    }
    if (report.baseline)
    {
        const auto& baseline = report.baseline->result;
        csv << report::csvField(baseline.category) << ',' << report::formatScore(baseline.score) << ','
            << baseline.issues.size() << ',' << report::csvField(baseline.summary) << '\n';
    }
    csv << report::csvField("Overall") << ',' << report.overall << ',' << report.totalIssues() << ','
        << report::csvField(report.passed ? "passed" : "needs remediation") << '\n';
    return csv.str();
}

bool QAReportWriter::write(const QAReport& report, const std::string& directory, const std::string& timestamp,
                           std::vector<std::string>& outPaths, std::string& outError)
{
    std::error_code ec;
    fs::create_directories(directory, ec);
    if (ec)
    {
        outError = "cannot create " + directory + ": " + ec.message();
        return false;
    }

    const fs::path json_path = fs::path(directory) / ("qa-report-" + timestamp + ".json");
    const fs::path csv_path = fs::path(directory) / ("qa-report-" + timestamp + ".csv");

    if (!report::writeTextFile(json_path.string(), toJson(report, timestamp).dump(2), outError))
        return false;
    outPaths.push_back(json_path.string());

    if (!report::writeTextFile(csv_path.string(), toCsv(report), outError))
        return false;
    outPaths.push_back(csv_path.string());

    PLOG_INFO << "[QAReportWriter] Wrote " << json_path.filename().string() << " and "
              << csv_path.filename().string();
    return true;
}

} // namespace qa
