#pragma once

#include <nlohmann/json_fwd.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace report
{

enum class Severity
{
    Low,
    Medium,
    High
};

const char* severityName(Severity severity);

struct Issue
{
    std::string type;                 // e.g. "ancient_collision", "missing_metadata"
    Severity severity = Severity::Medium;
    std::string subject;              // english key, phrase or metadata field
    std::optional<std::size_t> index; // position in the dictionary, when entry-bound
    std::string message;
    std::string recommendation;
};

struct CategoryResult
{
    std::string category;
    double score = 100.0; // always within [0, 100]
    std::vector<Issue> issues;
    std::string summary;
};

// An issue that was not raised because its subject is allowlisted.
struct SuppressionEvent
{
    std::string category;
    std::string issue_type;
    std::string subject;
    std::size_t index = 0;
    std::string reason; // e.g. ExclusionMatch::describe()
};

double clampScore(double score);

nlohmann::json issueToJson(const Issue& issue);
nlohmann::json suppressionToJson(const SuppressionEvent& event);

// Quote a CSV field, doubling embedded quotes.
std::string csvField(const std::string& text);

// Compact real-valued score for reports: 98.5, 100, 92.25
std::string formatScore(double score);

// Truncates and writes; the parent directory must exist.
bool writeTextFile(const std::string& path, const std::string& content, std::string& outError);

// ISO-8601 UTC with ':' and '.' replaced so it is safe in file names,
// e.g. 2025-09-23T01-42-19-197Z
std::string fileTimestamp();

} // namespace report
