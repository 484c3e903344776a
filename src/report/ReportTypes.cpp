#include "ReportTypes.hpp"
#include "../dictionary/TrancheMerger.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdio>
#include <fstream>

namespace report
{

const char* severityName(Severity severity)
{
    switch (severity)
    {
    case Severity::Low:
        return "low";
    case Severity::Medium:
        return "medium";
    case Severity::High:
        return "high";
    }
    return "unknown";
}

double clampScore(double score)
{
    return std::clamp(score, 0.0, 100.0);
}

nlohmann::json issueToJson(const Issue& issue)
{
    nlohmann::json j;
    j["type"] = issue.type;
    j["severity"] = severityName(issue.severity);
    j["subject"] = issue.subject;
    if (issue.index)
        j["index"] = *issue.index;
    j["message"] = issue.message;
    if (!issue.recommendation.empty())
        j["recommendation"] = issue.recommendation;
    return j;
}

nlohmann::json suppressionToJson(const SuppressionEvent& event)
{
    return { { "category", event.category },
             { "type", event.issue_type },
             { "subject", event.subject },
             { "index", event.index },
             { "reason", event.reason } };
}

std::string csvField(const std::string& text)
{
    std::string out;
    out.reserve(text.size() + 2);
    out.push_back('"');
    for (char c : text)
    {
        if (c == '"')
            out.push_back('"');
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

std::string formatScore(double score)
{
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.2f", score);
    std::string text = buffer;
    while (!text.empty() && text.back() == '0')
        text.pop_back();
    if (!text.empty() && text.back() == '.')
        text.pop_back();
    return text;
}

bool writeTextFile(const std::string& path, const std::string& content, std::string& outError)
{
    std::ofstream out(path, std::ios::trunc | std::ios::binary);
    if (!out.is_open())
    {
        outError = "cannot open " + path + " for writing";
        return false;
    }
    out << content;
    if (!out.good())
    {
        outError = "write failed: " + path;
        return false;
    }
    return true;
}

std::string fileTimestamp()
{
    std::string ts = dictionary::TrancheMerger::utcTimestamp();
    std::replace(ts.begin(), ts.end(), ':', '-');
    std::replace(ts.begin(), ts.end(), '.', '-');
    return ts;
}

} // namespace report
