#include "BaselineConsistency.hpp"
#include "QACategories.hpp"
#include "../processing/Diagnostics.hpp"
#include "../processing/TextUtils.hpp"
#include "../reference/BaselineIndex.hpp"

#include <plog/Log.h>

#include <cstdio>

using report::Issue;
using report::Severity;

namespace qa
{

namespace
{

void compareForm(const char* type, const char* label, const std::string& current, const std::string& expected,
                 const dictionary::Entry& entry, std::size_t index, std::vector<Issue>& issues)
{
    if (current.empty() || expected.empty())
        return;
    if (processing::toLowerAscii(current) == processing::toLowerAscii(expected))
        return;

    Issue issue;
    issue.type = type;
    issue.severity = Severity::High;
    issue.subject = entry.english;
    issue.index = index;
    issue.message = std::string(label) + " form differs from baseline: \"" + current + "\" vs \"" + expected + "\"";
    issue.recommendation = "Keep the baseline form or document the change";
    issues.push_back(std::move(issue));
}

} // namespace

BaselineConsistencyResult checkBaselineConsistency(const dictionary::UnifiedDictionary& dictionary,
                                                   const reference::BaselineIndex& baseline)
{
    BaselineConsistencyResult out;
    std::vector<Issue> issues;

    for (std::size_t i = 0; i < dictionary.entries.size(); ++i)
    {
        const dictionary::Entry& entry = dictionary.entries[i];
        ++out.checked;

        const reference::BaselineEntry* known = baseline.lookup(entry.english);
        if (known)
        {
            ++out.matches;
            compareForm("ancient_mismatch", "Ancient", entry.ancientSurface(), known->entry.ancientSurface(), entry, i, issues);
            compareForm("modern_mismatch", "Modern", entry.modernSurface(), known->entry.modernSurface(), entry, i, issues);

            if (known->entry.hasNotes() && !entry.hasNotes())
            {
                Issue issue;
                issue.type = "missing_notes";
                issue.severity = Severity::Medium;
                issue.subject = entry.english;
                issue.index = i;
                issue.message = "Baseline has notes that could inform this entry: \"" +
                                processing::Diagnostics::Preview(*known->entry.notes) + "\"";
                issues.push_back(std::move(issue));
            }
            continue;
        }

        const auto similar = baseline.findSimilar(entry.english);
        if (similar.empty())
            continue;

        Issue issue;
        issue.type = "similar_baseline_entries";
        issue.severity = Severity::Low;
        issue.subject = entry.english;
        issue.index = i;
        issue.message = "Found " + std::to_string(similar.size()) + " similar entries in baseline:";
        for (std::size_t k = 0; k < similar.size() && k < 3; ++k)
            issue.message += (k == 0 ? " " : ", ") + similar[k]->entry.english;
        issue.recommendation = "Align with the related baseline entries";
        issues.push_back(std::move(issue));
    }

    out.coverage = out.checked > 0 ? 100.0 * static_cast<double>(out.matches) / static_cast<double>(out.checked) : 0.0;

    double score = 100.0;
    for (const auto& issue : issues)
    {
        switch (issue.severity)
        {
        case Severity::High:
            score -= 5.0;
            break;
        case Severity::Medium:
            score -= 2.0;
            break;
        case Severity::Low:
            score -= 1.0;
            break;
        }
    }
    if (out.coverage > 80.0)
        score += 5.0;

    char coverage[16];
    std::snprintf(coverage, sizeof(coverage), "%.1f", out.coverage);

    out.result.category = kBaselineConsistency;
    out.result.score = report::clampScore(score);
    out.result.issues = std::move(issues);
    out.result.summary = std::to_string(out.matches) + "/" + std::to_string(out.checked) + " entries (" + coverage +
                         "%) match baseline reference";

    if (processing::Diagnostics::IsVerbose())
    {
        PLOG_INFO_(processing::Diagnostics::kLogInstance)
            << "[BaselineConsistency] " << out.result.summary << ", " << out.result.issues.size() << " issues";
    }
    return out;
}

} // namespace qa
