#include "RunSummary.hpp"
#include "../report/ReportTypes.hpp"

#include <algorithm>
#include <sstream>

namespace pipeline
{

std::vector<std::pair<std::string, std::size_t>> rankedIssueCounts(const qa::QAReport& report)
{
    std::vector<std::pair<std::string, std::size_t>> counts;
    for (const auto& category : report.categories)
    {
        if (!category.issues.empty())
            counts.emplace_back(category.category, category.issues.size());
    }
    if (report.baseline && !report.baseline->result.issues.empty())
        counts.emplace_back(report.baseline->result.category, report.baseline->result.issues.size());

    std::stable_sort(counts.begin(), counts.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });
    return counts;
}

std::string formatRunSummary(const RunOutcome& outcome)
{
    std::ostringstream out;

    if (outcome.verdict == Verdict::Fatal)
    {
        out << "BUILD ABORTED: " << outcome.error << "\n";
        out << "Lifecycle state: " << toString(outcome.final_state) << "\n";
        return out.str();
    }

    if (outcome.dry_run)
        out << "(dry run: no artifact written, no fragment relocated)\n";

    if (!outcome.unparsable.empty())
    {
        out << "Skipped " << outcome.unparsable.size() << " unparsable fragment(s):\n";
        for (const auto& reason : outcome.unparsable)
            out << "   - " << reason << "\n";
    }

    if (!outcome.qa)
        return out.str();
    const qa::QAReport& qa = *outcome.qa;

    if (outcome.verdict == Verdict::Passed)
    {
        out << "QA PASSED: " << qa.overall << "% (threshold: " << qa.pass_threshold << "%)\n";
        out << "DICTIONARY BUILD COMPLETE\n";
        out << "Final Statistics:\n";
        out << "   - Total entries: " << outcome.total_entries << "\n";
        out << "   - Duplicates removed: " << outcome.duplicates_removed << "\n";
        out << "   - QA Score: " << qa.overall << "%\n";
        if (outcome.audit)
        {
            out << "   - Audit Score: " << report::formatScore(outcome.audit->score) << "%\n";
            out << "   - Suspect entries: " << outcome.audit->suspectCount() << "\n";
        }
        out << "   - Files processed: " << outcome.fragments.size() << "\n";
        if (!outcome.artifact_path.empty())
            out << "   - Dictionary: " << outcome.artifact_path << "\n";

        if (outcome.audit && outcome.audit->suspectCount() > 0)
        {
            out << "\nAUDIT ALERT: Suspect entries detected\n";
            out << "Review audit reports for detailed analysis:\n";
            out << "   - audit-report-" << outcome.run_id << ".json for details\n";
            out << "   - audit-detailed-" << outcome.run_id << ".txt for specific issues\n";
        }
        return out.str();
    }

    out << "QA FAILED: " << qa.overall << "% (threshold: " << qa.pass_threshold << "%)\n";
    out << "Issues to address:\n";
    for (const auto& [category, count] : rankedIssueCounts(qa))
        out << "   - " << category << ": " << count << " issues\n";
    out << "\nTranches remain in the merged area for review.\n";
    out << "Address the QA issues and run the build again.\n";
    return out.str();
}

} // namespace pipeline
