#pragma once

#include "../dictionary/Entry.hpp"
#include "../report/ReportTypes.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace reference
{
class ExclusionRegistry;
}

namespace audit
{

inline constexpr const char* kSuspiciousPatterns = "Suspicious Patterns";
inline constexpr const char* kEtymologicalIssues = "Etymological Issues";
inline constexpr const char* kCulturalAnachronisms = "Cultural Anachronisms";
inline constexpr const char* kMissingNotes = "Missing Notes";

using SuppressionEvent = report::SuppressionEvent;

struct AuditOptions
{
    std::size_t min_note_length = 10; // code points
    bool parallel = false;
};

struct AuditReport
{
    std::vector<report::CategoryResult> categories; // check order
    std::vector<SuppressionEvent> suppressions;
    double score = 100.0;
    std::size_t total_entries = 0;

    std::size_t totalIssues() const;

    // Distinct entries carrying at least one high-severity issue.
    std::size_t suspectCount() const;
};

/**
 * @brief Informational linguistic audit. Never blocks promotion.
 *
 * Every candidate issue is tested against the exclusion registry with the
 * entry's english key; a match drops the issue and records a SuppressionEvent.
 */
class AuditEngine
{
public:
    explicit AuditEngine(AuditOptions options = {}, const reference::ExclusionRegistry* exclusions = nullptr);

    AuditReport run(const dictionary::UnifiedDictionary& dictionary) const;

    // 100 - 0.5 per issue, floored at 0
    static double scoreFor(std::size_t issues);

    static const std::vector<std::string>& anachronisticTerms();
    static const std::vector<std::string>& importantTerms();

private:
    struct CheckOutcome
    {
        report::CategoryResult result;
        std::vector<SuppressionEvent> suppressions;
    };

    CheckOutcome checkSuspiciousPatterns(const dictionary::UnifiedDictionary& dictionary) const;
    CheckOutcome checkEtymologicalIssues(const dictionary::UnifiedDictionary& dictionary) const;
    CheckOutcome checkCulturalAnachronisms(const dictionary::UnifiedDictionary& dictionary) const;
    CheckOutcome checkMissingNotes(const dictionary::UnifiedDictionary& dictionary) const;

    // Appends the issue unless the entry is excluded, in which case the suppression is recorded.
    void raise(CheckOutcome& outcome, report::Issue issue) const;

    AuditOptions options_;
    const reference::ExclusionRegistry* exclusions_;
};

} // namespace audit
