#include "AuditEngine.hpp"
#include "../heuristics/DonorHeuristics.hpp"
#include "../processing/TextUtils.hpp"
#include "../reference/ExclusionRegistry.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <exception>
#include <functional>
#include <set>
#include <thread>

using dictionary::Entry;
using dictionary::UnifiedDictionary;
using report::Issue;
using report::Severity;

namespace audit
{

namespace
{

Issue makeIssue(const char* type, Severity severity, const Entry& entry, std::size_t index, std::string message,
                std::string recommendation)
{
    Issue issue;
    issue.type = type;
    issue.severity = severity;
    issue.subject = entry.english;
    issue.index = index;
    issue.message = std::move(message);
    issue.recommendation = std::move(recommendation);
    return issue;
}

void summarize(report::CategoryResult& result, const char* what)
{
    result.score = AuditEngine::scoreFor(result.issues.size());
    result.summary = std::to_string(result.issues.size()) + " " + what;
}

} // namespace

std::size_t AuditReport::totalIssues() const
{
    std::size_t total = 0;
    for (const auto& category : categories)
        total += category.issues.size();
    return total;
}

std::size_t AuditReport::suspectCount() const
{
    std::set<std::size_t> suspects;
    for (const auto& category : categories)
    {
        for (const auto& issue : category.issues)
        {
            if (issue.severity == Severity::High && issue.index)
                suspects.insert(*issue.index);
        }
    }
    return suspects.size();
}

AuditEngine::AuditEngine(AuditOptions options, const reference::ExclusionRegistry* exclusions)
    : options_(options)
    , exclusions_(exclusions)
{
}

AuditReport AuditEngine::run(const UnifiedDictionary& dictionary) const
{
    const std::vector<std::function<CheckOutcome()>> checks = {
        [&] { return checkSuspiciousPatterns(dictionary); },
        [&] { return checkEtymologicalIssues(dictionary); },
        [&] { return checkCulturalAnachronisms(dictionary); },
        [&] { return checkMissingNotes(dictionary); },
    };
    std::vector<CheckOutcome> outcomes(checks.size());

    if (options_.parallel)
    {
        std::vector<std::exception_ptr> errors(checks.size());
        {
            std::vector<std::jthread> workers;
            for (std::size_t i = 0; i < checks.size(); ++i)
            {
                workers.emplace_back([&outcomes, &checks, &errors, i] {
                    try
                    {
                        outcomes[i] = checks[i]();
                    }
                    catch (...)
                    {
                        errors[i] = std::current_exception();
                    }
                });
            }
        }
        for (const auto& error : errors)
        {
            if (error)
                std::rethrow_exception(error);
        }
    }
    else
    {
        for (std::size_t i = 0; i < checks.size(); ++i)
            outcomes[i] = checks[i]();
    }

    AuditReport out;
    out.total_entries = dictionary.entries.size();
    for (auto& outcome : outcomes)
    {
        out.categories.push_back(std::move(outcome.result));
        for (auto& event : outcome.suppressions)
        {
            PLOG_INFO << "[AuditEngine] Excluded: " << event.subject << " (" << event.reason << ")";
            out.suppressions.push_back(std::move(event));
        }
    }
    out.score = scoreFor(out.totalIssues());

    PLOG_INFO << "[AuditEngine] Audit score " << report::formatScore(out.score) << ", " << out.totalIssues()
              << " issues, " << out.suppressions.size() << " suppressed";
    return out;
}

double AuditEngine::scoreFor(std::size_t issues)
{
    return std::max(0.0, 100.0 - 0.5 * static_cast<double>(issues));
}

const std::vector<std::string>& AuditEngine::anachronisticTerms()
{
    static const std::vector<std::string> terms = {
        "computer", "internet", "phone", "television", "radio", "electricity",
        "democracy", "republic", "capitalism", "psychology", "biology",
        "university", "hospital", "library", "bank", "insurance",
        "plastic", "rubber", "aluminum", "steel", "concrete",
        "chocolate", "coffee", "tea", "sugar", "tobacco"
    };
    return terms;
}

const std::vector<std::string>& AuditEngine::importantTerms()
{
    static const std::vector<std::string> terms = {
        "king", "queen", "prince", "princess", "duke", "lord", "lady",
        "knight", "warrior", "soldier", "priest", "monk", "nun",
        "magic", "spell", "potion", "dragon", "unicorn", "phoenix",
        "sword", "shield", "bow", "arrow", "armor", "helmet",
        "castle", "palace", "tower", "temple", "church", "throne"
    };
    return terms;
}

AuditEngine::CheckOutcome AuditEngine::checkSuspiciousPatterns(const UnifiedDictionary& dictionary) const
{
    CheckOutcome outcome;
    outcome.result.category = kSuspiciousPatterns;
    for (std::size_t i = 0; i < dictionary.entries.size(); ++i)
    {
        const Entry& entry = dictionary.entries[i];
        const std::string english = processing::toLowerAscii(entry.english);
        const std::string ancient = entry.ancientSurface();
        const std::string modern = entry.modernSurface();

        if (!ancient.empty())
        {
            const std::string lower = processing::toLowerAscii(ancient);
            if (lower.find(english) != std::string::npos && processing::endsWithAny(lower, { "or", "on" }))
            {
                raise(outcome, makeIssue("english_or_on_suffix", Severity::High, entry, i,
                                         "Ancient form \"" + ancient + "\" appears to be English + suffix",
                                         "Replace with authentic donor language formation"));
            }
        }

        if (!modern.empty())
        {
            const std::string lower = processing::toLowerAscii(modern);
            if (lower.find(english) != std::string::npos || processing::endsWithAny(lower, { "ing", "tion", "ness" }))
            {
                raise(outcome, makeIssue("english_like_modern", Severity::Medium, entry, i,
                                         "Modern form \"" + modern + "\" appears English-like",
                                         "Use authentic donor language phonology"));
            }
        }
    }

    summarize(outcome.result, "suspicious patterns found");
    return outcome;
}

AuditEngine::CheckOutcome AuditEngine::checkEtymologicalIssues(const UnifiedDictionary& dictionary) const
{
    CheckOutcome outcome;
    outcome.result.category = kEtymologicalIssues;
    for (std::size_t i = 0; i < dictionary.entries.size(); ++i)
    {
        const Entry& entry = dictionary.entries[i];
        const std::string ancient = entry.ancientSurface();
        const std::string modern = entry.modernSurface();

        if (processing::codepointLength(ancient) > 8 && !entry.hasNotes())
        {
            raise(outcome, makeIssue("complex_no_notes", Severity::Medium, entry, i,
                                     "Complex Ancient form \"" + ancient + "\" lacks donor language notes",
                                     "Add donor language explanation"));
        }

        if (!entry.hasNotes())
            continue;

        if (heuristics::claimsLatin(*entry.notes) && !heuristics::hasLatinEnding(ancient))
        {
            raise(outcome, makeIssue("latin_claim_mismatch", Severity::Low, entry, i,
                                     "Claims Latin origin but Ancient form doesn't have Latin ending",
                                     "Verify Latin claim or adjust form"));
        }

        if (heuristics::claimsHungarian(*entry.notes) && !heuristics::hasHungarianFeatures(modern))
        {
            raise(outcome, makeIssue("hungarian_claim_mismatch", Severity::Low, entry, i,
                                     "Claims Hungarian origin but Modern form lacks Hungarian features",
                                     "Verify Hungarian claim or adjust form"));
        }
    }

    summarize(outcome.result, "etymological issues found");
    return outcome;
}

AuditEngine::CheckOutcome AuditEngine::checkCulturalAnachronisms(const UnifiedDictionary& dictionary) const
{
    CheckOutcome outcome;
    outcome.result.category = kCulturalAnachronisms;
    for (std::size_t i = 0; i < dictionary.entries.size(); ++i)
    {
        const Entry& entry = dictionary.entries[i];
        const std::string english = processing::toLowerAscii(entry.english);

        for (const auto& term : anachronisticTerms())
        {
            if (english.find(term) == std::string::npos)
                continue;
            raise(outcome, makeIssue("cultural_anachronism", Severity::High, entry, i,
                                     "\"" + entry.english + "\" may be culturally anachronistic (" + term + ")",
                                     "Verify cultural appropriateness"));
        }
    }

    summarize(outcome.result, "cultural anachronisms found");
    return outcome;
}

AuditEngine::CheckOutcome AuditEngine::checkMissingNotes(const UnifiedDictionary& dictionary) const
{
    CheckOutcome outcome;
    outcome.result.category = kMissingNotes;
    for (std::size_t i = 0; i < dictionary.entries.size(); ++i)
    {
        const Entry& entry = dictionary.entries[i];
        const std::string english = processing::toLowerAscii(entry.english);

        // Short keys would match inside almost any term ("in" in "king").
        const auto& terms = importantTerms();
        const bool important = std::any_of(terms.begin(), terms.end(), [&english](const std::string& term) {
            return english.find(term) != std::string::npos ||
                   (english.size() >= 3 && term.find(english) != std::string::npos);
        });
        if (!important)
            continue;

        const std::size_t note_length = entry.notes ? processing::codepointLength(*entry.notes) : 0;
        if (note_length >= options_.min_note_length)
            continue;

        raise(outcome, makeIssue("important_missing_notes", Severity::Medium, entry, i,
                                 "Important term \"" + entry.english + "\" lacks sufficient notes",
                                 "Add cultural or historical context"));
    }

    summarize(outcome.result, "entries missing important notes");
    return outcome;
}

void AuditEngine::raise(CheckOutcome& outcome, Issue issue) const
{
    if (exclusions_)
    {
        if (auto match = exclusions_->isExcluded(issue.subject))
        {
            SuppressionEvent event;
            event.category = outcome.result.category;
            event.issue_type = issue.type;
            event.subject = issue.subject;
            event.index = issue.index.value_or(0);
            event.reason = match->describe();
            outcome.suppressions.push_back(std::move(event));
            return;
        }
    }
    outcome.result.issues.push_back(std::move(issue));
}

} // namespace audit
