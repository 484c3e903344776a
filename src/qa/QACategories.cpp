#include "QACategories.hpp"
#include "HomonymPolicy.hpp"
#include "../dictionary/Version.hpp"
#include "../heuristics/DonorHeuristics.hpp"
#include "../heuristics/WordTypeClassifier.hpp"
#include "../processing/TextUtils.hpp"

#include <cstdio>
#include <map>

using dictionary::Entry;
using dictionary::UnifiedDictionary;
using report::CategoryResult;
using report::Issue;
using report::Severity;

namespace qa
{

namespace
{

CategoryResult finish(const char* category, double penalty_per_issue, std::vector<Issue> issues, std::string summary)
{
    CategoryResult result;
    result.category = category;
    result.score = report::clampScore(100.0 - penalty_per_issue * static_cast<double>(issues.size()));
    result.issues = std::move(issues);
    result.summary = std::move(summary);
    return result;
}

Issue entryIssue(const char* type, Severity severity, const Entry& entry, std::size_t index, std::string message,
                 std::string recommendation = {})
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

std::string percent(double ratio)
{
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%.1f%%", ratio * 100.0);
    return buffer;
}

void collectCollisions(const UnifiedDictionary& dictionary, const IHomonymPolicy& policy, bool ancient,
                       std::vector<Issue>& issues, std::vector<report::SuppressionEvent>* suppressed)
{
    std::map<std::string, std::vector<std::size_t>> groups;
    for (std::size_t i = 0; i < dictionary.entries.size(); ++i)
    {
        const Entry& entry = dictionary.entries[i];
        std::string form = ancient ? entry.ancientSurface() : entry.modernSurface();
        if (!form.empty())
            groups[std::move(form)].push_back(i);
    }

    for (const auto& [form, members] : groups)
    {
        for (std::size_t a = 0; a < members.size(); ++a)
        {
            for (std::size_t b = a + 1; b < members.size(); ++b)
            {
                const Entry& first = dictionary.entries[members[a]];
                const Entry& second = dictionary.entries[members[b]];
                if (processing::toLowerAscii(first.english) == processing::toLowerAscii(second.english))
                    continue;
                const char* type = ancient ? "ancient_collision" : "modern_collision";
                if (auto reason = policy.justify(first.english, second.english))
                {
                    if (suppressed)
                    {
                        report::SuppressionEvent event;
                        event.category = kCollisionCheck;
                        event.issue_type = type;
                        event.subject = first.english + " / " + second.english;
                        event.index = members[a];
                        event.reason = std::move(*reason);
                        suppressed->push_back(std::move(event));
                    }
                    continue;
                }

                Issue issue;
                issue.type = type;
                issue.severity = Severity::Medium;
                issue.subject = first.english + " / " + second.english;
                issue.index = members[a];
                issue.message = std::string(ancient ? "Ancient" : "Modern") + " form \"" + form +
                                "\" is shared by \"" + first.english + "\" (#" + std::to_string(members[a]) +
                                ") and \"" + second.english + "\" (#" + std::to_string(members[b]) + ")";
                issue.recommendation = "Give one meaning a distinct form or allowlist the pair";
                issues.push_back(std::move(issue));
            }
        }
    }
}

} // namespace

const std::vector<std::string>& essentialVocabulary()
{
    static const std::vector<std::string> phrases = {
        "I am", "you are", "he is", "she is",
        "good", "bad", "big", "small",
        "house", "water", "food", "fire",
        "walk", "run", "see", "hear"
    };
    return phrases;
}

CategoryResult checkCollisions(const UnifiedDictionary& dictionary, const IHomonymPolicy& policy,
                               std::vector<report::SuppressionEvent>* suppressed)
{
    std::vector<Issue> issues;
    collectCollisions(dictionary, policy, true, issues, suppressed);
    collectCollisions(dictionary, policy, false, issues, suppressed);

    std::string summary = std::to_string(issues.size()) + " collisions found";
    return finish(kCollisionCheck, 2.0, std::move(issues), std::move(summary));
}

CategoryResult auditSuffixes(const UnifiedDictionary& dictionary)
{
    std::vector<Issue> issues;
    for (std::size_t i = 0; i < dictionary.entries.size(); ++i)
    {
        const Entry& entry = dictionary.entries[i];
        const std::string ancient = entry.ancientSurface();
        const std::string modern = entry.modernSurface();

        if (heuristics::isEnglishPlusSuffix(entry.english, ancient))
        {
            issues.push_back(entryIssue("lazy_ancient", Severity::High, entry, i,
                                        "Ancient form \"" + ancient + "\" appears to be English + suffix",
                                        "Replace with an authentic donor language formation"));
        }

        if (heuristics::isEnglishLikeModern(modern) && !heuristics::hasDonorLanguageRoot(entry.notes))
        {
            issues.push_back(entryIssue("english_like_modern", Severity::Medium, entry, i,
                                        "Modern form \"" + modern + "\" appears English-like without donor language notes",
                                        "Document the donor language or rework the form"));
        }
    }

    std::string summary = std::to_string(issues.size()) + " lazy formations found";
    return finish(kSuffixAudit, 1.5, std::move(issues), std::move(summary));
}

CategoryResult reviewCompounds(const UnifiedDictionary& dictionary)
{
    std::vector<Issue> issues;
    for (std::size_t i = 0; i < dictionary.entries.size(); ++i)
    {
        const Entry& entry = dictionary.entries[i];
        const std::string ancient = entry.ancientSurface();
        const std::string modern = entry.modernSurface();

        const bool hyphenated = ancient.find('-') != std::string::npos || modern.find('-') != std::string::npos;
        if (hyphenated && !heuristics::isCulturallyGrounded(entry.notes))
        {
            issues.push_back(entryIssue("meaningless_compound", Severity::Medium, entry, i,
                                        "Hyphenated compound without cultural grounding",
                                        "Explain the cultural basis of the compound in notes"));
        }

        if (processing::codepointLength(ancient) > 10 && !heuristics::hasDonorLanguageRoot(entry.notes))
        {
            issues.push_back(entryIssue("suspicious_compound", Severity::Low, entry, i,
                                        "Long form \"" + ancient + "\" without clear donor language evidence",
                                        "Name the donor roots in notes"));
        }
    }

    std::string summary = std::to_string(issues.size()) + " problematic compounds found";
    return finish(kCompoundReview, 2.0, std::move(issues), std::move(summary));
}

CategoryResult analyzeCoverage(const UnifiedDictionary& dictionary)
{
    std::vector<std::string> keys;
    keys.reserve(dictionary.entries.size());
    for (const auto& entry : dictionary.entries)
        keys.push_back(entry.english);

    const heuristics::WordTypeCounts counts = heuristics::WordTypeClassifier::count(keys);
    const double total = static_cast<double>(counts.total());
    const double verb_ratio = total > 0 ? static_cast<double>(counts.verbs) / total : 0.0;
    const double noun_ratio = total > 0 ? static_cast<double>(counts.nouns) / total : 0.0;

    std::vector<Issue> issues;
    if (verb_ratio < 0.15)
    {
        Issue issue;
        issue.type = "low_verb_coverage";
        issue.subject = "verbs";
        issue.message = "Verb ratio " + percent(verb_ratio) + " (" + std::to_string(counts.verbs) + ") is below 15%";
        issue.recommendation = "Increase verb coverage";
        issues.push_back(std::move(issue));
    }
    if (noun_ratio > 0.70)
    {
        Issue issue;
        issue.type = "high_noun_ratio";
        issue.subject = "nouns";
        issue.message = "Noun ratio " + percent(noun_ratio) + " (" + std::to_string(counts.nouns) + ") exceeds 70%";
        issue.recommendation = "Balance with more non-nouns";
        issues.push_back(std::move(issue));
    }

    std::string summary = std::to_string(counts.verbs) + " verbs, " + std::to_string(counts.nouns) + " nouns, " +
                          std::to_string(counts.adjectives) + " adjectives, " + std::to_string(counts.other) +
                          " other";
    return finish(kCoverageAnalysis, 10.0, std::move(issues), std::move(summary));
}

CategoryResult checkRulesetCompliance(const UnifiedDictionary& dictionary)
{
    std::vector<Issue> issues;
    for (std::size_t i = 0; i < dictionary.entries.size(); ++i)
    {
        const Entry& entry = dictionary.entries[i];
        if (heuristics::hasDonorLanguageRoot(entry.notes) ||
            heuristics::hasObviousDonorLanguage(entry.ancientSurface(), entry.modernSurface()))
            continue;

        issues.push_back(entryIssue("missing_etymology", Severity::Low, entry, i, "Missing donor language notes",
                                    "Add a note naming the donor language"));
        issues.push_back(entryIssue("missing_donor_anchor", Severity::Low, entry, i,
                                    "No clear donor language connection"));
    }

    std::string summary = std::to_string(issues.size()) + " compliance issues found";
    return finish(kRulesetCompliance, 1.0, std::move(issues), std::move(summary));
}

CategoryResult testPhrasebookIntegration(const UnifiedDictionary& dictionary)
{
    std::vector<std::string> keys;
    keys.reserve(dictionary.entries.size());
    for (const auto& entry : dictionary.entries)
        keys.push_back(processing::toLowerAscii(entry.english));

    const auto& phrases = essentialVocabulary();
    std::vector<Issue> issues;
    std::size_t covered = 0;
    for (const auto& phrase : phrases)
    {
        const std::string needle = processing::toLowerAscii(phrase);
        bool found = false;
        for (const auto& key : keys)
        {
            if (key.find(needle) != std::string::npos)
            {
                found = true;
                break;
            }
        }

        if (found)
        {
            ++covered;
            continue;
        }

        Issue issue;
        issue.type = "missing_phrase_coverage";
        issue.subject = phrase;
        issue.message = "No entry covers \"" + phrase + "\"";
        issue.recommendation = "Add essential vocabulary";
        issues.push_back(std::move(issue));
    }

    CategoryResult result;
    result.category = kPhrasebookIntegration;
    result.score = report::clampScore(100.0 * static_cast<double>(covered) / static_cast<double>(phrases.size()));
    result.issues = std::move(issues);
    result.summary = std::to_string(covered) + "/" + std::to_string(phrases.size()) + " essential phrases covered";
    return result;
}

CategoryResult checkVersioning(const UnifiedDictionary& dictionary)
{
    const dictionary::Metadata& meta = dictionary.metadata;
    std::vector<Issue> issues;

    auto missing = [&issues](const char* field, const std::string& message) {
        Issue issue;
        issue.type = "missing_metadata";
        issue.severity = Severity::High;
        issue.subject = field;
        issue.message = message;
        issue.recommendation = std::string("Add ") + field + " to metadata";
        issues.push_back(std::move(issue));
    };

    if (!dictionary::Version::parse(meta.version))
    {
        Issue issue;
        issue.type = "invalid_version_format";
        issue.severity = Severity::High;
        issue.subject = "version";
        issue.message = "Version \"" + meta.version + "\" is not major.minor.patch";
        issue.recommendation = "Use semantic versioning (major.minor.patch)";
        issues.push_back(std::move(issue));
    }

    if (meta.created_on.empty())
        missing("created_on", "Creation timestamp is missing");
    if (!meta.files_included)
        missing("files_included", "Source fragment list is missing");
    if (!meta.total_entries || *meta.total_entries == 0)
        missing("total_entries", "Total entry count is missing or zero");

    std::string summary = issues.empty() ? "Versioning compliant" : std::to_string(issues.size()) + " versioning issues";
    return finish(kVersioningCheck, 15.0, std::move(issues), std::move(summary));
}

} // namespace qa
