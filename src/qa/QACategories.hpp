#pragma once

#include "../dictionary/Entry.hpp"
#include "../report/ReportTypes.hpp"

#include <array>
#include <string>
#include <vector>

namespace qa
{

class IHomonymPolicy;

inline constexpr const char* kCollisionCheck = "Collision Check";
inline constexpr const char* kSuffixAudit = "Suffix/Laziness Audit";
inline constexpr const char* kCompoundReview = "Compound/Hyphen Review";
inline constexpr const char* kCoverageAnalysis = "Coverage Analysis";
inline constexpr const char* kRulesetCompliance = "Ruleset Compliance";
inline constexpr const char* kPhrasebookIntegration = "Phrasebook Integration";
inline constexpr const char* kVersioningCheck = "Versioning Check";
inline constexpr const char* kBaselineConsistency = "Baseline Consistency";

struct CategoryWeight
{
    const char* category;
    double weight;
};

// Table order is report order.
inline constexpr std::array<CategoryWeight, 7> kCategoryWeights = { {
    { kCollisionCheck, 0.20 },
    { kSuffixAudit, 0.20 },
    { kCompoundReview, 0.15 },
    { kCoverageAnalysis, 0.15 },
    { kRulesetCompliance, 0.15 },
    { kPhrasebookIntegration, 0.10 },
    { kVersioningCheck, 0.05 },
} };

// 16 items the phrasebook front end relies on.
const std::vector<std::string>& essentialVocabulary();

// Each evaluator is a pure function of the snapshot.

// Every unordered pair sharing a non-empty ancient or modern surface form, -2 each.
// Pairs the policy justifies are appended to suppressed instead, when given.
report::CategoryResult checkCollisions(const dictionary::UnifiedDictionary& dictionary, const IHomonymPolicy& policy,
                                       std::vector<report::SuppressionEvent>* suppressed = nullptr);

// English stem plus -or/-on/-um/-us in ancient; English-like modern without a donor note. -1.5 each.
report::CategoryResult auditSuffixes(const dictionary::UnifiedDictionary& dictionary);

// Hyphenated forms without cultural grounding; ancient over 10 code points without donor evidence. -2 each.
report::CategoryResult reviewCompounds(const dictionary::UnifiedDictionary& dictionary);

// verb ratio >= 15% and noun ratio <= 70%, -10 per violated target.
report::CategoryResult analyzeCoverage(const dictionary::UnifiedDictionary& dictionary);

// Missing etymology and missing donor anchor are separate issues, -1 each.
report::CategoryResult checkRulesetCompliance(const dictionary::UnifiedDictionary& dictionary);

// Score is the covered share of essentialVocabulary() times 100.
report::CategoryResult testPhrasebookIntegration(const dictionary::UnifiedDictionary& dictionary);

// Strict semver and required metadata, -15 per problem.
report::CategoryResult checkVersioning(const dictionary::UnifiedDictionary& dictionary);

} // namespace qa
