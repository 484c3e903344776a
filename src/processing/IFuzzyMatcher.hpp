#pragma once

#include <string>
#include <vector>

namespace processing
{

/**
 * @brief Fuzzy matching algorithms supported by the matcher.
 */
enum class MatchAlgorithm
{
    Ratio,          // Simple Levenshtein-based ratio (general purpose)
    PartialRatio,   // Partial substring matching (e.g., "king" matches "kingdom")
    TokenSortRatio  // Order-independent token matching (e.g., "to walk" matches "walk to")
};

/**
 * @brief Result of a fuzzy matching operation.
 */
struct MatchResult
{
    double score;              // Similarity score normalized to [0.0, 1.0]
    std::string matched;       // The original candidate text that was matched
    MatchAlgorithm algorithm;  // The algorithm used for matching
};

/**
 * @brief Abstract interface for string similarity scoring.
 *
 * Used by the baseline index to rank near-match candidates for new
 * dictionary keys.
 */
class IFuzzyMatcher
{
public:
    virtual ~IFuzzyMatcher() = default;

    /**
     * @brief Find all candidates matching above the threshold.
     *
     * @return Matches with score >= threshold, sorted by score (descending),
     *         ties broken by candidate text (ascending) so output is stable.
     */
    virtual std::vector<MatchResult> findMatches(const std::string& query,
                                                  const std::vector<std::string>& candidates, double threshold,
                                                  MatchAlgorithm algorithm = MatchAlgorithm::Ratio) const = 0;

    /**
     * @brief Calculate similarity between two strings in [0.0, 1.0].
     */
    virtual double similarity(const std::string& s1, const std::string& s2,
                              MatchAlgorithm algorithm = MatchAlgorithm::Ratio) const = 0;
};

} // namespace processing
