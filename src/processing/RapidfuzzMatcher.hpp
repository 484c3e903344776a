#pragma once

#include "IFuzzyMatcher.hpp"

namespace processing
{

/**
 * @brief IFuzzyMatcher over rapidfuzz-cpp.
 *
 * Inputs are compared as given; callers decide on case folding. Scores are
 * rescaled from rapidfuzz's [0, 100] to [0.0, 1.0].
 */
class RapidfuzzMatcher : public IFuzzyMatcher
{
public:
    std::vector<MatchResult> findMatches(const std::string& query, const std::vector<std::string>& candidates,
                                          double threshold,
                                          MatchAlgorithm algorithm = MatchAlgorithm::Ratio) const override;

    double similarity(const std::string& s1, const std::string& s2,
                      MatchAlgorithm algorithm = MatchAlgorithm::Ratio) const override;
};

} // namespace processing
