#include "RapidfuzzMatcher.hpp"
#include <rapidfuzz/fuzz.hpp>
#include <algorithm>

namespace processing
{

namespace
{

double callRapidfuzz(const std::string& s1, const std::string& s2, MatchAlgorithm algorithm)
{
    double rapidfuzz_score = 0.0;

    switch (algorithm)
    {
    case MatchAlgorithm::PartialRatio:
        rapidfuzz_score = rapidfuzz::fuzz::partial_ratio(s1, s2);
        break;

    case MatchAlgorithm::TokenSortRatio:
        rapidfuzz_score = rapidfuzz::fuzz::token_sort_ratio(s1, s2);
        break;

    case MatchAlgorithm::Ratio:
    default:
        rapidfuzz_score = rapidfuzz::fuzz::ratio(s1, s2);
        break;
    }

    return rapidfuzz_score / 100.0;
}

} // namespace

std::vector<MatchResult> RapidfuzzMatcher::findMatches(const std::string& query,
                                                       const std::vector<std::string>& candidates,
                                                       double threshold, MatchAlgorithm algorithm) const
{
    std::vector<MatchResult> results;

    if (candidates.empty() || query.empty())
    {
        return results;
    }

    for (const auto& candidate : candidates)
    {
        if (candidate.empty())
        {
            continue;
        }

        double score = callRapidfuzz(query, candidate, algorithm);
        if (score >= threshold)
        {
            results.push_back(MatchResult{score, candidate, algorithm});
        }
    }

    std::sort(results.begin(), results.end(),
              [](const MatchResult& a, const MatchResult& b) {
                  if (a.score != b.score)
                      return a.score > b.score;
                  return a.matched < b.matched;
              });

    return results;
}

double RapidfuzzMatcher::similarity(const std::string& s1, const std::string& s2, MatchAlgorithm algorithm) const
{
    if (s1.empty() || s2.empty())
    {
        return 0.0;
    }

    return callRapidfuzz(s1, s2, algorithm);
}

} // namespace processing
