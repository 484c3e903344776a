#pragma once

#include "../dictionary/Entry.hpp"
#include "../report/ReportTypes.hpp"

#include <cstddef>

namespace reference
{
class BaselineIndex;
}

namespace qa
{

struct BaselineConsistencyResult
{
    report::CategoryResult result;
    std::size_t checked = 0;
    std::size_t matches = 0;
    double coverage = 0.0; // percent of checked keys present in the baseline
};

// Compares every entry with the prior stable release. Reported beside the
// weighted categories, never folded into the overall score.
//   high   (-5) ancient or modern differs from the baseline form
//   medium (-2) the baseline documents notes this entry lacks
//   low    (-1) key absent from the baseline but near-matches exist
// Coverage above 80% earns +5; the result is clamped to [0, 100].
BaselineConsistencyResult checkBaselineConsistency(const dictionary::UnifiedDictionary& dictionary,
                                                   const reference::BaselineIndex& baseline);

} // namespace qa
