#pragma once

#include "BaselineConsistency.hpp"
#include "../dictionary/Entry.hpp"
#include "../report/ReportTypes.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace reference
{
class BaselineIndex;
}

namespace qa
{

class IHomonymPolicy;

struct QAOptions
{
    int pass_threshold = 95;
    bool parallel = false; // evaluate categories on worker threads
};

struct QAReport
{
    std::vector<report::CategoryResult> categories; // weight table order
    std::optional<BaselineConsistencyResult> baseline;
    std::vector<report::SuppressionEvent> suppressions; // collisions the homonym policy allowed
    int overall = 0;
    bool passed = false;
    int pass_threshold = 95;
    std::size_t total_entries = 0;

    std::size_t totalIssues() const;
};

/**
 * @brief Gatekeeper over a merged snapshot.
 *
 * Runs the seven weighted categories (and baseline consistency when an index
 * is supplied), combines them into a rounded overall score and compares it
 * with the pass threshold. Evaluation is deterministic for a given snapshot.
 */
class QAScorer
{
public:
    QAScorer(QAOptions options, const IHomonymPolicy& policy, const reference::BaselineIndex* baseline = nullptr);

    QAReport evaluate(const dictionary::UnifiedDictionary& dictionary) const;

    // Weighted sum of the known categories, rounded and clamped to [0, 100].
    static int combine(const std::vector<report::CategoryResult>& categories);

    static bool passes(int overall, int threshold) { return overall >= threshold; }

private:
    QAOptions options_;
    const IHomonymPolicy& policy_;
    const reference::BaselineIndex* baseline_;
};

} // namespace qa
