#include "QAScorer.hpp"
#include "HomonymPolicy.hpp"
#include "QACategories.hpp"
#include "../reference/BaselineIndex.hpp"

#include <plog/Log.h>

#include <cmath>
#include <exception>
#include <functional>
#include <thread>

namespace qa
{

std::size_t QAReport::totalIssues() const
{
    std::size_t total = 0;
    for (const auto& category : categories)
        total += category.issues.size();
    return total;
}

QAScorer::QAScorer(QAOptions options, const IHomonymPolicy& policy, const reference::BaselineIndex* baseline)
    : options_(options)
    , policy_(policy)
    , baseline_(baseline)
{
}

QAReport QAScorer::evaluate(const dictionary::UnifiedDictionary& dictionary) const
{
    const IHomonymPolicy& policy = policy_;
    std::vector<report::SuppressionEvent> suppressed;
    const std::vector<std::function<report::CategoryResult()>> evaluators = {
        [&] { return checkCollisions(dictionary, policy, &suppressed); },
        [&] { return auditSuffixes(dictionary); },
        [&] { return reviewCompounds(dictionary); },
        [&] { return analyzeCoverage(dictionary); },
        [&] { return checkRulesetCompliance(dictionary); },
        [&] { return testPhrasebookIntegration(dictionary); },
        [&] { return checkVersioning(dictionary); },
    };

    QAReport out;
    out.total_entries = dictionary.entries.size();
    out.pass_threshold = options_.pass_threshold;
    out.categories.resize(evaluators.size());

    if (options_.parallel)
    {
        // Each worker owns one result slot and one error slot.
        std::vector<std::exception_ptr> errors(evaluators.size());
        {
            std::vector<std::jthread> workers;
            workers.reserve(evaluators.size());
            for (std::size_t i = 0; i < evaluators.size(); ++i)
            {
                workers.emplace_back([&out, &evaluators, &errors, i] {
                    try
                    {
                        out.categories[i] = evaluators[i]();
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
        for (std::size_t i = 0; i < evaluators.size(); ++i)
            out.categories[i] = evaluators[i]();
    }

    if (baseline_ && !baseline_->empty())
        out.baseline = checkBaselineConsistency(dictionary, *baseline_);

    for (auto& event : suppressed)
    {
        PLOG_INFO << "[QAScorer] Excluded: " << event.subject << " (" << event.reason << ")";
        out.suppressions.push_back(std::move(event));
    }

    out.overall = combine(out.categories);
    out.passed = passes(out.overall, options_.pass_threshold);

    for (const auto& category : out.categories)
    {
        PLOG_INFO << "[QAScorer] " << category.category << ": " << report::formatScore(category.score) << " ("
                  << category.summary << ")";
    }
    PLOG_INFO << "[QAScorer] Overall " << out.overall << " (threshold " << options_.pass_threshold << "), "
              << (out.passed ? "PASSED" : "FAILED");
    return out;
}

int QAScorer::combine(const std::vector<report::CategoryResult>& categories)
{
    double weighted = 0.0;
    for (const auto& [name, weight] : kCategoryWeights)
    {
        for (const auto& category : categories)
        {
            if (category.category == name)
            {
                weighted += report::clampScore(category.score) * weight;
                break;
            }
        }
    }
    return static_cast<int>(std::lround(report::clampScore(weighted)));
}

} // namespace qa
