#pragma once

#include "PipelineOrchestrator.hpp"

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace pipeline
{

// QA categories with at least one issue, most issues first (ties keep weight table order).
std::vector<std::pair<std::string, std::size_t>> rankedIssueCounts(const qa::QAReport& report);

// Operator-facing end of run text: final statistics on pass, ranked issues and a
// remediation hint when the gate fails, the error on a fatal run.
std::string formatRunSummary(const RunOutcome& outcome);

} // namespace pipeline
