#pragma once

#include "LifecycleState.hpp"
#include "../audit/AuditEngine.hpp"
#include "../dictionary/TrancheMerger.hpp"
#include "../qa/QAScorer.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace config
{
struct PipelineConfig;
}

namespace reference
{
class BaselineIndex;
class ExclusionRegistry;
}

namespace qa
{
class IHomonymPolicy;
}

namespace pipeline
{

class FragmentStore;

enum class Verdict
{
    Passed,           // exit 0
    NeedsRemediation, // exit 1
    Fatal             // exit 2
};

const char* verdictName(Verdict verdict);
int exitCodeFor(Verdict verdict);

struct RunOutcome
{
    Verdict verdict = Verdict::Fatal;
    LifecycleState final_state = LifecycleState::Pending;
    std::string run_id;
    std::string error;

    std::vector<std::string> fragments;      // the lifecycle set
    std::vector<std::string> unparsable;     // "name: reason"
    std::size_t total_entries = 0;
    std::size_t duplicates_removed = 0;

    std::optional<qa::QAReport> qa;
    std::optional<audit::AuditReport> audit;
    std::vector<std::string> report_paths;
    std::string artifact_path;
    bool dry_run = false;
};

/**
 * @brief Sequences one build: merge, relocate to merged, QA, then audit and
 * relocation to deleted when QA passes.
 *
 * Run-level failures (no usable fragment, relocation, artifact or manifest
 * persistence) abort before the lifecycle moves further. Report persistence
 * failures are logged and never change the verdict. Collaborators are borrowed
 * and must outlive the orchestrator.
 */
class PipelineOrchestrator
{
public:
    PipelineOrchestrator(const config::PipelineConfig& config, const FragmentStore& store,
                         const qa::IHomonymPolicy& policy, const reference::BaselineIndex* baseline,
                         const reference::ExclusionRegistry* exclusions,
                         dictionary::TrancheMerger::Clock clock = {});
    ~PipelineOrchestrator();

    PipelineOrchestrator(const PipelineOrchestrator&) = delete;
    PipelineOrchestrator& operator=(const PipelineOrchestrator&) = delete;

    RunOutcome run();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace pipeline
