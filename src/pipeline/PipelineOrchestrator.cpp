#include "PipelineOrchestrator.hpp"
#include "FragmentStore.hpp"
#include "LifecycleManifest.hpp"
#include "RunLock.hpp"
#include "../audit/AuditReportWriter.hpp"
#include "../config/PipelineConfig.hpp"
#include "../dictionary/DictionaryIO.hpp"
#include "../processing/StageRunner.hpp"
#include "../qa/QAReportWriter.hpp"
#include "../reference/BaselineIndex.hpp"
#include "../report/ReportRetention.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <filesystem>
#include <set>

namespace fs = std::filesystem;
using utils::ErrorCategory;
using utils::ErrorReporter;

namespace pipeline
{

const char* verdictName(Verdict verdict)
{
    switch (verdict)
    {
    case Verdict::Passed:
        return "passed";
    case Verdict::NeedsRemediation:
        return "needs remediation";
    case Verdict::Fatal:
        return "fatal error";
    }
    return "unknown";
}

int exitCodeFor(Verdict verdict)
{
    switch (verdict)
    {
    case Verdict::Passed:
        return 0;
    case Verdict::NeedsRemediation:
        return 1;
    case Verdict::Fatal:
        return 2;
    }
    return 2;
}

struct PipelineOrchestrator::Impl
{
    const config::PipelineConfig& config;
    const FragmentStore& store;
    const qa::IHomonymPolicy& policy;
    const reference::BaselineIndex* baseline;
    const reference::ExclusionRegistry* exclusions;
    dictionary::TrancheMerger::Clock clock;

    RunOutcome& fail(RunOutcome& out, ErrorCategory category, const std::string& message, const std::string& details)
    {
        out.verdict = Verdict::Fatal;
        out.error = details.empty() ? message : message + ": " + details;
        ErrorReporter::ReportFatal(category, message, details);
        return out;
    }

    bool persist(const LifecycleManifest& manifest, std::string& outError) const
    {
        if (config.dry_run)
            return true;
        return manifest.save(store.manifestPath(), outError);
    }

    // Archive the closed manifest next to the deleted fragments and clear the merged area.
    bool retire(const LifecycleManifest& manifest, std::string& outError) const
    {
        if (config.dry_run)
            return true;

        const std::string archived = store.pathOf(Area::Deleted, "lifecycle-" + manifest.runId() + ".json");
        if (!manifest.save(archived, outError))
            return false;

        std::error_code ec;
        fs::remove(store.manifestPath(), ec);
        if (ec)
        {
            outError = "cannot remove " + store.manifestPath() + ": " + ec.message();
            return false;
        }
        return true;
    }

    // Puts the merged-area state back the way this run found it.
    void unwindMerge(const std::vector<std::string>& from_pending, const std::optional<LifecycleManifest>& previous) const
    {
        if (config.dry_run)
            return;

        std::string error;
        if (!store.relocate(from_pending, Area::Merged, Area::Pending, error))
            ErrorReporter::ReportError(ErrorCategory::Consistency, "Could not return fragments to pending", error);

        if (previous)
        {
            if (!previous->save(store.manifestPath(), error))
                ErrorReporter::ReportError(ErrorCategory::Consistency, "Could not restore the lifecycle manifest", error);
            return;
        }
        std::error_code ec;
        fs::remove(store.manifestPath(), ec);
        if (ec)
        {
            ErrorReporter::ReportError(ErrorCategory::Consistency, "Could not remove the lifecycle manifest",
                                       store.manifestPath() + ": " + ec.message());
        }
    }

    // A set whose QA verdict was recorded as passed but never reached the deleted area.
    bool finishPromotion(LifecycleManifest& manifest, const std::string& at, std::string& outError) const
    {
        const auto present = store.list(Area::Merged);
        std::vector<std::string> remaining;
        for (const auto& name : manifest.fragments())
        {
            if (std::binary_search(present.begin(), present.end(), name))
                remaining.push_back(name);
        }
        PLOG_INFO << "[Pipeline] Completing promotion of " << remaining.size() << " fragment(s) from run "
                  << manifest.runId();

        if (!store.relocate(remaining, Area::Merged, Area::Deleted, outError))
            return false;
        return manifest.transition(LifecycleState::Deleted, at, "promotion resumed", outError) &&
               retire(manifest, outError);
    }

    void writeQAReports(const qa::QAReport& report, RunOutcome& out) const
    {
        report::ReportRetention retention(config.reports.directory, config.reports.keep_recent);
        std::string error;
        if (!retention.ensureDirectories(error) ||
            !qa::QAReportWriter::write(report, retention.recentDir(), out.run_id, out.report_paths, error))
        {
            ErrorReporter::ReportWarning(ErrorCategory::Reporting, "Could not persist QA report", error);
        }
    }

    void writeAuditReports(const audit::AuditReport& report, const dictionary::UnifiedDictionary& dictionary,
                           RunOutcome& out) const
    {
        report::ReportRetention retention(config.reports.directory, config.reports.keep_recent);
        std::string error;
        if (!retention.ensureDirectories(error) ||
            !audit::AuditReportWriter::write(report, dictionary, retention.recentDir(), out.run_id, out.report_paths,
                                             error))
        {
            ErrorReporter::ReportWarning(ErrorCategory::Reporting, "Could not persist audit report", error);
        }
    }

    void rotateReports() const
    {
        report::ReportRetention retention(config.reports.directory, config.reports.keep_recent);
        std::size_t archived = 0;
        std::string error;
        if (!retention.rotate(archived, error))
            ErrorReporter::ReportWarning(ErrorCategory::Reporting, "Could not archive old reports", error);
    }
};

PipelineOrchestrator::PipelineOrchestrator(const config::PipelineConfig& config, const FragmentStore& store,
                                           const qa::IHomonymPolicy& policy, const reference::BaselineIndex* baseline,
                                           const reference::ExclusionRegistry* exclusions,
                                           dictionary::TrancheMerger::Clock clock)
    : impl_(new Impl{ config, store, policy, baseline, exclusions,
                      clock ? std::move(clock) : dictionary::TrancheMerger::Clock(&dictionary::TrancheMerger::utcTimestamp) })
{
}

PipelineOrchestrator::~PipelineOrchestrator() = default;

RunOutcome PipelineOrchestrator::run()
{
    Impl& d = *impl_;
    const config::PipelineConfig& cfg = d.config;

    RunOutcome out;
    out.dry_run = cfg.dry_run;

    const std::string created_on = d.clock();
    out.run_id = created_on;
    std::replace(out.run_id.begin(), out.run_id.end(), ':', '-');
    std::replace(out.run_id.begin(), out.run_id.end(), '.', '-');
    utils::ErrorReporter::RunScope run_scope(out.run_id);

    std::string error;
    auto lock = RunLock::Acquire(cfg.lockPath(), error);
    if (!lock)
        return d.fail(out, ErrorCategory::Initialization, "Cannot acquire the run lock", error);

    if (!cfg.dry_run && !d.store.ensureLayout(error))
        return d.fail(out, ErrorCategory::Consistency, "Cannot prepare fragment areas", error);

    PLOG_INFO << "[Pipeline] Run " << out.run_id << (cfg.dry_run ? " (dry run)" : "");
    PLOG_INFO << "[Pipeline] STEP 1: MERGING TRANCHES";

    // A set that failed QA earlier stays in the merged area and joins this run.
    std::optional<LifecycleManifest> previous;
    std::vector<std::string> carried;
    if (fs::exists(d.store.manifestPath()))
    {
        previous = LifecycleManifest::load(d.store.manifestPath(), error);
        if (!previous)
            return d.fail(out, ErrorCategory::Consistency, "Lifecycle manifest is unreadable", error);

        switch (previous->state())
        {
        case LifecycleState::QAFailed:
        {
            const auto present = d.store.list(Area::Merged);
            for (const auto& name : previous->fragments())
            {
                if (std::binary_search(present.begin(), present.end(), name))
                    carried.push_back(name);
            }
            PLOG_INFO << "[Pipeline] Re-evaluating " << carried.size() << " fragment(s) from run "
                      << previous->runId();
            break;
        }
        case LifecycleState::QAPassed:
            if (cfg.dry_run)
            {
                PLOG_INFO << "[Pipeline] Run " << previous->runId() << " passed QA but was not promoted; left as is";
            }
            else if (!d.finishPromotion(*previous, created_on, error))
            {
                return d.fail(out, ErrorCategory::Consistency, "Cannot complete the promotion of run " +
                                                                   previous->runId(), error);
            }
            previous.reset();
            break;
        case LifecycleState::Deleted:
            previous.reset();
            break;
        default:
            return d.fail(out, ErrorCategory::Consistency, "Previous run did not finish",
                          std::string("manifest state ") + toString(previous->state()) + " in " +
                              d.store.manifestPath() + "; move its fragments back to " +
                              d.store.directory(Area::Pending) + " and delete the manifest to retry");
        }
    }

    const std::vector<std::string> pending = d.store.list(Area::Pending);
    std::vector<dictionary::FragmentSource> sources = d.store.read(Area::Pending, pending);
    for (auto& source : d.store.read(Area::Merged, carried))
        sources.push_back(std::move(source));

    dictionary::MergeOptions merge_options;
    merge_options.version = cfg.dictionary.version;
    merge_options.unified_marker = cfg.dictionary.unified_marker;
    merge_options.project = cfg.dictionary.project;
    merge_options.source_directory = cfg.paths.tranches_dir;
    dictionary::TrancheMerger merger(merge_options, [created_on] { return created_on; });

    auto merged = processing::run_stage<dictionary::MergeResult>(
        "merge", [&](std::string& err) { return merger.merge(std::move(sources), err); });
    if (!merged.succeeded)
        return d.fail(out, ErrorCategory::Input, "Merge failed", merged.error.value_or(""));

    const dictionary::MergeResult& merge = merged.result;
    const dictionary::UnifiedDictionary& dict = merge.dictionary;
    out.fragments = merge.consumed;
    out.unparsable = merge.unparsable;
    out.total_entries = dict.entries.size();
    out.duplicates_removed = dict.metadata.duplicates_removed;
    PLOG_INFO << "[Pipeline] Merged " << out.total_entries << " entries from " << out.fragments.size()
              << " fragment(s), " << out.duplicates_removed << " duplicates removed";

    PLOG_INFO << "[Pipeline] STEP 2: MOVING TRANCHES TO MERGED AREA";
    const std::set<std::string> pending_set(pending.begin(), pending.end());
    std::vector<std::string> from_pending;
    for (const auto& name : merge.consumed)
    {
        if (pending_set.count(name) > 0)
            from_pending.push_back(name);
    }

    LifecycleManifest manifest = previous ? *previous : LifecycleManifest(out.run_id, {});
    manifest.setRunId(out.run_id);
    manifest.setFragments(merge.consumed);

    if (!cfg.dry_run && !d.store.relocate(from_pending, Area::Pending, Area::Merged, error))
        return d.fail(out, ErrorCategory::Consistency, "Relocation to the merged area failed", error);

    if (!manifest.transition(LifecycleState::Merged, created_on, std::to_string(out.total_entries) + " entries", error) ||
        !d.persist(manifest, error))
    {
        d.unwindMerge(from_pending, previous);
        return d.fail(out, ErrorCategory::Consistency, "Cannot record the merged state", error);
    }

    // The artifact is replaced only once the manifest names the set it was built from.
    if (!cfg.dry_run)
    {
        if (!dictionary::DictionaryIO::save(dict, cfg.dictionary.output_file, error))
        {
            d.unwindMerge(from_pending, previous);
            return d.fail(out, ErrorCategory::Consistency, "Cannot write the unified dictionary", error);
        }
        out.artifact_path = cfg.dictionary.output_file;
    }
    out.final_state = LifecycleState::Merged;

    PLOG_INFO << "[Pipeline] STEP 3: RUNNING QA PROCESS";
    qa::QAScorer scorer({ cfg.qa.pass_threshold, cfg.qa.parallel }, d.policy,
                        cfg.baseline.enabled ? d.baseline : nullptr);
    auto scored = processing::run_stage<qa::QAReport>(
        "qa", [&](std::string&) { return std::optional<qa::QAReport>(scorer.evaluate(dict)); });
    if (!scored.succeeded)
        return d.fail(out, ErrorCategory::Unknown, "QA evaluation failed", scored.error.value_or(""));

    out.qa = std::move(scored.result);
    d.writeQAReports(*out.qa, out);

    const LifecycleState verdict_state = out.qa->passed ? LifecycleState::QAPassed : LifecycleState::QAFailed;
    const std::string score_note = "score " + std::to_string(out.qa->overall);
    if (!manifest.transition(verdict_state, created_on, score_note, error) || !d.persist(manifest, error))
        return d.fail(out, ErrorCategory::Consistency, "Cannot record the QA verdict", error);
    out.final_state = verdict_state;

    if (!out.qa->passed)
    {
        PLOG_WARNING << "[Pipeline] QA FAILED: " << out.qa->overall << "% (threshold " << cfg.qa.pass_threshold
                     << "%), fragments remain in the merged area";
        out.verdict = Verdict::NeedsRemediation;
        d.rotateReports();
        return out;
    }

    PLOG_INFO << "[Pipeline] QA PASSED: " << out.qa->overall << "% (threshold " << cfg.qa.pass_threshold << "%)";
    PLOG_INFO << "[Pipeline] STEP 4: RUNNING DICTIONARY AUDIT";
    audit::AuditEngine engine({ cfg.audit.min_note_length, cfg.audit.parallel }, d.exclusions);
    auto audited = processing::run_stage<audit::AuditReport>(
        "audit", [&](std::string&) { return std::optional<audit::AuditReport>(engine.run(dict)); });
    if (audited.succeeded)
    {
        out.audit = std::move(audited.result);
        d.writeAuditReports(*out.audit, dict, out);
    }
    else
    {
        ErrorReporter::ReportWarning(ErrorCategory::Unknown, "Audit did not complete", audited.error.value_or(""));
    }

    PLOG_INFO << "[Pipeline] STEP 5: MOVING TRANCHES TO DELETED AREA";
    if (!cfg.dry_run && !d.store.relocate(merge.consumed, Area::Merged, Area::Deleted, error))
        return d.fail(out, ErrorCategory::Consistency, "Relocation to the deleted area failed", error);

    if (!manifest.transition(LifecycleState::Deleted, created_on, "promoted", error) || !d.retire(manifest, error))
        return d.fail(out, ErrorCategory::Consistency, "Cannot record the deleted state", error);
    out.final_state = LifecycleState::Deleted;
    out.verdict = Verdict::Passed;

    d.rotateReports();
    return out;
}

} // namespace pipeline
