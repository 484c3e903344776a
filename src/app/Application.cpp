#include "Application.hpp"
#include "Version.hpp"
#include "../audit/AuditEngine.hpp"
#include "../audit/AuditReportWriter.hpp"
#include "../config/PipelineConfig.hpp"
#include "../dictionary/DictionaryIO.hpp"
#include "../pipeline/FragmentStore.hpp"
#include "../pipeline/PipelineOrchestrator.hpp"
#include "../pipeline/RunSummary.hpp"
#include "../processing/Diagnostics.hpp"
#include "../qa/HomonymPolicy.hpp"
#include "../qa/QAReportWriter.hpp"
#include "../qa/QAScorer.hpp"
#include "../reference/BaselineIndex.hpp"
#include "../reference/ExclusionRegistry.hpp"
#include "../report/ReportRetention.hpp"
#include "../report/ReportTypes.hpp"
#include "../utils/ErrorReporter.hpp"
#include "../utils/LogManager.hpp"

#include <plog/Log.h>

#include <iostream>
#include <map>

using utils::ErrorCategory;
using utils::ErrorReporter;

namespace
{

constexpr int kExitPassed = 0;
constexpr int kExitFatal = 2;

qa::SemanticGroupPolicy::Groups homonymGroups(const config::PipelineConfig& cfg)
{
    if (cfg.qa.homonym_groups.empty())
        return qa::SemanticGroupPolicy::defaultGroups();
    return cfg.qa.homonym_groups;
}

void printReportPaths(const std::vector<std::string>& paths)
{
    for (const auto& path : paths)
        std::cout << "   report: " << path << "\n";
}

std::string categoryTitle(std::string category)
{
    for (auto& c : category)
    {
        if (c == '_')
            c = ' ';
        else if (c >= 'a' && c <= 'z')
            c = static_cast<char>(c - 'a' + 'A');
    }
    return category;
}

} // namespace

Application::Application(int argc, char** argv)
{
    for (int i = 1; i < argc; ++i)
        args_.emplace_back(argv[i]);
}

Application::~Application() { utils::LogManager::Shutdown(); }

int Application::run()
{
    std::string error;
    auto cli = app::CommandLine::parse(args_, error);
    if (!cli)
    {
        std::cerr << "lexgate: " << error << "\n\n" << app::CommandLine::usage();
        return kExitFatal;
    }
    cli_ = *cli;

    if (cli_.command == app::Command::Help)
    {
        std::cout << app::CommandLine::usage();
        return kExitPassed;
    }
    if (cli_.command == app::Command::Version)
    {
        std::cout << "lexgate " << LEXGATE_VERSION_STRING << "\n";
        return kExitPassed;
    }

    if (!initializeLogging())
        return finish(kExitFatal);

    if (!initializeConfig())
        return finish(kExitFatal);

    PLOG_INFO << "=== LEXGATE " << LEXGATE_VERSION_STRING << " ===";

    switch (cli_.command)
    {
    case app::Command::Build:
        return finish(runBuild());
    case app::Command::QA:
        return finish(runQA(cli_.args.front()));
    case app::Command::Audit:
        return finish(runAudit(cli_.args.front()));
    case app::Command::Exclusions:
        return finish(runExclusions());
    case app::Command::Baseline:
        return finish(runBaselineStats());
    default:
        break;
    }
    return finish(kExitFatal);
}

bool Application::initializeLogging()
{
    if (!utils::LogManager::Initialize(cli_.config_path))
    {
        ErrorReporter::ReportFatal(ErrorCategory::Initialization, "Failed to initialize logging system", "");
        return false;
    }

    bool ok = utils::LogManager::OpenChannel(utils::LogChannel::Run);
    ok = utils::LogManager::OpenChannel(utils::LogChannel::Pipeline) && ok;
    return ok;
}

bool Application::initializeConfig()
{
    std::string error;
    auto cfg = config::PipelineConfig::load(cli_.config_path, error);
    if (!cfg)
    {
        ErrorReporter::ReportFatal(ErrorCategory::Configuration, "Configuration file is malformed", error);
        return false;
    }

    if (cli_.verbose)
        cfg->verbose = true;
    if (cli_.dry_run)
        cfg->dry_run = true;

    processing::TraceSettings trace;
    trace.verbose = cfg->verbose;
    trace.preview_bytes = cfg->preview_bytes;
    processing::Diagnostics::Configure(trace);
    if (cfg->verbose)
        utils::LogManager::RaiseVerbosity(plog::debug);

    config_ = std::make_unique<config::PipelineConfig>(std::move(*cfg));
    return true;
}

bool Application::loadBaseline(bool required)
{
    const auto& bc = config_->baseline;
    reference::BaselineOptions options;
    options.case_sensitive = bc.case_sensitive;
    options.stem_fallback = bc.stem_fallback;
    options.fuzzy_threshold = bc.fuzzy_threshold;
    if (bc.similarity == "partial")
        options.algorithm = processing::MatchAlgorithm::PartialRatio;
    else if (bc.similarity == "token_sort")
        options.algorithm = processing::MatchAlgorithm::TokenSortRatio;
    options.max_similar = bc.max_similar;

    auto index = std::make_unique<reference::BaselineIndex>(options);
    std::string error;
    if (!index->loadFile(bc.path, error))
    {
        if (required)
        {
            ErrorReporter::ReportFatal(ErrorCategory::Input, "Baseline snapshot is required but unavailable", error);
            return false;
        }
        ErrorReporter::ReportWarning(ErrorCategory::Input, "Baseline consistency check skipped", error);
        return true;
    }
    baseline_ = std::move(index);
    return true;
}

bool Application::loadExclusions(bool required)
{
    auto registry = std::make_unique<reference::ExclusionRegistry>();
    std::string error;
    if (!registry->loadFile(config_->audit.exclusions_path, error))
    {
        if (required)
        {
            ErrorReporter::ReportFatal(ErrorCategory::Input, "Exclusion list is required but unavailable", error);
            return false;
        }
        ErrorReporter::ReportWarning(ErrorCategory::Input, "Audit runs without exclusions", error);
        return true;
    }
    exclusions_ = std::move(registry);
    return true;
}

std::unique_ptr<dictionary::UnifiedDictionary> Application::loadDictionary(const std::string& path)
{
    std::string error;
    auto dict = dictionary::DictionaryIO::load(path, error);
    if (!dict)
    {
        ErrorReporter::ReportFatal(ErrorCategory::Input, "Cannot read dictionary", error);
        return nullptr;
    }
    return std::make_unique<dictionary::UnifiedDictionary>(std::move(*dict));
}

int Application::runBuild()
{
    if (config_->baseline.enabled && !loadBaseline(config_->baseline.required))
        return kExitFatal;
    if (!loadExclusions(config_->audit.exclusions_required))
        return kExitFatal;

    qa::SemanticGroupPolicy groups(homonymGroups(*config_));
    std::unique_ptr<qa::IHomonymPolicy> aware;
    if (exclusions_)
        aware = std::make_unique<qa::ExclusionAwarePolicy>(groups, *exclusions_);
    const qa::IHomonymPolicy& policy = aware ? *aware : static_cast<const qa::IHomonymPolicy&>(groups);

    pipeline::FragmentStore store(
        { config_->paths.tranches_dir, config_->paths.merged_dir, config_->paths.deleted_dir });
    pipeline::PipelineOrchestrator orchestrator(*config_, store, policy, baseline_.get(), exclusions_.get());

    const pipeline::RunOutcome outcome = orchestrator.run();
    std::cout << "\n" << pipeline::formatRunSummary(outcome);
    printReportPaths(outcome.report_paths);

    PLOG_INFO << "[Application] Build finished: " << pipeline::verdictName(outcome.verdict) << ", state "
              << pipeline::toString(outcome.final_state);
    return pipeline::exitCodeFor(outcome.verdict);
}

int Application::runQA(const std::string& dictionary_path)
{
    auto dict = loadDictionary(dictionary_path);
    if (!dict)
        return kExitFatal;
    if (config_->baseline.enabled && !loadBaseline(config_->baseline.required))
        return kExitFatal;
    if (!loadExclusions(false))
        return kExitFatal;

    qa::SemanticGroupPolicy groups(homonymGroups(*config_));
    std::unique_ptr<qa::IHomonymPolicy> aware;
    if (exclusions_)
        aware = std::make_unique<qa::ExclusionAwarePolicy>(groups, *exclusions_);
    const qa::IHomonymPolicy& policy = aware ? *aware : static_cast<const qa::IHomonymPolicy&>(groups);

    qa::QAScorer scorer({ config_->qa.pass_threshold, config_->qa.parallel }, policy, baseline_.get());
    const qa::QAReport report = scorer.evaluate(*dict);

    report::ReportRetention retention(config_->reports.directory, config_->reports.keep_recent);
    std::vector<std::string> paths;
    std::string error;
    if (!retention.ensureDirectories(error) ||
        !qa::QAReportWriter::write(report, retention.recentDir(), report::fileTimestamp(), paths, error))
    {
        ErrorReporter::ReportWarning(ErrorCategory::Reporting, "Could not persist QA report", error);
    }

    for (const auto& category : report.categories)
        std::cout << "   " << category.category << ": " << report::formatScore(category.score) << " ("
                  << category.issues.size() << " issues)\n";
    if (report.baseline)
        std::cout << "   " << report.baseline->result.category << ": "
                  << report::formatScore(report.baseline->result.score) << " (coverage "
                  << report::formatScore(report.baseline->coverage) << "%)\n";
    std::cout << (report.passed ? "QA PASSED: " : "QA FAILED: ") << report.overall
              << "% (threshold: " << report.pass_threshold << "%)\n";
    printReportPaths(paths);

    return report.passed ? kExitPassed : 1;
}

int Application::runAudit(const std::string& dictionary_path)
{
    auto dict = loadDictionary(dictionary_path);
    if (!dict)
        return kExitFatal;
    if (!loadExclusions(config_->audit.exclusions_required))
        return kExitFatal;

    audit::AuditEngine engine({ config_->audit.min_note_length, config_->audit.parallel }, exclusions_.get());
    const audit::AuditReport report = engine.run(*dict);

    report::ReportRetention retention(config_->reports.directory, config_->reports.keep_recent);
    std::vector<std::string> paths;
    std::string error;
    if (!retention.ensureDirectories(error) ||
        !audit::AuditReportWriter::write(report, *dict, retention.recentDir(), report::fileTimestamp(), paths,
                                         error))
    {
        ErrorReporter::ReportWarning(ErrorCategory::Reporting, "Could not persist audit report", error);
    }

    for (const auto& category : report.categories)
        std::cout << "   " << category.category << ": " << category.issues.size() << " issues\n";
    std::cout << "   Excluded: " << report.suppressions.size() << "\n";
    std::cout << "Audit Score: " << report::formatScore(report.score) << "%\n";
    std::cout << "Suspect entries: " << report.suspectCount() << "\n";
    printReportPaths(paths);

    // Informational only.
    return kExitPassed;
}

int Application::runExclusions()
{
    if (!loadExclusions(true))
        return kExitFatal;
    const reference::ExclusionRegistry& registry = *exclusions_;
    const std::string& sub = cli_.args.front();

    if (sub == "categories")
    {
        std::cout << "Available categories:\n";
        for (const auto& [category, count] : registry.categories())
            std::cout << "   - " << category << " (" << count << " items)\n";
        return kExitPassed;
    }

    if (sub == "list")
    {
        const std::string category = cli_.args.size() > 1 ? cli_.args[1] : std::string();
        const auto entries = registry.list(category);
        if (entries.empty())
        {
            std::cout << "No items" << (category.empty() ? "" : " in " + category) << ".\n";
            return kExitPassed;
        }

        std::string current;
        std::size_t n = 0;
        for (const auto& entry : entries)
        {
            if (entry.category != current)
            {
                current = entry.category;
                n = 0;
                std::cout << "\n" << categoryTitle(current) << ":\n";
            }
            std::cout << "   " << ++n << ". " << entry.name << "\n";
            if (!entry.aliases.empty())
            {
                std::cout << "      Aliases: ";
                for (std::size_t i = 0; i < entry.aliases.size(); ++i)
                    std::cout << (i ? ", " : "") << entry.aliases[i];
                std::cout << "\n";
            }
            if (!entry.note.empty())
                std::cout << "      Note: " << entry.note << "\n";
        }
        return kExitPassed;
    }

    if (sub == "add")
    {
        reference::ExclusionEntry entry;
        entry.category = cli_.args[1];
        entry.name = cli_.args[2];
        for (std::size_t i = 3; i < cli_.args.size(); ++i)
        {
            if (cli_.args[i] == "--note")
                entry.note = cli_.args[++i];
            else
                entry.aliases.push_back(cli_.args[i]);
        }

        if (auto existing = registry.isExcluded(entry.name))
        {
            std::cout << "Already excluded: " << existing->describe() << "\n";
            return kExitPassed;
        }

        exclusions_->addEntry(entry);
        std::string error;
        if (!exclusions_->saveFile(config_->audit.exclusions_path, error))
        {
            ErrorReporter::ReportFatal(ErrorCategory::Input, "Cannot save the exclusion list", error);
            return kExitFatal;
        }
        std::cout << "Added exclusion to " << entry.category << ": " << entry.name << "\n";
        return kExitPassed;
    }

    // search and test read a dictionary
    auto dict = loadDictionary(cli_.args.back());
    if (!dict)
        return kExitFatal;

    if (sub == "search")
    {
        const std::string& query = cli_.args[1];
        std::cout << "Searching for \"" << query << "\":\n";
        std::size_t n = 0;
        for (const auto* entry : dictionary::findEntries(*dict, query))
        {
            std::cout << "   " << ++n << ". " << entry->english << " -> " << entry->ancientSurface() << " / "
                      << entry->modernSurface();
            if (auto match = registry.isExcluded(entry->english))
                std::cout << "  [" << match->describe() << "]";
            std::cout << "\n";
            if (entry->hasNotes())
                std::cout << "      Notes: " << *entry->notes << "\n";
        }
        if (n == 0)
            std::cout << "   no dictionary entries\n";

        const auto matches = registry.search(query);
        if (!matches.empty())
        {
            std::cout << "Exclusions mentioning \"" << query << "\":\n";
            for (const auto& entry : matches)
                std::cout << "   - " << entry.name << " (" << entry.category << ")\n";
        }
        return kExitPassed;
    }

    // test
    std::vector<std::string> keys;
    keys.reserve(dict->entries.size());
    for (const auto& entry : dict->entries)
        keys.push_back(entry.english);

    std::cout << "Testing exclusions against " << keys.size() << " dictionary entries...\n";
    std::map<reference::MatchKind, std::size_t> by_kind;
    const auto matches = registry.testAll(keys);
    for (const auto& match : matches)
    {
        ++by_kind[match.kind];
        std::cout << "   " << match.describe() << "\n";
    }
    std::cout << "\nTest Results:\n";
    std::cout << "   Total matches: " << matches.size() << "\n";
    for (auto kind : { reference::MatchKind::Exact, reference::MatchKind::Alias, reference::MatchKind::NormalizedPrimary,
                       reference::MatchKind::NormalizedAlias })
        std::cout << "   " << reference::matchKindName(kind) << " matches: " << by_kind[kind] << "\n";
    return kExitPassed;
}

int Application::runBaselineStats()
{
    if (!loadBaseline(true))
        return kExitFatal;

    const reference::BaselineStats stats = baseline_->stats();
    std::cout << "Baseline: " << (baseline_->title().empty() ? config_->baseline.path : baseline_->title()) << "\n";
    std::cout << "   Indexed english keys: " << stats.indexed << "\n";
    std::cout << "   Clusters: " << stats.clusters << "\n";
    std::cout << "   Ancient records: " << stats.ancient << "\n";
    std::cout << "   Modern records: " << stats.modern << "\n";
    return kExitPassed;
}

int Application::finish(int code)
{
    printPendingErrors();
    return code;
}

void Application::printPendingErrors()
{
    const auto errors = ErrorReporter::GetPendingErrors();
    if (errors.empty())
        return;

    std::cerr << "\n" << errors.size() << " problem(s) reported during this run:\n";
    for (const auto& report : errors)
    {
        std::cerr << "   " << report.describe() << "\n";
    }
}
