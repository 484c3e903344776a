#pragma once

#include "CommandLine.hpp"

#include <memory>
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

namespace dictionary
{
struct UnifiedDictionary;
}

class Application
{
public:
    Application(int argc, char** argv);
    ~Application();

    int run();

private:
    bool initializeLogging();
    bool initializeConfig();

    // Optional references honour the *_required switches: a missing file is a
    // warning unless required, in which case it is fatal and false is returned.
    bool loadBaseline(bool required);
    bool loadExclusions(bool required);
    std::unique_ptr<dictionary::UnifiedDictionary> loadDictionary(const std::string& path);

    int runBuild();
    int runQA(const std::string& dictionary_path);
    int runAudit(const std::string& dictionary_path);
    int runExclusions();
    int runBaselineStats();

    int finish(int code);
    void printPendingErrors();

    std::vector<std::string> args_;
    app::CommandLine cli_;
    std::unique_ptr<config::PipelineConfig> config_;
    std::unique_ptr<reference::BaselineIndex> baseline_;
    std::unique_ptr<reference::ExclusionRegistry> exclusions_;
};
