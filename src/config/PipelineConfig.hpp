#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace config
{

struct PathsConfig
{
    std::string tranches_dir = "data/Tranches";
    std::string merged_dir = "data/Tranches/merged";
    std::string deleted_dir = "data/Tranches/delete";
};

struct DictionaryConfig
{
    std::string output_file = "data/UnifiedLibranDictionary.json";
    std::string version = "1.0.0";
    std::string project = "Libran Language Files";
    std::string unified_marker = "UnifiedLibranDictionary";
};

struct QAConfig
{
    int pass_threshold = 95;
    bool parallel = false;
    // group name -> member words; empty means the built-in kinship/body groups
    std::map<std::string, std::vector<std::string>> homonym_groups;
};

struct BaselineConfig
{
    bool enabled = true;
    std::string path = "data/UnifiedLibranDictionaryv1.3Baseline.json";
    bool required = false; // a missing snapshot is fatal instead of a warning
    bool case_sensitive = true;
    bool stem_fallback = true;
    double fuzzy_threshold = 0.0;
    std::string similarity = "ratio"; // ratio, partial or token_sort
    std::size_t max_similar = 10;
};

struct AuditConfig
{
    std::string exclusions_path = "data/audit-exclusions.json";
    bool exclusions_required = false;
    std::size_t min_note_length = 10;
    bool parallel = false;
};

struct ReportsConfig
{
    std::string directory = "reports";
    std::size_t keep_recent = 3;
};

// Run-level settings loaded from lexgate.toml. [logging] is read by utils::LogManager;
// only the switches the pipeline itself needs are mirrored here.
struct PipelineConfig
{
    PathsConfig paths;
    DictionaryConfig dictionary;
    QAConfig qa;
    BaselineConfig baseline;
    AuditConfig audit;
    ReportsConfig reports;
    bool verbose = false;
    std::size_t preview_bytes = 80;
    bool dry_run = false;

    std::string lockPath() const;

    // Missing file: defaults. Malformed file: std::nullopt with outError.
    // Out-of-range values are reported and replaced by their defaults.
    static std::optional<PipelineConfig> load(const std::string& path, std::string& outError);

    static std::optional<PipelineConfig> parse(const std::string& toml_text, std::string& outError);
};

} // namespace config
