#include "PipelineConfig.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>
#include <toml++/toml.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace config
{

namespace
{

void invalidValue(const std::string& key, const std::string& reason)
{
    utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                        "Invalid configuration value, using default", key + ": " + reason);
}

template <typename T>
void readValue(const toml::table& tbl, const char* key, T& out)
{
    if (auto v = tbl[key].value<T>())
        out = *v;
}

void readSize(const toml::table& tbl, const char* table, const char* key, std::size_t& out)
{
    if (auto v = tbl[key].value<std::int64_t>())
    {
        if (*v < 0)
            invalidValue(std::string(table) + "." + key, "must not be negative");
        else
            out = static_cast<std::size_t>(*v);
    }
}

void applyTables(const toml::table& root, PipelineConfig& cfg)
{
    if (auto* paths = root["paths"].as_table())
    {
        readValue(*paths, "tranches_dir", cfg.paths.tranches_dir);
        readValue(*paths, "merged_dir", cfg.paths.merged_dir);
        readValue(*paths, "deleted_dir", cfg.paths.deleted_dir);
    }

    if (auto* dict = root["dictionary"].as_table())
    {
        readValue(*dict, "output_file", cfg.dictionary.output_file);
        readValue(*dict, "version", cfg.dictionary.version);
        readValue(*dict, "project", cfg.dictionary.project);
        readValue(*dict, "unified_marker", cfg.dictionary.unified_marker);
    }

    if (auto* qa = root["qa"].as_table())
    {
        if (auto v = (*qa)["pass_threshold"].value<std::int64_t>())
        {
            if (*v < 0 || *v > 100)
                invalidValue("qa.pass_threshold", "must be within 0..100");
            else
                cfg.qa.pass_threshold = static_cast<int>(*v);
        }
        readValue(*qa, "parallel", cfg.qa.parallel);

        if (auto* groups = (*qa)["homonym_groups"].as_table())
        {
            for (const auto& [name, node] : *groups)
            {
                const auto* words = node.as_array();
                if (!words)
                {
                    invalidValue("qa.homonym_groups." + std::string(name.str()), "must be an array of strings");
                    continue;
                }
                auto& members = cfg.qa.homonym_groups[std::string(name.str())];
                for (const auto& word : *words)
                {
                    if (auto text = word.value<std::string>())
                        members.push_back(*text);
                }
            }
        }
    }

    if (auto* baseline = root["baseline"].as_table())
    {
        readValue(*baseline, "enabled", cfg.baseline.enabled);
        readValue(*baseline, "path", cfg.baseline.path);
        readValue(*baseline, "required", cfg.baseline.required);
        readValue(*baseline, "case_sensitive", cfg.baseline.case_sensitive);
        readValue(*baseline, "stem_fallback", cfg.baseline.stem_fallback);
        if (auto v = (*baseline)["fuzzy_threshold"].value<double>())
        {
            if (*v < 0.0 || *v > 1.0)
                invalidValue("baseline.fuzzy_threshold", "must be within 0.0..1.0");
            else
                cfg.baseline.fuzzy_threshold = *v;
        }
        if (auto v = (*baseline)["similarity"].value<std::string>())
        {
            if (*v != "ratio" && *v != "partial" && *v != "token_sort")
                invalidValue("baseline.similarity", "must be ratio, partial or token_sort");
            else
                cfg.baseline.similarity = *v;
        }
        readSize(*baseline, "baseline", "max_similar", cfg.baseline.max_similar);
    }

    if (auto* audit = root["audit"].as_table())
    {
        readValue(*audit, "exclusions_path", cfg.audit.exclusions_path);
        readValue(*audit, "exclusions_required", cfg.audit.exclusions_required);
        readValue(*audit, "parallel", cfg.audit.parallel);
        readSize(*audit, "audit", "min_note_length", cfg.audit.min_note_length);
    }

    if (auto* reports = root["reports"].as_table())
    {
        readValue(*reports, "directory", cfg.reports.directory);
        readSize(*reports, "reports", "keep_recent", cfg.reports.keep_recent);
    }

    if (auto* logging = root["logging"].as_table())
    {
        readValue(*logging, "verbose", cfg.verbose);
        readSize(*logging, "logging", "preview_bytes", cfg.preview_bytes);
    }
}

std::string describe(const toml::parse_error& pe)
{
    if (pe.source().begin.line > 0)
        return "Error at line " + std::to_string(pe.source().begin.line) + ": " + std::string(pe.description());
    return std::string(pe.description());
}

} // namespace

std::string PipelineConfig::lockPath() const
{
    return (fs::path(paths.tranches_dir) / ".lexgate.lock").string();
}

std::optional<PipelineConfig> PipelineConfig::load(const std::string& path, std::string& outError)
{
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs)
    {
        PLOG_INFO << "[PipelineConfig] " << path << " not found, using defaults";
        return PipelineConfig{};
    }

    std::stringstream buffer;
    buffer << ifs.rdbuf();
    auto cfg = parse(buffer.str(), outError);
    if (!cfg)
        outError += "\nFile: " + path;
    return cfg;
}

std::optional<PipelineConfig> PipelineConfig::parse(const std::string& toml_text, std::string& outError)
{
    try
    {
        toml::table root = toml::parse(toml_text);
        PipelineConfig cfg;
        applyTables(root, cfg);
        return cfg;
    }
    catch (const toml::parse_error& pe)
    {
        outError = describe(pe);
        return std::nullopt;
    }
}

} // namespace config
