#pragma once

#include "Entry.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace dictionary
{

// One fragment as handed to the merger: a name for provenance and its raw text.
struct FragmentSource
{
    std::string name;
    std::string content;
};

struct MergeOptions
{
    std::string version = "1.0.0";
    std::string unified_marker = "UnifiedLibranDictionary";
    std::string project = "Libran Language Files";
    std::string source_directory;
};

struct MergeResult
{
    UnifiedDictionary dictionary;
    std::vector<std::string> consumed;       // fragments that contributed (lifecycle set)
    std::vector<std::string> skipped_by_name; // unified artifacts and processed markers
    std::vector<std::string> unparsable;      // "name: reason"
};

/**
 * @brief Merges fragment sources into a fresh UnifiedDictionary.
 *
 * Fragments are visited in name order. The first entry seen for an english key
 * (ASCII case-insensitive, trimmed) wins; later ones are counted as duplicates.
 * An unparsable fragment is skipped with a warning. The merge fails only when no
 * fragment is usable. merge() touches no files.
 */
class TrancheMerger
{
public:
    using Clock = std::function<std::string()>;

    explicit TrancheMerger(MergeOptions options = {}, Clock clock = {});

    std::optional<MergeResult> merge(std::vector<FragmentSource> fragments, std::string& outError) const;

    // Naming convention for files that must never be merged again.
    static bool isSkippedByName(const std::string& name, const std::string& unified_marker);

    static std::string dedupKey(const std::string& english);

    // ISO-8601 UTC with milliseconds, e.g. 2025-09-23T01:42:19.197Z
    static std::string utcTimestamp();

private:
    MergeOptions options_;
    Clock clock_;
};

} // namespace dictionary
