#include "TrancheMerger.hpp"
#include "FragmentParser.hpp"
#include "../processing/Diagnostics.hpp"
#include "../processing/TextUtils.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <unordered_set>

namespace dictionary
{

TrancheMerger::TrancheMerger(MergeOptions options, Clock clock)
    : options_(std::move(options))
    , clock_(clock ? std::move(clock) : Clock(&TrancheMerger::utcTimestamp))
{
}

bool TrancheMerger::isSkippedByName(const std::string& name, const std::string& unified_marker)
{
    if (!unified_marker.empty() && name.find(unified_marker) != std::string::npos)
        return true;
    if (name.find(" (1)") != std::string::npos)
        return true;
    return processing::startsWith(name, "merged") || processing::startsWith(name, "delete");
}

std::string TrancheMerger::dedupKey(const std::string& english)
{
    return processing::toLowerAscii(processing::trim(english));
}

std::string TrancheMerger::utcTimestamp()
{
    using namespace std::chrono;
    auto now = system_clock::now();
    auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
    std::time_t t = system_clock::to_time_t(now);

    std::tm tm_buf{};
#ifdef _WIN32
    gmtime_s(&tm_buf, &t);
#else
    gmtime_r(&t, &tm_buf);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << ms << 'Z';
    return oss.str();
}

std::optional<MergeResult> TrancheMerger::merge(std::vector<FragmentSource> fragments, std::string& outError) const
{
    std::sort(fragments.begin(), fragments.end(),
              [](const FragmentSource& a, const FragmentSource& b) { return a.name < b.name; });

    PLOG_INFO << "[TrancheMerger] Merging " << fragments.size() << " candidate fragment(s)";

    MergeResult result;
    std::unordered_set<std::string> seen;
    std::size_t duplicates = 0;

    for (const auto& fragment : fragments)
    {
        if (isSkippedByName(fragment.name, options_.unified_marker))
        {
            PLOG_INFO << "[TrancheMerger] Skipping by naming convention: " << fragment.name;
            result.skipped_by_name.push_back(fragment.name);
            continue;
        }

        std::string parse_error;
        auto parsed = FragmentParser::parse(fragment.content, fragment.name, parse_error);
        if (!parsed)
        {
            utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Input, "Skipping unparsable fragment",
                                                fragment.name + ": " + parse_error);
            result.unparsable.push_back(fragment.name + ": " + parse_error);
            continue;
        }

        FragmentStats stats;
        stats.filename = fragment.name;
        stats.entries = parsed->entries.size();
        stats.rejected = parsed->rejected;

        for (auto& entry : parsed->entries)
        {
            if (!seen.insert(dedupKey(entry.english)).second)
            {
                ++stats.duplicates_removed;
                if (processing::Diagnostics::IsVerbose())
                {
                    PLOG_DEBUG_(processing::Diagnostics::kLogInstance)
                        << "[TrancheMerger] duplicate key '" << processing::Diagnostics::Preview(entry.english)
                        << "' in " << fragment.name;
                }
                continue;
            }
            result.dictionary.entries.push_back(std::move(entry));
        }
        duplicates += stats.duplicates_removed;

        if (stats.rejected > 0)
        {
            PLOG_WARNING << "[TrancheMerger] " << fragment.name << ": rejected " << stats.rejected
                         << " record(s) without a usable english key";
        }

        PLOG_INFO << "[TrancheMerger] " << fragment.name << " (" << shapeName(parsed->shape) << "): "
                  << stats.entries << " entries, " << stats.duplicates_removed << " duplicates";

        result.consumed.push_back(fragment.name);
        result.dictionary.metadata.files.push_back(std::move(stats));
    }

    if (result.consumed.empty())
    {
        outError = "no valid fragments among " + std::to_string(fragments.size()) + " candidate(s)";
        return std::nullopt;
    }

    Metadata& meta = result.dictionary.metadata;
    meta.version = options_.version;
    meta.created_on = clock_();
    meta.files_included = result.consumed;
    meta.total_entries = result.dictionary.entries.size();
    meta.duplicates_removed = duplicates;
    meta.project = options_.project;
    meta.source_directory = options_.source_directory;
    meta.processing_notes = {
        "Merged from individual tranche files",
        "Removed duplicate entries by english key (first occurrence kept)",
        "Excluded existing unified dictionaries and processed markers",
    };

    PLOG_INFO << "[TrancheMerger] Merge complete: " << result.dictionary.entries.size() << " unique entries, "
              << duplicates << " duplicates removed, " << result.consumed.size() << " source files";

    return result;
}

} // namespace dictionary
