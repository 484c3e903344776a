#pragma once

#include "../processing/TermNormalizer.hpp"

#include <nlohmann/json_fwd.hpp>

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace reference
{

struct ExclusionEntry
{
    std::string category;
    std::string name;
    std::vector<std::string> aliases;
    std::string note;
};

enum class MatchKind
{
    Exact,
    Alias,
    NormalizedPrimary,
    NormalizedAlias
};

const char* matchKindName(MatchKind kind);

struct ExclusionMatch
{
    std::size_t entry_index = 0; // stable identity of the matched canonical term
    MatchKind kind = MatchKind::Exact;
    std::string category;
    std::string name;     // canonical primary term
    std::string spelling; // the primary or alias spelling that matched

    // e.g. "Alias match in world_core: Cordavora (alias: Cordavorum)"
    std::string describe() const;
};

/**
 * @brief Canonical terms that audits must never flag.
 *
 * Lookup order is exact primary, exact alias, then (only when a normalization
 * option is on) normalized primary and normalized alias. All four tiers are hash
 * lookups; when two entries claim the same spelling the one loaded first wins.
 */
class ExclusionRegistry
{
public:
    ExclusionRegistry() = default;

    bool loadFile(const std::string& path, std::string& outError);
    bool loadJson(const nlohmann::json& doc, std::string& outError);
    bool saveFile(const std::string& path, std::string& outError) const;

    void addEntry(ExclusionEntry entry);

    void setNormalization(const processing::NormalizationOptions& options);
    const processing::NormalizationOptions& normalization() const { return normalizer_.options(); }

    std::optional<ExclusionMatch> isExcluded(const std::string& term) const;

    // Matches for every key that is excluded, in input order.
    std::vector<ExclusionMatch> testAll(const std::vector<std::string>& keys) const;

    // Case-insensitive substring search over names, aliases and notes.
    std::vector<ExclusionEntry> search(const std::string& query) const;

    // All entries, or only those of one category, in load order.
    std::vector<ExclusionEntry> list(const std::string& category = {}) const;

    // Category name -> number of entries.
    std::map<std::string, std::size_t> categories() const;

    std::size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

private:
    void indexEntry(std::size_t index);
    void rebuildNormalizedIndex();
    ExclusionMatch makeMatch(std::size_t index, MatchKind kind, const std::string& spelling) const;

    std::vector<ExclusionEntry> entries_;
    std::string meta_version_;
    std::string meta_description_;

    processing::TermNormalizer normalizer_;

    std::unordered_map<std::string, std::size_t> exact_;
    std::unordered_map<std::string, std::size_t> alias_;
    std::unordered_map<std::string, std::size_t> normalized_primary_;
    std::unordered_map<std::string, std::pair<std::size_t, std::string>> normalized_alias_;
};

} // namespace reference
