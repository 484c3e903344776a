#pragma once

#include "../dictionary/Entry.hpp"
#include "../processing/IFuzzyMatcher.hpp"

#include <nlohmann/json_fwd.hpp>

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace reference
{

struct BaselineEntry
{
    dictionary::Entry entry;
    std::string cluster;
};

struct BaselineOptions
{
    bool case_sensitive = true;   // exact keys; false folds case with utf8proc
    bool stem_fallback = true;    // findSimilar also matches on stripped suffixes
    double fuzzy_threshold = 0.0; // > 0 admits keys whose similarity reaches it
    processing::MatchAlgorithm algorithm = processing::MatchAlgorithm::Ratio;
    std::size_t max_similar = 10;
};

struct BaselineStats
{
    std::size_t ancient = 0;  // records listed under cluster "ancient"
    std::size_t modern = 0;   // records listed under cluster "modern"
    std::size_t clusters = 0;
    std::size_t indexed = 0;  // distinct english keys after combining
};

/**
 * @brief Read-only index over a prior stable release.
 *
 * Snapshot layout: {"title", "clusters": {name: {"ancient": [Entry], "modern": [Entry], "commentary"}}}.
 * Records for the same english key are combined so one BaselineEntry carries
 * both variants. Lookups by english, ancient and modern surface form are hash
 * lookups. Passed explicitly to the stages that need it.
 */
class BaselineIndex
{
public:
    explicit BaselineIndex(BaselineOptions options = {}, std::unique_ptr<processing::IFuzzyMatcher> matcher = nullptr);
    ~BaselineIndex();

    BaselineIndex(const BaselineIndex&) = delete;
    BaselineIndex& operator=(const BaselineIndex&) = delete;
    BaselineIndex(BaselineIndex&&) noexcept;
    BaselineIndex& operator=(BaselineIndex&&) noexcept;

    bool loadFile(const std::string& path, std::string& outError);
    bool loadJson(const nlohmann::json& doc, std::string& outError);

    const BaselineEntry* lookup(const std::string& english) const;
    const BaselineEntry* lookupAncient(const std::string& form) const;
    const BaselineEntry* lookupModern(const std::string& form) const;

    // Near-matches for a key with no exact entry: containment, shared stem, or
    // (when configured) fuzzy similarity. Ranked by similarity, ties by key.
    std::vector<const BaselineEntry*> findSimilar(const std::string& english) const;

    std::optional<std::string> clusterOf(const std::string& english) const;

    BaselineStats stats() const;
    std::optional<BaselineStats> clusterStats(const std::string& cluster) const;

    const std::string& title() const { return title_; }
    std::size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    // Strips the longest of -ing/-ed/-er/-est/-ly/-s, keeping at least one character.
    static std::string stem(const std::string& word);

private:
    std::string key(const std::string& text) const;
    void addRecord(const dictionary::Entry& record, const std::string& cluster);

    BaselineOptions options_;
    std::unique_ptr<processing::IFuzzyMatcher> matcher_;

    std::string title_;
    std::vector<BaselineEntry> entries_;
    std::unordered_map<std::string, std::size_t> by_english_;
    std::unordered_map<std::string, std::size_t> by_ancient_;
    std::unordered_map<std::string, std::size_t> by_modern_;
    std::map<std::string, BaselineStats> cluster_stats_;
};

} // namespace reference
