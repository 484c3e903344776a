#include "BaselineIndex.hpp"
#include "../processing/RapidfuzzMatcher.hpp"
#include "../processing/TextUtils.hpp"

#include <plog/Log.h>
#include <nlohmann/json.hpp>

#include <array>
#include <fstream>
#include <sstream>
#include <string_view>

using json = nlohmann::json;

namespace reference
{

BaselineIndex::BaselineIndex(BaselineOptions options, std::unique_ptr<processing::IFuzzyMatcher> matcher)
    : options_(options)
    , matcher_(matcher ? std::move(matcher) : std::make_unique<processing::RapidfuzzMatcher>())
{
}

BaselineIndex::~BaselineIndex() = default;
BaselineIndex::BaselineIndex(BaselineIndex&&) noexcept = default;
BaselineIndex& BaselineIndex::operator=(BaselineIndex&&) noexcept = default;

bool BaselineIndex::loadFile(const std::string& path, std::string& outError)
{
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open())
    {
        outError = "baseline reference not found: " + path;
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    json doc = json::parse(buffer.str(), nullptr, false);
    if (doc.is_discarded())
    {
        outError = "invalid JSON in " + path;
        return false;
    }

    if (!loadJson(doc, outError))
        return false;

    PLOG_INFO << "[BaselineIndex] Loaded '" << title_ << "': " << cluster_stats_.size() << " clusters, "
              << entries_.size() << " entries";
    return true;
}

bool BaselineIndex::loadJson(const json& doc, std::string& outError)
{
    if (!doc.is_object())
    {
        outError = "baseline snapshot must be a JSON object";
        return false;
    }

    auto clusters = doc.find("clusters");
    if (clusters == doc.end() || !clusters->is_object())
    {
        outError = "baseline snapshot has no 'clusters' object";
        return false;
    }

    title_ = doc.value("title", std::string{});
    entries_.clear();
    by_english_.clear();
    by_ancient_.clear();
    by_modern_.clear();
    cluster_stats_.clear();

    for (const auto& [name, cluster] : clusters->items())
    {
        if (!cluster.is_object())
            continue;

        BaselineStats& stats = cluster_stats_[name];
        stats.clusters = 1;

        for (const char* variant : { "ancient", "modern" })
        {
            auto list = cluster.find(variant);
            if (list == cluster.end() || !list->is_array())
                continue;

            const bool is_ancient = std::string_view(variant) == "ancient";
            (is_ancient ? stats.ancient : stats.modern) += list->size();

            for (const auto& record : *list)
            {
                std::string reason;
                auto entry = dictionary::entryFromJson(record, reason);
                if (!entry)
                {
                    PLOG_DEBUG << "[BaselineIndex] Skipped record in '" << name << "': " << reason;
                    continue;
                }
                const bool has_form = is_ancient ? dictionary::isPresent(entry->ancient)
                                                 : dictionary::isPresent(entry->modern);
                if (!has_form)
                    continue;
                addRecord(*entry, name);
            }
        }
    }

    for (auto& [name, stats] : cluster_stats_)
    {
        for (const auto& baseline : entries_)
        {
            if (baseline.cluster == name)
                ++stats.indexed;
        }
    }

    return true;
}

const BaselineEntry* BaselineIndex::lookup(const std::string& english) const
{
    auto it = by_english_.find(key(english));
    return it == by_english_.end() ? nullptr : &entries_[it->second];
}

const BaselineEntry* BaselineIndex::lookupAncient(const std::string& form) const
{
    auto it = by_ancient_.find(key(form));
    return it == by_ancient_.end() ? nullptr : &entries_[it->second];
}

const BaselineEntry* BaselineIndex::lookupModern(const std::string& form) const
{
    auto it = by_modern_.find(key(form));
    return it == by_modern_.end() ? nullptr : &entries_[it->second];
}

std::vector<const BaselineEntry*> BaselineIndex::findSimilar(const std::string& english) const
{
    const std::string query = key(english);
    if (query.empty() || options_.max_similar == 0)
        return {};

    const std::string query_stem = options_.stem_fallback ? stem(query) : std::string{};

    std::vector<std::string> keys;
    keys.reserve(by_english_.size());
    for (const auto& indexed : by_english_)
    {
        if (!indexed.first.empty() && indexed.first != query)
            keys.push_back(indexed.first);
    }

    // Every key is scored; relatedness below decides which ones are kept.
    const auto ranked = matcher_->findMatches(query, keys, 0.0, options_.algorithm);

    std::vector<const BaselineEntry*> results;
    for (const auto& match : ranked)
    {
        if (results.size() == options_.max_similar)
            break;

        bool related = match.matched.find(query) != std::string::npos || query.find(match.matched) != std::string::npos;
        if (!related && options_.stem_fallback)
            related = stem(match.matched) == query_stem;
        if (!related && options_.fuzzy_threshold > 0.0)
            related = match.score >= options_.fuzzy_threshold;

        if (!related)
            continue;

        auto it = by_english_.find(match.matched);
        if (it != by_english_.end())
            results.push_back(&entries_[it->second]);
    }
    return results;
}

std::optional<std::string> BaselineIndex::clusterOf(const std::string& english) const
{
    if (const BaselineEntry* found = lookup(english))
        return found->cluster;
    return std::nullopt;
}

BaselineStats BaselineIndex::stats() const
{
    BaselineStats total;
    for (const auto& [name, stats] : cluster_stats_)
    {
        if (stats.ancient == 0 && stats.modern == 0)
            continue;
        total.ancient += stats.ancient;
        total.modern += stats.modern;
        ++total.clusters;
    }
    total.indexed = entries_.size();
    return total;
}

std::optional<BaselineStats> BaselineIndex::clusterStats(const std::string& cluster) const
{
    auto it = cluster_stats_.find(cluster);
    if (it == cluster_stats_.end())
        return std::nullopt;
    return it->second;
}

std::string BaselineIndex::stem(const std::string& word)
{
    static constexpr std::array<std::string_view, 6> kSuffixes = { "ing", "est", "ed", "er", "ly", "s" };

    std::string_view best;
    for (auto suffix : kSuffixes)
    {
        if (suffix.size() > best.size() && word.size() > suffix.size() && processing::endsWith(word, suffix))
            best = suffix;
    }
    return word.substr(0, word.size() - best.size());
}

std::string BaselineIndex::key(const std::string& text) const
{
    return options_.case_sensitive ? text : processing::caseFold(text);
}

void BaselineIndex::addRecord(const dictionary::Entry& record, const std::string& cluster)
{
    const std::string english_key = key(record.english);

    std::size_t index;
    if (auto it = by_english_.find(english_key); it != by_english_.end())
    {
        index = it->second;
        dictionary::Entry& existing = entries_[index].entry;
        if (!dictionary::isPresent(existing.ancient))
            existing.ancient = record.ancient;
        if (!dictionary::isPresent(existing.modern))
            existing.modern = record.modern;
        if (!existing.hasNotes() && record.hasNotes())
            existing.notes = record.notes;
    }
    else
    {
        index = entries_.size();
        entries_.push_back({ record, cluster });
        by_english_.emplace(english_key, index);
    }

    const dictionary::Entry& stored = entries_[index].entry;
    if (const std::string form = stored.ancientSurface(); !form.empty())
        by_ancient_.emplace(key(form), index);
    if (const std::string form = stored.modernSurface(); !form.empty())
        by_modern_.emplace(key(form), index);
}

} // namespace reference
