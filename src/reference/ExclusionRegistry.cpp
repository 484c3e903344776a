#include "ExclusionRegistry.hpp"
#include "../processing/TextUtils.hpp"
#include "../utils/FileIO.hpp"

#include <plog/Log.h>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace reference
{

const char* matchKindName(MatchKind kind)
{
    switch (kind)
    {
    case MatchKind::Exact:
        return "Exact";
    case MatchKind::Alias:
        return "Alias";
    case MatchKind::NormalizedPrimary:
        return "Normalized";
    case MatchKind::NormalizedAlias:
        return "Normalized alias";
    }
    return "Unknown";
}

std::string ExclusionMatch::describe() const
{
    std::string text = std::string(matchKindName(kind)) + " match in " + category + ": " + name;
    if (kind == MatchKind::Alias || kind == MatchKind::NormalizedAlias)
        text += " (alias: " + spelling + ")";
    return text;
}

bool ExclusionRegistry::loadFile(const std::string& path, std::string& outError)
{
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open())
    {
        outError = "cannot open " + path;
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

    PLOG_INFO << "[ExclusionRegistry] Loaded " << entries_.size() << " exclusions across "
              << categories().size() << " categories from " << path;
    return true;
}

bool ExclusionRegistry::loadJson(const json& doc, std::string& outError)
{
    if (!doc.is_object())
    {
        outError = "exclusion list must be a JSON object";
        return false;
    }

    auto cats = doc.find("categories");
    if (cats == doc.end() || !cats->is_object())
    {
        outError = "exclusion list has no 'categories' object";
        return false;
    }

    std::vector<ExclusionEntry> loaded;
    for (const auto& [category, items] : cats->items())
    {
        if (!items.is_array())
        {
            PLOG_WARNING << "[ExclusionRegistry] Category '" << category << "' is not a list, ignored";
            continue;
        }
        for (const auto& item : items)
        {
            if (!item.is_object() || !item.contains("name") || !item["name"].is_string())
            {
                PLOG_WARNING << "[ExclusionRegistry] Entry without a name in '" << category << "', ignored";
                continue;
            }

            ExclusionEntry entry;
            entry.category = category;
            entry.name = item["name"].get<std::string>();
            entry.note = item.value("note", std::string{});
            if (auto aliases = item.find("aliases"); aliases != item.end() && aliases->is_array())
            {
                for (const auto& alias : *aliases)
                {
                    if (alias.is_string())
                        entry.aliases.push_back(alias.get<std::string>());
                }
            }
            loaded.push_back(std::move(entry));
        }
    }

    processing::NormalizationOptions options;
    if (auto norm = doc.find("normalization"); norm != doc.end() && norm->is_object())
    {
        options.ignore_case = norm->value("ignore_case", false);
        options.normalize_diacritics = norm->value("normalize_diacritics", false);
        options.treat_hyphen_dash_equal = norm->value("treat_hyphen_dash_equal", false);
    }

    meta_version_.clear();
    meta_description_.clear();
    if (auto meta = doc.find("meta"); meta != doc.end() && meta->is_object())
    {
        meta_version_ = meta->value("version", std::string{});
        meta_description_ = meta->value("description", std::string{});
    }

    entries_ = std::move(loaded);
    exact_.clear();
    alias_.clear();
    for (std::size_t i = 0; i < entries_.size(); ++i)
        indexEntry(i);

    setNormalization(options);
    return true;
}

bool ExclusionRegistry::saveFile(const std::string& path, std::string& outError) const
{
    json cats = json::object();
    for (const auto& entry : entries_)
    {
        json item;
        item["name"] = entry.name;
        if (!entry.aliases.empty())
            item["aliases"] = entry.aliases;
        if (!entry.note.empty())
            item["note"] = entry.note;
        cats[entry.category].push_back(std::move(item));
    }

    const auto& options = normalizer_.options();
    json doc;
    doc["meta"] = { { "version", meta_version_ }, { "description", meta_description_ } };
    doc["normalization"] = { { "ignore_case", options.ignore_case },
                             { "normalize_diacritics", options.normalize_diacritics },
                             { "treat_hyphen_dash_equal", options.treat_hyphen_dash_equal } };
    doc["categories"] = std::move(cats);

    if (!utils::WriteFileAtomic(path, doc.dump(2), outError))
        return false;

    PLOG_INFO << "[ExclusionRegistry] Saved " << entries_.size() << " entries to " << path;
    return true;
}

void ExclusionRegistry::addEntry(ExclusionEntry entry)
{
    entries_.push_back(std::move(entry));
    const std::size_t index = entries_.size() - 1;
    indexEntry(index);

    if (normalizer_.isActive())
    {
        const ExclusionEntry& added = entries_[index];
        normalized_primary_.emplace(normalizer_.normalize(added.name), index);
        for (const auto& alias : added.aliases)
            normalized_alias_.emplace(normalizer_.normalize(alias), std::make_pair(index, alias));
    }
}

void ExclusionRegistry::setNormalization(const processing::NormalizationOptions& options)
{
    normalizer_ = processing::TermNormalizer(options);
    rebuildNormalizedIndex();
}

std::optional<ExclusionMatch> ExclusionRegistry::isExcluded(const std::string& term) const
{
    if (auto it = exact_.find(term); it != exact_.end())
        return makeMatch(it->second, MatchKind::Exact, term);

    if (auto it = alias_.find(term); it != alias_.end())
        return makeMatch(it->second, MatchKind::Alias, term);

    if (!normalizer_.isActive())
        return std::nullopt;

    const std::string key = normalizer_.normalize(term);
    if (auto it = normalized_primary_.find(key); it != normalized_primary_.end())
        return makeMatch(it->second, MatchKind::NormalizedPrimary, entries_[it->second].name);

    if (auto it = normalized_alias_.find(key); it != normalized_alias_.end())
        return makeMatch(it->second.first, MatchKind::NormalizedAlias, it->second.second);

    return std::nullopt;
}

std::vector<ExclusionMatch> ExclusionRegistry::testAll(const std::vector<std::string>& keys) const
{
    std::vector<ExclusionMatch> matches;
    for (const auto& key : keys)
    {
        if (auto match = isExcluded(key))
            matches.push_back(std::move(*match));
    }
    return matches;
}

std::vector<ExclusionEntry> ExclusionRegistry::search(const std::string& query) const
{
    const std::string needle = processing::caseFold(query);
    auto hit = [&needle](const std::string& text) {
        return processing::caseFold(text).find(needle) != std::string::npos;
    };

    std::vector<ExclusionEntry> results;
    for (const auto& entry : entries_)
    {
        bool matched = hit(entry.name) || hit(entry.note);
        for (std::size_t i = 0; !matched && i < entry.aliases.size(); ++i)
            matched = hit(entry.aliases[i]);
        if (matched)
            results.push_back(entry);
    }
    return results;
}

std::vector<ExclusionEntry> ExclusionRegistry::list(const std::string& category) const
{
    if (category.empty())
        return entries_;

    std::vector<ExclusionEntry> results;
    for (const auto& entry : entries_)
    {
        if (entry.category == category)
            results.push_back(entry);
    }
    return results;
}

std::map<std::string, std::size_t> ExclusionRegistry::categories() const
{
    std::map<std::string, std::size_t> counts;
    for (const auto& entry : entries_)
        ++counts[entry.category];
    return counts;
}

void ExclusionRegistry::indexEntry(std::size_t index)
{
    const ExclusionEntry& entry = entries_[index];
    exact_.emplace(entry.name, index);
    for (const auto& alias : entry.aliases)
        alias_.emplace(alias, index);
}

void ExclusionRegistry::rebuildNormalizedIndex()
{
    normalized_primary_.clear();
    normalized_alias_.clear();
    if (!normalizer_.isActive())
        return;

    for (std::size_t i = 0; i < entries_.size(); ++i)
    {
        normalized_primary_.emplace(normalizer_.normalize(entries_[i].name), i);
        for (const auto& alias : entries_[i].aliases)
            normalized_alias_.emplace(normalizer_.normalize(alias), std::make_pair(i, alias));
    }
}

ExclusionMatch ExclusionRegistry::makeMatch(std::size_t index, MatchKind kind, const std::string& spelling) const
{
    ExclusionMatch match;
    match.entry_index = index;
    match.kind = kind;
    match.category = entries_[index].category;
    match.name = entries_[index].name;
    match.spelling = spelling;
    return match;
}

} // namespace reference
