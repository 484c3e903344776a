#include "DictionaryIO.hpp"
#include "FragmentParser.hpp"
#include "../utils/FileIO.hpp"

#include <plog/Log.h>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace dictionary
{

json DictionaryIO::toJson(const UnifiedDictionary& dictionary)
{
    const Metadata& meta = dictionary.metadata;

    json metadata;
    metadata["version"] = meta.version;
    metadata["created_on"] = meta.created_on;
    if (meta.files_included)
        metadata["files_included"] = *meta.files_included;
    if (meta.total_entries)
        metadata["total_entries"] = *meta.total_entries;
    metadata["duplicates_removed"] = meta.duplicates_removed;
    metadata["processing_notes"] = meta.processing_notes;
    metadata["project"] = meta.project;
    metadata["source_directory"] = meta.source_directory;

    json data = json::array();
    for (const auto& entry : dictionary.entries)
        data.push_back(entryToJson(entry));

    json files = json::array();
    for (const auto& stats : meta.files)
    {
        files.push_back({ { "filename", stats.filename },
                          { "entries", stats.entries },
                          { "duplicates_removed", stats.duplicates_removed },
                          { "rejected", stats.rejected } });
    }

    json doc;
    doc["metadata"] = std::move(metadata);
    doc["sections"]["Unified"]["data"] = std::move(data);
    doc["sections"]["Unified"]["files"] = std::move(files);
    return doc;
}

std::optional<UnifiedDictionary> DictionaryIO::fromJson(const json& doc, std::string& outError)
{
    if (!doc.is_object() || !doc.contains("sections"))
    {
        outError = "not a unified dictionary (missing 'sections')";
        return std::nullopt;
    }

    UnifiedDictionary dictionary;
    Metadata& meta = dictionary.metadata;

    if (auto it = doc.find("metadata"); it != doc.end() && it->is_object())
    {
        const json& m = *it;
        meta.version = m.value("version", std::string{});
        meta.created_on = m.value("created_on", std::string{});
        if (auto files = m.find("files_included"); files != m.end() && files->is_array())
        {
            std::vector<std::string> names;
            for (const auto& name : *files)
            {
                if (name.is_string())
                    names.push_back(name.get<std::string>());
            }
            meta.files_included = std::move(names);
        }
        if (auto total = m.find("total_entries"); total != m.end() && total->is_number_unsigned())
            meta.total_entries = total->get<std::size_t>();
        meta.duplicates_removed = m.value("duplicates_removed", std::size_t{ 0 });
        meta.project = m.value("project", std::string{});
        meta.source_directory = m.value("source_directory", std::string{});
        if (auto notes = m.find("processing_notes"); notes != m.end() && notes->is_array())
        {
            for (const auto& note : *notes)
            {
                if (note.is_string())
                    meta.processing_notes.push_back(note.get<std::string>());
            }
        }
    }

    // Per-file statistics live beside the data; entry records are gathered by the
    // shared fragment normalizer so the artifact and fragments parse identically.
    if (auto unified = doc["sections"].find("Unified"); unified != doc["sections"].end() && unified->is_object())
    {
        if (auto files = unified->find("files"); files != unified->end() && files->is_array())
        {
            for (const auto& f : *files)
            {
                if (!f.is_object() || f.contains("data"))
                    continue;
                FragmentStats stats;
                stats.filename = f.value("filename", std::string{});
                stats.entries = f.value("entries", std::size_t{ 0 });
                stats.duplicates_removed = f.value("duplicates_removed", std::size_t{ 0 });
                stats.rejected = f.value("rejected", std::size_t{ 0 });
                meta.files.push_back(std::move(stats));
            }
        }
    }

    auto classified = FragmentParser::classify(doc, "");
    if (!classified)
    {
        outError = "unsupported 'sections' layout";
        return std::nullopt;
    }

    ParsedFragment parsed = FragmentParser::normalize(*classified);
    if (parsed.rejected > 0)
    {
        PLOG_WARNING << "[DictionaryIO] Ignored " << parsed.rejected << " record(s) without an english key";
    }
    dictionary.entries = std::move(parsed.entries);
    return dictionary;
}

bool DictionaryIO::save(const UnifiedDictionary& dictionary, const std::string& path, std::string& outError)
{
    if (!utils::WriteFileAtomic(path, toJson(dictionary).dump(2), outError))
        return false;

    PLOG_INFO << "[DictionaryIO] Wrote " << dictionary.entries.size() << " entries to " << path;
    return true;
}

std::optional<UnifiedDictionary> DictionaryIO::load(const std::string& path, std::string& outError)
{
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open())
    {
        outError = "cannot open " + path;
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    json doc = json::parse(buffer.str(), nullptr, false);
    if (doc.is_discarded())
    {
        outError = "invalid JSON in " + path;
        return std::nullopt;
    }

    return fromJson(doc, outError);
}

} // namespace dictionary
