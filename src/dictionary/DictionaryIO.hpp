#pragma once

#include "Entry.hpp"

#include <nlohmann/json_fwd.hpp>

#include <optional>
#include <string>

namespace dictionary
{

// Reads and writes the unified artifact:
//   { "metadata": {...}, "sections": { "Unified": { "data": [...], "files": [...] } } }
// This is also the read path for downstream consumers such as the translation service.
class DictionaryIO
{
public:
    static nlohmann::json toJson(const UnifiedDictionary& dictionary);
    static std::optional<UnifiedDictionary> fromJson(const nlohmann::json& doc, std::string& outError);

    static bool save(const UnifiedDictionary& dictionary, const std::string& path, std::string& outError);
    static std::optional<UnifiedDictionary> load(const std::string& path, std::string& outError);
};

} // namespace dictionary
