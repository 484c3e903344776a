#include "Entry.hpp"
#include "../processing/TextUtils.hpp"

#include <nlohmann/json.hpp>
#include <array>

using json = nlohmann::json;

namespace dictionary
{

namespace
{

constexpr std::array<const char*, 5> kPrimaryFormKeys = { "base", "lemma", "singular", "nominative", "infinitive" };

Form formFromJson(const json& value)
{
    if (value.is_string())
    {
        return value.get<std::string>();
    }

    if (value.is_object())
    {
        FormMap forms;
        for (const auto& [key, sub] : value.items())
        {
            if (sub.is_string())
                forms.emplace(key, sub.get<std::string>());
        }
        if (forms.empty())
            return std::monostate{};
        return forms;
    }

    return std::monostate{};
}

} // namespace

std::string surfaceOf(const Form& form)
{
    if (const auto* text = std::get_if<std::string>(&form))
        return *text;

    if (const auto* forms = std::get_if<FormMap>(&form))
    {
        for (const char* key : kPrimaryFormKeys)
        {
            auto it = forms->find(key);
            if (it != forms->end())
                return it->second;
        }
        if (!forms->empty())
            return forms->begin()->second;
    }

    return {};
}

bool isPresent(const Form& form)
{
    return !surfaceOf(form).empty();
}

json formToJson(const Form& form)
{
    if (const auto* text = std::get_if<std::string>(&form))
        return *text;
    if (const auto* forms = std::get_if<FormMap>(&form))
        return json(*forms);
    return nullptr;
}

json entryToJson(const Entry& entry)
{
    json j;
    j["english"] = entry.english;
    j["ancient"] = formToJson(entry.ancient);
    j["modern"] = formToJson(entry.modern);
    j["notes"] = entry.notes ? json(*entry.notes) : json(nullptr);
    return j;
}

std::optional<Entry> entryFromJson(const json& record, std::string& outReason)
{
    if (!record.is_object())
    {
        outReason = "record is not an object";
        return std::nullopt;
    }

    auto english_it = record.find("english");
    if (english_it == record.end() || !english_it->is_string())
    {
        outReason = "missing string field 'english'";
        return std::nullopt;
    }

    Entry entry;
    entry.english = processing::trim(english_it->get<std::string>());
    if (entry.english.empty())
    {
        outReason = "empty 'english' key";
        return std::nullopt;
    }

    if (auto it = record.find("ancient"); it != record.end())
        entry.ancient = formFromJson(*it);
    if (auto it = record.find("modern"); it != record.end())
        entry.modern = formFromJson(*it);
    if (auto it = record.find("notes"); it != record.end() && it->is_string())
        entry.notes = it->get<std::string>();

    return entry;
}

std::vector<const Entry*> findEntries(const UnifiedDictionary& dictionary, const std::string& query,
                                      std::size_t limit)
{
    std::vector<const Entry*> found;
    const std::string needle = processing::caseFold(query);
    if (needle.empty())
        return found;

    for (const auto& entry : dictionary.entries)
    {
        if (found.size() >= limit)
            break;
        for (const auto& text : { entry.english, entry.ancientSurface(), entry.modernSurface() })
        {
            if (processing::caseFold(text).find(needle) != std::string::npos)
            {
                found.push_back(&entry);
                break;
            }
        }
    }
    return found;
}

} // namespace dictionary
