#include "FragmentParser.hpp"
#include "../processing/TextUtils.hpp"

namespace dictionary
{

using json = nlohmann::json;

namespace
{

template <class... Ts>
struct overloaded : Ts...
{
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

void appendRecords(const json& records, ParsedFragment& out)
{
    for (const auto& record : records)
    {
        std::string reason;
        if (auto entry = entryFromJson(record, reason))
        {
            out.entries.push_back(std::move(*entry));
        }
        else
        {
            ++out.rejected;
            out.rejection_reasons.push_back(reason);
        }
    }
}

bool isFlatMapValue(const json& value)
{
    return value.is_string() || value.is_object() || value.is_null();
}

// {"name": {"data": [...], "files": [...]}, ...}; a flat-map word "sections" has string or form values.
bool looksSectioned(const json& sections)
{
    if (!sections.is_object() || sections.empty())
        return false;
    for (const auto& [name, section] : sections.items())
    {
        if (!section.is_object() || (!section.contains("data") && !section.contains("files")))
            return false;
    }
    return true;
}

} // namespace

const char* shapeName(FragmentShape shape)
{
    switch (shape)
    {
    case FragmentShape::EntryList:
        return "entry-list";
    case FragmentShape::Sectioned:
        return "sectioned";
    case FragmentShape::DataObject:
        return "data-object";
    case FragmentShape::FlatMap:
        return "flat-map";
    }
    return "unknown";
}

std::optional<FragmentDocument> FragmentParser::classify(const json& doc, const std::string& fragment_name)
{
    if (doc.is_array())
        return EntryListDoc{ &doc };

    if (!doc.is_object())
        return std::nullopt;

    // "sections" and "data" are also ordinary english words, so their value decides the shape.
    if (auto it = doc.find("sections"); it != doc.end() && looksSectioned(*it))
        return SectionedDoc{ &*it };

    if (auto it = doc.find("data"); it != doc.end() && it->is_array())
        return DataObjectDoc{ &*it };

    for (const auto& [key, value] : doc.items())
    {
        if (!isFlatMapValue(value))
            return std::nullopt;
    }

    const bool ancient_fragment =
        processing::toLowerAscii(fragment_name).find("ancient") != std::string::npos;
    return FlatMapDoc{ &doc, ancient_fragment ? "ancient" : "modern" };
}

ParsedFragment FragmentParser::normalize(const FragmentDocument& doc)
{
    ParsedFragment out;

    std::visit(overloaded{
                   [&out](const EntryListDoc& list) {
                       out.shape = FragmentShape::EntryList;
                       appendRecords(*list.records, out);
                   },
                   [&out](const SectionedDoc& sectioned) {
                       out.shape = FragmentShape::Sectioned;
                       for (const auto& [name, section] : sectioned.sections->items())
                       {
                           if (!section.is_object())
                               continue;
                           if (auto data = section.find("data"); data != section.end() && data->is_array())
                               appendRecords(*data, out);
                           if (auto files = section.find("files"); files != section.end() && files->is_array())
                           {
                               for (const auto& file : *files)
                               {
                                   if (!file.is_object())
                                       continue;
                                   if (auto data = file.find("data"); data != file.end() && data->is_array())
                                       appendRecords(*data, out);
                               }
                           }
                       }
                   },
                   [&out](const DataObjectDoc& data) {
                       out.shape = FragmentShape::DataObject;
                       appendRecords(*data.records, out);
                   },
                   [&out](const FlatMapDoc& flat) {
                       out.shape = FragmentShape::FlatMap;
                       for (const auto& [english, value] : flat.mapping->items())
                       {
                           json record = value.is_object() ? value : json::object();
                           record["english"] = english;
                           if (value.is_string())
                               record[flat.string_variant] = value;
                           std::string reason;
                           if (auto entry = entryFromJson(record, reason))
                           {
                               out.entries.push_back(std::move(*entry));
                           }
                           else
                           {
                               ++out.rejected;
                               out.rejection_reasons.push_back(reason);
                           }
                       }
                   } },
               doc);

    return out;
}

std::optional<ParsedFragment> FragmentParser::parse(const std::string& text, const std::string& fragment_name,
                                                    std::string& outError)
{
    json doc = json::parse(text, nullptr, false);
    if (doc.is_discarded())
    {
        outError = "invalid JSON";
        return std::nullopt;
    }

    auto classified = classify(doc, fragment_name);
    if (!classified)
    {
        outError = "unsupported fragment layout";
        return std::nullopt;
    }

    return normalize(*classified);
}

} // namespace dictionary
