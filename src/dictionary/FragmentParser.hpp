#pragma once

#include "Entry.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace dictionary
{

enum class FragmentShape
{
    EntryList,  // [ {english, ancient, modern, notes}, ... ]
    Sectioned,  // { sections: { name: { data: [...], files: [ { data: [...] } ] } } }
    DataObject, // { data: [...] }
    FlatMap     // { english: "form" | {ancient, modern, notes} }
};

const char* shapeName(FragmentShape shape);

// Borrowed views over an already-parsed document, one per supported shape.
struct EntryListDoc
{
    const nlohmann::json* records;
};

struct SectionedDoc
{
    const nlohmann::json* sections;
};

struct DataObjectDoc
{
    const nlohmann::json* records;
};

struct FlatMapDoc
{
    const nlohmann::json* mapping;
    const char* string_variant; // "ancient" or "modern"
};

using FragmentDocument = std::variant<EntryListDoc, SectionedDoc, DataObjectDoc, FlatMapDoc>;

struct ParsedFragment
{
    FragmentShape shape = FragmentShape::EntryList;
    std::vector<Entry> entries;
    std::size_t rejected = 0;
    std::vector<std::string> rejection_reasons;
};

/**
 * @brief Single normalization point for every fragment layout.
 *
 * classify() tags the document once; normalize() visits the tag and yields the
 * canonical Entry list. No other component inspects raw fragment JSON.
 */
class FragmentParser
{
public:
    // Returns std::nullopt when the document matches no supported shape.
    static std::optional<FragmentDocument> classify(const nlohmann::json& doc, const std::string& fragment_name);

    static ParsedFragment normalize(const FragmentDocument& doc);

    // Parse raw text and normalize. Fails on invalid JSON or an unsupported shape.
    static std::optional<ParsedFragment> parse(const std::string& text, const std::string& fragment_name,
                                               std::string& outError);
};

} // namespace dictionary
