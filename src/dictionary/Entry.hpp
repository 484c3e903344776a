#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace dictionary
{

// Grammatical sub-forms of one variant, e.g. {"singular": "domus", "plural": "domūs"}
using FormMap = std::map<std::string, std::string>;

// A variant rendering: absent, a plain string, or a structured map of sub-forms.
using Form = std::variant<std::monostate, std::string, FormMap>;

// Representative string of a form. For a FormMap this is the first present key among
// base, lemma, singular, nominative, infinitive, else the first key in order.
std::string surfaceOf(const Form& form);

bool isPresent(const Form& form);

struct Entry
{
    std::string english;
    Form ancient;
    Form modern;
    std::optional<std::string> notes;

    std::string ancientSurface() const { return surfaceOf(ancient); }
    std::string modernSurface() const { return surfaceOf(modern); }

    bool hasNotes() const { return notes.has_value() && !notes->empty(); }

    bool operator==(const Entry& other) const = default;
};

struct FragmentStats
{
    std::string filename;
    std::size_t entries = 0;            // records read from the fragment
    std::size_t duplicates_removed = 0; // records dropped because the key was already taken
    std::size_t rejected = 0;           // records without a usable english key

    bool operator==(const FragmentStats& other) const = default;
};

struct Metadata
{
    std::string version;
    std::string created_on;
    std::optional<std::vector<std::string>> files_included;
    std::optional<std::size_t> total_entries;
    std::size_t duplicates_removed = 0;
    std::vector<std::string> processing_notes;
    std::string project;
    std::string source_directory;
    std::vector<FragmentStats> files;

    bool operator==(const Metadata& other) const = default;
};

// Snapshot produced by one merge. Consumers receive it by const reference.
struct UnifiedDictionary
{
    Metadata metadata;
    std::vector<Entry> entries;

    bool operator==(const UnifiedDictionary& other) const = default;
};

nlohmann::json formToJson(const Form& form);
nlohmann::json entryToJson(const Entry& entry);

// Returns std::nullopt (with reason) when the record has no non-empty string "english".
// Forms of unsupported JSON types are treated as absent.
std::optional<Entry> entryFromJson(const nlohmann::json& record, std::string& outReason);

// Entries whose english, ancient or modern surface contains `query` (case-folded), in order.
std::vector<const Entry*> findEntries(const UnifiedDictionary& dictionary, const std::string& query,
                                      std::size_t limit = 10);

} // namespace dictionary
