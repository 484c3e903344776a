#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace heuristics
{

enum class WordType
{
    Noun,
    Verb,
    Adjective,
    Other
};

const char* wordTypeName(WordType type);

struct WordTypeCounts
{
    std::size_t nouns = 0;
    std::size_t verbs = 0;
    std::size_t adjectives = 0;
    std::size_t other = 0;

    std::size_t total() const { return nouns + verbs + adjectives + other; }
};

// Buckets english keys by shape: -ing or "to " is a verb, multi-word or hyphenated
// is other, a common adjective or adjectival suffix is an adjective, else a noun.
class WordTypeClassifier
{
public:
    static WordType classify(const std::string& english);

    static WordTypeCounts count(const std::vector<std::string>& keys);
};

} // namespace heuristics
