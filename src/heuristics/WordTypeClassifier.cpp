#include "WordTypeClassifier.hpp"
#include "../processing/TextUtils.hpp"

#include <string_view>
#include <unordered_set>

namespace heuristics
{

namespace
{

const std::unordered_set<std::string_view>& commonAdjectives()
{
    static const std::unordered_set<std::string_view> words = {
        "good", "bad", "big", "small", "old", "new", "young", "long", "short", "high",
        "low", "great", "little", "hot", "cold", "warm", "dark", "light", "strong", "weak",
        "fast", "slow", "happy", "sad", "true", "false", "rich", "poor", "holy", "wise",
        "brave", "free", "full", "empty", "deep", "wide", "red", "green", "blue", "white",
        "black", "bright", "quiet", "loud", "sweet", "bitter", "clean", "dirty", "hard", "soft"
    };
    return words;
}

} // namespace

const char* wordTypeName(WordType type)
{
    switch (type)
    {
    case WordType::Noun:
        return "noun";
    case WordType::Verb:
        return "verb";
    case WordType::Adjective:
        return "adjective";
    case WordType::Other:
        return "other";
    }
    return "other";
}

WordType WordTypeClassifier::classify(const std::string& english)
{
    const std::string key = processing::toLowerAscii(processing::trim(english));

    if (processing::endsWith(key, "ing") || processing::startsWith(key, "to "))
        return WordType::Verb;

    if (key.find(' ') != std::string::npos || key.find('-') != std::string::npos)
        return WordType::Other;

    if (commonAdjectives().count(key) > 0)
        return WordType::Adjective;

    if (processing::endsWithAny(key, { "ous", "ful", "ive", "able", "ible", "less", "ish", "ic", "ical" }))
        return WordType::Adjective;

    return WordType::Noun;
}

WordTypeCounts WordTypeClassifier::count(const std::vector<std::string>& keys)
{
    WordTypeCounts counts;
    for (const auto& key : keys)
    {
        switch (classify(key))
        {
        case WordType::Noun:
            ++counts.nouns;
            break;
        case WordType::Verb:
            ++counts.verbs;
            break;
        case WordType::Adjective:
            ++counts.adjectives;
            break;
        case WordType::Other:
            ++counts.other;
            break;
        }
    }
    return counts;
}

} // namespace heuristics
