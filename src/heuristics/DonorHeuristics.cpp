#include "DonorHeuristics.hpp"
#include "../processing/TextUtils.hpp"

#include <array>
#include <string_view>

using processing::containsAny;
using processing::containsWord;
using processing::endsWithAny;
using processing::toLowerAscii;

namespace heuristics
{

namespace
{

constexpr std::array<std::string_view, 7> kHungarianVowels = { "á", "é", "í", "ó", "ú", "ő", "ű" };
constexpr std::array<std::string_view, 8> kHungarianDigraphs = { "cs", "dz", "gy", "ly", "ny", "sz", "ty", "zs" };

bool isAsciiLetter(char c)
{
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

bool hasHungarianVowel(std::string_view text)
{
    for (auto vowel : kHungarianVowels)
    {
        if (text.find(vowel) != std::string_view::npos)
            return true;
    }
    return false;
}

} // namespace

bool hasDonorLanguageRoot(const std::optional<std::string>& notes)
{
    if (!notes || notes->empty())
        return false;

    const std::string lower = toLowerAscii(*notes);
    if (containsAny(lower, { "latin", "hungarian", "romanian", "icelandic" }))
        return true;

    for (std::string_view code : { "lat", "hu", "ro", "is" })
    {
        if (containsWord(lower, code))
            return true;
    }
    return false;
}

bool hasObviousDonorLanguage(const std::string& ancient, const std::string& modern)
{
    if (hasLatinEnding(ancient))
        return true;

    for (auto vowel : kHungarianVowels)
    {
        if (processing::endsWith(modern, vowel))
            return true;
    }
    return false;
}

bool isCulturallyGrounded(const std::optional<std::string>& notes)
{
    if (!notes || notes->empty())
        return false;
    return containsAny(toLowerAscii(*notes), { "cultural", "traditional", "ceremonial", "religious", "mythical" });
}

bool hasLatinEnding(const std::string& form)
{
    return endsWithAny(toLowerAscii(form), { "us", "um", "ae", "is" });
}

bool hasHungarianFeatures(const std::string& form)
{
    if (hasHungarianVowel(form))
        return true;

    const std::string lower = toLowerAscii(form);
    for (auto digraph : kHungarianDigraphs)
    {
        if (lower.find(digraph) != std::string::npos)
            return true;
    }
    return false;
}

bool claimsLatin(const std::string& notes)
{
    const std::string lower = toLowerAscii(notes);
    return lower.find("latin") != std::string::npos || containsWord(lower, "lat");
}

bool claimsHungarian(const std::string& notes)
{
    const std::string lower = toLowerAscii(notes);
    return lower.find("hungarian") != std::string::npos || containsWord(lower, "hu");
}

bool isEnglishLikeModern(const std::string& modern)
{
    if (modern.size() < 3)
        return false;

    for (char c : modern)
    {
        if (!isAsciiLetter(c))
            return false;
    }
    // At least one letter must precede the suffix.
    return endsWithAny(toLowerAscii(modern), { "or", "on", "um" });
}

bool isEnglishPlusSuffix(const std::string& english, const std::string& ancient)
{
    if (english.empty() || ancient.empty())
        return false;

    const std::string lowerAncient = toLowerAscii(ancient);
    return endsWithAny(lowerAncient, { "or", "on", "um", "us" }) &&
           lowerAncient.find(toLowerAscii(english)) != std::string::npos;
}

} // namespace heuristics
