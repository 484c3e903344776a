#pragma once

#include <optional>
#include <string>

namespace heuristics
{

// Lexical signals about donor languages (Latin, Hungarian, Romanian, Icelandic).
// All checks operate on surface forms and free-text notes; none consult a lexicon.

// Notes name a donor language: a full name anywhere, or lat/hu/ro/is as a whole word.
bool hasDonorLanguageRoot(const std::optional<std::string>& notes);

// Ancient ends in -us/-um/-ae/-is, or modern ends in an acute or double-acute vowel.
bool hasObviousDonorLanguage(const std::string& ancient, const std::string& modern);

// Notes mention cultural, traditional, ceremonial, religious or mythical context.
bool isCulturallyGrounded(const std::optional<std::string>& notes);

bool hasLatinEnding(const std::string& form);

// Acute/double-acute vowels or one of the digraphs cs dz gy ly ny sz ty zs.
bool hasHungarianFeatures(const std::string& form);

bool claimsLatin(const std::string& notes);
bool claimsHungarian(const std::string& notes);

// ASCII letters followed by -or, -on or -um, e.g. "leaderor".
bool isEnglishLikeModern(const std::string& modern);

// Ancient contains the english key and ends in one of the Latin-looking suffixes.
bool isEnglishPlusSuffix(const std::string& english, const std::string& ancient);

} // namespace heuristics
