#pragma once

#include <cstddef>
#include <initializer_list>
#include <string>
#include <string_view>

namespace processing
{

/// Number of Unicode code points in a UTF-8 string (invalid bytes count as one each)
std::size_t codepointLength(std::string_view utf8);

/// ASCII-only lower casing; multi-byte sequences pass through untouched
std::string toLowerAscii(std::string_view text);

/// Strip leading and trailing ASCII whitespace
std::string trim(std::string_view text);

bool startsWith(std::string_view text, std::string_view prefix);
bool endsWith(std::string_view text, std::string_view suffix);
bool endsWithAny(std::string_view text, std::initializer_list<std::string_view> suffixes);
bool containsAny(std::string_view text, std::initializer_list<std::string_view> needles);

/// True if `word` occurs in `text` delimited by non-letters (ASCII letters only)
bool containsWord(std::string_view text, std::string_view word);

/// Unicode case folding via utf8proc; returns input unchanged on invalid UTF-8
std::string caseFold(const std::string& utf8);

/// Remove combining marks after canonical decomposition (é -> e, ő -> o)
std::string stripDiacritics(const std::string& utf8);

/// Map en dash and em dash to ASCII hyphen-minus
std::string unifyDashes(const std::string& utf8);

} // namespace processing
