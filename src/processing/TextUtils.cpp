#include "TextUtils.hpp"
#include <utf8proc.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace processing
{

namespace
{

std::string mapWithOptions(const std::string& utf8, int options)
{
    if (utf8.empty())
        return utf8;

    utf8proc_uint8_t* mapped = nullptr;
    utf8proc_ssize_t len = utf8proc_map(reinterpret_cast<const utf8proc_uint8_t*>(utf8.data()),
                                        static_cast<utf8proc_ssize_t>(utf8.size()), &mapped,
                                        static_cast<utf8proc_option_t>(options));
    if (len < 0 || !mapped)
        return utf8;

    std::string out(reinterpret_cast<char*>(mapped), static_cast<std::size_t>(len));
    std::free(mapped);
    return out;
}

bool isAsciiLetter(char c)
{
    return std::isalpha(static_cast<unsigned char>(c)) != 0;
}

} // namespace

std::size_t codepointLength(std::string_view utf8)
{
    const auto* str = reinterpret_cast<const utf8proc_uint8_t*>(utf8.data());
    const auto len = static_cast<utf8proc_ssize_t>(utf8.size());

    std::size_t count = 0;
    utf8proc_ssize_t pos = 0;
    while (pos < len)
    {
        utf8proc_int32_t codepoint;
        utf8proc_ssize_t bytes = utf8proc_iterate(str + pos, len - pos, &codepoint);
        pos += bytes > 0 ? bytes : 1;
        ++count;
    }
    return count;
}

std::string toLowerAscii(std::string_view text)
{
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : static_cast<char>(c);
    });
    return out;
}

std::string trim(std::string_view text)
{
    const char* ws = " \t\r\n\f\v";
    auto begin = text.find_first_not_of(ws);
    if (begin == std::string_view::npos)
        return {};
    auto end = text.find_last_not_of(ws);
    return std::string(text.substr(begin, end - begin + 1));
}

bool startsWith(std::string_view text, std::string_view prefix)
{
    return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

bool endsWith(std::string_view text, std::string_view suffix)
{
    return text.size() >= suffix.size() && text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool endsWithAny(std::string_view text, std::initializer_list<std::string_view> suffixes)
{
    return std::any_of(suffixes.begin(), suffixes.end(),
                       [text](std::string_view s) { return endsWith(text, s); });
}

bool containsAny(std::string_view text, std::initializer_list<std::string_view> needles)
{
    return std::any_of(needles.begin(), needles.end(),
                       [text](std::string_view n) { return text.find(n) != std::string_view::npos; });
}

bool containsWord(std::string_view text, std::string_view word)
{
    if (word.empty())
        return false;

    std::size_t pos = text.find(word);
    while (pos != std::string_view::npos)
    {
        bool left_ok = pos == 0 || !isAsciiLetter(text[pos - 1]);
        std::size_t after = pos + word.size();
        bool right_ok = after >= text.size() || !isAsciiLetter(text[after]);
        if (left_ok && right_ok)
            return true;
        pos = text.find(word, pos + 1);
    }
    return false;
}

std::string caseFold(const std::string& utf8)
{
    return mapWithOptions(utf8, UTF8PROC_STABLE | UTF8PROC_COMPOSE | UTF8PROC_CASEFOLD);
}

std::string stripDiacritics(const std::string& utf8)
{
    return mapWithOptions(utf8, UTF8PROC_STABLE | UTF8PROC_COMPOSE | UTF8PROC_STRIPMARK);
}

std::string unifyDashes(const std::string& utf8)
{
    static constexpr std::string_view kEnDash = "\xE2\x80\x93";
    static constexpr std::string_view kEmDash = "\xE2\x80\x94";

    std::string out;
    out.reserve(utf8.size());
    std::string_view rest(utf8);
    while (!rest.empty())
    {
        if (startsWith(rest, kEnDash) || startsWith(rest, kEmDash))
        {
            out.push_back('-');
            rest.remove_prefix(3);
        }
        else
        {
            out.push_back(rest.front());
            rest.remove_prefix(1);
        }
    }
    return out;
}

} // namespace processing
