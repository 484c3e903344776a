#include "Version.hpp"

#include <charconv>

namespace dictionary
{

std::string Version::toString() const
{
    return std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(patch);
}

std::optional<Version> Version::parse(std::string_view text)
{
    Version out;
    int* parts[] = { &out.major, &out.minor, &out.patch };

    const char* cursor = text.data();
    const char* end = text.data() + text.size();
    for (std::size_t i = 0; i < 3; ++i)
    {
        if (i > 0)
        {
            if (cursor == end || *cursor != '.')
                return std::nullopt;
            ++cursor;
        }
        // from_chars accepts neither a sign nor whitespace here, only digits.
        if (cursor == end || *cursor < '0' || *cursor > '9')
            return std::nullopt;
        auto [next, ec] = std::from_chars(cursor, end, *parts[i]);
        if (ec != std::errc())
            return std::nullopt;
        cursor = next;
    }

    if (cursor != end)
        return std::nullopt;
    return out;
}

} // namespace dictionary
