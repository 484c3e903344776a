#pragma once

#include <compare>
#include <optional>
#include <string>
#include <string_view>

namespace dictionary
{

// Artifact version from metadata.version: exactly "major.minor.patch", no "v" prefix or suffix.
struct Version
{
    int major = 0;
    int minor = 0;
    int patch = 0;

    std::string toString() const;

    // Version to stamp on the next vocabulary expansion.
    Version nextMinor() const { return Version{ major, minor + 1, 0 }; }

    auto operator<=>(const Version&) const = default;

    static std::optional<Version> parse(std::string_view text);
};

} // namespace dictionary
