#pragma once

#include <string>

namespace processing
{

// Comparison key derivation for dictionary terms (exclusion aliases, baseline keys).
class ITermNormalizer
{
public:
    virtual ~ITermNormalizer() = default;

    // Returns the key used for equality comparison. Identity when no option is enabled.
    [[nodiscard]] virtual std::string normalize(const std::string& term) const = 0;

    // True if normalize() can differ from its input.
    [[nodiscard]] virtual bool isActive() const = 0;
};

} // namespace processing
