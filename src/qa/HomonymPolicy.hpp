#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace reference
{
class ExclusionRegistry;
}

namespace qa
{

// Decides whether two english meanings may legitimately share one form.
class IHomonymPolicy
{
public:
    virtual ~IHomonymPolicy() = default;

    // Reason the pair may share a form, or nullopt when it is a real collision.
    virtual std::optional<std::string> justify(const std::string& english1, const std::string& english2) const = 0;

    bool isJustified(const std::string& english1, const std::string& english2) const
    {
        return justify(english1, english2).has_value();
    }
};

// Both words belong to one configured semantic group (case-insensitive).
class SemanticGroupPolicy : public IHomonymPolicy
{
public:
    using Groups = std::map<std::string, std::vector<std::string>>;

    explicit SemanticGroupPolicy(const Groups& groups = defaultGroups());

    std::optional<std::string> justify(const std::string& english1, const std::string& english2) const override;

    // kinship and body-part terms
    static Groups defaultGroups();

private:
    std::unordered_map<std::string, std::set<std::string>> membership_;
};

// Two keys that resolve to the same canonical exclusion term are one meaning
// spelled twice; anything else is delegated.
class ExclusionAwarePolicy : public IHomonymPolicy
{
public:
    ExclusionAwarePolicy(const IHomonymPolicy& fallback, const reference::ExclusionRegistry& registry);

    std::optional<std::string> justify(const std::string& english1, const std::string& english2) const override;

private:
    const IHomonymPolicy& fallback_;
    const reference::ExclusionRegistry& registry_;
};

} // namespace qa
