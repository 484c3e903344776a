#include "HomonymPolicy.hpp"
#include "../processing/TextUtils.hpp"
#include "../reference/ExclusionRegistry.hpp"

namespace qa
{

SemanticGroupPolicy::SemanticGroupPolicy(const Groups& groups)
{
    for (const auto& [group, words] : groups)
    {
        for (const auto& word : words)
            membership_[processing::toLowerAscii(word)].insert(group);
    }
}

std::optional<std::string> SemanticGroupPolicy::justify(const std::string& english1,
                                                        const std::string& english2) const
{
    auto first = membership_.find(processing::toLowerAscii(english1));
    auto second = membership_.find(processing::toLowerAscii(english2));
    if (first == membership_.end() || second == membership_.end())
        return std::nullopt;

    for (const auto& group : first->second)
    {
        if (second->second.count(group) > 0)
            return "Homonym group " + group;
    }
    return std::nullopt;
}

SemanticGroupPolicy::Groups SemanticGroupPolicy::defaultGroups()
{
    return {
        { "kinship", { "brother", "sister", "father", "mother", "son", "daughter" } },
        { "body", { "hand", "foot", "eye", "ear", "mouth" } },
    };
}

ExclusionAwarePolicy::ExclusionAwarePolicy(const IHomonymPolicy& fallback,
                                           const reference::ExclusionRegistry& registry)
    : fallback_(fallback)
    , registry_(registry)
{
}

std::optional<std::string> ExclusionAwarePolicy::justify(const std::string& english1,
                                                         const std::string& english2) const
{
    auto first = registry_.isExcluded(english1);
    if (first)
    {
        auto second = registry_.isExcluded(english2);
        if (second && second->entry_index == first->entry_index)
            return first->describe() + "; " + second->describe();
    }
    return fallback_.justify(english1, english2);
}

} // namespace qa
