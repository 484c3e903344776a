#include "LifecycleState.hpp"

namespace pipeline
{

const char* toString(LifecycleState state)
{
    switch (state)
    {
    case LifecycleState::Pending:
        return "Pending";
    case LifecycleState::Merged:
        return "Merged";
    case LifecycleState::QAPassed:
        return "QAPassed";
    case LifecycleState::QAFailed:
        return "QAFailed";
    case LifecycleState::Deleted:
        return "Deleted";
    }
    return "Unknown";
}

std::optional<LifecycleState> lifecycleStateFromString(const std::string& text)
{
    for (auto state : { LifecycleState::Pending, LifecycleState::Merged, LifecycleState::QAPassed,
                        LifecycleState::QAFailed, LifecycleState::Deleted })
    {
        if (text == toString(state))
            return state;
    }
    return std::nullopt;
}

bool canTransition(LifecycleState from, LifecycleState to)
{
    switch (from)
    {
    case LifecycleState::Pending:
        return to == LifecycleState::Merged;
    case LifecycleState::Merged:
        return to == LifecycleState::QAPassed || to == LifecycleState::QAFailed;
    case LifecycleState::QAPassed:
        return to == LifecycleState::Deleted;
    case LifecycleState::QAFailed:
        return to == LifecycleState::Merged;
    case LifecycleState::Deleted:
        return false;
    }
    return false;
}

} // namespace pipeline
