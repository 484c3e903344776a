#pragma once

#include <optional>
#include <string>

namespace pipeline
{

// Lifecycle of one fragment set.
//   Pending -> Merged -> QAPassed -> Deleted
//                     -> QAFailed -> Merged (re-run after remediation)
enum class LifecycleState
{
    Pending,
    Merged,
    QAPassed,
    QAFailed,
    Deleted
};

const char* toString(LifecycleState state);

std::optional<LifecycleState> lifecycleStateFromString(const std::string& text);

bool canTransition(LifecycleState from, LifecycleState to);

} // namespace pipeline
