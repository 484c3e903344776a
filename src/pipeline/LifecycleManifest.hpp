#pragma once

#include "LifecycleState.hpp"

#include <nlohmann/json_fwd.hpp>

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace pipeline
{

struct StateTransition
{
    LifecycleState from = LifecycleState::Pending;
    LifecycleState to = LifecycleState::Pending;
    std::string at; // ISO-8601 UTC
    std::string note;
};

/**
 * @brief Persistent lifecycle record of one fragment set (lifecycle.json).
 *
 * Every state change goes through transition(), which rejects moves the
 * lifecycle does not allow and appends to the history.
 */
class LifecycleManifest
{
public:
    static constexpr const char* kFileName = "lifecycle.json";

    LifecycleManifest() = default;
    LifecycleManifest(std::string runId, std::vector<std::string> fragments);

    bool transition(LifecycleState to, const std::string& at, const std::string& note, std::string& outError);

    LifecycleState state() const { return state_; }
    const std::string& runId() const { return run_id_; }
    const std::vector<std::string>& fragments() const { return fragments_; }
    const std::vector<StateTransition>& history() const { return history_; }

    void setFragments(std::vector<std::string> fragments) { fragments_ = std::move(fragments); }
    void setRunId(std::string runId) { run_id_ = std::move(runId); }

    nlohmann::json toJson() const;
    static std::optional<LifecycleManifest> fromJson(const nlohmann::json& doc, std::string& outError);

    bool save(const std::string& path, std::string& outError) const;
    static std::optional<LifecycleManifest> load(const std::string& path, std::string& outError);

private:
    std::string run_id_;
    LifecycleState state_ = LifecycleState::Pending;
    std::vector<std::string> fragments_;
    std::vector<StateTransition> history_;
};

} // namespace pipeline
