#include "LifecycleManifest.hpp"
#include "../utils/FileIO.hpp"

#include <plog/Log.h>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace pipeline
{

LifecycleManifest::LifecycleManifest(std::string runId, std::vector<std::string> fragments)
    : run_id_(std::move(runId))
    , fragments_(std::move(fragments))
{
}

bool LifecycleManifest::transition(LifecycleState to, const std::string& at, const std::string& note,
                                   std::string& outError)
{
    if (!canTransition(state_, to))
    {
        outError = std::string("illegal lifecycle transition ") + toString(state_) + " -> " + toString(to);
        PLOG_ERROR << "[LifecycleManifest] " << outError << " (run " << run_id_ << ")";
        return false;
    }

    history_.push_back({ state_, to, at, note });
    PLOG_INFO << "[LifecycleManifest] " << run_id_ << ": " << toString(state_) << " -> " << toString(to);
    state_ = to;
    return true;
}

json LifecycleManifest::toJson() const
{
    json history = json::array();
    for (const auto& step : history_)
    {
        history.push_back({ { "from", toString(step.from) },
                            { "to", toString(step.to) },
                            { "at", step.at },
                            { "note", step.note } });
    }

    json doc;
    doc["run_id"] = run_id_;
    doc["state"] = toString(state_);
    doc["fragments"] = fragments_;
    doc["history"] = std::move(history);
    return doc;
}

std::optional<LifecycleManifest> LifecycleManifest::fromJson(const json& doc, std::string& outError)
{
    if (!doc.is_object())
    {
        outError = "manifest must be a JSON object";
        return std::nullopt;
    }

    auto state = lifecycleStateFromString(doc.value("state", std::string{}));
    if (!state)
    {
        outError = "manifest has an unknown state";
        return std::nullopt;
    }

    LifecycleManifest manifest;
    manifest.run_id_ = doc.value("run_id", std::string{});
    manifest.state_ = *state;

    if (auto fragments = doc.find("fragments"); fragments != doc.end() && fragments->is_array())
    {
        for (const auto& name : *fragments)
        {
            if (name.is_string())
                manifest.fragments_.push_back(name.get<std::string>());
        }
    }

    if (auto history = doc.find("history"); history != doc.end() && history->is_array())
    {
        for (const auto& step : *history)
        {
            if (!step.is_object())
                continue;
            auto from = lifecycleStateFromString(step.value("from", std::string{}));
            auto to = lifecycleStateFromString(step.value("to", std::string{}));
            if (!from || !to)
            {
                outError = "manifest history has an unknown state";
                return std::nullopt;
            }
            manifest.history_.push_back({ *from, *to, step.value("at", std::string{}), step.value("note", std::string{}) });
        }
    }

    return manifest;
}

bool LifecycleManifest::save(const std::string& path, std::string& outError) const
{
    return utils::WriteFileAtomic(path, toJson().dump(2), outError);
}

std::optional<LifecycleManifest> LifecycleManifest::load(const std::string& path, std::string& outError)
{
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open())
    {
        outError = "cannot open " + path;
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    json doc = json::parse(buffer.str(), nullptr, false);
    if (doc.is_discarded())
    {
        outError = "invalid JSON in " + path;
        return std::nullopt;
    }
    return fromJson(doc, outError);
}

} // namespace pipeline
