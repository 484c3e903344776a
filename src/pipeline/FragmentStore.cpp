#include "FragmentStore.hpp"
#include "LifecycleManifest.hpp"
#include "../processing/TextUtils.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace pipeline
{

const char* areaName(Area area)
{
    switch (area)
    {
    case Area::Pending:
        return "pending";
    case Area::Merged:
        return "merged";
    case Area::Deleted:
        return "deleted";
    }
    return "unknown";
}

FragmentStore::FragmentStore(StoreLayout layout, Mover mover)
    : layout_(std::move(layout))
    , mover_(mover ? std::move(mover)
                   : Mover([](const fs::path& from, const fs::path& to, std::error_code& ec) { fs::rename(from, to, ec); }))
{
}

bool FragmentStore::ensureLayout(std::string& outError) const
{
    for (auto area : { Area::Pending, Area::Merged, Area::Deleted })
    {
        std::error_code ec;
        fs::create_directories(directory(area), ec);
        if (ec)
        {
            outError = "cannot create " + std::string(areaName(area)) + " area " + directory(area) + ": " + ec.message();
            return false;
        }
    }
    return true;
}

std::vector<std::string> FragmentStore::list(Area area) const
{
    std::vector<std::string> names;
    std::error_code ec;
    fs::directory_iterator it(directory(area), ec);
    if (ec)
    {
        PLOG_WARNING << "[FragmentStore] Cannot list " << directory(area) << ": " << ec.message();
        return names;
    }

    for (const auto& entry : it)
    {
        if (!entry.is_regular_file(ec))
            continue;
        std::string name = entry.path().filename().string();
        if (name == LifecycleManifest::kFileName)
            continue;
        if (processing::endsWith(processing::toLowerAscii(name), ".json"))
            names.push_back(std::move(name));
    }

    std::sort(names.begin(), names.end());
    return names;
}

std::vector<dictionary::FragmentSource> FragmentStore::read(Area area, const std::vector<std::string>& names) const
{
    std::vector<dictionary::FragmentSource> sources;
    sources.reserve(names.size());
    for (const auto& name : names)
    {
        std::ifstream file(pathOf(area, name), std::ios::binary);
        if (!file.is_open())
        {
            utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Input, "Skipping unreadable fragment",
                                                pathOf(area, name));
            continue;
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        sources.push_back({ name, buffer.str() });
    }
    return sources;
}

bool FragmentStore::relocate(const std::vector<std::string>& names, Area from, Area to, std::string& outError) const
{
    if (from == to || names.empty())
        return true;

    std::error_code ec;
    fs::create_directories(directory(to), ec);
    if (ec)
    {
        outError = "cannot create " + directory(to) + ": " + ec.message();
        return false;
    }

    // Refuse up front rather than overwrite a fragment of an earlier run.
    for (const auto& name : names)
    {
        if (!fs::exists(pathOf(from, name), ec))
        {
            outError = "fragment missing from " + std::string(areaName(from)) + " area: " + name;
            return false;
        }
        if (fs::exists(pathOf(to, name), ec))
        {
            outError = "fragment already present in " + std::string(areaName(to)) + " area: " + name;
            return false;
        }
    }

    std::vector<std::string> moved;
    for (const auto& name : names)
    {
        mover_(pathOf(from, name), pathOf(to, name), ec);
        if (!ec)
        {
            moved.push_back(name);
            continue;
        }

        outError = "cannot move " + name + " to " + areaName(to) + ": " + ec.message();
        PLOG_ERROR << "[FragmentStore] " << outError << ", rolling back " << moved.size() << " file(s)";

        for (auto it = moved.rbegin(); it != moved.rend(); ++it)
        {
            std::error_code rollback_ec;
            mover_(pathOf(to, *it), pathOf(from, *it), rollback_ec);
            if (rollback_ec)
            {
                utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Consistency,
                                                  "Fragment rollback failed, manual repair needed",
                                                  *it + ": " + rollback_ec.message());
            }
        }
        return false;
    }

    PLOG_INFO << "[FragmentStore] Moved " << moved.size() << " file(s) " << areaName(from) << " -> " << areaName(to);
    return true;
}

const std::string& FragmentStore::directory(Area area) const
{
    switch (area)
    {
    case Area::Pending:
        return layout_.pending_dir;
    case Area::Merged:
        return layout_.merged_dir;
    case Area::Deleted:
        return layout_.deleted_dir;
    }
    return layout_.pending_dir;
}

std::string FragmentStore::pathOf(Area area, const std::string& name) const
{
    return (fs::path(directory(area)) / name).string();
}

std::string FragmentStore::manifestPath() const
{
    return pathOf(Area::Merged, LifecycleManifest::kFileName);
}

} // namespace pipeline
