#include "ReportRetention.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <filesystem>
#include <functional>
#include <map>
#include <regex>
#include <vector>

namespace fs = std::filesystem;

namespace report
{

ReportRetention::ReportRetention(const std::string& reportsDir, std::size_t keepRecent)
    : reportsDir_(reportsDir)
    , keepRecent_(keepRecent)
{
}

std::string ReportRetention::recentDir() const { return (fs::path(reportsDir_) / "recent").string(); }

std::string ReportRetention::archiveDir() const { return (fs::path(reportsDir_) / "archive").string(); }

bool ReportRetention::ensureDirectories(std::string& outError) const
{
    std::error_code ec;
    fs::create_directories(recentDir(), ec);
    if (!ec)
        fs::create_directories(archiveDir(), ec);
    if (ec)
    {
        outError = "cannot create report directories under " + reportsDir_ + ": " + ec.message();
        return false;
    }
    return true;
}

bool ReportRetention::rotate(std::size_t& outArchived, std::string& outError) const
{
    static const std::regex kReportName(R"(^(?:qa-report|audit-report|audit-detailed)-(.+)\.(?:json|csv|txt)$)");

    outArchived = 0;
    try
    {
        if (!fs::exists(recentDir()))
            return true;

        // Timestamps sort lexicographically in chronological order.
        std::map<std::string, std::vector<fs::path>, std::greater<>> groups;
        for (const auto& entry : fs::directory_iterator(recentDir()))
        {
            if (!entry.is_regular_file())
                continue;
            std::smatch match;
            const std::string name = entry.path().filename().string();
            if (std::regex_match(name, match, kReportName))
                groups[match[1].str()].push_back(entry.path());
        }

        if (groups.size() <= keepRecent_)
            return true;

        fs::create_directories(archiveDir());

        std::size_t position = 0;
        for (const auto& [timestamp, files] : groups)
        {
            if (position++ < keepRecent_)
                continue;
            for (const auto& file : files)
            {
                std::error_code ec;
                fs::rename(file, fs::path(archiveDir()) / file.filename(), ec);
                if (ec)
                {
                    PLOG_WARNING << "[ReportRetention] Could not archive " << file.filename().string() << ": "
                                 << ec.message();
                    continue;
                }
                ++outArchived;
            }
        }

        if (outArchived > 0)
        {
            PLOG_INFO << "[ReportRetention] Archived " << outArchived << " report file(s), kept "
                      << std::min(keepRecent_, groups.size()) << " most recent set(s)";
        }
        return true;
    }
    catch (const fs::filesystem_error& e)
    {
        outError = std::string("Filesystem error: ") + e.what();
        return false;
    }
}

} // namespace report
