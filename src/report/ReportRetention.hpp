#pragma once

#include <cstddef>
#include <string>

namespace report
{

/**
 * @brief Keeps <reports_dir>/recent bounded.
 *
 * Report files are grouped by the timestamp in their name; every group beyond
 * the newest `keep_recent` is moved into <reports_dir>/archive.
 */
class ReportRetention
{
public:
    ReportRetention(const std::string& reportsDir, std::size_t keepRecent);

    std::string recentDir() const;
    std::string archiveDir() const;

    bool ensureDirectories(std::string& outError) const;

    // Moves stale report sets into the archive; outArchived counts moved files.
    bool rotate(std::size_t& outArchived, std::string& outError) const;

private:
    std::string reportsDir_;
    std::size_t keepRecent_;
};

} // namespace report
