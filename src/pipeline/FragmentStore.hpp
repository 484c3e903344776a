#pragma once

#include "../dictionary/TrancheMerger.hpp"

#include <filesystem>
#include <functional>
#include <string>
#include <system_error>
#include <vector>

namespace pipeline
{

enum class Area
{
    Pending,
    Merged,
    Deleted
};

const char* areaName(Area area);

struct StoreLayout
{
    std::string pending_dir;
    std::string merged_dir;
    std::string deleted_dir;
};

/**
 * @brief Directory-backed storage for fragment files.
 *
 * One directory per lifecycle area. relocate() is all-or-nothing: if any move
 * fails, files already moved are put back before it returns false.
 */
class FragmentStore
{
public:
    using Mover = std::function<void(const std::filesystem::path& from, const std::filesystem::path& to,
                                     std::error_code& ec)>;

    explicit FragmentStore(StoreLayout layout, Mover mover = {});

    bool ensureLayout(std::string& outError) const;

    // *.json file names directly inside the area, sorted. The manifest is never listed.
    std::vector<std::string> list(Area area) const;

    // Unreadable files are reported and left out of the result.
    std::vector<dictionary::FragmentSource> read(Area area, const std::vector<std::string>& names) const;

    bool relocate(const std::vector<std::string>& names, Area from, Area to, std::string& outError) const;

    const std::string& directory(Area area) const;
    std::string pathOf(Area area, const std::string& name) const;

    // lifecycle.json inside the merged area
    std::string manifestPath() const;

private:
    StoreLayout layout_;
    Mover mover_;
};

} // namespace pipeline
