#include "FileIO.hpp"

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace utils
{

bool WriteFileAtomic(const std::string& path, const std::string& content, std::string& outError)
{
    std::error_code ec;
    const fs::path target(path);
    if (target.has_parent_path())
    {
        fs::create_directories(target.parent_path(), ec);
        if (ec)
        {
            outError = "cannot create " + target.parent_path().string() + ": " + ec.message();
            return false;
        }
    }

    fs::path tmp = fs::path(path).concat(".tmp");
    bool written = false;
    {
        std::ofstream out(tmp, std::ios::trunc | std::ios::binary);
        if (!out.is_open())
        {
            outError = "cannot open " + tmp.string() + " for writing";
            return false;
        }
        out << content;
        out.flush();
        written = out.good();
    }
    if (!written)
    {
        outError = "write failed: " + tmp.string();
        fs::remove(tmp, ec);
        return false;
    }

    fs::rename(tmp, target, ec);
    if (ec)
    {
        outError = "cannot replace " + path + ": " + ec.message();
        std::error_code cleanup;
        fs::remove(tmp, cleanup);
        return false;
    }
    return true;
}

} // namespace utils
