#include "RunLock.hpp"

#include <plog/Log.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <system_error>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace pipeline
{

RunLock::RunLock(int fd, std::string path)
    : fd_(fd)
    , path_(std::move(path))
{
}

RunLock::~RunLock()
{
    if (fd_ >= 0)
    {
        ::flock(fd_, LOCK_UN);
        ::close(fd_);
    }
}

std::unique_ptr<RunLock> RunLock::Acquire(const std::string& lock_path, std::string& outError)
{
    std::error_code ec;
    auto parent = std::filesystem::path(lock_path).parent_path();
    if (!parent.empty())
        std::filesystem::create_directories(parent, ec);

    int fd = ::open(lock_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0)
    {
        outError = "cannot open lock file " + lock_path + ": " + std::strerror(errno);
        return nullptr;
    }

    if (::flock(fd, LOCK_EX | LOCK_NB) != 0)
    {
        const int err = errno;
        ::close(fd);
        outError = err == EWOULDBLOCK ? "another run holds " + lock_path
                                      : "cannot lock " + lock_path + ": " + std::strerror(err);
        PLOG_WARNING << "[RunLock] " << outError;
        return nullptr;
    }

    PLOG_DEBUG << "[RunLock] Acquired " << lock_path;
    return std::unique_ptr<RunLock>(new RunLock(fd, lock_path));
}

} // namespace pipeline
