#pragma once

#include <memory>
#include <string>

namespace pipeline
{

// Exclusive advisory lock serializing runs over one fragment source.
// Released when the guard is destroyed.
class RunLock
{
public:
    // nullptr if another run holds the lock or the lock file cannot be opened.
    static std::unique_ptr<RunLock> Acquire(const std::string& lock_path, std::string& outError);
    ~RunLock();

    RunLock(const RunLock&) = delete;
    RunLock& operator=(const RunLock&) = delete;

    const std::string& path() const { return path_; }

private:
    RunLock(int fd, std::string path);

    int fd_ = -1;
    std::string path_;
};

} // namespace pipeline
