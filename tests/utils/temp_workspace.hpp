#pragma once

#include "dictionary/Entry.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace test_utils {

// Scratch directory under the system temp dir, removed with everything in it on destruction.
class TempWorkspace {
public:
    explicit TempWorkspace(const std::string& tag = "lexgate")
    {
        static std::atomic<int> counter{0};
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        root_ = std::filesystem::temp_directory_path() /
                (tag + "-" + std::to_string(stamp) + "-" + std::to_string(counter++));
        std::filesystem::create_directories(root_);
    }

    ~TempWorkspace()
    {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    TempWorkspace(const TempWorkspace&) = delete;
    TempWorkspace& operator=(const TempWorkspace&) = delete;

    const std::filesystem::path& root() const { return root_; }

    std::string path(const std::string& relative) const { return (root_ / relative).string(); }

    std::string write(const std::string& relative, const std::string& content) const
    {
        const auto full = root_ / relative;
        std::filesystem::create_directories(full.parent_path());
        std::ofstream out(full, std::ios::binary | std::ios::trunc);
        out << content;
        return full.string();
    }

    std::string read(const std::string& relative) const
    {
        std::ifstream in(root_ / relative, std::ios::binary);
        std::stringstream buffer;
        buffer << in.rdbuf();
        return buffer.str();
    }

    bool exists(const std::string& relative) const { return std::filesystem::exists(root_ / relative); }

private:
    std::filesystem::path root_;
};

inline dictionary::Entry makeEntry(const std::string& english, const std::string& ancient, const std::string& modern,
                                   std::optional<std::string> notes = std::nullopt)
{
    dictionary::Entry entry;
    entry.english = english;
    if (!ancient.empty())
        entry.ancient = ancient;
    if (!modern.empty())
        entry.modern = modern;
    entry.notes = std::move(notes);
    return entry;
}

// A snapshot with the metadata a fresh merge would produce.
inline dictionary::UnifiedDictionary makeDictionary(std::vector<dictionary::Entry> entries)
{
    dictionary::UnifiedDictionary dict;
    dict.metadata.version = "1.0.0";
    dict.metadata.created_on = "2025-09-23T01:42:19.197Z";
    dict.metadata.files_included = std::vector<std::string>{"tranche-01.json"};
    dict.metadata.total_entries = entries.size();
    dict.entries = std::move(entries);
    return dict;
}

} // namespace test_utils
