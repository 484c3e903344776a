#pragma once

#include <string>

namespace utils
{

// Writes content to path + ".tmp" and renames it over path, creating parent
// directories first. On failure the target is untouched and no .tmp remains.
bool WriteFileAtomic(const std::string& path, const std::string& content, std::string& outError);

} // namespace utils
