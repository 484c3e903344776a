#pragma once

#include <atomic>
#include <cstddef>
#include <string>
#include <string_view>

namespace processing
{

// Knobs for the pipeline trace log. Filled from [logging] and the --verbose flag.
struct TraceSettings
{
    bool verbose = false;
    std::size_t preview_bytes = 80;
};

// Process-wide state behind the stage trace (plog instance kLogInstance).
class Diagnostics
{
public:
    static constexpr int kLogInstance = 1;

    static void Configure(const TraceSettings& settings) noexcept;
    static TraceSettings Current() noexcept;

    static bool IsVerbose() noexcept;

    // Single-line, length-limited rendering of entry text (notes, forms) for log lines.
    static std::string Preview(std::string_view text);

    // Swaps in settings for a scope and puts the previous ones back on exit.
    class ScopedSettings
    {
    public:
        explicit ScopedSettings(const TraceSettings& settings) noexcept
            : saved_(Current())
        {
            Configure(settings);
        }
        ~ScopedSettings() { Configure(saved_); }

        ScopedSettings(const ScopedSettings&) = delete;
        ScopedSettings& operator=(const ScopedSettings&) = delete;

    private:
        TraceSettings saved_;
    };

private:
    static void maskControlBytes(std::string& text);

    static std::atomic<bool> verbose_;
    static std::atomic<std::size_t> preview_bytes_;
};

} // namespace processing
