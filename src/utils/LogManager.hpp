#pragma once

#include <string>
#include <vector>
#include <memory>
#include <plog/Severity.h>

namespace plog
{
class IAppender;
}

namespace utils
{

// Log files written by a run. Run goes to plog instance 0 and the console;
// Pipeline is the stage trace on processing::Diagnostics::kLogInstance.
enum class LogChannel
{
    Run,
    Pipeline
};

class LogManager
{
public:
    // Values of the [logging] table.
    struct Settings
    {
        bool append = true;
        plog::Severity level = plog::info;
        std::string directory = "logs";
        size_t max_file_size = 10 * 1024 * 1024;
        size_t backup_count = 3;
        bool console = true;
    };

    // Reads [logging] from config_path (a missing file keeps defaults) and creates the log directory.
    static bool Initialize(const std::string& config_path = "lexgate.toml");

    static bool OpenChannel(LogChannel channel);

    // Lowers the severity threshold of every open channel, e.g. for --verbose.
    static void RaiseVerbosity(plog::Severity level);

    static void Shutdown();

    static const Settings& CurrentSettings();
    static std::string ChannelPath(LogChannel channel);

private:
    LogManager() = default;

    template <int InstanceId>
    static bool attach(const std::string& filepath, bool with_console);

    static bool readSettings(const std::string& config_path);
    static void prepareDirectory();

    static bool s_initialized;
    static Settings s_settings;
    static std::vector<LogChannel> s_open;
    static std::vector<std::unique_ptr<plog::IAppender>> s_appenders;
};

} // namespace utils
