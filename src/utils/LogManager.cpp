#include "LogManager.hpp"
#include "ErrorReporter.hpp"
#include "../processing/Diagnostics.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>

#include <plog/Log.h>
#include <plog/Init.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <toml++/toml.h>

namespace utils
{

bool LogManager::s_initialized = false;
LogManager::Settings LogManager::s_settings;
std::vector<LogChannel> LogManager::s_open;
std::vector<std::unique_ptr<plog::IAppender>> LogManager::s_appenders;

namespace
{

const char* channelFile(LogChannel channel)
{
    return channel == LogChannel::Run ? "run.log" : "pipeline.log";
}

} // namespace

bool LogManager::Initialize(const std::string& config_path)
{
    if (s_initialized)
        return true;

    s_settings = Settings{};
    if (!readSettings(config_path))
        return false;

    prepareDirectory();
    s_initialized = true;
    return true;
}

bool LogManager::OpenChannel(LogChannel channel)
{
    if (!s_initialized)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "LogManager not initialized before opening a log",
                                   channelFile(channel));
        return false;
    }
    if (std::find(s_open.begin(), s_open.end(), channel) != s_open.end())
        return true;

    const std::string path = ChannelPath(channel);
    const bool ok = channel == LogChannel::Run
                        ? attach<0>(path, s_settings.console)
                        : attach<processing::Diagnostics::kLogInstance>(path, false);
    if (ok)
        s_open.push_back(channel);
    return ok;
}

template <int InstanceId>
bool LogManager::attach(const std::string& filepath, bool with_console)
{
    try
    {
        if (!s_settings.append)
            std::ofstream(filepath, std::ios::trunc).close();

        auto file_appender = std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(
            filepath.c_str(), s_settings.max_file_size, static_cast<int>(s_settings.backup_count));
        plog::init<InstanceId>(s_settings.level, file_appender.get());
        s_appenders.push_back(std::move(file_appender));

        if (with_console)
        {
            auto console_appender = std::make_unique<plog::ConsoleAppender<plog::TxtFormatter>>();
            if (auto logger = plog::get<InstanceId>())
            {
                logger->addAppender(console_appender.get());
                s_appenders.push_back(std::move(console_appender));
            }
        }
        return true;
    }
    catch (const std::exception& ex)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Failed to open log file: " + filepath, ex.what());
        return false;
    }
}

void LogManager::RaiseVerbosity(plog::Severity level)
{
    if (level <= s_settings.level)
        return;
    s_settings.level = level;
    if (auto run = plog::get<0>())
        run->setMaxSeverity(level);
    if (auto pipeline = plog::get<processing::Diagnostics::kLogInstance>())
        pipeline->setMaxSeverity(level);
}

void LogManager::Shutdown()
{
    s_appenders.clear();
    s_open.clear();
    s_initialized = false;
}

const LogManager::Settings& LogManager::CurrentSettings() { return s_settings; }

std::string LogManager::ChannelPath(LogChannel channel)
{
    return (std::filesystem::path(s_settings.directory) / channelFile(channel)).string();
}

void LogManager::prepareDirectory()
{
    std::error_code ec;
    std::filesystem::create_directories(s_settings.directory, ec);
    if (ec)
    {
        ErrorReporter::ReportWarning(ErrorCategory::Initialization, "Unable to prepare log directory",
                                     s_settings.directory + ": " + ec.message());
    }
}

bool LogManager::readSettings(const std::string& config_path)
{
    std::error_code ec;
    if (!std::filesystem::exists(config_path, ec))
        return true;

    try
    {
        auto cfg = toml::parse_file(config_path);
        auto logging = cfg["logging"].as_table();
        if (!logging)
            return true;

        s_settings.append = (*logging)["append"].value_or(s_settings.append);
        s_settings.console = (*logging)["console"].value_or(s_settings.console);
        s_settings.directory = (*logging)["directory"].value_or(s_settings.directory);

        if (auto level = (*logging)["level"].value<int64_t>(); level && *level >= 0 && *level <= 6)
            s_settings.level = static_cast<plog::Severity>(*level);
        if (auto mb = (*logging)["max_file_mb"].value<int64_t>(); mb && *mb > 0)
            s_settings.max_file_size = static_cast<size_t>(*mb) * 1024 * 1024;
        if (auto backups = (*logging)["backups"].value<int64_t>(); backups && *backups >= 0)
            s_settings.backup_count = static_cast<size_t>(*backups);
        return true;
    }
    catch (const toml::parse_error& err)
    {
        // PipelineConfig::load reports the same file with line context.
        ErrorReporter::ReportWarning(ErrorCategory::Configuration, "Logging settings ignored",
                                     std::string(err.description()));
        return true;
    }
}

} // namespace utils
