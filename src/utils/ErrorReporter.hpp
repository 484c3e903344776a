#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

namespace utils {

enum class ErrorCategory
{
    Initialization, // logging, run lock, CLI arguments
    Configuration,  // TOML parsing, invalid config values
    Input,          // fragments, baseline snapshot, exclusion list
    Consistency,    // lifecycle relocation, manifest updates
    Reporting,      // report persistence and retention
    Unknown
};

enum class ErrorSeverity
{
    Warning, // Degraded functionality, but the run continues
    Error,   // Operation failed, but the run can continue
    Fatal    // The run must abort
};

// Where in a run a report was raised. Empty fields mean "outside any run/stage".
struct ErrorContext
{
    std::string run_id;
    std::string stage;
};

struct ErrorReport
{
    ErrorCategory category = ErrorCategory::Unknown;
    ErrorSeverity severity = ErrorSeverity::Warning;
    std::string user_message;      // Actionable message for the operator
    std::string technical_details; // Paths, library messages, counts
    std::string timestamp;         // UTC, ISO-8601
    ErrorContext context;

    // "[Warning] Input in merge: Skipping unparsable fragment (tranche-07.json: ...)"
    std::string describe() const;
};

/**
 * @brief Thread-safe error reporter shared by all pipeline stages
 *
 * Logs every report through plog, tagged with the run and stage it was raised
 * in, and keeps a bounded queue that the command line front end drains and
 * prints once the run finishes.
 *
 * Usage:
 *   ErrorReporter::RunScope run(run_id);
 *   ErrorReporter::StageScope stage("merge");
 *   ErrorReporter::ReportWarning(ErrorCategory::Input,
 *                                "Skipping unparsable fragment",
 *                                "tranche-07.json: unexpected token");
 *
 *   // At exit:
 *   for (const auto& report : ErrorReporter::GetPendingErrors()) { ... }
 */
class ErrorReporter
{
public:
    // Tags reports with a run id until destroyed; restores the enclosing run.
    class RunScope
    {
    public:
        explicit RunScope(std::string run_id);
        ~RunScope();

        RunScope(const RunScope&) = delete;
        RunScope& operator=(const RunScope&) = delete;

    private:
        std::string previous_;
    };

    // Tags reports with a stage name. Stages run one at a time, so worker
    // threads inside a stage report under it too.
    class StageScope
    {
    public:
        explicit StageScope(std::string stage);
        ~StageScope();

        StageScope(const StageScope&) = delete;
        StageScope& operator=(const StageScope&) = delete;

    private:
        std::string previous_;
    };

    static void Report(ErrorCategory category, ErrorSeverity severity,
                       const std::string& user_message,
                       const std::string& technical_details = "");

    static void ReportFatal(ErrorCategory category,
                            const std::string& user_message,
                            const std::string& technical_details = "");

    static void ReportError(ErrorCategory category,
                            const std::string& user_message,
                            const std::string& technical_details = "");

    static void ReportWarning(ErrorCategory category,
                              const std::string& user_message,
                              const std::string& technical_details = "");

    /**
     * @brief Get all pending errors and clear the queue
     */
    static std::vector<ErrorReport> GetPendingErrors();

    static void ClearErrors();

    static ErrorContext CurrentContext();

    static const char* CategoryToString(ErrorCategory category);
    static const char* SeverityToString(ErrorSeverity severity);

private:
    static std::string utcTimestamp();

    static std::mutex s_mutex;
    static std::vector<ErrorReport> s_error_queue;
    static ErrorContext s_context;
    static constexpr std::size_t MAX_QUEUE_SIZE = 100;
};

} // namespace utils
