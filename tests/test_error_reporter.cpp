#include <catch2/catch_test_macros.hpp>
#include "processing/StageRunner.hpp"
#include "utils/ErrorReporter.hpp"

#include <optional>
#include <stdexcept>

using utils::ErrorCategory;
using utils::ErrorReporter;
using utils::ErrorSeverity;

TEST_CASE("ErrorReporter - Reports carry the run and stage", "[errors]")
{
    ErrorReporter::ClearErrors();

    ErrorReporter::ReportWarning(ErrorCategory::Configuration, "Outside any run");
    {
        ErrorReporter::RunScope run("2025-09-23T01-42-19-197Z");
        {
            ErrorReporter::StageScope stage("qa");
            ErrorReporter::ReportError(ErrorCategory::Reporting, "Cannot write QA report", "disk full");
        }
        ErrorReporter::ReportFatal(ErrorCategory::Consistency, "Cannot persist manifest");
    }

    const auto reports = ErrorReporter::GetPendingErrors();
    REQUIRE(reports.size() == 3);

    REQUIRE(reports[0].context.run_id.empty());
    REQUIRE(reports[0].context.stage.empty());

    REQUIRE(reports[1].severity == ErrorSeverity::Error);
    REQUIRE(reports[1].context.run_id == "2025-09-23T01-42-19-197Z");
    REQUIRE(reports[1].context.stage == "qa");
    REQUIRE(reports[1].describe() == "[Error] Reporting in qa: Cannot write QA report (disk full)");

    // the stage ended, the run did not
    REQUIRE(reports[2].context.run_id == "2025-09-23T01-42-19-197Z");
    REQUIRE(reports[2].context.stage.empty());
    REQUIRE(reports[2].describe() == "[Fatal] Consistency: Cannot persist manifest");
    REQUIRE(reports[2].timestamp.back() == 'Z');

    REQUIRE(ErrorReporter::CurrentContext().run_id.empty());
}

TEST_CASE("ErrorReporter - Stage failures name the stage", "[errors]")
{
    ErrorReporter::ClearErrors();

    const auto result = processing::run_stage<int>("audit", [](std::string&) -> std::optional<int> {
        ErrorReporter::ReportWarning(ErrorCategory::Input, "Exclusion list not found");
        throw std::runtime_error("registry corrupted");
    });

    REQUIRE_FALSE(result.succeeded);
    REQUIRE(result.error == "registry corrupted");

    const auto reports = ErrorReporter::GetPendingErrors();
    REQUIRE(reports.size() == 2);
    REQUIRE(reports[0].context.stage == "audit");
    REQUIRE(reports[1].category == ErrorCategory::Unknown);
    REQUIRE(reports[1].context.stage == "audit");
    REQUIRE(reports[1].technical_details == "audit: registry corrupted");
    REQUIRE(ErrorReporter::CurrentContext().stage.empty());
}
