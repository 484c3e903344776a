#include <catch2/catch_test_macros.hpp>
#include "report/ReportRetention.hpp"
#include "report/ReportTypes.hpp"
#include "utils/temp_workspace.hpp"

#include <regex>

namespace
{

void writeReportSet(const test_utils::TempWorkspace& ws, const std::string& timestamp)
{
    ws.write("reports/recent/qa-report-" + timestamp + ".json", "{}");
    ws.write("reports/recent/qa-report-" + timestamp + ".csv", "");
    ws.write("reports/recent/audit-report-" + timestamp + ".json", "{}");
    ws.write("reports/recent/audit-detailed-" + timestamp + ".txt", "");
}

} // namespace

TEST_CASE("ReportRetention - Directories", "[report]")
{
    test_utils::TempWorkspace ws;
    report::ReportRetention retention(ws.path("reports"), 3);

    REQUIRE(retention.recentDir() == ws.path("reports/recent"));
    REQUIRE(retention.archiveDir() == ws.path("reports/archive"));

    std::string error;
    REQUIRE(retention.ensureDirectories(error));
    REQUIRE(ws.exists("reports/recent"));
    REQUIRE(ws.exists("reports/archive"));
}

TEST_CASE("ReportRetention - Keeps the newest report sets", "[report]")
{
    test_utils::TempWorkspace ws;
    writeReportSet(ws, "2025-09-20T10-00-00-000Z");
    writeReportSet(ws, "2025-09-21T10-00-00-000Z");
    writeReportSet(ws, "2025-09-22T10-00-00-000Z");
    writeReportSet(ws, "2025-09-23T10-00-00-000Z");
    writeReportSet(ws, "2025-09-24T10-00-00-000Z");
    ws.write("reports/recent/README.md", "operator notes");

    report::ReportRetention retention(ws.path("reports"), 3);
    std::size_t archived = 0;
    std::string error;
    REQUIRE(retention.rotate(archived, error));

    REQUIRE(archived == 8);
    REQUIRE(ws.exists("reports/archive/qa-report-2025-09-20T10-00-00-000Z.json"));
    REQUIRE(ws.exists("reports/archive/audit-detailed-2025-09-21T10-00-00-000Z.txt"));
    REQUIRE(ws.exists("reports/recent/qa-report-2025-09-22T10-00-00-000Z.csv"));
    REQUIRE(ws.exists("reports/recent/audit-report-2025-09-24T10-00-00-000Z.json"));
    REQUIRE(ws.exists("reports/recent/README.md"));

    SECTION("A second rotation has nothing to move")
    {
        REQUIRE(retention.rotate(archived, error));
        REQUIRE(archived == 0);
    }
}

TEST_CASE("ReportRetention - Nothing to rotate", "[report]")
{
    test_utils::TempWorkspace ws;
    std::size_t archived = 7;
    std::string error;

    SECTION("No recent directory yet")
    {
        report::ReportRetention retention(ws.path("reports"), 3);
        REQUIRE(retention.rotate(archived, error));
        REQUIRE(archived == 0);
    }

    SECTION("Within the limit")
    {
        writeReportSet(ws, "2025-09-23T10-00-00-000Z");
        report::ReportRetention retention(ws.path("reports"), 3);
        REQUIRE(retention.rotate(archived, error));
        REQUIRE(archived == 0);
        REQUIRE_FALSE(ws.exists("reports/archive"));
    }
}

TEST_CASE("ReportTypes - Formatting helpers", "[report]")
{
    REQUIRE(report::formatScore(98.5) == "98.5");
    REQUIRE(report::formatScore(100.0) == "100");
    REQUIRE(report::formatScore(92.25) == "92.25");
    REQUIRE(report::formatScore(0.0) == "0");

    REQUIRE(report::csvField("plain") == "\"plain\"");
    REQUIRE(report::csvField("say \"hi\"") == "\"say \"\"hi\"\"\"");

    REQUIRE(report::clampScore(-3.0) == 0.0);
    REQUIRE(report::clampScore(140.0) == 100.0);

    REQUIRE(std::string(report::severityName(report::Severity::High)) == "high");

    const std::regex file_safe(R"(^\d{4}-\d{2}-\d{2}T\d{2}-\d{2}-\d{2}-\d{3}Z$)");
    REQUIRE(std::regex_match(report::fileTimestamp(), file_safe));
}
