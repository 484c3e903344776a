#include <catch2/catch_test_macros.hpp>
#include "pipeline/FragmentStore.hpp"
#include "pipeline/LifecycleManifest.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/temp_workspace.hpp"

#include <filesystem>
#include <system_error>

using pipeline::Area;
using pipeline::FragmentStore;
using pipeline::StoreLayout;

namespace fs = std::filesystem;

namespace
{

StoreLayout layoutIn(const test_utils::TempWorkspace& ws)
{
    return { ws.path("tranches"), ws.path("tranches/merged"), ws.path("tranches/deleted") };
}

} // namespace

TEST_CASE("FragmentStore - Layout and listing", "[store]")
{
    test_utils::TempWorkspace ws;
    FragmentStore store(layoutIn(ws));

    std::string error;
    REQUIRE(store.ensureLayout(error));
    REQUIRE(fs::is_directory(ws.path("tranches/merged")));
    REQUIRE(fs::is_directory(ws.path("tranches/deleted")));

    ws.write("tranches/tranche-02.json", "[]");
    ws.write("tranches/tranche-01.json", "[]");
    ws.write("tranches/notes.txt", "not a fragment");
    ws.write("tranches/merged/tranche-00.json", "[]");
    ws.write("tranches/merged/lifecycle.json", "{}");

    SECTION("Only json files directly inside the area, sorted")
    {
        const auto pending = store.list(Area::Pending);
        REQUIRE(pending == std::vector<std::string>{ "tranche-01.json", "tranche-02.json" });
    }

    SECTION("The manifest is never listed")
    {
        REQUIRE(store.list(Area::Merged) == std::vector<std::string>{ "tranche-00.json" });
        REQUIRE(store.manifestPath() == ws.path("tranches/merged/lifecycle.json"));
    }

    SECTION("Missing area lists nothing")
    {
        FragmentStore absent({ ws.path("nowhere"), ws.path("nowhere/m"), ws.path("nowhere/d") });
        REQUIRE(absent.list(Area::Pending).empty());
    }
}

TEST_CASE("FragmentStore - Reading fragments", "[store]")
{
    test_utils::TempWorkspace ws;
    FragmentStore store(layoutIn(ws));
    ws.write("tranches/tranche-01.json", R"([{"english": "sun"}])");

    utils::ErrorReporter::ClearErrors();
    const auto sources = store.read(Area::Pending, { "tranche-01.json", "tranche-09.json" });

    REQUIRE(sources.size() == 1);
    REQUIRE(sources[0].name == "tranche-01.json");
    REQUIRE(sources[0].content == R"([{"english": "sun"}])");

    const auto reports = utils::ErrorReporter::GetPendingErrors();
    REQUIRE(reports.size() == 1);
    REQUIRE(reports[0].severity == utils::ErrorSeverity::Warning);
    REQUIRE(reports[0].technical_details.find("tranche-09.json") != std::string::npos);
}

TEST_CASE("FragmentStore - Relocation", "[store]")
{
    test_utils::TempWorkspace ws;
    ws.write("tranches/tranche-01.json", "[1]");
    ws.write("tranches/tranche-02.json", "[2]");
    ws.write("tranches/tranche-03.json", "[3]");
    const std::vector<std::string> names = { "tranche-01.json", "tranche-02.json", "tranche-03.json" };

    SECTION("Moves every file")
    {
        FragmentStore store(layoutIn(ws));
        std::string error;
        REQUIRE(store.relocate(names, Area::Pending, Area::Merged, error));
        REQUIRE(store.list(Area::Pending).empty());
        REQUIRE(store.list(Area::Merged) == names);
        REQUIRE(ws.read("tranches/merged/tranche-02.json") == "[2]");
    }

    SECTION("A failed move puts earlier files back")
    {
        int calls = 0;
        FragmentStore store(layoutIn(ws), [&calls](const fs::path& from, const fs::path& to, std::error_code& ec) {
            ++calls;
            if (from.filename() == "tranche-03.json")
            {
                ec = std::make_error_code(std::errc::permission_denied);
                return;
            }
            fs::rename(from, to, ec);
        });

        std::string error;
        REQUIRE_FALSE(store.relocate(names, Area::Pending, Area::Merged, error));
        REQUIRE(error.find("cannot move tranche-03.json to merged") == 0);
        // three forward moves, two rollbacks
        REQUIRE(calls == 5);
        REQUIRE(store.list(Area::Pending) == names);
        REQUIRE(store.list(Area::Merged).empty());
    }

    SECTION("Refuses to overwrite a file in the target area")
    {
        ws.write("tranches/merged/tranche-02.json", "[old]");
        FragmentStore store(layoutIn(ws));

        std::string error;
        REQUIRE_FALSE(store.relocate(names, Area::Pending, Area::Merged, error));
        REQUIRE(error == "fragment already present in merged area: tranche-02.json");
        REQUIRE(store.list(Area::Pending) == names);
        REQUIRE(ws.read("tranches/merged/tranche-02.json") == "[old]");
    }

    SECTION("Refuses when a source is missing")
    {
        FragmentStore store(layoutIn(ws));
        std::string error;
        REQUIRE_FALSE(store.relocate({ "tranche-01.json", "tranche-07.json" }, Area::Pending, Area::Deleted, error));
        REQUIRE(error == "fragment missing from pending area: tranche-07.json");
        REQUIRE(store.list(Area::Pending) == names);
    }

    SECTION("Nothing to do")
    {
        FragmentStore store(layoutIn(ws));
        std::string error;
        REQUIRE(store.relocate({}, Area::Pending, Area::Merged, error));
        REQUIRE(store.relocate(names, Area::Merged, Area::Merged, error));
        REQUIRE(store.list(Area::Pending) == names);
    }
}
