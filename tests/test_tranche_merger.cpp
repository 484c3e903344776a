#include <catch2/catch_test_macros.hpp>
#include "dictionary/TrancheMerger.hpp"

#include <regex>

using namespace dictionary;

namespace
{

TrancheMerger fixedClockMerger()
{
    MergeOptions options;
    options.version = "1.0.0";
    options.source_directory = "data/Tranches";
    return TrancheMerger(options, [] { return std::string("2025-09-23T01:42:19.197Z"); });
}

} // namespace

TEST_CASE("TrancheMerger - Duplicate keys across fragments", "[merger]")
{
    auto merger = fixedClockMerger();
    std::string error;

    auto result = merger.merge({ { "tranche-a.json", R"({"hello":"salaam"})" },
                                 { "tranche-b.json", R"({"hello":"salaam"})" } },
                               error);

    REQUIRE(result.has_value());
    const UnifiedDictionary& dict = result->dictionary;
    REQUIRE(dict.entries.size() == 1);
    REQUIRE(dict.metadata.total_entries == std::optional<std::size_t>(1));
    REQUIRE(dict.metadata.duplicates_removed == 1);
    REQUIRE(dict.metadata.files.size() == 2);
    REQUIRE(dict.metadata.files[1].duplicates_removed == 1);
    REQUIRE(result->consumed == std::vector<std::string>{ "tranche-a.json", "tranche-b.json" });
}

TEST_CASE("TrancheMerger - First occurrence wins in name order", "[merger]")
{
    auto merger = fixedClockMerger();
    std::string error;

    // Supplied out of order on purpose
    auto result = merger.merge({ { "tranche-2.json", R"([{"english":"Water","ancient":"unda"}])" },
                                 { "tranche-1.json", R"([{"english":"water ","ancient":"aqua"}])" } },
                               error);

    REQUIRE(result.has_value());
    REQUIRE(result->dictionary.entries.size() == 1);
    REQUIRE(result->dictionary.entries[0].ancientSurface() == "aqua");
    REQUIRE(result->dictionary.metadata.duplicates_removed == 1);
}

TEST_CASE("TrancheMerger - Merging the same set twice is identical", "[merger]")
{
    auto merger = fixedClockMerger();
    const std::vector<FragmentSource> fragments = {
        { "tranche-01.json", R"([{"english":"sun","ancient":"sol","modern":"nap"},{"english":"moon","ancient":"luna"}])" },
        { "tranche-02.json", R"({"sun":"nap","star":"csillag"})" },
        { "tranche-03.json", R"({"data":[{"english":"sky","ancient":"caelum","modern":"ég"}]})" },
    };

    std::string error;
    auto first = merger.merge(fragments, error);
    auto second = merger.merge(fragments, error);

    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    REQUIRE(first->dictionary == second->dictionary);
    REQUIRE(first->dictionary.metadata.duplicates_removed == 1);
    REQUIRE(first->dictionary.entries.size() == 4);
}

TEST_CASE("TrancheMerger - Unparsable fragments are skipped", "[merger]")
{
    auto merger = fixedClockMerger();
    std::string error;

    auto result = merger.merge({ { "tranche-01.json", "{broken" }, { "tranche-02.json", R"({"fire":"tűz"})" } }, error);

    REQUIRE(result.has_value());
    REQUIRE(result->consumed == std::vector<std::string>{ "tranche-02.json" });
    REQUIRE(result->unparsable.size() == 1);
    REQUIRE(result->unparsable[0].rfind("tranche-01.json", 0) == 0);
    REQUIRE(result->dictionary.metadata.files_included == std::optional<std::vector<std::string>>(result->consumed));
}

TEST_CASE("TrancheMerger - Zero valid fragments fails", "[merger]")
{
    auto merger = fixedClockMerger();
    std::string error;

    SECTION("Nothing to merge")
    {
        REQUIRE_FALSE(merger.merge({}, error).has_value());
        REQUIRE_FALSE(error.empty());
    }

    SECTION("Only broken or excluded files")
    {
        auto result = merger.merge({ { "tranche-01.json", "[1,2" },
                                     { "UnifiedLibranDictionary.json", R"({"a":"b"})" } },
                                   error);
        REQUIRE_FALSE(result.has_value());
    }
}

TEST_CASE("TrancheMerger - Empty but valid fragments merge to an empty dictionary", "[merger]")
{
    auto merger = fixedClockMerger();
    std::string error;

    auto result = merger.merge({ { "tranche-01.json", "[]" }, { "tranche-02.json", R"({"data":[]})" } }, error);

    REQUIRE(result.has_value());
    REQUIRE(result->consumed == std::vector<std::string>{ "tranche-01.json", "tranche-02.json" });
    REQUIRE(result->dictionary.entries.empty());
    REQUIRE(result->dictionary.metadata.total_entries == std::optional<std::size_t>(0));
}

TEST_CASE("TrancheMerger - Naming convention exclusions", "[merger]")
{
    const std::string marker = "UnifiedLibranDictionary";

    REQUIRE(TrancheMerger::isSkippedByName("UnifiedLibranDictionaryv1.6.json", marker));
    REQUIRE(TrancheMerger::isSkippedByName("tranche-05 (1).json", marker));
    REQUIRE(TrancheMerger::isSkippedByName("merged-tranche.json", marker));
    REQUIRE(TrancheMerger::isSkippedByName("delete-me.json", marker));
    REQUIRE_FALSE(TrancheMerger::isSkippedByName("tranche-05.json", marker));
}

TEST_CASE("TrancheMerger - Metadata of a fresh merge", "[merger]")
{
    auto merger = fixedClockMerger();
    std::string error;
    auto result = merger.merge({ { "tranche-01.json", R"({"bread":"kenyér"})" } }, error);

    REQUIRE(result.has_value());
    const Metadata& meta = result->dictionary.metadata;
    REQUIRE(meta.version == "1.0.0");
    REQUIRE(meta.created_on == "2025-09-23T01:42:19.197Z");
    REQUIRE(meta.source_directory == "data/Tranches");
    REQUIRE_FALSE(meta.processing_notes.empty());
}

TEST_CASE("TrancheMerger - Default clock is ISO-8601 UTC", "[merger]")
{
    static const std::regex iso(R"(^\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}\.\d{3}Z$)");
    REQUIRE(std::regex_match(TrancheMerger::utcTimestamp(), iso));
}
