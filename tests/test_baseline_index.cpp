#include <catch2/catch_test_macros.hpp>
#include "processing/IFuzzyMatcher.hpp"
#include "reference/BaselineIndex.hpp"
#include "utils/temp_workspace.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>

using reference::BaselineIndex;
using reference::BaselineOptions;

namespace
{

const char* kSnapshot = R"({
    "title": "Libran v1.3",
    "clusters": {
        "nature": {
            "ancient": [ {"english": "stone", "ancient": "lapis", "notes": "Latin lapis"},
                         {"english": "tree", "ancient": "arbor"} ],
            "modern":  [ {"english": "stone", "modern": "kő"},
                         {"english": "tree", "modern": "fa"},
                         {"english": "river"} ],
            "commentary": "Landscape words"
        },
        "people": {
            "ancient": [ {"english": "king", "ancient": "rex"},
                         {"english": "walking", "ancient": "ambulans"} ]
        },
        "unused": {}
    }
})";

BaselineIndex loadIndex(BaselineOptions options = {})
{
    BaselineIndex index(options);
    std::string error;
    REQUIRE(index.loadJson(nlohmann::json::parse(kSnapshot), error));
    return index;
}

// Scores every pair the same so only the threshold decides.
class FixedScoreMatcher : public processing::IFuzzyMatcher
{
public:
    explicit FixedScoreMatcher(double score)
        : score_(score)
    {
    }

    std::vector<processing::MatchResult> findMatches(const std::string&, const std::vector<std::string>& candidates,
                                                     double, processing::MatchAlgorithm algorithm) const override
    {
        std::vector<processing::MatchResult> results;
        for (const auto& candidate : candidates)
            results.push_back({ score_, candidate, algorithm });
        std::sort(results.begin(), results.end(),
                  [](const auto& a, const auto& b) { return a.matched < b.matched; });
        return results;
    }

    double similarity(const std::string&, const std::string&, processing::MatchAlgorithm) const override
    {
        return score_;
    }

private:
    double score_;
};

} // namespace

TEST_CASE("BaselineIndex - Variants combine per english key", "[baseline]")
{
    const auto index = loadIndex();

    REQUIRE(index.title() == "Libran v1.3");
    REQUIRE(index.size() == 4);

    const auto* stone = index.lookup("stone");
    REQUIRE(stone != nullptr);
    REQUIRE(stone->entry.ancientSurface() == "lapis");
    REQUIRE(stone->entry.modernSurface() == "kő");
    REQUIRE(stone->entry.notes == std::optional<std::string>("Latin lapis"));
    REQUIRE(stone->cluster == "nature");

    REQUIRE(index.lookupAncient("rex") == index.lookup("king"));
    REQUIRE(index.lookupModern("fa") == index.lookup("tree"));
    REQUIRE(index.clusterOf("walking") == std::optional<std::string>("people"));

    SECTION("Records without a form for their variant are not indexed")
    {
        REQUIRE(index.lookup("river") == nullptr);
        REQUIRE_FALSE(index.clusterOf("river"));
    }
}

TEST_CASE("BaselineIndex - Key comparison", "[baseline]")
{
    SECTION("Exact by default")
    {
        const auto index = loadIndex();
        REQUIRE(index.lookup("Stone") == nullptr);
        REQUIRE(index.lookupAncient("LAPIS") == nullptr);
    }

    SECTION("Case folding when configured")
    {
        BaselineOptions options;
        options.case_sensitive = false;
        const auto index = loadIndex(options);
        REQUIRE(index.lookup("Stone") != nullptr);
        REQUIRE(index.lookupAncient("LAPIS") != nullptr);
        REQUIRE(index.lookupModern("KŐ") != nullptr);
    }
}

TEST_CASE("BaselineIndex - Statistics", "[baseline]")
{
    const auto index = loadIndex();

    const auto total = index.stats();
    REQUIRE(total.ancient == 4);
    REQUIRE(total.modern == 3);
    REQUIRE(total.clusters == 2);
    REQUIRE(total.indexed == 4);

    const auto nature = index.clusterStats("nature");
    REQUIRE(nature);
    REQUIRE(nature->ancient == 2);
    REQUIRE(nature->modern == 3);
    REQUIRE(nature->indexed == 2);

    const auto people = index.clusterStats("people");
    REQUIRE(people);
    REQUIRE(people->modern == 0);

    REQUIRE_FALSE(index.clusterStats("missing"));
}

TEST_CASE("BaselineIndex - Stemming", "[baseline]")
{
    REQUIRE(BaselineIndex::stem("walking") == "walk");
    REQUIRE(BaselineIndex::stem("stones") == "stone");
    REQUIRE(BaselineIndex::stem("bravest") == "brav");
    REQUIRE(BaselineIndex::stem("worked") == "work");
    REQUIRE(BaselineIndex::stem("kindly") == "kind");
    REQUIRE(BaselineIndex::stem("s") == "s");
    REQUIRE(BaselineIndex::stem("ing") == "ing");
}

TEST_CASE("BaselineIndex - Similar entries", "[baseline]")
{
    SECTION("Containment")
    {
        const auto index = loadIndex();
        const auto similar = index.findSimilar("stones");
        REQUIRE(similar.size() == 1);
        REQUIRE(similar[0]->entry.english == "stone");
    }

    SECTION("The exact key is not its own near-match")
    {
        const auto index = loadIndex();
        REQUIRE(index.findSimilar("stone").empty());
    }

    SECTION("Shared stem")
    {
        const auto index = loadIndex();
        const auto similar = index.findSimilar("walked");
        REQUIRE(similar.size() == 1);
        REQUIRE(similar[0]->entry.english == "walking");

        BaselineOptions options;
        options.stem_fallback = false;
        REQUIRE(loadIndex(options).findSimilar("walked").empty());
    }

    SECTION("Ranked by similarity and capped")
    {
        const auto index = loadIndex();
        const auto similar = index.findSimilar("in");
        REQUIRE(similar.size() == 2);
        REQUIRE(similar[0]->entry.english == "king");
        REQUIRE(similar[1]->entry.english == "walking");

        BaselineOptions options;
        options.max_similar = 1;
        REQUIRE(loadIndex(options).findSimilar("in").size() == 1);
    }

    SECTION("Fuzzy threshold")
    {
        BaselineOptions options;
        options.stem_fallback = false;
        options.fuzzy_threshold = 0.75;
        const auto index = loadIndex(options);
        const auto similar = index.findSimilar("stane");
        REQUIRE(similar.size() == 1);
        REQUIRE(similar[0]->entry.english == "stone");
    }

    SECTION("Similarity algorithm")
    {
        BaselineOptions options;
        options.stem_fallback = false;
        options.fuzzy_threshold = 0.84;
        REQUIRE(loadIndex(options).findSimilar("xwalkinx").empty());

        options.algorithm = processing::MatchAlgorithm::PartialRatio;
        const auto similar = loadIndex(options).findSimilar("xwalkinx");
        REQUIRE(similar.size() == 1);
        REQUIRE(similar[0]->entry.english == "walking");
    }

    SECTION("Injected matcher")
    {
        BaselineOptions options;
        options.fuzzy_threshold = 0.85;
        BaselineIndex index(options, std::make_unique<FixedScoreMatcher>(0.9));
        std::string error;
        REQUIRE(index.loadJson(nlohmann::json::parse(kSnapshot), error));

        // every indexed key qualifies; equal scores sort by key
        const auto similar = index.findSimilar("bread");
        REQUIRE(similar.size() == 4);
        REQUIRE(similar[0]->entry.english == "king");
        REQUIRE(similar[3]->entry.english == "walking");
    }
}

TEST_CASE("BaselineIndex - Load failures", "[baseline]")
{
    BaselineIndex index;
    std::string error;

    REQUIRE_FALSE(index.loadJson(nlohmann::json::array(), error));
    REQUIRE(error == "baseline snapshot must be a JSON object");

    REQUIRE_FALSE(index.loadJson(nlohmann::json::parse(R"({"title": "x"})"), error));
    REQUIRE(error == "baseline snapshot has no 'clusters' object");

    test_utils::TempWorkspace ws;
    REQUIRE_FALSE(index.loadFile(ws.path("missing.json"), error));
    REQUIRE(error == "baseline reference not found: " + ws.path("missing.json"));

    ws.write("broken.json", "{ not json");
    REQUIRE_FALSE(index.loadFile(ws.path("broken.json"), error));
    REQUIRE(error.find("invalid JSON") == 0);

    ws.write("baseline.json", kSnapshot);
    REQUIRE(index.loadFile(ws.path("baseline.json"), error));
    REQUIRE(index.size() == 4);
}
