#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "qa/HomonymPolicy.hpp"
#include "qa/QACategories.hpp"
#include "qa/QAReportWriter.hpp"
#include "qa/QAScorer.hpp"
#include "reference/BaselineIndex.hpp"
#include "reference/ExclusionRegistry.hpp"
#include "utils/temp_workspace.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <stdexcept>

using Catch::Matchers::WithinAbs;
using test_utils::makeDictionary;
using test_utils::makeEntry;

namespace
{

const report::CategoryResult* findCategory(const qa::QAReport& report, const std::string& name)
{
    for (const auto& category : report.categories)
    {
        if (category.category == name)
            return &category;
    }
    return nullptr;
}

std::vector<report::CategoryResult> uniformCategories(double score)
{
    std::vector<report::CategoryResult> categories;
    for (const auto& [name, weight] : qa::kCategoryWeights)
    {
        report::CategoryResult result;
        result.category = name;
        result.score = score;
        categories.push_back(result);
    }
    return categories;
}

// Twelve documented entries covering 12 of the 16 essential phrases, no verbs.
std::vector<dictionary::Entry> documentedEntries()
{
    const std::string note = "From Latin root";
    return {
        makeEntry("good", "bonitas", "bonë", note),   makeEntry("bad", "malus", "malë", note),
        makeEntry("big", "magnus", "magnë", note),    makeEntry("small", "parvus", "parvë", note),
        makeEntry("house", "domus", "domë", note),    makeEntry("water", "aqua", "akva", note),
        makeEntry("food", "cibus", "cibë", note),     makeEntry("fire", "ignis", "ignë", note),
        makeEntry("walk", "ambulare", "ambulë", note), makeEntry("run", "currere", "currë", note),
        makeEntry("see", "videre", "vidë", note),     makeEntry("hear", "audire", "audë", note),
    };
}

} // namespace

TEST_CASE("QAScorer - Lazy suffix formation", "[qa]")
{
    const qa::SemanticGroupPolicy policy;
    qa::QAScorer scorer({}, policy);

    auto dict = makeDictionary({ makeEntry("leader", "leaderor", "leaderë") });
    const qa::QAReport report = scorer.evaluate(dict);

    const auto* suffix = findCategory(report, qa::kSuffixAudit);
    REQUIRE(suffix != nullptr);
    REQUIRE_THAT(suffix->score, WithinAbs(98.5, 1e-9));
    REQUIRE(suffix->issues.size() == 1);
    REQUIRE(suffix->issues[0].type == "lazy_ancient");
    REQUIRE(suffix->issues[0].severity == report::Severity::High);
}

TEST_CASE("QAScorer - English-like modern form needs a donor note", "[qa]")
{
    auto without = makeDictionary({ makeEntry("honour", "honos", "honor") });
    auto with = makeDictionary({ makeEntry("honour", "honos", "honor", "Latin honor") });

    REQUIRE(qa::auditSuffixes(without).issues.size() == 1);
    REQUIRE(qa::auditSuffixes(without).issues[0].type == "english_like_modern");
    REQUIRE(qa::auditSuffixes(with).issues.empty());
}

TEST_CASE("QAScorer - Collisions", "[qa][collision]")
{
    const qa::SemanticGroupPolicy policy;

    SECTION("Every pair sharing a form is flagged once")
    {
        auto dict = makeDictionary({ makeEntry("stone", "lapis", "kő"), makeEntry("rock", "lapis", "szikla"),
                                     makeEntry("pebble", "lapis", "kavics") });
        const auto result = qa::checkCollisions(dict, policy);
        REQUIRE(result.issues.size() == 3);
        REQUIRE_THAT(result.score, WithinAbs(94.0, 1e-9));
    }

    SECTION("Order of entries does not change the outcome")
    {
        auto forward = makeDictionary({ makeEntry("stone", "lapis", "kő"), makeEntry("rock", "lapis", "szikla") });
        auto backward = makeDictionary({ makeEntry("rock", "lapis", "szikla"), makeEntry("stone", "lapis", "kő") });
        REQUIRE(qa::checkCollisions(forward, policy).issues.size() == 1);
        REQUIRE(qa::checkCollisions(backward, policy).issues.size() == 1);
    }

    SECTION("Modern collisions count separately")
    {
        auto dict = makeDictionary({ makeEntry("stone", "lapis", "kő"), makeEntry("rock", "saxum", "kő") });
        const auto result = qa::checkCollisions(dict, policy);
        REQUIRE(result.issues.size() == 1);
        REQUIRE(result.issues[0].type == "modern_collision");
    }

    SECTION("Justified homonyms are not flagged")
    {
        auto dict = makeDictionary({ makeEntry("brother", "frater", "testvér"), makeEntry("sister", "soror", "testvér") });
        REQUIRE(qa::checkCollisions(dict, policy).issues.empty());
    }

    SECTION("Absent forms never collide")
    {
        auto dict = makeDictionary({ makeEntry("stone", "", "kő"), makeEntry("rock", "", "szikla") });
        REQUIRE(qa::checkCollisions(dict, policy).issues.empty());
    }
}

TEST_CASE("QAScorer - Homonym policies", "[qa][collision]")
{
    const qa::SemanticGroupPolicy defaults;
    REQUIRE(defaults.isJustified("Mother", "daughter"));
    REQUIRE(defaults.isJustified("hand", "eye"));
    REQUIRE_FALSE(defaults.isJustified("hand", "mother"));
    REQUIRE_FALSE(defaults.isJustified("stone", "rock"));

    const qa::SemanticGroupPolicy custom({ { "geology", { "stone", "rock" } } });
    REQUIRE(custom.isJustified("stone", "rock"));
    REQUIRE_FALSE(custom.isJustified("brother", "sister"));

    reference::ExclusionRegistry registry;
    registry.addEntry({ "world_core", "Cordavora", { "Cordavorum" }, "" });
    const qa::ExclusionAwarePolicy aware(defaults, registry);
    REQUIRE(aware.isJustified("Cordavora", "Cordavorum"));
    REQUIRE(aware.isJustified("brother", "sister"));
    REQUIRE_FALSE(aware.isJustified("Cordavora", "stone"));
}

TEST_CASE("QAScorer - Compound review", "[qa]")
{
    auto dict = makeDictionary({
        makeEntry("sky-fire", "caelum-ignis", "ég-tűz"),
        makeEntry("festival", "dies-festus", "ünnep", "Traditional ceremonial day, Latin dies"),
    });
    const auto result = qa::reviewCompounds(dict);

    // meaningless compound plus a long undocumented form on the first entry
    REQUIRE(result.issues.size() == 2);
    REQUIRE(result.issues[0].subject == "sky-fire");
    REQUIRE(result.issues[1].subject == "sky-fire");
    REQUIRE_THAT(result.score, WithinAbs(96.0, 1e-9));
}

TEST_CASE("QAScorer - Coverage analysis", "[qa]")
{
    SECTION("Noun heavy dictionary without verbs violates both targets")
    {
        auto dict = makeDictionary({ makeEntry("stone", "lapis", "kő"), makeEntry("tree", "arbor", "fa") });
        const auto result = qa::analyzeCoverage(dict);
        REQUIRE(result.issues.size() == 2);
        REQUIRE_THAT(result.score, WithinAbs(80.0, 1e-9));
    }

    SECTION("Balanced dictionary")
    {
        auto dict = makeDictionary({ makeEntry("to walk", "ambulare", "sétál"), makeEntry("singing", "cantus", "ének"),
                                     makeEntry("good", "bonus", "jó"), makeEntry("stone", "lapis", "kő") });
        const auto result = qa::analyzeCoverage(dict);
        REQUIRE(result.issues.empty());
        REQUIRE(result.summary == "2 verbs, 1 nouns, 1 adjectives, 0 other");
    }

    SECTION("Empty dictionary has no verbs")
    {
        const auto result = qa::analyzeCoverage(makeDictionary({}));
        REQUIRE(result.issues.size() == 1);
        REQUIRE(result.issues[0].type == "low_verb_coverage");
    }
}

TEST_CASE("QAScorer - Ruleset compliance", "[qa]")
{
    auto dict = makeDictionary({
        makeEntry("stone", "lapis", "kő"),          // Latin ending in ancient
        makeEntry("tree", "arbor", "fa"),           // nothing to anchor it
        makeEntry("sun", "sol", "nap", "From Hungarian nap"),
    });
    const auto result = qa::checkRulesetCompliance(dict);

    REQUIRE(result.issues.size() == 2);
    REQUIRE(result.issues[0].subject == "tree");
    REQUIRE(result.issues[1].subject == "tree");
    REQUIRE_THAT(result.score, WithinAbs(98.0, 1e-9));
}

TEST_CASE("QAScorer - Phrasebook integration", "[qa]")
{
    auto dict = makeDictionary(documentedEntries());
    const auto result = qa::testPhrasebookIntegration(dict);

    REQUIRE_THAT(result.score, WithinAbs(75.0, 1e-9));
    REQUIRE(result.issues.size() == 4);
    REQUIRE(result.summary == "12/16 essential phrases covered");

    auto with_phrase = makeDictionary({ makeEntry("She is here", "", "") });
    // "she is" also covers "he is"
    REQUIRE(qa::testPhrasebookIntegration(with_phrase).issues.size() == 14);
}

TEST_CASE("QAScorer - Versioning check", "[qa]")
{
    auto dict = makeDictionary({ makeEntry("sun", "sol", "nap") });
    REQUIRE(qa::checkVersioning(dict).issues.empty());

    SECTION("Loose version strings are rejected")
    {
        dict.metadata.version = "v1.6";
        const auto result = qa::checkVersioning(dict);
        REQUIRE(result.issues.size() == 1);
        REQUIRE(result.issues[0].type == "invalid_version_format");
        REQUIRE_THAT(result.score, WithinAbs(85.0, 1e-9));
    }

    SECTION("Missing metadata is reported per field")
    {
        dict.metadata.created_on.clear();
        dict.metadata.files_included.reset();
        dict.metadata.total_entries = 0;
        REQUIRE(qa::checkVersioning(dict).issues.size() == 3);
    }
}

TEST_CASE("QAScorer - Gate boundary", "[qa][gate]")
{
    REQUIRE(qa::QAScorer::passes(95, 95));
    REQUIRE_FALSE(qa::QAScorer::passes(94, 95));
    REQUIRE(qa::QAScorer::passes(100, 95));

    REQUIRE(qa::QAScorer::combine(uniformCategories(95.0)) == 95);
    REQUIRE(qa::QAScorer::combine(uniformCategories(94.0)) == 94);
}

TEST_CASE("QAScorer - Weighted score stays within bounds", "[qa][gate]")
{
    REQUIRE(qa::QAScorer::combine(uniformCategories(0.0)) == 0);
    REQUIRE(qa::QAScorer::combine(uniformCategories(100.0)) == 100);
    REQUIRE(qa::QAScorer::combine(uniformCategories(250.0)) == 100);
    REQUIRE(qa::QAScorer::combine(uniformCategories(-40.0)) == 0);

    double total = 0.0;
    for (const auto& [name, weight] : qa::kCategoryWeights)
        total += weight;
    REQUIRE_THAT(total, WithinAbs(1.0, 1e-9));
}

TEST_CASE("QAScorer - Weighted combination", "[qa][gate]")
{
    auto categories = uniformCategories(100.0);
    categories[3].score = 90.0; // coverage, weight 0.15
    categories[5].score = 75.0; // phrasebook, weight 0.10
    REQUIRE(qa::QAScorer::combine(categories) == 96);

    auto failing = uniformCategories(60.0);
    REQUIRE(qa::QAScorer::combine(failing) == 60);
    REQUIRE_FALSE(qa::QAScorer::passes(qa::QAScorer::combine(failing), 95));
}

TEST_CASE("QAScorer - Evaluation is deterministic", "[qa]")
{
    const qa::SemanticGroupPolicy policy;
    auto dict = makeDictionary({ makeEntry("stone", "lapis", "kő"), makeEntry("rock", "lapis", "szikla"),
                                 makeEntry("leader", "leaderor", "leaderë"), makeEntry("sky-fire", "caelum-ignis", "") });

    qa::QAScorer serial({ 95, false }, policy);
    qa::QAScorer parallel({ 95, true }, policy);

    const auto first = serial.evaluate(dict);
    const auto second = serial.evaluate(dict);
    const auto threaded = parallel.evaluate(dict);

    REQUIRE(first.overall == second.overall);
    REQUIRE(first.overall == threaded.overall);
    REQUIRE(first.totalIssues() == threaded.totalIssues());
    for (std::size_t i = 0; i < first.categories.size(); ++i)
    {
        REQUIRE(first.categories[i].category == threaded.categories[i].category);
        REQUIRE(first.categories[i].score == threaded.categories[i].score);
        REQUIRE(first.categories[i].issues.size() == second.categories[i].issues.size());
    }
}

TEST_CASE("QAScorer - Allowlisted collisions are recorded", "[qa][collision][exclusions]")
{
    reference::ExclusionRegistry registry;
    registry.addEntry({ "world_core", "Cordavora", { "Cordavorum" }, "" });
    const qa::SemanticGroupPolicy groups;
    const qa::ExclusionAwarePolicy policy(groups, registry);

    auto dict = makeDictionary({ makeEntry("Cordavora", "cordava", "kordava"),
                                 makeEntry("Cordavorum", "cordava", "kordavum"),
                                 makeEntry("brother", "frater", "frat"), makeEntry("sister", "frater", "sorë"),
                                 makeEntry("stone", "lapis", "kő"), makeEntry("rock", "lapis", "szikla") });

    qa::QAScorer scorer({}, policy);
    const auto report = scorer.evaluate(dict);

    const auto* collisions = findCategory(report, qa::kCollisionCheck);
    REQUIRE(collisions);
    REQUIRE(collisions->issues.size() == 1);
    REQUIRE(collisions->issues[0].subject == "stone / rock");

    REQUIRE(report.suppressions.size() == 2);
    const auto& excluded = report.suppressions[0].subject == "Cordavora / Cordavorum" ? report.suppressions[0]
                                                                                       : report.suppressions[1];
    REQUIRE(excluded.subject == "Cordavora / Cordavorum");
    REQUIRE(excluded.category == qa::kCollisionCheck);
    REQUIRE(excluded.issue_type == "ancient_collision");
    REQUIRE(excluded.index == 0);
    REQUIRE(excluded.reason.rfind("Exact match in world_core: Cordavora", 0) == 0);
    REQUIRE(excluded.reason.find("alias: Cordavorum") != std::string::npos);

    const auto& kin = report.suppressions[0].subject == "brother / sister" ? report.suppressions[0]
                                                                            : report.suppressions[1];
    REQUIRE(kin.reason == "Homonym group kinship");

    const auto doc = qa::QAReportWriter::toJson(report, "2025-09-23T01-42-19-197Z");
    REQUIRE(doc["suppressions"].size() == 2);
    bool listed = false;
    for (const auto& item : doc["suppressions"])
        listed = listed || item["subject"].get<std::string>() == "Cordavora / Cordavorum";
    REQUIRE(listed);
}

namespace
{

class ExplodingPolicy : public qa::IHomonymPolicy
{
public:
    std::optional<std::string> justify(const std::string&, const std::string&) const override
    {
        throw std::runtime_error("policy unavailable");
    }
};

} // namespace

TEST_CASE("QAScorer - Worker failures reach the caller", "[qa]")
{
    const ExplodingPolicy policy;
    auto dict = makeDictionary({ makeEntry("stone", "lapis", "kő"), makeEntry("rock", "lapis", "szikla") });

    qa::QAScorer serial({ 95, false }, policy);
    qa::QAScorer parallel({ 95, true }, policy);

    REQUIRE_THROWS_AS(serial.evaluate(dict), std::runtime_error);
    REQUIRE_THROWS_AS(parallel.evaluate(dict), std::runtime_error);
}

TEST_CASE("QAScorer - Documented dictionary scores 96", "[qa][gate]")
{
    const qa::SemanticGroupPolicy policy;
    qa::QAScorer scorer({}, policy);

    const auto report = scorer.evaluate(makeDictionary(documentedEntries()));
    REQUIRE(report.overall == 96);
    REQUIRE(report.passed);
    REQUIRE(report.categories.size() == qa::kCategoryWeights.size());
    REQUIRE_FALSE(report.baseline.has_value());
}

TEST_CASE("QAScorer - Baseline consistency", "[qa][baseline]")
{
    reference::BaselineIndex baseline;
    std::string error;
    REQUIRE(baseline.loadJson(nlohmann::json::parse(R"({
        "title": "Libran v1.3",
        "clusters": {
            "nature": {
                "ancient": [ {"english":"stone","ancient":"lapis","notes":"Latin lapis"},
                             {"english":"tree","ancient":"arbor"} ],
                "modern":  [ {"english":"stone","modern":"kő"},
                             {"english":"tree","modern":"fa"} ]
            }
        }
    })"), error));

    auto dict = makeDictionary({
        makeEntry("stone", "LAPIS", "kő"),   // case-only difference, notes missing
        makeEntry("tree", "arbos", "fa"),    // ancient mismatch
        makeEntry("stones", "saxa", "kövek") // near match only
    });

    const auto result = qa::checkBaselineConsistency(dict, baseline);
    REQUIRE(result.checked == 3);
    REQUIRE(result.matches == 2);
    REQUIRE(result.result.issues.size() == 3);
    // 100 - 5 (mismatch) - 2 (notes) - 1 (similar); coverage 66.7% earns no bonus
    REQUIRE_THAT(result.result.score, WithinAbs(92.0, 1e-9));

    const qa::SemanticGroupPolicy policy;
    qa::QAScorer scorer({}, policy, &baseline);
    const auto report = scorer.evaluate(dict);
    REQUIRE(report.baseline.has_value());
    REQUIRE(report.baseline->result.category == qa::kBaselineConsistency);
}

TEST_CASE("QAReportWriter - JSON and CSV content", "[qa][report]")
{
    const qa::SemanticGroupPolicy policy;
    qa::QAScorer scorer({}, policy);
    const auto report = scorer.evaluate(makeDictionary({ makeEntry("leader", "leaderor", "leaderë") }));

    const auto doc = qa::QAReportWriter::toJson(report, "2025-09-23T01-42-19-197Z");
    REQUIRE(doc["overallScore"].get<int>() == report.overall);
    REQUIRE(doc["categories"].size() == 7);
    REQUIRE(doc["detailedIssues"].size() == report.totalIssues());

    const std::string csv = qa::QAReportWriter::toCsv(report);
    REQUIRE(csv.rfind("Category,Score,Issues,Summary\n", 0) == 0);
    REQUIRE(csv.find("\"Suffix/Laziness Audit\",98.5,1,") != std::string::npos);
    REQUIRE(csv.find("\"Overall\",") != std::string::npos);

    test_utils::TempWorkspace ws;
    std::vector<std::string> paths;
    std::string error;
    REQUIRE(qa::QAReportWriter::write(report, ws.path("recent"), "2025-09-23T01-42-19-197Z", paths, error));
    REQUIRE(paths.size() == 2);
    REQUIRE(ws.exists("recent/qa-report-2025-09-23T01-42-19-197Z.json"));
    REQUIRE(ws.exists("recent/qa-report-2025-09-23T01-42-19-197Z.csv"));
}
