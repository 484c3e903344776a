#include <catch2/catch_test_macros.hpp>
#include "app/CommandLine.hpp"

using app::Command;
using app::CommandLine;

namespace
{

std::optional<CommandLine> parse(const std::vector<std::string>& argv)
{
    std::string error;
    return CommandLine::parse(argv, error);
}

std::string parseError(const std::vector<std::string>& argv)
{
    std::string error;
    auto cli = CommandLine::parse(argv, error);
    REQUIRE_FALSE(cli);
    return error;
}

} // namespace

TEST_CASE("CommandLine - Build is the default command", "[cli]")
{
    auto cli = parse({});
    REQUIRE(cli);
    REQUIRE(cli->command == Command::Build);
    REQUIRE(cli->config_path == "lexgate.toml");
    REQUIRE_FALSE(cli->verbose);
    REQUIRE_FALSE(cli->dry_run);
    REQUIRE(cli->args.empty());
}

TEST_CASE("CommandLine - Global flags", "[cli]")
{
    SECTION("Flags before the command")
    {
        auto cli = parse({ "--verbose", "--dry-run", "--config", "conf/lexgate.toml", "build" });
        REQUIRE(cli);
        REQUIRE(cli->verbose);
        REQUIRE(cli->dry_run);
        REQUIRE(cli->config_path == "conf/lexgate.toml");
        REQUIRE(cli->command == Command::Build);
    }

    SECTION("Flags after the command and the inline config form")
    {
        auto cli = parse({ "qa", "dict.json", "-v", "--config=other.toml" });
        REQUIRE(cli);
        REQUIRE(cli->verbose);
        REQUIRE(cli->config_path == "other.toml");
        REQUIRE(cli->command == Command::QA);
        REQUIRE(cli->args == std::vector<std::string>{ "dict.json" });
    }

    SECTION("Help and version")
    {
        REQUIRE(parse({ "--help" })->command == Command::Help);
        REQUIRE(parse({ "-h" })->command == Command::Help);
        REQUIRE(parse({ "help" })->command == Command::Help);
        REQUIRE(parse({ "--version" })->command == Command::Version);
    }
}

TEST_CASE("CommandLine - Rejected input", "[cli]")
{
    REQUIRE(parseError({ "publish" }) == "unknown command 'publish'");
    REQUIRE(parseError({ "--force" }) == "unknown option '--force'");
    REQUIRE(parseError({ "--config" }) == "--config needs a file");
    REQUIRE(parseError({ "--config=" }) == "--config needs a file");
    REQUIRE(parseError({ "build", "extra" }) == "unexpected argument 'extra'");
    REQUIRE(parseError({ "qa" }) == "expected exactly one dictionary file");
    REQUIRE(parseError({ "audit", "a.json", "b.json" }) == "expected exactly one dictionary file");
    REQUIRE(parseError({ "baseline" }) == "usage: baseline stats");
    REQUIRE(parseError({ "baseline", "show" }) == "usage: baseline stats");
}

TEST_CASE("CommandLine - Exclusions subcommands", "[cli]")
{
    SECTION("Accepted forms")
    {
        REQUIRE(parse({ "exclusions", "list" }));
        REQUIRE(parse({ "exclusions", "list", "world_core" }));
        REQUIRE(parse({ "exclusions", "categories" }));
        REQUIRE(parse({ "exclusions", "test", "dict.json" }));
        REQUIRE(parse({ "exclusions", "search", "cord", "dict.json" }));

        auto add = parse({ "exclusions", "add", "world_core", "Cordavora", "Cordavorum", "--note", "Capital" });
        REQUIRE(add);
        REQUIRE(add->command == Command::Exclusions);
        REQUIRE(add->args.size() == 6);
        REQUIRE(add->args[0] == "add");
        REQUIRE(add->args[5] == "Capital");
    }

    SECTION("Rejected forms")
    {
        REQUIRE(parseError({ "exclusions" }) == "missing exclusions subcommand");
        REQUIRE(parseError({ "exclusions", "purge" }) == "invalid exclusions command 'purge'");
        REQUIRE(parseError({ "exclusions", "search", "cord" }) == "invalid exclusions command 'search'");
        REQUIRE(parseError({ "exclusions", "add", "world_core" }) == "invalid exclusions command 'add'");
        REQUIRE(parseError({ "exclusions", "add", "world_core", "Cordavora", "--note" }) == "--note needs a value");
    }
}

TEST_CASE("CommandLine - Usage lists every command", "[cli]")
{
    const std::string usage = CommandLine::usage();
    for (const char* word : { "build", "qa <dictionary.json>", "audit <dictionary.json>", "exclusions list",
                              "exclusions search", "exclusions test", "exclusions categories", "exclusions add",
                              "baseline stats" })
    {
        REQUIRE(usage.find(word) != std::string::npos);
    }
    REQUIRE(usage.find("Exit status: 0 passed, 1 QA failed, 2 fatal error.") != std::string::npos);
}
