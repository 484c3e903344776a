#include "CommandLine.hpp"

#include <map>

namespace app
{

namespace
{

const std::map<std::string, Command>& commandTable()
{
    static const std::map<std::string, Command> table = {
        { "build", Command::Build },           { "qa", Command::QA },
        { "audit", Command::Audit },           { "exclusions", Command::Exclusions },
        { "baseline", Command::Baseline },     { "help", Command::Help },
        { "version", Command::Version },
    };
    return table;
}

bool checkOperands(const CommandLine& cli, std::string& outError)
{
    const auto& a = cli.args;
    switch (cli.command)
    {
    case Command::Build:
    case Command::Help:
    case Command::Version:
        if (!a.empty())
        {
            outError = "unexpected argument '" + a.front() + "'";
            return false;
        }
        return true;
    case Command::QA:
    case Command::Audit:
        if (a.size() != 1)
        {
            outError = "expected exactly one dictionary file";
            return false;
        }
        return true;
    case Command::Baseline:
        if (a.size() != 1 || a.front() != "stats")
        {
            outError = "usage: baseline stats";
            return false;
        }
        return true;
    case Command::Exclusions:
        break;
    }

    if (a.empty())
    {
        outError = "missing exclusions subcommand";
        return false;
    }
    const std::string& sub = a.front();
    const std::size_t operands = a.size() - 1;
    if (sub == "list" && operands <= 1)
        return true;
    if (sub == "search" && operands == 2)
        return true;
    if (sub == "test" && operands == 1)
        return true;
    if (sub == "categories" && operands == 0)
        return true;
    if (sub == "add" && operands >= 2)
    {
        for (std::size_t i = 1; i < a.size(); ++i)
        {
            if (a[i] == "--note" && i + 1 >= a.size())
            {
                outError = "--note needs a value";
                return false;
            }
        }
        return true;
    }
    outError = "invalid exclusions command '" + sub + "'";
    return false;
}

} // namespace

std::optional<CommandLine> CommandLine::parse(const std::vector<std::string>& argv, std::string& outError)
{
    CommandLine cli;
    bool have_command = false;

    for (std::size_t i = 0; i < argv.size(); ++i)
    {
        const std::string& arg = argv[i];
        if (arg == "--verbose" || arg == "-v")
        {
            cli.verbose = true;
        }
        else if (arg == "--dry-run")
        {
            cli.dry_run = true;
        }
        else if (arg == "--config")
        {
            if (i + 1 >= argv.size())
            {
                outError = "--config needs a file";
                return std::nullopt;
            }
            cli.config_path = argv[++i];
        }
        else if (arg.rfind("--config=", 0) == 0)
        {
            cli.config_path = arg.substr(9);
        }
        else if (arg == "--help" || arg == "-h")
        {
            cli.command = Command::Help;
            have_command = true;
        }
        else if (arg == "--version")
        {
            cli.command = Command::Version;
            have_command = true;
        }
        else if (!have_command)
        {
            if (arg.rfind("-", 0) == 0)
            {
                outError = "unknown option '" + arg + "'";
                return std::nullopt;
            }
            auto it = commandTable().find(arg);
            if (it == commandTable().end())
            {
                outError = "unknown command '" + arg + "'";
                return std::nullopt;
            }
            cli.command = it->second;
            have_command = true;
        }
        else
        {
            cli.args.push_back(arg);
        }
    }

    if (cli.config_path.empty())
    {
        outError = "--config needs a file";
        return std::nullopt;
    }
    if (!checkOperands(cli, outError))
        return std::nullopt;
    return cli;
}

std::string CommandLine::usage()
{
    return "Usage: lexgate [--config FILE] [--verbose] [--dry-run] <command>\n"
           "\n"
           "Commands:\n"
           "  build                               merge, score and promote pending tranches (default)\n"
           "  qa <dictionary.json>                score an existing dictionary\n"
           "  audit <dictionary.json>             audit an existing dictionary\n"
           "  exclusions list [category]          show canonical exclusions\n"
           "  exclusions search <query> <dictionary.json>\n"
           "                                      find dictionary entries and exclusions\n"
           "  exclusions test <dictionary.json>   show which entries are excluded\n"
           "  exclusions categories               count exclusions per category\n"
           "  exclusions add <category> <name> [alias...] [--note TEXT]\n"
           "  baseline stats                      summarize the baseline snapshot\n"
           "\n"
           "Exit status: 0 passed, 1 QA failed, 2 fatal error.\n";
}

} // namespace app
