#pragma once

#include <optional>
#include <string>
#include <vector>

namespace app
{

enum class Command
{
    Build,
    QA,
    Audit,
    Exclusions,
    Baseline,
    Help,
    Version
};

struct CommandLine
{
    std::string config_path = "lexgate.toml";
    bool verbose = false;
    bool dry_run = false;
    Command command = Command::Build;
    std::vector<std::string> args; // operands after the command word, e.g. {"search", "cord", "dict.json"}

    // Returns std::nullopt with a one-line reason for unknown flags, commands or wrong operand counts.
    static std::optional<CommandLine> parse(const std::vector<std::string>& argv, std::string& outError);

    static std::string usage();
};

} // namespace app
