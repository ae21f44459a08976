#pragma once

#include "kdeploy/config/ConfigParser.hpp"

#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace kdeploy::tools {

struct ToolInfo {
    const char* program;
    const char* summary;
    // Extra "--name <value>" options and their help text
    std::vector<std::pair<std::string, std::string>> value_options;
};

struct ToolOptions {
    std::optional<std::filesystem::path> config_path;
    std::map<std::string, std::string> values;
};

enum class ParseOutcome {
    Run,
    ExitSuccess,
    ExitFailure
};

ParseOutcome parseArguments(int argc, char* argv[], const ToolInfo& info, ToolOptions& options);

// Embedded defaults overlaid with the first config file found.
// Throws PreconditionError if that file does not parse.
DeployConfig loadConfig(const std::optional<std::filesystem::path>& explicit_path);

void printBanner(const std::string& title);

// Runs body, turning DeployError and other exceptions into exit status 1.
int runTool(const std::function<int()>& body);

std::filesystem::path expandHome(const std::string& path, const std::filesystem::path& home);

// Adds the execute bits; a missing file only warns.
void markExecutable(const std::filesystem::path& path);

} // namespace kdeploy::tools
