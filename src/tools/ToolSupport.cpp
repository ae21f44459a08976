#include "ToolSupport.hpp"
#include "kdeploy/core/Errors.hpp"

#include <algorithm>
#include <iostream>
#include <system_error>

#ifndef KDEPLOY_VERSION
#define KDEPLOY_VERSION "1.0.0"
#endif

namespace kdeploy::tools {

namespace {

void printUsage(const ToolInfo& info) {
    std::cout << info.summary << "\n"
              << "Usage: " << info.program << " [options]\n"
              << "\nOptions:\n"
              << "  -h, --help            Show this help message\n"
              << "  -v, --version         Show version information\n"
              << "  -c, --config <path>   Specify config file path\n";
    for (const auto& [name, help] : info.value_options) {
        std::string flag = "  " + name + " <value>";
        flag.resize(std::max<size_t>(flag.size() + 1, 24), ' ');
        std::cout << flag << help << "\n";
    }
    std::cout << std::endl;
}

void printVersion(const ToolInfo& info) {
    std::cout << info.program << " (kdeploy) v" << KDEPLOY_VERSION << "\n"
              << "Pilot Kneeboard deployment tools\n"
              << std::endl;
}

} // namespace

ParseOutcome parseArguments(int argc, char* argv[], const ToolInfo& info, ToolOptions& options) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            printUsage(info);
            return ParseOutcome::ExitSuccess;
        }

        if (arg == "-v" || arg == "--version") {
            printVersion(info);
            return ParseOutcome::ExitSuccess;
        }

        if (arg == "-c" || arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --config requires a path argument" << std::endl;
                return ParseOutcome::ExitFailure;
            }
            options.config_path = argv[++i];
            continue;
        }

        bool matched = false;
        for (const auto& option : info.value_options) {
            if (arg != option.first) continue;
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires an argument" << std::endl;
                return ParseOutcome::ExitFailure;
            }
            options.values[option.first] = argv[++i];
            matched = true;
            break;
        }

        if (!matched) {
            std::cerr << "Error: unknown option " << arg << std::endl;
            printUsage(info);
            return ParseOutcome::ExitFailure;
        }
    }
    return ParseOutcome::Run;
}

DeployConfig loadConfig(const std::optional<std::filesystem::path>& explicit_path) {
    ConfigParser parser;

    if (!parser.loadFromString(ConfigParser::getEmbeddedConfig())) {
        throw PreconditionError("Embedded default configuration is invalid", "Rebuild kdeploy");
    }

    auto path = ConfigParser::resolveConfigPath(explicit_path);
    if (path && !parser.load(*path)) {
        std::string first = parser.getErrors().empty() ? "" : ": " + parser.getErrors().front();
        throw PreconditionError("Invalid configuration in " + path->string() + first,
                                "Fix " + path->string() + " or run without -c to use the defaults");
    }

    return parser.getConfig();
}

void printBanner(const std::string& title) {
    std::cout << "===== " << title << " =====" << std::endl;
}

int runTool(const std::function<int()>& body) {
    try {
        return body();
    } catch (const DeployError& e) {
        std::cerr << e.what() << std::endl;
        if (!e.remediation().empty()) {
            std::cerr << "To fix, run:" << std::endl;
            std::cerr << "  " << e.remediation() << std::endl;
        }
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}

std::filesystem::path expandHome(const std::string& path, const std::filesystem::path& home) {
    if (path == "~") {
        return home;
    }
    if (path.rfind("~/", 0) == 0) {
        return home / path.substr(2);
    }
    return path;
}

void markExecutable(const std::filesystem::path& path) {
    namespace fs = std::filesystem;

    std::error_code ec;
    fs::permissions(path, fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec,
                    fs::perm_options::add, ec);
    if (ec) {
        std::cerr << "Warning: could not make " << path.string() << " executable: "
                  << ec.message() << std::endl;
    }
}

} // namespace kdeploy::tools
