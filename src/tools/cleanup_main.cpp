#include "ToolSupport.hpp"
#include "kdeploy/cleanup/CleanupAgent.hpp"
#include "kdeploy/core/Prompt.hpp"
#include "kdeploy/core/SystemView.hpp"

#include <filesystem>
#include <iostream>

using namespace kdeploy;

int main(int argc, char* argv[]) {
    tools::ToolInfo info{"kneeboard-cleanup", "Pilot Kneeboard - remove temporary files",
                         {{"--root", "Project tree to clean (default: current directory)"}}};
    tools::ToolOptions options;

    switch (tools::parseArguments(argc, argv, info, options)) {
        case tools::ParseOutcome::ExitSuccess: return 0;
        case tools::ParseOutcome::ExitFailure: return 1;
        case tools::ParseOutcome::Run: break;
    }

    return tools::runTool([&]() {
        DeployConfig config = tools::loadConfig(options.config_path);

        tools::printBanner("Pilot Kneeboard Cleanup");
        std::cout << "This tool will remove temporary files and directories." << std::endl;
        std::cout << std::endl;

        HostSystemView system;

        CleanupRules rules;
        rules.directories = config.cleanup.directories;
        rules.patterns = config.cleanup.patterns;
        if (!config.cleanup.toolkit_cache.empty()) {
            rules.toolkit_cache = tools::expandHome(config.cleanup.toolkit_cache, system.homeDirectory());
        }

        std::filesystem::path root = options.values.count("--root")
            ? std::filesystem::path(options.values["--root"])
            : std::filesystem::current_path();

        CleanupAgent agent(root, rules);
        if (!agent.confirm(Prompt::standard())) {
            return 0;
        }

        agent.run();

        std::cout << std::endl;
        tools::printBanner("Cleanup Complete");
        std::cout << std::endl;
        return 0;
    });
}
