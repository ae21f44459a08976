#include "ToolSupport.hpp"
#include "kdeploy/package/Packager.hpp"

#include <filesystem>
#include <iostream>

using namespace kdeploy;

int main(int argc, char* argv[]) {
    tools::ToolInfo info{"kneeboard-package", "Pilot Kneeboard - release packager",
                         {{"--output", "Directory the archive is written to (default: current directory)"},
                          {"--release", "Version string overriding app.version"}}};
    tools::ToolOptions options;

    switch (tools::parseArguments(argc, argv, info, options)) {
        case tools::ParseOutcome::ExitSuccess: return 0;
        case tools::ParseOutcome::ExitFailure: return 1;
        case tools::ParseOutcome::Run: break;
    }

    return tools::runTool([&]() {
        DeployConfig config = tools::loadConfig(options.config_path);

        tools::printBanner("Pilot Kneeboard Packaging");
        std::cout << "This tool will create a distributable zip file of the application." << std::endl;
        std::cout << std::endl;

        PackageManifest manifest;
        manifest.name = config.app.name;
        manifest.version = options.values.count("--release") ? options.values["--release"] : config.app.version;
        manifest.files = config.package.files;

        std::filesystem::path source = std::filesystem::current_path();
        std::filesystem::path output = options.values.count("--output")
            ? std::filesystem::path(options.values["--output"])
            : source;

        Packager packager(source, output);
        PackageResult result = packager.build(manifest);

        std::cout << std::endl;
        tools::printBanner("Packaging Complete");
        std::cout << "Package created: " << result.archive.filename().string()
                  << " (" << result.entry_count << " entries)" << std::endl;
        std::cout << std::endl;
        std::cout << "You can distribute this zip file to other users." << std::endl;
        std::cout << "They can extract it and follow the installation instructions in the README.md file." << std::endl;
        return 0;
    });
}
