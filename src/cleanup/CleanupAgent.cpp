#include "kdeploy/cleanup/CleanupAgent.hpp"

#include <fnmatch.h>

#include <algorithm>
#include <iostream>
#include <system_error>

namespace kdeploy {

namespace fs = std::filesystem;

CleanupAgent::CleanupAgent(fs::path root, CleanupRules rules)
    : root_(std::move(root)), rules_(std::move(rules)) {}

bool CleanupAgent::matchesPattern(const std::string& file_name, const std::string& pattern) {
    return fnmatch(pattern.c_str(), file_name.c_str(), 0) == 0;
}

bool CleanupAgent::isTargetDirectory(const std::string& name) const {
    return std::find(rules_.directories.begin(), rules_.directories.end(), name) != rules_.directories.end();
}

bool CleanupAgent::isTargetFile(const std::string& name) const {
    return std::any_of(rules_.patterns.begin(), rules_.patterns.end(),
                       [&](const std::string& pattern) { return matchesPattern(name, pattern); });
}

bool CleanupAgent::confirm(Prompt& prompt) const {
    if (!prompt.confirm("Are you sure you want to clean up temporary files?")) {
        std::cout << "Cleanup cancelled." << std::endl;
        return false;
    }
    return true;
}

std::vector<fs::path> CleanupAgent::collectTargets() const {
    std::vector<fs::path> targets;
    std::error_code ec;

    fs::recursive_directory_iterator it(root_, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        std::cerr << "[CleanupAgent] Cannot scan " << root_.string() << ": " << ec.message() << std::endl;
        return targets;
    }

    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            std::cerr << "[CleanupAgent] Warning: " << ec.message() << std::endl;
            ec.clear();
            continue;
        }

        const fs::directory_entry& entry = *it;
        std::string name = entry.path().filename().string();
        std::error_code status_ec;

        if (entry.is_directory(status_ec) && !entry.is_symlink(status_ec)) {
            if (isTargetDirectory(name)) {
                targets.push_back(entry.path());
                it.disable_recursion_pending();
            }
        } else if (isTargetFile(name)) {
            targets.push_back(entry.path());
        }
    }

    return targets;
}

void CleanupAgent::remove(const fs::path& path, CleanupReport& report) const {
    std::error_code ec;
    fs::remove_all(path, ec);

    if (ec) {
        std::cerr << "[CleanupAgent] Could not remove " << path.string() << ": " << ec.message() << std::endl;
        report.failed++;
        report.failures.push_back(path);
    } else {
        report.removed++;
    }
}

CleanupReport CleanupAgent::run() {
    CleanupReport report;

    std::cout << "Cleaning up Python bytecode, log and temporary files..." << std::endl;
    for (const auto& target : collectTargets()) {
        remove(target, report);
    }

    if (!rules_.toolkit_cache.empty()) {
        std::cout << "Cleaning up Kivy cache files..." << std::endl;

        std::vector<fs::path> cached;
        std::error_code ec;
        if (fs::is_directory(rules_.toolkit_cache, ec)) {
            for (fs::directory_iterator it(rules_.toolkit_cache, ec), end; !ec && it != end; it.increment(ec)) {
                cached.push_back(it->path());
            }
        }
        if (ec) {
            std::cerr << "[CleanupAgent] Warning: " << rules_.toolkit_cache.string()
                      << ": " << ec.message() << std::endl;
        }

        for (const auto& path : cached) {
            remove(path, report);
        }
    }

    std::cout << "[CleanupAgent] removed " << report.removed << " item(s)";
    if (report.failed > 0) {
        std::cout << ", " << report.failed << " could not be removed";
    }
    std::cout << std::endl;

    return report;
}

} // namespace kdeploy
