#pragma once

/**
 * @file CleanupAgent.hpp
 * @brief Removal of interpreter caches and editor leftovers
 *
 * @author Pilot Kneeboard Deployment Team
 * @version 1.0.0
 */

#include "kdeploy/core/Prompt.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace kdeploy {

struct CleanupRules {
    std::vector<std::string> directories;       // directory names removed with their contents
    std::vector<std::string> patterns;          // file name globs
    std::filesystem::path toolkit_cache;        // contents removed, directory kept; may be empty
};

struct CleanupReport {
    size_t removed{0};
    size_t failed{0};
    std::vector<std::filesystem::path> failures;
};

/**
 * @brief Removes bytecode, toolkit caches, logs and editor backups
 *
 * Targets are collected first and deleted afterwards, each on its own:
 * a file that cannot be removed is counted and logged, and the rest of
 * the cleanup carries on. Symlinked directories are not followed.
 */
class CleanupAgent {
public:
    CleanupAgent(std::filesystem::path root, CleanupRules rules);

    // Prints "Cleanup cancelled." on anything but y.
    bool confirm(Prompt& prompt) const;

    std::vector<std::filesystem::path> collectTargets() const;

    CleanupReport run();

    static bool matchesPattern(const std::string& file_name, const std::string& pattern);

private:
    std::filesystem::path root_;
    CleanupRules rules_;

    bool isTargetDirectory(const std::string& name) const;
    bool isTargetFile(const std::string& name) const;
    void remove(const std::filesystem::path& path, CleanupReport& report) const;
};

} // namespace kdeploy
