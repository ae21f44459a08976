#pragma once

#include "kdeploy/core/SystemView.hpp"

#include <filesystem>
#include <string>

namespace kdeploy {

/**
 * @brief XDG desktop autostart entry for hosts without a service manager
 *
 * Keys are fixed: Type, Name, Comment, Exec, Terminal and
 * X-GNOME-Autostart-enabled. Only Exec is computed.
 */
class AutostartEntry {
public:
    AutostartEntry(std::string name, std::string comment, std::string exec);

    std::string render() const;

    // Creates the directory if needed and overwrites an existing entry.
    std::filesystem::path write(const std::filesystem::path& directory, const std::string& file_name) const;

    // $XDG_CONFIG_HOME/autostart, else ~/.config/autostart
    static std::filesystem::path defaultDirectory(const SystemView& system);

    const std::string& exec() const { return exec_; }

private:
    std::string name_;
    std::string comment_;
    std::string exec_;
};

} // namespace kdeploy
