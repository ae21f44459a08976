#include "kdeploy/service/AutostartEntry.hpp"
#include "kdeploy/core/Errors.hpp"

#include <fstream>
#include <sstream>
#include <system_error>

namespace kdeploy {

AutostartEntry::AutostartEntry(std::string name, std::string comment, std::string exec)
    : name_(std::move(name)), comment_(std::move(comment)), exec_(std::move(exec)) {}

std::string AutostartEntry::render() const {
    std::ostringstream out;
    out << "[Desktop Entry]\n"
        << "Type=Application\n"
        << "Name=" << name_ << "\n"
        << "Comment=" << comment_ << "\n"
        << "Exec=" << exec_ << "\n"
        << "Terminal=false\n"
        << "X-GNOME-Autostart-enabled=true\n";
    return out.str();
}

std::filesystem::path AutostartEntry::write(const std::filesystem::path& directory,
                                            const std::string& file_name) const {
    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
    if (ec) {
        throw PreconditionError("Cannot create " + directory.string() + ": " + ec.message(),
                                "mkdir -p " + directory.string());
    }

    auto path = directory / file_name;
    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        throw PreconditionError("Cannot write " + path.string(), "ls -ld " + directory.string());
    }
    out << render();
    if (!out.flush()) {
        throw PreconditionError("Failed writing " + path.string(), "df -h " + directory.string());
    }
    return path;
}

std::filesystem::path AutostartEntry::defaultDirectory(const SystemView& system) {
    auto xdg = system.getEnv("XDG_CONFIG_HOME");
    if (xdg && !xdg->empty()) {
        return std::filesystem::path(*xdg) / "autostart";
    }
    return system.homeDirectory() / ".config" / "autostart";
}

} // namespace kdeploy
