#include "kdeploy/core/SystemView.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <pwd.h>
#include <sys/utsname.h>
#include <unistd.h>

namespace kdeploy {

std::optional<std::string> HostSystemView::readFile(const std::filesystem::path& path) const {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return std::nullopt;
    }
    return buffer.str();
}

bool HostSystemView::fileExists(const std::filesystem::path& path) const {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
}

std::optional<std::string> HostSystemView::getEnv(const std::string& name) const {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

bool HostSystemView::commandAvailable(const std::string& name) const {
    const char* path_env = std::getenv("PATH");
    if (path_env == nullptr || name.empty()) {
        return false;
    }

    std::istringstream dirs(path_env);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) {
            dir = ".";
        }
        std::filesystem::path candidate = std::filesystem::path(dir) / name;
        if (access(candidate.c_str(), X_OK) == 0) {
            return true;
        }
    }
    return false;
}

std::string HostSystemView::osName() const {
    struct utsname info {};
    if (uname(&info) != 0) {
        return "";
    }
    return info.sysname;
}

bool HostSystemView::isPrivileged() const {
    return geteuid() == 0;
}

std::optional<std::string> HostSystemView::loginName() const {
    const char* login = getlogin();
    if (login == nullptr || login[0] == '\0') {
        return std::nullopt;
    }
    return std::string(login);
}

std::optional<std::string> HostSystemView::sessionUser() const {
    struct passwd* pw = getpwuid(getuid());
    if (pw == nullptr || pw->pw_name == nullptr) {
        return std::nullopt;
    }
    return std::string(pw->pw_name);
}

std::filesystem::path HostSystemView::homeDirectory() const {
    const char* home = std::getenv("HOME");
    if (home != nullptr && home[0] != '\0') {
        return home;
    }

    struct passwd* pw = getpwuid(getuid());
    if (pw && pw->pw_dir) {
        return pw->pw_dir;
    }

    return "/tmp";
}

} // namespace kdeploy
