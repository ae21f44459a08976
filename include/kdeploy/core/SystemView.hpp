#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace kdeploy {

/**
 * @brief Read-only view of the host
 *
 * Environment probing, user resolution and privilege checks read the
 * machine exclusively through this interface.
 */
class SystemView {
public:
    virtual ~SystemView() = default;

    virtual std::optional<std::string> readFile(const std::filesystem::path& path) const = 0;
    virtual bool fileExists(const std::filesystem::path& path) const = 0;
    virtual std::optional<std::string> getEnv(const std::string& name) const = 0;

    // True if an executable with this name is found on PATH.
    virtual bool commandAvailable(const std::string& name) const = 0;

    virtual std::string osName() const = 0;
    virtual bool isPrivileged() const = 0;

    // Name of the user who originally logged in on the controlling terminal.
    virtual std::optional<std::string> loginName() const = 0;

    // Name of the user owning the current process.
    virtual std::optional<std::string> sessionUser() const = 0;

    virtual std::filesystem::path homeDirectory() const = 0;
};

class HostSystemView : public SystemView {
public:
    HostSystemView() = default;
    ~HostSystemView() override = default;

    std::optional<std::string> readFile(const std::filesystem::path& path) const override;
    bool fileExists(const std::filesystem::path& path) const override;
    std::optional<std::string> getEnv(const std::string& name) const override;
    bool commandAvailable(const std::string& name) const override;
    std::string osName() const override;
    bool isPrivileged() const override;
    std::optional<std::string> loginName() const override;
    std::optional<std::string> sessionUser() const override;
    std::filesystem::path homeDirectory() const override;
};

} // namespace kdeploy
