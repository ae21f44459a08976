#pragma once

/**
 * @file ServiceManager.hpp
 * @brief Service manager interface and its systemd backend
 *
 * The systemd backend talks to org.freedesktop.systemd1 over the system bus.
 *
 * @author Pilot Kneeboard Deployment Team
 * @version 1.0.0
 */

#include <string>

namespace kdeploy {

/**
 * @brief Adapter over the OS service manager
 *
 * Every call returns false on failure and leaves a description in
 * lastError(); none of them throw.
 */
class ServiceManager {
public:
    virtual ~ServiceManager() = default;

    // Re-read unit files from disk
    virtual bool reload() = 0;

    // Enable for boot-time autostart
    virtual bool enable(const std::string& unit) = 0;

    virtual bool start(const std::string& unit) = 0;

    // "active", "activating", "failed", ...; empty if it could not be read
    virtual std::string activeState(const std::string& unit) = 0;

    virtual std::string lastError() const = 0;
};

/**
 * @brief systemd over the system D-Bus (org.freedesktop.systemd1)
 */
class SystemdServiceManager : public ServiceManager {
public:
    SystemdServiceManager();
    ~SystemdServiceManager() override;

    SystemdServiceManager(const SystemdServiceManager&) = delete;
    SystemdServiceManager& operator=(const SystemdServiceManager&) = delete;

    bool isConnected() const { return connection_ != nullptr; }

    bool reload() override;
    bool enable(const std::string& unit) override;
    bool start(const std::string& unit) override;
    std::string activeState(const std::string& unit) override;
    std::string lastError() const override { return last_error_; }

private:
    void* connection_{nullptr};     // GDBusConnection
    std::string last_error_;

    // Calls a method on the systemd manager object. Returns the reply
    // (a GVariant*, caller unrefs) or nullptr with last_error_ set.
    void* callManager(const char* method, void* parameters, const char* reply_type);
    std::string unitPath(const std::string& unit);
};

} // namespace kdeploy
