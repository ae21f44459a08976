#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace kdeploy {

/**
 * @brief Base class for fatal deployment errors
 *
 * Carries a copy-pasteable remediation command that entry points print
 * before exiting with status 1.
 */
class DeployError : public std::runtime_error {
public:
    DeployError(const std::string& message, std::string remediation)
        : std::runtime_error(message), remediation_(std::move(remediation)) {}

    const std::string& remediation() const noexcept { return remediation_; }

private:
    std::string remediation_;
};

// Missing privilege, missing required file, malformed template or config.
class PreconditionError : public DeployError {
public:
    using DeployError::DeployError;
};

// A required dependency still fails its check after one install attempt.
class DependencyError : public DeployError {
public:
    DependencyError(std::string dependency, const std::string& remediation)
        : DeployError("Required dependency '" + dependency + "' is not available", remediation),
          dependency_(std::move(dependency)) {}

    const std::string& dependency() const noexcept { return dependency_; }

private:
    std::string dependency_;
};

} // namespace kdeploy
