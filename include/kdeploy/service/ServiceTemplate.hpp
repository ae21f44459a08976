#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace kdeploy {

struct ServiceDescriptor {
    std::string exec_path;              // full ExecStart value: runtime + entry point
    std::string working_directory;
    std::string run_as_user;
    bool autostart{true};
};

/**
 * @brief Unit file template with three substitutable directives
 *
 * The template must contain exactly one line each starting with
 * ExecStart=, WorkingDirectory= and User=. Those lines are replaced when
 * rendering; every other line is passed through byte for byte.
 */
class ServiceTemplate {
public:
    // Throws PreconditionError if a directive is missing or repeated.
    static ServiceTemplate parse(const std::string& text);
    static ServiceTemplate load(const std::filesystem::path& path);

    std::string render(const ServiceDescriptor& descriptor) const;

private:
    enum class Slot {
        ExecStart,
        WorkingDirectory,
        User
    };

    struct Line {
        std::optional<Slot> slot;
        std::string text;
    };

    std::vector<Line> lines_;
    bool trailing_newline_{true};

    static std::optional<Slot> classify(const std::string& line);
};

} // namespace kdeploy
