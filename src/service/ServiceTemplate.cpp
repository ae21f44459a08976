#include "kdeploy/service/ServiceTemplate.hpp"
#include "kdeploy/core/Errors.hpp"

#include <fstream>
#include <sstream>

namespace kdeploy {

namespace {

constexpr const char* EXEC_START = "ExecStart=";
constexpr const char* WORKING_DIRECTORY = "WorkingDirectory=";
constexpr const char* USER = "User=";

bool startsWith(const std::string& text, const std::string& prefix) {
    return text.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

std::optional<ServiceTemplate::Slot> ServiceTemplate::classify(const std::string& line) {
    size_t start = line.find_first_not_of(" \t");
    if (start == std::string::npos) {
        return std::nullopt;
    }

    std::string trimmed = line.substr(start);
    if (startsWith(trimmed, EXEC_START)) return Slot::ExecStart;
    if (startsWith(trimmed, WORKING_DIRECTORY)) return Slot::WorkingDirectory;
    if (startsWith(trimmed, USER)) return Slot::User;
    return std::nullopt;
}

ServiceTemplate ServiceTemplate::parse(const std::string& text) {
    ServiceTemplate result;
    int exec_count = 0;
    int workdir_count = 0;
    int user_count = 0;

    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        Line parsed;
        parsed.text = line;
        parsed.slot = classify(line);

        if (parsed.slot) {
            switch (*parsed.slot) {
                case Slot::ExecStart: exec_count++; break;
                case Slot::WorkingDirectory: workdir_count++; break;
                case Slot::User: user_count++; break;
            }
        }
        result.lines_.push_back(std::move(parsed));
    }
    result.trailing_newline_ = text.empty() || text.back() == '\n';

    auto require = [](int count, const char* directive) {
        if (count != 1) {
            throw PreconditionError(
                std::string("Service template must contain exactly one ") + directive +
                    " line (found " + std::to_string(count) + ")",
                std::string("Edit the template so it has a single '") + directive + "...' line");
        }
    };
    require(exec_count, EXEC_START);
    require(workdir_count, WORKING_DIRECTORY);
    require(user_count, USER);

    return result;
}

ServiceTemplate ServiceTemplate::load(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw PreconditionError("Service template not found: " + path.string(),
                                "Copy kneeboard.service next to the application and retry");
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str());
}

std::string ServiceTemplate::render(const ServiceDescriptor& descriptor) const {
    std::string out;

    for (size_t i = 0; i < lines_.size(); ++i) {
        const Line& line = lines_[i];

        if (!line.slot) {
            out += line.text;
        } else {
            switch (*line.slot) {
                case Slot::ExecStart:
                    out += EXEC_START + descriptor.exec_path;
                    break;
                case Slot::WorkingDirectory:
                    out += WORKING_DIRECTORY + descriptor.working_directory;
                    break;
                case Slot::User:
                    out += USER + descriptor.run_as_user;
                    break;
            }
        }

        if (i + 1 < lines_.size() || trailing_newline_) {
            out += '\n';
        }
    }

    return out;
}

} // namespace kdeploy
