#pragma once

#include <iosfwd>
#include <string>

namespace kdeploy {

/**
 * @brief Interactive y/n confirmation
 *
 * Only the exact answer "y" confirms. Anything else, including an empty
 * line or end of input, is a decline.
 */
class Prompt {
public:
    Prompt(std::istream& in, std::ostream& out);

    Prompt(const Prompt&) = delete;
    Prompt& operator=(const Prompt&) = delete;

    bool confirm(const std::string& question);

    static Prompt& standard();

    static constexpr const char* AFFIRMATIVE = "y";

private:
    std::istream& in_;
    std::ostream& out_;
};

} // namespace kdeploy
