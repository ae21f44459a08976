#include "kdeploy/core/Prompt.hpp"

#include <iostream>

namespace kdeploy {

Prompt::Prompt(std::istream& in, std::ostream& out) : in_(in), out_(out) {}

bool Prompt::confirm(const std::string& question) {
    out_ << question << " (y/n): " << std::flush;

    std::string answer;
    if (!std::getline(in_, answer)) {
        out_ << std::endl;
        return false;
    }

    return answer == AFFIRMATIVE;
}

Prompt& Prompt::standard() {
    static Prompt prompt(std::cin, std::cout);
    return prompt;
}

} // namespace kdeploy
