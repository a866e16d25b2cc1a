#include "prompt.hpp"

#include <cstdlib>

namespace {

constexpr const char* PROMPT_ENV = "MINISH_PROMPT";

} // namespace

namespace prompt {

std::string build_prompt() {
    const char* custom = std::getenv(PROMPT_ENV);
    if (custom && *custom) {
        return custom;
    }
    return DEFAULT_PROMPT;
}

} // namespace prompt
