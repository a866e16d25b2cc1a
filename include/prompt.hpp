/**
 * @file prompt.hpp
 * @brief Prompt generation utilities.
 */
#pragma once

#include <string>

namespace prompt {

constexpr const char* DEFAULT_PROMPT = "-> ";

/// Returns $MINISH_PROMPT when set and non-empty, DEFAULT_PROMPT otherwise.
std::string build_prompt();

} // namespace prompt
