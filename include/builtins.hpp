/**
 * @file builtins.hpp
 * @brief Shell built-in command declarations.
 */
#pragma once

#include "parser.hpp"

#include <ostream>

namespace builtins {

bool is_builtin(const parser::Command& cmd);
int run(const parser::Command& cmd, bool& should_exit, std::ostream& out);

} // namespace builtins
