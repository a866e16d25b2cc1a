/**
 * @file shell.hpp
 * @brief The read-eval loop.
 */
#pragma once

#include "executor.hpp"

#include <istream>
#include <ostream>

namespace shell {

/// Prompts on @p out, reads commands from @p in and executes them until
/// `exit` or end of input. Returns the shell's exit status.
int run(std::istream& in, std::ostream& out, executor::ExecutionContext& ctx);

} // namespace shell
