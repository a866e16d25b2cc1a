/**
 * @file executor.hpp
 * @brief Dispatch of a parsed command to a builtin or an external process.
 */
#pragma once

#include "parser.hpp"

#include <ostream>

namespace executor {

struct ExecutionContext {
    bool should_exit = false;
    int last_status = 0;
};

/// Exit code of a child that could not be found on PATH.
constexpr int STATUS_NOT_FOUND = 127;
/// Exit code of a child that was found but could not be executed.
constexpr int STATUS_NOT_EXECUTABLE = 126;

/// Runs @p cmd and blocks until it completes. External commands inherit
/// stdin, stdout and stderr. Returns the command's exit code, or 128 plus
/// the signal number when the child was killed by a signal.
int execute(const parser::Command& cmd, ExecutionContext& ctx, std::ostream& out);

int decode_status(int status);

} // namespace executor
