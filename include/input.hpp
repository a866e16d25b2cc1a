/**
 * @file input.hpp
 * @brief Reading a line of user input and classifying it.
 */
#pragma once

#include "parser.hpp"

#include <istream>

namespace input {

enum class InputState {
    Valid,
    Empty,
    Exiting,
};

struct ReadResult {
    InputState state = InputState::Exiting;
    parser::Command command;
};

/// Reads one line from @p in. End of stream (CTRL-D) or a read error
/// yields InputState::Exiting.
ReadResult read_command(std::istream& in);

} // namespace input
