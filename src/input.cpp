#include "input.hpp"

#include <string>

namespace input {

ReadResult read_command(std::istream& in) {
    ReadResult result;

    std::string line;
    if (!std::getline(in, line)) {
        result.state = InputState::Exiting;
        return result;
    }

    result.command = parser::parse_line(line);
    result.state = result.command.empty() ? InputState::Empty : InputState::Valid;
    return result;
}

} // namespace input
