#include "builtins.hpp"

#include <algorithm>
#include <string_view>
#include <vector>

namespace builtins {
namespace {

constexpr const char* HELP_TEXT =
    "minish - a minimal command shell\n"
    "\n"
    "Type a program name and its arguments to run it.\n"
    "CTRL-C stops the running program, CTRL-D logs you out.\n"
    "\n"
    "Available commands:\n"
    "  help - Show this help message\n"
    "  exit - Exit the shell\n";

std::string_view command_name(const parser::Command& cmd) {
    if (cmd.empty()) {
        return {};
    }
    return cmd.name();
}

int builtin_help(std::ostream& out) {
    out << HELP_TEXT;
    out.flush();
    return 0;
}

} // namespace

bool is_builtin(const parser::Command& cmd) {
    const auto name = command_name(cmd);
    if (name.empty()) {
        return false;
    }
    static const std::vector<std::string_view> builtins = {"help", "exit"};
    return std::find(builtins.begin(), builtins.end(), name) != builtins.end();
}

int run(const parser::Command& cmd, bool& should_exit, std::ostream& out) {
    const auto name = command_name(cmd);
    if (name.empty()) {
        return 0;
    }

    if (name == "help") {
        return builtin_help(out);
    }
    if (name == "exit") {
        should_exit = true;
        return 0;
    }
    return 0;
}

} // namespace builtins
