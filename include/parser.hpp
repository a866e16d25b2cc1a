/**
 * @file parser.hpp
 * @brief Parsing utilities for turning user input into executable commands.
 */
#pragma once

#include <string>
#include <vector>

namespace parser {

struct Command {
    std::vector<std::string> args;

    bool empty() const { return args.empty(); }
    const std::string& name() const { return args.front(); }
};

Command parse_line(const std::string& line);

} // namespace parser
