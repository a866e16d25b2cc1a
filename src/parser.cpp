#include "parser.hpp"

#include <cctype>

namespace parser {
namespace {

void flush_token(std::string& token, bool& quoted, Command& cmd) {
    if (!token.empty() || quoted) {
        cmd.args.push_back(token);
        token.clear();
    }
    quoted = false;
}

} // namespace

Command parse_line(const std::string& line) {
    Command result;
    std::string token;
    bool in_single = false;
    bool in_double = false;
    bool escape = false;
    // Set once a quote pair is seen so that "" still yields an argument.
    bool quoted = false;

    for (const char ch : line) {
        if (escape) {
            token.push_back(ch);
            escape = false;
            continue;
        }

        if (ch == '\\' && !in_single) {
            escape = true;
            continue;
        }

        if (ch == '"' && !in_single) {
            in_double = !in_double;
            quoted = true;
            continue;
        }

        if (ch == '\'' && !in_double) {
            in_single = !in_single;
            quoted = true;
            continue;
        }

        if (!in_single && !in_double &&
            std::isspace(static_cast<unsigned char>(ch))) {
            flush_token(token, quoted, result);
            continue;
        }

        token.push_back(ch);
    }

    if (escape) {
        token.push_back('\\');
    }

    flush_token(token, quoted, result);
    return result;
}

} // namespace parser
