#include "shell.hpp"

#include "input.hpp"
#include "prompt.hpp"
#include "signals.hpp"

#include <iostream>
#include <stdexcept>
#include <string>

namespace shell {

int run(std::istream& in, std::ostream& out, executor::ExecutionContext& ctx) {
    while (!ctx.should_exit) {
        const std::string ps1 = prompt::build_prompt();
        signals::set_prompt(ps1);
        out << ps1;
        out.flush();

        input::ReadResult read = input::read_command(in);

        if (read.state == input::InputState::Exiting) {
            out << "\nCTRL-D detected. Logging you out...\n";
            out.flush();
            break;
        }

        if (read.state == input::InputState::Empty) {
            continue;
        }

        // Execute command - continue loop even if command fails
        try {
            executor::execute(read.command, ctx, out);
        } catch (const std::exception& e) {
            std::cerr << "minish: error: " << e.what() << '\n';
        }
    }

    return 0;
}

} // namespace shell
