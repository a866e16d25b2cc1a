#include "executor.hpp"
#include "shell.hpp"
#include "signals.hpp"

#include <iostream>

int main() {
    // CTRL-C is absorbed by the shell and forwarded to the running command.
    signals::install_handlers();

    executor::ExecutionContext ctx;
    return shell::run(std::cin, std::cout, ctx);
}
