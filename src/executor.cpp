#include "executor.hpp"

#include "builtins.hpp"
#include "signals.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <string>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

namespace executor {
namespace {

std::vector<char*> build_argv(const parser::Command& cmd,
                              std::vector<std::string>& storage) {
    storage = cmd.args;
    std::vector<char*> argv;
    argv.reserve(storage.size() + 1);
    for (auto& arg : storage) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);
    return argv;
}

[[noreturn]] void run_child(const parser::Command& cmd) {
    signals::restore_default_handlers();

    std::vector<std::string> storage;
    auto argv = build_argv(cmd, storage);
    ::execvp(argv[0], argv.data());

    const int error = errno;
    if (error == ENOENT) {
        std::cerr << "minish: " << cmd.name() << ": command not found\n";
    } else {
        std::cerr << "minish: " << cmd.name() << ": " << std::strerror(error) << '\n';
    }
    std::cerr.flush();
    _exit(error == ENOENT ? STATUS_NOT_FOUND : STATUS_NOT_EXECUTABLE);
}

int wait_for_child(pid_t pid) {
    int status = 0;
    pid_t waited = 0;
    do {
        waited = ::waitpid(pid, &status, 0);
    } while (waited < 0 && errno == EINTR);

    if (waited < 0) {
        perror("waitpid");
        return 1;
    }
    return decode_status(status);
}

} // namespace

int decode_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return status;
}

int execute(const parser::Command& cmd, ExecutionContext& ctx, std::ostream& out) {
    if (cmd.empty()) {
        return 0;
    }

    if (builtins::is_builtin(cmd)) {
        ctx.last_status = builtins::run(cmd, ctx.should_exit, out);
        return ctx.last_status;
    }

    // Anything buffered must reach the terminal before the child writes.
    out.flush();
    std::cout.flush();
    std::cerr.flush();

    pid_t pid = ::fork();
    if (pid < 0) {
        perror("fork");
        ctx.last_status = 1;
        return ctx.last_status;
    }

    if (pid == 0) {
        run_child(cmd);
    }

    signals::set_foreground_child(pid);
    const int status = wait_for_child(pid);
    signals::clear_foreground_child();

    ctx.last_status = status;
    return status;
}

} // namespace executor
