#include "signals.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <unistd.h>

namespace signals {
namespace {

constexpr const char INTERRUPT_MESSAGE[] = "CTRL-C detected. Terminating active task.\n";

volatile sig_atomic_t foreground_pid = 0;

std::array<char, 256> prompt_buffer{};
volatile sig_atomic_t prompt_length = 0;

void write_raw(const char* data, std::size_t length) {
    while (length > 0) {
        const ssize_t written = ::write(STDOUT_FILENO, data, length);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            return;
        }
        data += written;
        length -= static_cast<std::size_t>(written);
    }
}

void sigint_handler(int) {
    const int saved_errno = errno;
    const pid_t child = static_cast<pid_t>(foreground_pid);
    if (child > 0) {
        write_raw(INTERRUPT_MESSAGE, sizeof(INTERRUPT_MESSAGE) - 1);
        ::kill(child, SIGKILL);
    } else {
        write_raw("\n", 1);
        write_raw(prompt_buffer.data(), static_cast<std::size_t>(prompt_length));
    }
    errno = saved_errno;
}

void install_handler(int sig, void (*fn)(int)) {
    struct sigaction action {};
    action.sa_handler = fn;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_RESTART;
    if (sigaction(sig, &action, nullptr) != 0) {
        perror("sigaction");
    }
}

} // namespace

void install_handlers() {
    install_handler(SIGINT, sigint_handler);
}

void restore_default_handlers() {
    install_handler(SIGINT, SIG_DFL);
}

void set_foreground_child(pid_t pid) {
    foreground_pid = static_cast<sig_atomic_t>(pid);
}

void clear_foreground_child() {
    foreground_pid = 0;
}

pid_t foreground_child() {
    return static_cast<pid_t>(foreground_pid);
}

void set_prompt(const std::string& text) {
    // Hide the buffer from the handler while it is rewritten.
    prompt_length = 0;
    const std::size_t length = std::min(text.size(), prompt_buffer.size());
    std::memcpy(prompt_buffer.data(), text.data(), length);
    prompt_length = static_cast<sig_atomic_t>(length);
}

} // namespace signals
