/**
 * @file signals.hpp
 * @brief Signal installation and helpers.
 *
 * CTRL-C never terminates the shell. While a foreground child is registered
 * the SIGINT handler kills that child; otherwise it re-prints the prompt.
 */
#pragma once

#include <string>

#include <sys/types.h>

namespace signals {

void install_handlers();
void restore_default_handlers();

void set_foreground_child(pid_t pid);
void clear_foreground_child();
pid_t foreground_child();

/// Copies @p text into the buffer the SIGINT handler prints from.
/// Text longer than the buffer is truncated.
void set_prompt(const std::string& text);

} // namespace signals
