#include "cli_interface.h"
#include <cstdio>  // readline.h uses FILE
#include <cstdlib> // For free()
#include <iostream>
#include <readline/history.h>
#include <readline/readline.h>

namespace gptcli {

void CliInterface::initialize() {
    // Readline initializes itself on first use; history is kept in memory only.
    using_history();
}

void CliInterface::shutdown() {
    clear_history();
}

std::optional<std::string> CliInterface::readLine(const std::string& prompt) {
    char* input_cstr = readline(prompt.c_str());
    if (!input_cstr) {
        return std::nullopt;
    }
    std::string input(input_cstr);
    free(input_cstr); // Free memory allocated by readline
    return input;
}

// Single-line mode returns the line as typed.
// Multiline mode keeps reading continuation lines until EOF (Ctrl+D) and returns
// the block joined with newlines. Blank lines inside the block are kept, trailing
// ones are dropped.
std::optional<std::string> CliInterface::promptUserInput(const std::string& prompt) {
    auto first = readLine(prompt);
    if (!first) {
        std::cout << std::endl; // Print a newline after Ctrl+D for cleaner terminal output
        return std::nullopt;
    }

    std::string input = *first;
    if (m_multiline && !input.empty()) {
        while (auto next = readLine(CONTINUATION_PROMPT)) {
            input += "\n" + *next;
        }
        std::cout << std::endl; // Ctrl+D leaves the cursor on the continuation prompt

        // Strip trailing blank lines
        auto last = input.find_last_not_of("\n");
        input.erase(last + 1);
    }

    if (!input.empty()) {
        add_history(input.c_str());
    }
    return input;
}

void CliInterface::displayOutput(const std::string& output) {
    std::cout << output;
    if (output.empty() || output.back() != '\n') {
        std::cout << '\n';
    }
    std::cout.flush();
}

// Errors go to stderr with an "Error: " prefix.
void CliInterface::displayError(const std::string& error) {
    std::cerr << "Error: " << error;
    if (error.empty() || error.back() != '\n') {
        std::cerr << '\n';
    }
    std::cerr.flush();
}

void CliInterface::displayStatus(const std::string& status) {
    std::cout << "[Status] " << status;
    if (status.empty() || status.back() != '\n') {
        std::cout << '\n';
    }
    std::cout.flush();
}

} // namespace gptcli
