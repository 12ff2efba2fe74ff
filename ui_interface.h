#pragma once

#include <optional>
#include <string>

namespace gptcli {

// Abstract base class defining the contract for user interaction.
// This allows the session logic to be decoupled from the terminal implementation.
class UserInterface {
public:
    // Prompts the user for one turn of input.
    // Returns std::nullopt if the user signals end-of-input (e.g., Ctrl+D).
    virtual std::optional<std::string> promptUserInput(const std::string& prompt) = 0;

    // Displays assistant replies and the usage summary.
    virtual void displayOutput(const std::string& output) = 0;

    // Displays error messages to the user.
    virtual void displayError(const std::string& error) = 0;

    // Displays status messages to the user (e.g., context files loaded).
    virtual void displayStatus(const std::string& status) = 0;

    // Performs any necessary initialization for the UI.
    virtual void initialize() = 0;

    // Performs any necessary cleanup for the UI.
    virtual void shutdown() = 0;

    virtual ~UserInterface() = default;
};

} // namespace gptcli
