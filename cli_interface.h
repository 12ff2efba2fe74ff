#pragma once

#include "ui_interface.h"
#include <optional>
#include <string>

namespace gptcli {

// Concrete implementation of UserInterface for a terminal, backed by readline.
class CliInterface : public UserInterface {
public:
    explicit CliInterface(bool multiline = false) : m_multiline(multiline) {}
    ~CliInterface() override = default;

    // In multiline mode a turn is ended by Ctrl+D; blank lines belong to the block.
    void setMultiline(bool multiline) { m_multiline = multiline; }

    std::optional<std::string> promptUserInput(const std::string& prompt) override;
    void displayOutput(const std::string& output) override;
    void displayError(const std::string& error) override;
    void displayStatus(const std::string& status) override;
    void initialize() override;
    void shutdown() override;

    static constexpr const char* CONTINUATION_PROMPT = "... ";

protected:
    // Reads one raw line. Returns std::nullopt on EOF (Ctrl+D).
    virtual std::optional<std::string> readLine(const std::string& prompt);

private:

    bool m_multiline;
};

} // namespace gptcli
