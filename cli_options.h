#pragma once

#include <optional>
#include <string>
#include <vector>

namespace gptcli {

/// Options collected from the command line. Unset optionals mean "not given".
struct CliOptions {
    std::vector<std::string> context_files;
    std::optional<std::string> api_key;
    std::optional<std::string> model;
    std::optional<std::string> config_path;
    bool multiline = false;
    bool help = false;
};

/// A context file read from disk, ready to be seeded as a system message.
struct ContextBlock {
    std::string name;
    std::string content;
};

// Parses arguments (without argv[0]).
// Throws std::invalid_argument on unknown flags or missing values.
CliOptions parseCommandLine(const std::vector<std::string>& args);

std::string usageText();

// Throws std::runtime_error if a file cannot be read.
std::vector<ContextBlock> readContextFiles(const std::vector<std::string>& paths);

} // namespace gptcli
