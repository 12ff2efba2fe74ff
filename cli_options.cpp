#include "cli_options.h"
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace gptcli {

CliOptions parseCommandLine(const std::vector<std::string>& args) {
    CliOptions options;

    auto require_value = [&args](size_t& i) -> const std::string& {
        if (i + 1 >= args.size()) {
            throw std::invalid_argument("Option '" + args[i] + "' requires a value");
        }
        return args[++i];
    };

    for (size_t i = 0; i < args.size(); i++) {
        const std::string& arg = args[i];
        if (arg == "-c" || arg == "--context") {
            options.context_files.push_back(require_value(i));
        } else if (arg == "-k" || arg == "--key") {
            options.api_key = require_value(i);
        } else if (arg == "-m" || arg == "--model") {
            options.model = require_value(i);
        } else if (arg == "--config") {
            options.config_path = require_value(i);
        } else if (arg == "-ml" || arg == "--multiline") {
            options.multiline = true;
        } else if (arg == "-h" || arg == "--help") {
            options.help = true;
        } else {
            throw std::invalid_argument("Unknown option: " + arg);
        }
    }
    return options;
}

std::string usageText() {
    return "Usage: gptcli [OPTIONS]\n\n"
           "Options:\n"
           "  -c, --context FILE    Path to a context file (repeatable)\n"
           "  -k, --key KEY         Set the API key\n"
           "  -m, --model MODEL     Set the model\n"
           "  -ml, --multiline      Use the multiline input mode (end a block with Ctrl+D)\n"
           "  --config PATH         Use an alternative configuration file\n"
           "  -h, --help            Show this message and exit\n";
}

std::vector<ContextBlock> readContextFiles(const std::vector<std::string>& paths) {
    std::vector<ContextBlock> blocks;
    for (const auto& path : paths) {
        std::ifstream file(path);
        if (!file) {
            throw std::runtime_error("Could not open context file: " + path);
        }
        std::ostringstream content;
        content << file.rdbuf();
        if (file.bad()) {
            throw std::runtime_error("Failed reading context file: " + path);
        }
        blocks.push_back(ContextBlock{path, content.str()});
    }
    return blocks;
}

} // namespace gptcli
