#include <cstdlib> // For getenv
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>
#include "app_config.h"
#include "cli_interface.h"
#include "cli_options.h"
#include "conversation_store.h"
#include "filesystem_utils.h"
#include "http_transport.h"
#include "pricing_table.h"
#include "request_dispatcher.h"
#include "session_loop.h"
#include "usage_tracker.h"

using namespace gptcli;

int main(int argc, char* argv[]) {
    CliOptions options;
    try {
        options = parseCommandLine(std::vector<std::string>(argv + 1, argv + argc));
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n\n" << usageText();
        return 2;
    }
    if (options.help) {
        std::cout << usageText();
        return 0;
    }

    CliInterface cli_ui;
    try {
        std::filesystem::path config_path = options.config_path
            ? std::filesystem::path(*options.config_path)
            : utils::default_config_path();

        AppConfig config;
        std::vector<ContextBlock> context_blocks;
        try {
            if (ensureConfigFile(config_path)) {
                cli_ui.displayStatus("New config file initialized: " + config_path.string());
            }
            config = loadConfigFile(config_path);
            applyOverrides(config, options, std::getenv(API_KEY_ENV_VAR));
            validateConfig(config);
            context_blocks = readContextFiles(options.context_files);
        } catch (const std::runtime_error& e) {
            cli_ui.displayError(e.what());
            return 1;
        }

        PricingTable pricing = PricingTable::withDefaults();
        for (const auto& [model_id, entry] : config.pricing) {
            pricing.set(model_id, entry);
        }

        cli_ui.setMultiline(config.multiline);
        cli_ui.initialize();

        CurlTransport transport(config.timeout_seconds);
        RequestDispatcher dispatcher(transport);
        ConversationStore store;
        UsageTracker usage;
        SessionLoop session(cli_ui, store, usage, dispatcher, pricing, config);

        cli_ui.displayStatus("gptcli: activated");
        session.seedConversation(context_blocks);
        int exit_status = session.run();

        cli_ui.shutdown();
        return exit_status;
    } catch (const std::exception& e) {
        cli_ui.displayError("Fatal Error: " + std::string(e.what()));
        cli_ui.shutdown();
        return 1;
    }
}
