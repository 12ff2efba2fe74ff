#include "session_loop.h"
#include "app_config.h"
#include "conversation_store.h"
#include "filesystem_utils.h"
#include "pricing_table.h"
#include "request_dispatcher.h"
#include "ui_interface.h"
#include "usage_tracker.h"
#include <algorithm>
#include <cctype>
#include <nlohmann/json.hpp>

namespace gptcli {

SessionLoop::SessionLoop(UserInterface& ui_ref,
                         ConversationStore& store_ref,
                         UsageTracker& usage_ref,
                         RequestDispatcher& dispatcher_ref,
                         const PricingTable& pricing_ref,
                         const AppConfig& config_ref)
    : ui(ui_ref), store(store_ref), usage(usage_ref), dispatcher(dispatcher_ref),
      pricing(pricing_ref), config(config_ref) {}

void SessionLoop::seedConversation(const std::vector<ContextBlock>& context_blocks) {
    // Try to force the model to always answer with well formatted code blocks and tables
    if (config.markdown) {
        store.appendSystem(FORMATTING_DIRECTIVE);
    }

    for (const auto& block : context_blocks) {
        std::string content = utils::trim(block.content);
        if (content.empty()) {
            ui.displayError("Context file " + block.name + " is empty, skipping it");
            continue;
        }
        ui.displayStatus("Context file: " + block.name);
        store.appendSystem(content);
    }
}

int SessionLoop::run() {
    ui.displayStatus("Session started. Active model: " + config.model);

    try {
        while (true) {
            auto input_opt = ui.promptUserInput(promptText());
            if (!input_opt) break; // End of input (Ctrl+D)

            // A fatal outcome has already been reported; it ends the session like a quit
            TurnResult result = processTurn(*input_opt);
            if (result != TurnResult::Continue) break;
        }
    } catch (...) {
        // Still show what was spent before the error propagates
        emitSummary();
        throw;
    }

    emitSummary();
    return 0;
}

bool SessionLoop::isQuitToken(const std::string& input) {
    std::string lowered = input;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered == QUIT_TOKEN;
}

std::string SessionLoop::promptText() const {
    return "[" + std::to_string(usage.totalTokens()) + "] >>> ";
}

TurnResult SessionLoop::processTurn(const std::string& input) {
    if (input.empty()) {
        return TurnResult::Continue;
    }
    if (isQuitToken(input)) {
        return TurnResult::Quit;
    }

    // Speculative: undone below unless the exchange is accepted.
    store.appendUser(input);
    Outcome outcome = dispatcher.send(store.snapshot(), config);

    if (auto* success = std::get_if<Success>(&outcome)) {
        // The exchange was billed whatever the reply holds
        usage.record(success->usage);
        if (success->reply.content.empty()) {
            // Nothing to keep: drop the question too so the history stays in user/assistant pairs
            store.rollbackLast();
            ui.displayError(EMPTY_REPLY_MESSAGE);
            return TurnResult::Continue;
        }
        store.append(success->reply);
        renderReply(success->reply);
        return TurnResult::Continue;
    }

    if (auto* recoverable = std::get_if<RecoverableFailure>(&outcome)) {
        store.rollbackLast();
        ui.displayError(recoverable->reason);
        return TurnResult::Continue;
    }

    // The session ends here; drop the unanswered turn so the store only holds accepted exchanges.
    store.rollbackLast();
    reportFatal(std::get<FatalFailure>(outcome));
    return TurnResult::Fatal;
}

void SessionLoop::renderReply(const Message& reply) {
    ui.displayOutput("\n" + utils::trim(reply.content) + "\n");
}

void SessionLoop::reportFatal(const FatalFailure& failure) {
    // Reason only, when there is no body worth showing
    if (failure.raw_body.empty()) {
        ui.displayError(failure.reason);
        return;
    }

    std::string body = failure.raw_body;
    try {
        body = nlohmann::json::parse(failure.raw_body).dump(2);
    } catch (const nlohmann::json::parse_error&) {
        // Not JSON; surface it as received.
    }
    ui.displayError(failure.reason + ":\n" + body);
}

void SessionLoop::emitSummary() {
    if (m_summary_emitted) return;
    m_summary_emitted = true;

    // Format: "[<total tokens>] $<cost>", the cost omitted when the model has no known price
    std::string tokens = "[" + std::to_string(usage.totalTokens()) + "]";
    try {
        ui.displayOutput("\n" + tokens + " $" + usage.formattedCost(config.model, pricing));
    } catch (const UnknownModelPricingError& e) {
        ui.displayOutput("\n" + tokens);
        ui.displayError(std::string(e.what()) + ", cannot estimate the expense");
    }
}

} // namespace gptcli
