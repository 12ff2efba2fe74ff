#pragma once

#include "cli_options.h"
#include "outcome.h"
#include <string>
#include <vector>

namespace gptcli {

struct AppConfig;
class ConversationStore;
class PricingTable;
class RequestDispatcher;
class UsageTracker;
class UserInterface;

enum class TurnResult {
    Continue,   // success, recoverable failure or empty input: prompt again
    Quit,       // quit token
    Fatal       // fatal failure: the session ends
};

/**
 * SessionLoop orchestrates the conversation:
 * - Seeds the conversation with system messages before the first turn
 * - Prompts for a turn, appends it speculatively and dispatches the request
 * - Commits the reply and usage on success, rolls back on recoverable failure
 * - Terminates on fatal failure, quit token or end of input
 * - Emits the usage/cost summary exactly once at termination
 */
class SessionLoop {
public:
    static constexpr const char* QUIT_TOKEN = "/q";
    static constexpr const char* FORMATTING_DIRECTIVE =
        "Always use code blocks with the appropriate language tags. "
        "If asked for a table always format it using Markdown syntax.";
    static constexpr const char* EMPTY_REPLY_MESSAGE = "The model returned an empty reply, nothing was added to the conversation";

    SessionLoop(UserInterface& ui_ref,
                ConversationStore& store_ref,
                UsageTracker& usage_ref,
                RequestDispatcher& dispatcher_ref,
                const PricingTable& pricing_ref,
                const AppConfig& config_ref);

    // Must be called once, before run().
    void seedConversation(const std::vector<ContextBlock>& context_blocks);

    // Main loop. Returns the process exit status: 0 on quit, end of input or a
    // reported fatal failure. Exceptions from the UI propagate after the summary.
    int run();

    // Processes one line/block of user input.
    TurnResult processTurn(const std::string& input);

    // Prints "[total tokens] $cost". Only the first call has an effect.
    void emitSummary();

    std::string promptText() const;
    bool summaryEmitted() const { return m_summary_emitted; }

    static bool isQuitToken(const std::string& input);

private:
    UserInterface& ui;
    ConversationStore& store;
    UsageTracker& usage;
    RequestDispatcher& dispatcher;
    const PricingTable& pricing;
    const AppConfig& config;
    bool m_summary_emitted = false;

    void renderReply(const Message& reply);
    void reportFatal(const FatalFailure& failure);
};

} // namespace gptcli
