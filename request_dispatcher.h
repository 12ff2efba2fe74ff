#pragma once

#include "message.h"
#include "outcome.h"
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <vector>

namespace gptcli {

struct AppConfig;
class HttpTransport;

/**
 * RequestDispatcher handles the communication with the chat-completion API:
 * - Constructing the request body from the conversation and configuration
 * - Performing the POST through an HttpTransport
 * - Classifying the reply into an Outcome
 * It never mutates the conversation or usage totals; the caller commits or
 * rolls back based on the returned Outcome.
 */
class RequestDispatcher {
public:
    explicit RequestDispatcher(HttpTransport& transport);

    // Sends the whole conversation. Never throws for network or HTTP errors;
    // those come back as RecoverableFailure / FatalFailure.
    Outcome send(const std::vector<Message>& conversation, const AppConfig& config);

    // Builds the JSON payload: model, temperature, messages and optional max_tokens.
    static nlohmann::json buildPayload(const std::vector<Message>& conversation, const AppConfig& config);

    static std::string completionsUrl(const AppConfig& config);

    size_t requestCount() const { return m_request_count; }

private:
    HttpTransport& m_transport;
    size_t m_request_count = 0;
};

} // namespace gptcli
