#include "request_dispatcher.h"
#include "app_config.h"
#include "error_classifier.h"
#include "http_transport.h"
#include <nlohmann/json.hpp>

namespace gptcli {

RequestDispatcher::RequestDispatcher(HttpTransport& transport) : m_transport(transport) {}

nlohmann::json RequestDispatcher::buildPayload(const std::vector<Message>& conversation,
                                               const AppConfig& config) {
    nlohmann::json payload;
    payload["model"] = config.model;
    payload["temperature"] = config.temperature;

    nlohmann::json msg_array = nlohmann::json::array();
    for (const auto& msg : conversation) {
        msg_array.push_back({{"role", roleToString(msg.role)}, {"content", msg.content}});
    }
    payload["messages"] = std::move(msg_array);

    if (config.max_tokens) {
        payload["max_tokens"] = *config.max_tokens;
    }
    return payload;
}

std::string RequestDispatcher::completionsUrl(const AppConfig& config) {
    return config.endpoint + "/chat/completions";
}

Outcome RequestDispatcher::send(const std::vector<Message>& conversation, const AppConfig& config) {
    const std::vector<std::string> headers = {
        "Authorization: Bearer " + config.api_key,
        "Content-Type: application/json",
    };
    std::string json_payload = buildPayload(conversation, config).dump();

    ++m_request_count;
    HttpResponse response;
    try {
        response = m_transport.post(completionsUrl(config), headers, json_payload);
    } catch (const TransportError& e) {
        return RecoverableFailure{FailureKind::Transport,
                                  e.timedOut() ? "Connection timed out, try again..."
                                               : "Connection error, try again..."};
    }

    return ErrorClassifier::classify(response.status_code, response.body);
}

} // namespace gptcli
