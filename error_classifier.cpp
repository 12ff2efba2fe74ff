#include "error_classifier.h"
#include <nlohmann/json.hpp>
#include <regex>
#include <stdexcept>

namespace gptcli {

Outcome ErrorClassifier::classify(long status_code, const std::string& body) {
    // Map the HTTP status to an outcome; only 200 and 400 need the body parsed
    switch (status_code) {
        case 200:
            return parseSuccessBody(body);
        case 400:
            return classifyBadRequest(body);
        case 401:
            // No point retrying with the same key
            return FatalFailure{FailureKind::Authentication, "Invalid API Key", "", std::nullopt};
        case 429:
            return RecoverableFailure{FailureKind::RateLimitOrQuota, "Rate limit or maximum monthly limit exceeded"};
        case 502:
        case 503:
            return RecoverableFailure{FailureKind::UpstreamOverload, "The server seems to be overloaded, try again"};
        default:
            // Keep the body so the user can see what the server said
            return FatalFailure{FailureKind::UnknownStatus,
                                "Unknown error, status code " + std::to_string(status_code),
                                body, std::nullopt};
    }
}

std::optional<ContextLengthDetail> ErrorClassifier::parseContextLengthMessage(const std::string& message) {
    // e.g. "This model's maximum context length is 4096 tokens. However, your messages resulted in 4500 tokens."
    static const std::regex pattern(
        R"(maximum context length is (\d+) tokens[\s\S]*?resulted in (\d+) tokens)");

    std::smatch match;
    if (!std::regex_search(message, match, pattern)) {
        return std::nullopt;
    }
    // Digits can still overflow long long
    try {
        ContextLengthDetail detail;
        detail.max_tokens = std::stoll(match[1].str());
        detail.sent_tokens = std::stoll(match[2].str());
        return detail;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

Outcome ErrorClassifier::parseSuccessBody(const std::string& body) {
    try {
        auto response = nlohmann::json::parse(body);

        // .at() throws on a missing key or an empty choices array, handled below
        const auto& message = response.at("choices").at(0).at("message");
        const auto& content = message.at("content");
        // A null content (no text produced) is read as an empty reply; anything else must be a string
        if (!content.is_null() && !content.is_string()) {
            return FatalFailure{FailureKind::MalformedResponse,
                                "API response contained a non-text assistant content", body, std::nullopt};
        }

        // Usage is mandatory: it drives the prompt counter and the cost summary
        const auto& usage = response.at("usage");
        const auto& prompt = usage.at("prompt_tokens");
        const auto& completion = usage.at("completion_tokens");
        if (!prompt.is_number_unsigned() || !completion.is_number_unsigned()) {
            return FatalFailure{FailureKind::MalformedResponse,
                                "API response contained invalid usage counts", body, std::nullopt};
        }

        Success success;
        success.reply = Message{Role::Assistant, content.is_string() ? content.get<std::string>() : std::string()};
        success.usage.prompt_tokens = prompt.get<std::uint64_t>();
        success.usage.completion_tokens = completion.get<std::uint64_t>();
        return success;
    } catch (const nlohmann::json::exception& e) {
        return FatalFailure{FailureKind::MalformedResponse,
                            "Invalid API response structure: " + std::string(e.what()), body, std::nullopt};
    }
}

Outcome ErrorClassifier::classifyBadRequest(const std::string& body) {
    nlohmann::json response;
    try {
        response = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error&) {
        response = nullptr; // Falls through to the missing error details case
    }

    if (!response.is_object() || !response.contains("error") || !response["error"].is_object()) {
        return FatalFailure{FailureKind::MalformedErrorBody,
                            "Invalid request and could not find error details in API response",
                            body, std::nullopt};
    }

    const auto& error = response["error"];
    bool is_context_length = error.contains("code") && error["code"].is_string() &&
                             error["code"].get<std::string>() == "context_length_exceeded";
    if (!is_context_length) {
        return FatalFailure{FailureKind::InvalidRequest,
                            "Invalid request, please review API response", body, std::nullopt};
    }

    // Without usable numbers the generic context length message is reported
    std::optional<ContextLengthDetail> detail;
    if (error.contains("message") && error["message"].is_string()) {
        detail = parseContextLengthMessage(error["message"].get<std::string>());
    }

    FatalFailure failure{FailureKind::ContextLengthExceeded, "Maximum context length exceeded.", "", detail};
    if (detail) {
        failure.reason = "Maximum context length (" + std::to_string(detail->max_tokens) +
                         ") exceeded. Try reducing " + std::to_string(detail->overage()) +
                         " from the source total (" + std::to_string(detail->sent_tokens) + ")";
    }
    return failure;
}

} // namespace gptcli
