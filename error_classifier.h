#pragma once

#include "outcome.h"
#include <optional>
#include <string>

namespace gptcli {

/**
 * ErrorClassifier turns the HTTP status and body of a chat-completion
 * response into an Outcome:
 * - 200: Success with the assistant message and usage counts
 * - 400: context-length, invalid-request or malformed-error-body failures
 * - 401: authentication failure
 * - 429, 502, 503: recoverable failures
 * - anything else: unknown status, raw body surfaced
 * It has no state; classify() is a pure function of its arguments.
 */
class ErrorClassifier {
public:
    static Outcome classify(long status_code, const std::string& body);

    // Extracts "maximum context length is N tokens ... resulted in M tokens".
    // Returns std::nullopt if the message does not follow that pattern.
    static std::optional<ContextLengthDetail> parseContextLengthMessage(const std::string& message);

private:
    static Outcome parseSuccessBody(const std::string& body);
    static Outcome classifyBadRequest(const std::string& body);
};

} // namespace gptcli
