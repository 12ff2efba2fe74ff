#pragma once

#include "message.h"
#include "usage_tracker.h"
#include <optional>
#include <string>
#include <variant>

namespace gptcli {

enum class FailureKind {
    // Recoverable: the turn is rolled back and the user may resend.
    Transport,
    RateLimitOrQuota,
    UpstreamOverload,
    // Fatal: the session ends after the diagnostic.
    Authentication,
    ContextLengthExceeded,
    InvalidRequest,
    MalformedErrorBody,
    MalformedResponse,
    UnknownStatus
};

/// Numbers extracted from a "maximum context length" error message.
struct ContextLengthDetail {
    long long max_tokens = 0;
    long long sent_tokens = 0;

    long long overage() const { return sent_tokens - max_tokens; }
};

struct Success {
    Message reply;
    UsageCounters usage;
};

struct RecoverableFailure {
    FailureKind kind = FailureKind::Transport;
    std::string reason;
};

struct FatalFailure {
    FailureKind kind = FailureKind::UnknownStatus;
    std::string reason;
    std::string raw_body;  // empty when there is nothing worth surfacing
    std::optional<ContextLengthDetail> context_length;
};

/// Classified result of one request attempt.
using Outcome = std::variant<Success, RecoverableFailure, FatalFailure>;

inline bool isSuccess(const Outcome& outcome) { return std::holds_alternative<Success>(outcome); }
inline bool isRecoverable(const Outcome& outcome) { return std::holds_alternative<RecoverableFailure>(outcome); }
inline bool isFatal(const Outcome& outcome) { return std::holds_alternative<FatalFailure>(outcome); }

} // namespace gptcli
