#include "gtest/gtest.h"
#include "error_classifier.h"
#include "test_fakes.h"

using namespace gptcli;

namespace {

FatalFailure expectFatal(const Outcome& outcome) {
    EXPECT_TRUE(isFatal(outcome));
    return isFatal(outcome) ? std::get<FatalFailure>(outcome) : FatalFailure{};
}

const char* kContextLengthBody = R"({"error":{"code":"context_length_exceeded","message":"This model's maximum context length is 4096 tokens. However, your messages resulted in 4500 tokens. Please reduce the length of the messages."}})";

} // namespace

TEST(ErrorClassifierTest, StatusTable) {
    EXPECT_TRUE(isSuccess(ErrorClassifier::classify(200, fakes::successBody("hi", 1, 1))));
    EXPECT_TRUE(isFatal(ErrorClassifier::classify(400, R"({"error":{"code":"x","message":"y"}})")));
    EXPECT_TRUE(isFatal(ErrorClassifier::classify(401, "{}")));
    EXPECT_TRUE(isRecoverable(ErrorClassifier::classify(429, "{}")));
    EXPECT_TRUE(isRecoverable(ErrorClassifier::classify(502, "")));
    EXPECT_TRUE(isRecoverable(ErrorClassifier::classify(503, "")));

    auto teapot = expectFatal(ErrorClassifier::classify(418, R"({"error":"teapot"})"));
    EXPECT_EQ(teapot.kind, FailureKind::UnknownStatus);
    EXPECT_EQ(teapot.raw_body, R"({"error":"teapot"})");
}

TEST(ErrorClassifierTest, RecoverableKinds) {
    EXPECT_EQ(std::get<RecoverableFailure>(ErrorClassifier::classify(429, "")).kind, FailureKind::RateLimitOrQuota);
    EXPECT_EQ(std::get<RecoverableFailure>(ErrorClassifier::classify(502, "")).kind, FailureKind::UpstreamOverload);
    EXPECT_EQ(std::get<RecoverableFailure>(ErrorClassifier::classify(503, "")).kind, FailureKind::UpstreamOverload);
}

TEST(ErrorClassifierTest, SuccessExtractsReplyAndUsage) {
    auto outcome = ErrorClassifier::classify(200, fakes::successBody("Hello there", 12, 34));
    ASSERT_TRUE(isSuccess(outcome));
    const auto& success = std::get<Success>(outcome);
    EXPECT_EQ(success.reply.role, Role::Assistant);
    EXPECT_EQ(success.reply.content, "Hello there");
    EXPECT_EQ(success.usage.prompt_tokens, 12u);
    EXPECT_EQ(success.usage.completion_tokens, 34u);
}

TEST(ErrorClassifierTest, EmptyOrNullContentIsSuccess) {
    auto empty = ErrorClassifier::classify(200, fakes::successBody("", 10, 0));
    ASSERT_TRUE(isSuccess(empty));
    EXPECT_EQ(std::get<Success>(empty).reply.content, "");
    EXPECT_EQ(std::get<Success>(empty).usage.prompt_tokens, 10u);

    auto null_content = ErrorClassifier::classify(
        200, R"({"choices":[{"message":{"role":"assistant","content":null}}],"usage":{"prompt_tokens":3,"completion_tokens":0}})");
    ASSERT_TRUE(isSuccess(null_content));
    EXPECT_EQ(std::get<Success>(null_content).reply.content, "");
    EXPECT_EQ(std::get<Success>(null_content).usage.prompt_tokens, 3u);
}

TEST(ErrorClassifierTest, MalformedSuccessBodyIsFatal) {
    EXPECT_EQ(expectFatal(ErrorClassifier::classify(200, "not json")).kind, FailureKind::MalformedResponse);
    EXPECT_EQ(expectFatal(ErrorClassifier::classify(200, R"({"choices":[]})")).kind, FailureKind::MalformedResponse);
    EXPECT_EQ(expectFatal(ErrorClassifier::classify(
                  200, R"({"choices":[{"message":{"role":"assistant","content":"x"}}]})")).kind,
              FailureKind::MalformedResponse);
    EXPECT_EQ(expectFatal(ErrorClassifier::classify(
                  200, R"({"choices":[{"message":{"content":42}}],"usage":{"prompt_tokens":1,"completion_tokens":1}})")).kind,
              FailureKind::MalformedResponse);
}

TEST(ErrorClassifierTest, AuthenticationFailure) {
    auto failure = expectFatal(ErrorClassifier::classify(401, R"({"error":{"code":"invalid_api_key"}})"));
    EXPECT_EQ(failure.kind, FailureKind::Authentication);
    EXPECT_EQ(failure.reason, "Invalid API Key");
}

TEST(ErrorClassifierTest, ParsesContextLengthMessage) {
    auto detail = ErrorClassifier::parseContextLengthMessage(
        "This model's maximum context length is 4096 tokens... your messages resulted in 4500 tokens");
    ASSERT_TRUE(detail.has_value());
    EXPECT_EQ(detail->max_tokens, 4096);
    EXPECT_EQ(detail->sent_tokens, 4500);
    EXPECT_EQ(detail->overage(), 404);
}

TEST(ErrorClassifierTest, ContextLengthExceededWithDetail) {
    auto failure = expectFatal(ErrorClassifier::classify(400, kContextLengthBody));
    EXPECT_EQ(failure.kind, FailureKind::ContextLengthExceeded);
    ASSERT_TRUE(failure.context_length.has_value());
    EXPECT_EQ(failure.context_length->overage(), 404);
    EXPECT_EQ(failure.reason, "Maximum context length (4096) exceeded. Try reducing 404 from the source total (4500)");
}

TEST(ErrorClassifierTest, ContextLengthExceededFallback) {
    auto failure = expectFatal(ErrorClassifier::classify(
        400, R"({"error":{"code":"context_length_exceeded","message":"too long"}})"));
    EXPECT_EQ(failure.kind, FailureKind::ContextLengthExceeded);
    EXPECT_FALSE(failure.context_length.has_value());
    EXPECT_EQ(failure.reason, "Maximum context length exceeded.");
    EXPECT_FALSE(ErrorClassifier::parseContextLengthMessage("too long").has_value());
}

TEST(ErrorClassifierTest, BadRequestWithoutErrorObjectSurfacesBody) {
    auto failure = expectFatal(ErrorClassifier::classify(400, R"({"detail":"nope"})"));
    EXPECT_EQ(failure.kind, FailureKind::MalformedErrorBody);
    EXPECT_EQ(failure.raw_body, R"({"detail":"nope"})");

    EXPECT_EQ(expectFatal(ErrorClassifier::classify(400, "<html>")).kind, FailureKind::MalformedErrorBody);
}

TEST(ErrorClassifierTest, OtherBadRequestIsInvalidRequest) {
    auto failure = expectFatal(ErrorClassifier::classify(400, R"({"error":{"message":"bad temperature"}})"));
    EXPECT_EQ(failure.kind, FailureKind::InvalidRequest);
    EXPECT_FALSE(failure.raw_body.empty());
}
