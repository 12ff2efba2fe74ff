#include "gtest/gtest.h"
#include "app_config.h"
#include "request_dispatcher.h"
#include "test_fakes.h"
#include <algorithm>
#include <nlohmann/json.hpp>

using namespace gptcli;

class RequestDispatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        m_config.api_key = "sk-test";
        m_config.model = "gpt-4";
        m_config.temperature = 0.5;
        m_conversation = {
            Message{Role::System, "be brief"},
            Message{Role::User, "hello"},
        };
    }

    AppConfig m_config;
    std::vector<Message> m_conversation;
    fakes::FakeTransport m_transport;
};

TEST_F(RequestDispatcherTest, BuildsPayloadWithoutMaxTokens) {
    auto payload = RequestDispatcher::buildPayload(m_conversation, m_config);

    EXPECT_EQ(payload["model"], "gpt-4");
    EXPECT_DOUBLE_EQ(payload["temperature"].get<double>(), 0.5);
    ASSERT_EQ(payload["messages"].size(), 2u);
    EXPECT_EQ(payload["messages"][0]["role"], "system");
    EXPECT_EQ(payload["messages"][1]["role"], "user");
    EXPECT_EQ(payload["messages"][1]["content"], "hello");
    EXPECT_FALSE(payload.contains("max_tokens"));
}

TEST_F(RequestDispatcherTest, IncludesMaxTokensWhenConfigured) {
    m_config.max_tokens = 500;
    auto payload = RequestDispatcher::buildPayload(m_conversation, m_config);
    EXPECT_EQ(payload["max_tokens"], 500);
}

TEST_F(RequestDispatcherTest, PostsToCompletionsEndpointWithBearerKey) {
    m_transport.queueResponse(200, fakes::successBody("hi", 3, 1));
    RequestDispatcher dispatcher(m_transport);

    auto outcome = dispatcher.send(m_conversation, m_config);

    EXPECT_TRUE(isSuccess(outcome));
    ASSERT_EQ(m_transport.requests.size(), 1u);
    const auto& request = m_transport.requests[0];
    EXPECT_EQ(request.url, "https://api.openai.com/v1/chat/completions");
    EXPECT_NE(std::find(request.headers.begin(), request.headers.end(), "Authorization: Bearer sk-test"),
              request.headers.end());
    EXPECT_EQ(nlohmann::json::parse(request.body), RequestDispatcher::buildPayload(m_conversation, m_config));
    EXPECT_EQ(dispatcher.requestCount(), 1u);
}

TEST_F(RequestDispatcherTest, TransportErrorsAreRecoverable) {
    m_transport.queueTransportError(false);
    m_transport.queueTransportError(true);
    RequestDispatcher dispatcher(m_transport);

    auto refused = dispatcher.send(m_conversation, m_config);
    ASSERT_TRUE(isRecoverable(refused));
    EXPECT_EQ(std::get<RecoverableFailure>(refused).kind, FailureKind::Transport);
    EXPECT_EQ(std::get<RecoverableFailure>(refused).reason, "Connection error, try again...");

    auto timed_out = dispatcher.send(m_conversation, m_config);
    ASSERT_TRUE(isRecoverable(timed_out));
    EXPECT_EQ(std::get<RecoverableFailure>(timed_out).reason, "Connection timed out, try again...");
}

TEST_F(RequestDispatcherTest, HttpErrorsAreClassified) {
    m_transport.queueResponse(401, R"({"error":{"code":"invalid_api_key","message":"bad key"}})");
    RequestDispatcher dispatcher(m_transport);

    auto outcome = dispatcher.send(m_conversation, m_config);
    ASSERT_TRUE(isFatal(outcome));
    EXPECT_EQ(std::get<FatalFailure>(outcome).kind, FailureKind::Authentication);
}
