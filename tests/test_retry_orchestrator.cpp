#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <memory>
#include <string>
#include <vector>
#include "deepseek/error.hpp"
#include "deepseek/retry_orchestrator.hpp"
#include "test_doubles.hpp"

using namespace deepseek;
using deepseek::testing_support::MockCompletionClient;
using deepseek::testing_support::MockHttpClient;
using deepseek::testing_support::RecordingSleeper;
using deepseek::testing_support::make_completion;
using deepseek::testing_support::make_response;

class RetryOrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        orchestrator_ = std::make_unique<RetryOrchestrator>(config_, Logger::create_null(), sleeper_.sleeper());
    }

    static std::vector<Message> prompt() {
        return {{Role::USER, "Generate a scraper"}};
    }

    static TransportError rate_limited() {
        return TransportError(TransportFailure::STATUS, "429 error for POST /chat/completions", 429);
    }

    AppRetryConfig config_;
    RecordingSleeper sleeper_;
    testing::StrictMock<MockCompletionClient> client_;
    std::unique_ptr<RetryOrchestrator> orchestrator_;
};

TEST_F(RetryOrchestratorTest, CallWithRetry_SucceedsOnFirstAttempt) {
    EXPECT_CALL(client_, complete(testing::A<const ChatRequest&>()))
        .WillOnce(testing::Return(make_completion("import requests")));

    auto content = orchestrator_->call_with_retry(client_, prompt(), "scraper");

    EXPECT_EQ(content, "import requests");
    EXPECT_TRUE(sleeper_.delays().empty());
}

TEST_F(RetryOrchestratorTest, CallWithRetry_UsesConfiguredModelAndTemperature) {
    ChatRequest captured;
    EXPECT_CALL(client_, complete(testing::A<const ChatRequest&>()))
        .WillOnce(testing::DoAll(testing::SaveArg<0>(&captured),
                                 testing::Return(make_completion("ok"))));

    orchestrator_->call_with_retry(client_, prompt(), "scraper");

    EXPECT_EQ(captured.model, "deepseek-reasoner");
    EXPECT_DOUBLE_EQ(captured.temperature, 0.2);
    EXPECT_FALSE(captured.stream);
    EXPECT_EQ(captured.messages, prompt());
}

TEST_F(RetryOrchestratorTest, CallWithRetry_RecoversWithinBudget) {
    EXPECT_CALL(client_, complete(testing::A<const ChatRequest&>()))
        .WillOnce(testing::Throw(rate_limited()))
        .WillOnce(testing::Throw(MalformedResponse("Response has no 'choices'")))
        .WillOnce(testing::Return(make_completion("done")));

    auto content = orchestrator_->call_with_retry(client_, prompt(), "scraper", 3);

    EXPECT_EQ(content, "done");
    EXPECT_THAT(sleeper_.delays(), testing::ElementsAre(10.0, 15.0));
}

TEST_F(RetryOrchestratorTest, CallWithRetry_ExhaustsAfterMaxAttempts) {
    EXPECT_CALL(client_, complete(testing::A<const ChatRequest&>()))
        .Times(3)
        .WillRepeatedly(testing::Throw(rate_limited()));

    try {
        orchestrator_->call_with_retry(client_, prompt(), "scraper", 3);
        FAIL() << "Expected ExhaustedRetries";
    } catch (const ExhaustedRetries& e) {
        EXPECT_EQ(e.attempts(), 3);
        EXPECT_EQ(e.description(), "scraper");
        EXPECT_EQ(e.code(), ErrorCode::RETRIES_EXHAUSTED);
        EXPECT_THAT(e.last_message(), testing::HasSubstr("429"));
        EXPECT_THROW(e.rethrow_last_error(), TransportError);
    }
    EXPECT_THAT(sleeper_.delays(), testing::ElementsAre(10.0, 15.0));
}

TEST_F(RetryOrchestratorTest, CallWithRetry_BlankContentIsRetried) {
    EXPECT_CALL(client_, complete(testing::A<const ChatRequest&>()))
        .WillOnce(testing::Return(make_completion("  \n\t")))
        .WillOnce(testing::Return(make_completion("print('hi')")));

    EXPECT_EQ(orchestrator_->call_with_retry(client_, prompt(), "scraper"), "print('hi')");
    EXPECT_THAT(sleeper_.delays(), testing::ElementsAre(10.0));
}

TEST_F(RetryOrchestratorTest, CallWithRetry_BlankContentExhaustsAsEmptyContent) {
    EXPECT_CALL(client_, complete(testing::A<const ChatRequest&>()))
        .Times(2)
        .WillRepeatedly(testing::Return(make_completion("")));

    try {
        orchestrator_->call_with_retry(client_, prompt(), "scraper", 2);
        FAIL() << "Expected ExhaustedRetries";
    } catch (const ExhaustedRetries& e) {
        EXPECT_EQ(e.attempts(), 2);
        EXPECT_THROW(e.rethrow_last_error(), EmptyContent);
    }
}

TEST_F(RetryOrchestratorTest, CallWithRetry_SingleAttemptNeverSleeps) {
    EXPECT_CALL(client_, complete(testing::A<const ChatRequest&>()))
        .WillOnce(testing::Throw(rate_limited()));

    EXPECT_THROW(orchestrator_->call_with_retry(client_, prompt(), "scraper", 1), ExhaustedRetries);
    EXPECT_TRUE(sleeper_.delays().empty());
}

TEST_F(RetryOrchestratorTest, CallWithRetry_InvalidArgumentIsNotRetried) {
    EXPECT_CALL(client_, complete(testing::A<const ChatRequest&>()))
        .WillOnce(testing::Throw(InvalidArgumentError("Unsupported model: 'gpt-4'")));

    EXPECT_THROW(orchestrator_->call_with_retry(client_, prompt(), "scraper"), InvalidArgumentError);
    EXPECT_TRUE(sleeper_.delays().empty());
}

TEST_F(RetryOrchestratorTest, CallWithRetry_RejectsNonPositiveAttempts) {
    EXPECT_THROW(orchestrator_->call_with_retry(client_, prompt(), "scraper", 0), InvalidArgumentError);
}

TEST_F(RetryOrchestratorTest, DelayBefore_GrowsLinearly) {
    EXPECT_DOUBLE_EQ(orchestrator_->delay_before(0).count(), 0.0);
    EXPECT_DOUBLE_EQ(orchestrator_->delay_before(1).count(), 10.0);
    EXPECT_DOUBLE_EQ(orchestrator_->delay_before(2).count(), 15.0);
    EXPECT_DOUBLE_EQ(orchestrator_->delay_before(3).count(), 20.0);
}

// A 404 escapes the transport tier untouched and is retried here.
TEST(RetryOrchestratorClientTest, NotFoundIsRetriedByApplicationTier) {
    auto http_client = std::make_shared<MockHttpClient>();
    EXPECT_CALL(*http_client, post(testing::_, testing::_, testing::_, testing::_))
        .Times(2)
        .WillRepeatedly(testing::Return(make_response(404, "not found")));

    ClientConfig client_config;
    client_config.api_key = "k";
    CompletionClient client(client_config, http_client, Logger::create_null());

    RecordingSleeper sleeper;
    RetryOrchestrator orchestrator(AppRetryConfig(), Logger::create_null(), sleeper.sleeper());

    try {
        orchestrator.call_with_retry(client, {{Role::USER, "ping"}}, "ping", 2);
        FAIL() << "Expected ExhaustedRetries";
    } catch (const ExhaustedRetries& e) {
        try {
            e.rethrow_last_error();
        } catch (const TransportError& last) {
            EXPECT_EQ(last.http_status(), 404);
        }
    }
    EXPECT_TRUE(client.history().empty());
}

TEST(IsBlankTest, Whitespace) {
    EXPECT_TRUE(is_blank(""));
    EXPECT_TRUE(is_blank(" \n\t\r"));
    EXPECT_FALSE(is_blank(" x "));
}

TEST(AttemptStateTest, Names) {
    EXPECT_STREQ(to_string(AttemptState::ATTEMPTING), "attempting");
    EXPECT_STREQ(to_string(AttemptState::SUCCESS), "success");
    EXPECT_STREQ(to_string(AttemptState::RETRYING), "retrying");
    EXPECT_STREQ(to_string(AttemptState::FAILED), "failed");
}
