#pragma once

#include "deepseek/completion_client.hpp"
#include "deepseek/config.hpp"
#include "deepseek/http_client.hpp"
#include "deepseek/logging.hpp"
#include <chrono>
#include <exception>
#include <memory>
#include <string>
#include <vector>

namespace deepseek {

enum class AttemptState {
    ATTEMPTING,
    SUCCESS,
    RETRYING,
    FAILED
};

const char* to_string(AttemptState state);

// One failed attempt, kept only while the retry loop runs.
struct RetryAttempt {
    int index = 0;                          // 0-based
    std::exception_ptr error;
    std::string error_message;
    std::chrono::duration<double> delay{0.0};   // wait before the next attempt
};

/**
 * Application-tier retry around CompletionClient::complete.
 *
 * Unlike the transport tier, this loop also treats a successful call whose
 * content is blank as a failure. Attempts are separated by a linear delay,
 * base_delay * (index + 1) before attempt `index`. TransportError,
 * MalformedResponse and EmptyContent are retried; every other error is
 * propagated at once. Exhausting the budget raises ExhaustedRetries.
 *
 * The orchestrator holds no per-call state, so concurrent calls are
 * independent as long as the client they use is.
 */
class RetryOrchestrator {
public:
    explicit RetryOrchestrator(AppRetryConfig config,
                               std::shared_ptr<Logger> logger,
                               Sleeper sleeper = thread_sleeper());

    std::string call_with_retry(CompletionClient& client,
                                const std::vector<Message>& messages,
                                const std::string& description,
                                int max_attempts) const;

    // Uses the configured attempt budget.
    std::string call_with_retry(CompletionClient& client,
                                const std::vector<Message>& messages,
                                const std::string& description) const;

    std::chrono::duration<double> delay_before(int attempt_index) const;

    const AppRetryConfig& config() const { return config_; }

private:
    AppRetryConfig config_;
    std::shared_ptr<Logger> logger_;
    Sleeper sleeper_;
};

// Blank means empty or only whitespace.
bool is_blank(const std::string& text);

} // namespace deepseek
