#include "deepseek/retry_orchestrator.hpp"
#include "deepseek/error.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace deepseek {

const char* to_string(AttemptState state) {
    switch (state) {
        case AttemptState::ATTEMPTING: return "attempting";
        case AttemptState::SUCCESS: return "success";
        case AttemptState::RETRYING: return "retrying";
        case AttemptState::FAILED: return "failed";
    }
    return "unknown";
}

bool is_blank(const std::string& text) {
    return std::all_of(text.begin(), text.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

RetryOrchestrator::RetryOrchestrator(AppRetryConfig config,
                                     std::shared_ptr<Logger> logger,
                                     Sleeper sleeper)
    : config_(std::move(config)),
      logger_(std::move(logger)),
      sleeper_(std::move(sleeper)) {}

std::chrono::duration<double> RetryOrchestrator::delay_before(int attempt_index) const {
    if (attempt_index <= 0) {
        return std::chrono::duration<double>(0.0);
    }
    return config_.base_delay * static_cast<double>(attempt_index + 1);
}

std::string RetryOrchestrator::call_with_retry(CompletionClient& client,
                                               const std::vector<Message>& messages,
                                               const std::string& description) const {
    return call_with_retry(client, messages, description, config_.max_attempts);
}

std::string RetryOrchestrator::call_with_retry(CompletionClient& client,
                                               const std::vector<Message>& messages,
                                               const std::string& description,
                                               int max_attempts) const {
    DEEPSEEK_CHECK_ARGUMENT(max_attempts >= 1, "max_attempts must be at least 1");

    ChatRequest request;
    request.model = config_.model;
    request.messages = messages;
    request.temperature = config_.temperature;

    RetryAttempt last;
    for (int attempt = 0; attempt < max_attempts; ++attempt) {
        if (attempt > 0) {
            sleeper_(delay_before(attempt));
        }

        logger_->info("Attempt " + std::to_string(attempt + 1) + " of " + std::to_string(max_attempts) +
                      " for " + description);
        AttemptState state = AttemptState::ATTEMPTING;
        try {
            ChatCompletion completion = client.complete(request);
            const std::string& content = completion.content();
            if (is_blank(content)) {
                throw EmptyContent("The API returned an empty response", description);
            }
            state = AttemptState::SUCCESS;
            logger_->debug(description + ": " + to_string(state) + " on attempt " + std::to_string(attempt + 1));
            return content;
        } catch (const TransportError& e) {
            last = RetryAttempt{attempt, std::current_exception(), e.message()};
        } catch (const MalformedResponse& e) {
            last = RetryAttempt{attempt, std::current_exception(), e.message()};
        } catch (const EmptyContent& e) {
            last = RetryAttempt{attempt, std::current_exception(), e.message()};
        }

        state = attempt + 1 < max_attempts ? AttemptState::RETRYING : AttemptState::FAILED;
        last.delay = state == AttemptState::RETRYING ? delay_before(attempt + 1)
                                                     : std::chrono::duration<double>(0.0);

        std::ostringstream message;
        message << "Error on attempt " << (attempt + 1) << " for " << description << ": "
                << last.error_message;
        if (state == AttemptState::RETRYING) {
            message << " (retrying in " << std::fixed << std::setprecision(1) << last.delay.count() << "s)";
        }
        logger_->error(message.str());
    }

    throw ExhaustedRetries(description, max_attempts, last.error, last.error_message);
}

} // namespace deepseek
