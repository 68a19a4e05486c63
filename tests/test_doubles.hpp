#pragma once

#include <gmock/gmock.h>
#include <chrono>
#include <mutex>
#include <string>
#include <vector>
#include "deepseek/completion_client.hpp"
#include "deepseek/http_client.hpp"
#include "deepseek/logging.hpp"

namespace deepseek {
namespace testing_support {

class MockHttpSession : public HttpSession {
public:
    MOCK_METHOD(HttpResponse, send, (const HttpRequest&, std::chrono::seconds), (override));
};

class MockHttpClient : public HttpClient {
public:
    MockHttpClient() : HttpClient(nullptr, TransportRetryConfig(), Logger::create_null()) {}

    MOCK_METHOD(HttpResponse, post,
        (const std::string&, const std::string&, const HttpHeaders&, std::chrono::seconds), (override));
};

class MockCompletionClient : public CompletionClient {
public:
    MockCompletionClient() : CompletionClient(Logger::create_null()) {}

    using CompletionClient::complete;
    MOCK_METHOD(ChatCompletion, complete, (const ChatRequest&), (override));
};

// Records requested delays instead of sleeping.
class RecordingSleeper {
public:
    Sleeper sleeper() {
        return [this](std::chrono::duration<double> delay) {
            std::lock_guard<std::mutex> lock(mutex_);
            delays_.push_back(delay.count());
        };
    }

    std::vector<double> delays() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return delays_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<double> delays_;
};

inline HttpResponse make_response(int status, const std::string& body = "", HttpHeaders headers = {}) {
    HttpResponse response;
    response.status = status;
    response.body = body;
    response.headers = std::move(headers);
    return response;
}

inline std::string completion_body(const std::string& content, int total_tokens = 5) {
    return R"({"id":"cmpl-1","model":"deepseek-reasoner","choices":[{"index":0,"message":{"role":"assistant","content":")" +
           content + R"("},"finish_reason":"stop"}],"usage":{"prompt_tokens":2,"completion_tokens":3,"total_tokens":)" +
           std::to_string(total_tokens) + "}}";
}

inline ChatCompletion make_completion(const std::string& content, int total_tokens = 5) {
    ChatCompletion completion;
    completion.id = "cmpl-1";
    completion.model = "deepseek-reasoner";
    Choice choice;
    choice.message.role = "assistant";
    choice.message.content = content;
    completion.choices.push_back(choice);
    completion.usage = Usage{2, 3, total_tokens};
    completion.http_status = 200;
    return completion;
}

} // namespace testing_support
} // namespace deepseek
