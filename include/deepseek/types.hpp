#pragma once

#include <boost/json.hpp>
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace deepseek {

enum class Role {
    SYSTEM,
    USER,
    ASSISTANT
};

const char* to_string(Role role);
// Throws InvalidArgumentError on anything but "system", "user", "assistant".
Role role_from_string(const std::string& value);

struct Message {
    Role role;
    std::string content;
};

bool operator==(const Message& lhs, const Message& rhs);
bool operator!=(const Message& lhs, const Message& rhs);

// [{"role": ..., "content": ...}, ...] in the order given
boost::json::array messages_to_json(const std::vector<Message>& messages);

// Extra request fields merged verbatim into the JSON body.
using RequestOptions = std::map<std::string, boost::json::value>;

struct ChatRequest {
    std::string model = "deepseek-reasoner";
    std::vector<Message> messages;
    double temperature = 0.7;
    bool stream = false;
    RequestOptions options;
};

struct Usage {
    std::optional<std::int64_t> prompt_tokens;
    std::optional<std::int64_t> completion_tokens;
    std::optional<std::int64_t> total_tokens;
};

struct ChoiceMessage {
    std::string role;
    std::string content;
    std::optional<std::string> reasoning_content;
};

struct Choice {
    std::int64_t index = 0;
    ChoiceMessage message;
    std::optional<std::string> finish_reason;
};

// Parsed chat completion. Always holds at least one choice.
struct ChatCompletion {
    std::string id;
    std::string model;
    std::vector<Choice> choices;
    std::optional<Usage> usage;
    int http_status = 0;

    const std::string& content() const { return choices.front().message.content; }
    std::int64_t tokens_used() const {
        return usage && usage->total_tokens ? *usage->total_tokens : 0;
    }
};

struct CallRecord {
    std::chrono::system_clock::time_point timestamp;
    std::string model;
    std::vector<Message> messages;
    std::chrono::duration<double> duration{0.0};
    int status = 0;
    std::int64_t tokens_used = 0;
};

bool operator==(const CallRecord& lhs, const CallRecord& rhs);
bool operator!=(const CallRecord& lhs, const CallRecord& rhs);

} // namespace deepseek
