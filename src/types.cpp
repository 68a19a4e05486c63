#include "deepseek/types.hpp"
#include "deepseek/error.hpp"

namespace deepseek {

const char* to_string(Role role) {
    switch (role) {
        case Role::SYSTEM: return "system";
        case Role::USER: return "user";
        case Role::ASSISTANT: return "assistant";
    }
    return "user";
}

Role role_from_string(const std::string& value) {
    if (value == "system") return Role::SYSTEM;
    if (value == "user") return Role::USER;
    if (value == "assistant") return Role::ASSISTANT;
    throw InvalidArgumentError("Unknown message role: '" + value + "'");
}

bool operator==(const Message& lhs, const Message& rhs) {
    return lhs.role == rhs.role && lhs.content == rhs.content;
}

bool operator!=(const Message& lhs, const Message& rhs) {
    return !(lhs == rhs);
}

boost::json::array messages_to_json(const std::vector<Message>& messages) {
    boost::json::array messages_array;
    messages_array.reserve(messages.size());
    for (const auto& msg : messages) {
        boost::json::object message;
        message["role"] = to_string(msg.role);
        message["content"] = msg.content;
        messages_array.push_back(std::move(message));
    }
    return messages_array;
}

bool operator==(const CallRecord& lhs, const CallRecord& rhs) {
    return lhs.timestamp == rhs.timestamp &&
           lhs.model == rhs.model &&
           lhs.messages == rhs.messages &&
           lhs.duration == rhs.duration &&
           lhs.status == rhs.status &&
           lhs.tokens_used == rhs.tokens_used;
}

bool operator!=(const CallRecord& lhs, const CallRecord& rhs) {
    return !(lhs == rhs);
}

} // namespace deepseek
