#include "deepseek/completion_client.hpp"
#include "deepseek/beast_session.hpp"
#include "deepseek/error.hpp"
#include <boost/json.hpp>
#include <chrono>
#include <sstream>

namespace deepseek {

namespace {

const char* kCodeSystemPrompt =
    "You are a helpful programming assistant. Generate only Python code based on the given "
    "description. Include comments and error handling.";

std::string snippet(const std::string& body) {
    constexpr std::size_t kMaxSnippet = 200;
    return body.size() > kMaxSnippet ? body.substr(0, kMaxSnippet) + "..." : body;
}

std::string to_std_string(const boost::json::string& value) {
    return std::string(value.data(), value.size());
}

std::optional<std::string> optional_string(const boost::json::object& object, const char* key) {
    const auto* value = object.if_contains(key);
    if (!value || !value->is_string()) {
        return std::nullopt;
    }
    return to_std_string(value->get_string());
}

std::optional<std::int64_t> optional_int(const boost::json::object& object, const char* key) {
    const auto* value = object.if_contains(key);
    if (!value) {
        return std::nullopt;
    }
    if (value->is_int64()) return value->get_int64();
    if (value->is_uint64()) return static_cast<std::int64_t>(value->get_uint64());
    if (value->is_double()) return static_cast<std::int64_t>(value->get_double());
    return std::nullopt;
}

std::optional<Usage> parse_usage(const boost::json::object& root) {
    const auto* value = root.if_contains("usage");
    if (!value || !value->is_object()) {
        return std::nullopt;
    }
    const auto& usage_object = value->get_object();
    Usage usage;
    usage.prompt_tokens = optional_int(usage_object, "prompt_tokens");
    usage.completion_tokens = optional_int(usage_object, "completion_tokens");
    usage.total_tokens = optional_int(usage_object, "total_tokens");
    return usage;
}

Choice parse_choice(const boost::json::value& value, std::size_t position) {
    const std::string where = "choices[" + std::to_string(position) + "]";
    const auto* object = value.if_object();
    if (!object) {
        throw MalformedResponse(where + " is not an object");
    }

    const auto* message = object->if_contains("message");
    if (!message || !message->is_object()) {
        throw MalformedResponse(where + " has no 'message' object");
    }
    const auto& message_object = message->get_object();

    const auto* content = message_object.if_contains("content");
    if (!content || !content->is_string()) {
        throw MalformedResponse(where + ".message has no string 'content'");
    }

    Choice choice;
    choice.index = optional_int(*object, "index").value_or(static_cast<std::int64_t>(position));
    choice.message.role = optional_string(message_object, "role").value_or("assistant");
    choice.message.content = to_std_string(content->get_string());
    choice.message.reasoning_content = optional_string(message_object, "reasoning_content");
    choice.finish_reason = optional_string(*object, "finish_reason");
    return choice;
}

boost::json::object parse_object(const std::string& text, const std::string& what) {
    boost::json::error_code ec;
    boost::json::value value = boost::json::parse(text, ec);
    if (ec) {
        throw MalformedResponse(what + " is not valid JSON: " + ec.message(), snippet(text));
    }
    if (!value.is_object()) {
        throw MalformedResponse(what + " is not a JSON object", snippet(text));
    }
    return std::move(value.get_object());
}

} // namespace

CompletionClient::CompletionClient(const ClientConfig& config,
                                   std::shared_ptr<HttpClient> http_client,
                                   std::shared_ptr<Logger> logger)
    : config_(config),
      http_client_(std::move(http_client)),
      logger_(std::move(logger)) {
    DEEPSEEK_CHECK_ARGUMENT(http_client_ != nullptr, "http_client must not be null");
    DEEPSEEK_CHECK_ARGUMENT(logger_ != nullptr, "logger must not be null");

    config_.api_key = resolve_api_key(config.api_key);
    if (config_.api_key.empty()) {
        throw ConfigurationError("API key must be provided or set in the " + std::string(kApiKeyEnvVar) +
                                     " environment variable",
                                 "CompletionClient", "", ErrorCode::API_KEY_MISSING);
    }

    if (supported_models().count(config_.default_model) == 0) {
        throw ConfigurationError("Unsupported default model: '" + config_.default_model + "'",
                                 "CompletionClient");
    }

    target_ = parse_base_url(config_.base_url).target("/chat/completions");
}

CompletionClient::CompletionClient(std::shared_ptr<Logger> logger)
    : logger_(std::move(logger)),
      target_("/chat/completions") {}

const std::set<std::string>& CompletionClient::supported_models() {
    return deepseek::supported_models();
}

const std::set<std::string>& CompletionClient::reserved_option_keys() {
    static const std::set<std::string> keys = {"model", "messages", "temperature", "stream"};
    return keys;
}

std::string CompletionClient::build_request_body(const ChatRequest& request) const {
    boost::json::object root;
    root["model"] = request.model;
    root["messages"] = messages_to_json(request.messages);
    root["temperature"] = request.temperature;
    root["stream"] = request.stream;

    for (const auto& [key, value] : request.options) {
        if (reserved_option_keys().count(key) > 0) {
            logger_->warning("Ignoring option '" + key + "': it is set explicitly by the request");
            continue;
        }
        root[key] = value;
    }

    return boost::json::serialize(root);
}

ChatCompletion CompletionClient::parse_response(const std::string& body) {
    boost::json::object root = parse_object(body, "Response body");

    const auto* choices = root.if_contains("choices");
    if (!choices) {
        throw MalformedResponse("Response has no 'choices'", snippet(body));
    }
    const auto* choice_array = choices->if_array();
    if (!choice_array || choice_array->empty()) {
        throw MalformedResponse("'choices' is not a non-empty array", snippet(body));
    }

    ChatCompletion completion;
    completion.id = optional_string(root, "id").value_or("");
    completion.model = optional_string(root, "model").value_or("");
    completion.choices.reserve(choice_array->size());
    for (std::size_t i = 0; i < choice_array->size(); ++i) {
        completion.choices.push_back(parse_choice((*choice_array)[i], i));
    }
    completion.usage = parse_usage(root);
    return completion;
}

ChatCompletion CompletionClient::parse_event_stream(const std::string& body) {
    ChatCompletion completion;
    Choice choice;
    choice.message.role = "assistant";
    std::string reasoning;
    bool saw_choice = false;

    std::istringstream lines(body);
    std::string line;
    while (std::getline(lines, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.compare(0, 5, "data:") != 0) {
            continue;
        }
        std::string payload = line.substr(5);
        payload.erase(0, payload.find_first_not_of(' '));
        if (payload == "[DONE]") {
            break;
        }

        boost::json::object chunk = parse_object(payload, "Event stream chunk");
        if (auto id = optional_string(chunk, "id")) completion.id = *id;
        if (auto model = optional_string(chunk, "model")) completion.model = *model;
        if (auto usage = parse_usage(chunk)) completion.usage = usage;

        const auto* choices = chunk.if_contains("choices");
        if (!choices || !choices->is_array() || choices->get_array().empty()) {
            continue;
        }
        const auto* first = choices->get_array()[0].if_object();
        if (!first) {
            throw MalformedResponse("Event stream chunk has a non-object choice", snippet(payload));
        }
        saw_choice = true;

        if (const auto* delta = first->if_contains("delta"); delta && delta->is_object()) {
            const auto& delta_object = delta->get_object();
            if (auto role = optional_string(delta_object, "role")) choice.message.role = *role;
            if (auto content = optional_string(delta_object, "content")) choice.message.content += *content;
            if (auto reasoning_part = optional_string(delta_object, "reasoning_content")) reasoning += *reasoning_part;
        }
        if (auto finish = optional_string(*first, "finish_reason")) {
            choice.finish_reason = finish;
        }
    }

    if (!saw_choice) {
        throw MalformedResponse("Event stream carried no choices", snippet(body));
    }
    if (!reasoning.empty()) {
        choice.message.reasoning_content = reasoning;
    }
    completion.choices.push_back(std::move(choice));
    return completion;
}

ChatCompletion CompletionClient::complete(const ChatRequest& request) {
    DEEPSEEK_CHECK_ARGUMENT(!request.messages.empty(), "messages must not be empty");
    DEEPSEEK_CHECK_ARGUMENT(supported_models().count(request.model) > 0,
                            "Unsupported model: '" + request.model + "'");

    const std::string body = build_request_body(request);
    const HttpHeaders headers = {
        {"Authorization", "Bearer " + config_.api_key},
        {"Content-Type", "application/json"}
    };

    logger_->debug("Sending chat completion with " + std::to_string(request.messages.size()) +
                   " message(s) to " + request.model);

    const auto start = std::chrono::steady_clock::now();
    HttpResponse response;
    try {
        response = http_client_->post(target_, body, headers, config_.timeout);
    } catch (const TransportError& e) {
        logger_->error("Error calling API: " + e.message());
        throw;
    }

    if (!response.ok()) {
        logger_->error("Error calling API: status " + std::to_string(response.status));
        throw TransportError(TransportFailure::STATUS,
                             std::to_string(response.status) + " error for POST " + target_,
                             response.status, snippet(response.body));
    }

    const auto content_type = response.header("Content-Type").value_or("");
    const bool event_stream = content_type.rfind("text/event-stream", 0) == 0;

    ChatCompletion completion;
    try {
        completion = event_stream ? parse_event_stream(response.body) : parse_response(response.body);
    } catch (const MalformedResponse& e) {
        logger_->error("Malformed response from " + request.model + ": " + e.message());
        throw;
    }
    completion.http_status = response.status;

    CallRecord record;
    record.timestamp = std::chrono::system_clock::now();
    record.model = request.model;
    record.messages = request.messages;
    record.duration = std::chrono::steady_clock::now() - start;
    record.status = response.status;
    record.tokens_used = completion.tokens_used();
    history_.append(record);

    logger_->info("Successful call to " + request.model + ": " + std::to_string(record.tokens_used) +
                  " tokens used");
    return completion;
}

ChatCompletion CompletionClient::complete(const std::vector<Message>& messages) {
    return complete(messages, config_.default_model);
}

ChatCompletion CompletionClient::complete(const std::vector<Message>& messages,
                                          const std::string& model,
                                          double temperature,
                                          const RequestOptions& options) {
    ChatRequest request;
    request.model = model;
    request.messages = messages;
    request.temperature = temperature;
    request.options = options;
    return complete(request);
}

std::vector<Message> CompletionClient::code_generation_messages(const std::string& prompt) {
    return {
        {Role::SYSTEM, kCodeSystemPrompt},
        {Role::USER, "Generate Python code for the following task:\n\n" + prompt}
    };
}

std::string CompletionClient::generate_code(const std::string& prompt) {
    return generate_code(prompt, config_.default_model);
}

std::string CompletionClient::generate_code(const std::string& prompt,
                                            const std::string& model,
                                            const RequestOptions& options) {
    ChatRequest request;
    request.model = model;
    request.messages = code_generation_messages(prompt);
    request.temperature = 0.2;
    request.options = options;
    return complete(request).content();
}

std::shared_ptr<CompletionClient> make_completion_client(const Config& config,
                                                         const std::shared_ptr<Logger>& logger) {
    auto endpoint = parse_base_url(config.client.base_url);
    auto session = std::make_shared<BeastSession>(endpoint, logger->child("session"),
                                                  config.transport.pool_size, config.client.user_agent);
    auto http_client = std::make_shared<HttpClient>(session, config.transport, logger->child("transport"));
    return std::make_shared<CompletionClient>(config.client, http_client, logger->child("client"));
}

} // namespace deepseek
