#pragma once

#include "deepseek/call_history.hpp"
#include "deepseek/config.hpp"
#include "deepseek/http_client.hpp"
#include "deepseek/logging.hpp"
#include "deepseek/types.hpp"
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace deepseek {

/**
 * Chat-completion client for the Deepseek API.
 *
 * Builds the request body, sends it through the transport layer, turns the
 * answer into a typed ChatCompletion and records every successfully parsed
 * call in its CallHistory.
 *
 * Errors are never swallowed: transport failures and non-2xx statuses raise
 * TransportError, bodies without choices[].message.content raise
 * MalformedResponse.
 */
class CompletionClient {
public:
    // Throws ConfigurationError if no API key can be resolved.
    CompletionClient(const ClientConfig& config,
                     std::shared_ptr<HttpClient> http_client,
                     std::shared_ptr<Logger> logger);
    virtual ~CompletionClient() = default;

    CompletionClient(const CompletionClient&) = delete;
    CompletionClient& operator=(const CompletionClient&) = delete;

    virtual ChatCompletion complete(const ChatRequest& request);

    // Sends to the configured default model.
    ChatCompletion complete(const std::vector<Message>& messages);
    ChatCompletion complete(const std::vector<Message>& messages,
                            const std::string& model,
                            double temperature = 0.7,
                            const RequestOptions& options = {});

    // Asks for Python code at low temperature and returns the first choice.
    std::string generate_code(const std::string& prompt);
    std::string generate_code(const std::string& prompt,
                              const std::string& model,
                              const RequestOptions& options = {});

    // System instruction plus the framed user prompt used by generate_code.
    static std::vector<Message> code_generation_messages(const std::string& prompt);

    // Read-only copy of the call history.
    std::vector<CallRecord> call_history() const { return history_.snapshot(); }
    const CallHistory& history() const { return history_; }

    const std::string& completions_target() const { return target_; }
    const std::string& default_model() const { return config_.default_model; }

    static const std::set<std::string>& supported_models();
    static const std::set<std::string>& reserved_option_keys();

    // Exposed for tests of the wire format.
    std::string build_request_body(const ChatRequest& request) const;
    static ChatCompletion parse_response(const std::string& body);
    static ChatCompletion parse_event_stream(const std::string& body);

protected:
    // For test doubles that never touch the network.
    explicit CompletionClient(std::shared_ptr<Logger> logger);

private:
    ClientConfig config_;
    std::shared_ptr<HttpClient> http_client_;
    std::shared_ptr<Logger> logger_;
    std::string target_;
    CallHistory history_;
};

/**
 * Wires a CompletionClient to a pooled Beast session from configuration.
 * The logger is the root logger; components receive named children.
 */
std::shared_ptr<CompletionClient> make_completion_client(const Config& config,
                                                         const std::shared_ptr<Logger>& logger);

} // namespace deepseek
