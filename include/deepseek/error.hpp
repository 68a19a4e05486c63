#pragma once

#include <exception>
#include <stdexcept>
#include <string>

namespace deepseek {

/**
 * Error handling for the completion client.
 *
 * Every failure leaves the library as a DeepseekException subtype. The
 * transport layer and the completion client propagate them untouched; only
 * the retry orchestrator absorbs the retryable ones.
 */

enum class ErrorCode {
    SUCCESS = 0,
    INVALID_ARGUMENT = 1,

    // Configuration errors
    CONFIGURATION_INVALID = 100,
    API_KEY_MISSING = 101,

    // Transport errors
    CONNECTION_FAILED = 400,
    CONNECTION_LOST = 401,
    NETWORK_TIMEOUT = 402,
    HTTP_STATUS = 403,

    // Response errors
    MALFORMED_RESPONSE = 500,
    EMPTY_CONTENT = 501,

    // Retry errors
    RETRIES_EXHAUSTED = 600
};

class DeepseekException : public std::runtime_error {
public:
    explicit DeepseekException(ErrorCode code, const std::string& message,
                               const std::string& context = "",
                               const std::string& suggestion = "")
        : std::runtime_error(format_message(code, message, context, suggestion))
        , code_(code)
        , message_(message)
        , context_(context)
        , suggestion_(suggestion) {}

    ErrorCode code() const noexcept { return code_; }
    const std::string& message() const noexcept { return message_; }
    const std::string& context() const noexcept { return context_; }
    const std::string& suggestion() const noexcept { return suggestion_; }

private:
    static std::string format_message(ErrorCode code, const std::string& message,
                                      const std::string& context, const std::string& suggestion) {
        std::string result = "Deepseek error [" + std::to_string(static_cast<int>(code)) + "]: " + message;
        if (!context.empty()) {
            result += "\nContext: " + context;
        }
        if (!suggestion.empty()) {
            result += "\nSuggestion: " + suggestion;
        }
        return result;
    }

    ErrorCode code_;
    std::string message_;
    std::string context_;
    std::string suggestion_;
};

class InvalidArgumentError : public DeepseekException {
public:
    explicit InvalidArgumentError(const std::string& message,
                                  const std::string& context = "",
                                  const std::string& suggestion = "")
        : DeepseekException(ErrorCode::INVALID_ARGUMENT, message, context, suggestion) {}
};

// Missing API key or unusable configuration. Never retried.
class ConfigurationError : public DeepseekException {
public:
    explicit ConfigurationError(const std::string& message,
                                const std::string& context = "",
                                const std::string& suggestion = "",
                                ErrorCode code = ErrorCode::CONFIGURATION_INVALID)
        : DeepseekException(code, message, context, suggestion) {}
};

enum class TransportFailure {
    CONNECT,  // nothing reached the server
    READ,     // request sent, response lost or timed out
    STATUS    // server answered with an error status
};

inline const char* to_string(TransportFailure kind) {
    switch (kind) {
        case TransportFailure::CONNECT: return "connect";
        case TransportFailure::READ: return "read";
        case TransportFailure::STATUS: return "status";
    }
    return "unknown";
}

class TransportError : public DeepseekException {
public:
    TransportError(TransportFailure kind, const std::string& message,
                   int http_status = 0,
                   const std::string& context = "",
                   bool timed_out = false)
        : DeepseekException(code_for(kind, timed_out), message, context)
        , kind_(kind)
        , http_status_(http_status)
        , timed_out_(timed_out) {}

    TransportFailure kind() const noexcept { return kind_; }
    // 0 when no response was received
    int http_status() const noexcept { return http_status_; }
    bool timed_out() const noexcept { return timed_out_; }

private:
    static ErrorCode code_for(TransportFailure kind, bool timed_out) {
        if (timed_out) {
            return ErrorCode::NETWORK_TIMEOUT;
        }
        switch (kind) {
            case TransportFailure::CONNECT: return ErrorCode::CONNECTION_FAILED;
            case TransportFailure::READ: return ErrorCode::CONNECTION_LOST;
            case TransportFailure::STATUS: return ErrorCode::HTTP_STATUS;
        }
        return ErrorCode::CONNECTION_FAILED;
    }

    TransportFailure kind_;
    int http_status_;
    bool timed_out_;
};

class MalformedResponse : public DeepseekException {
public:
    explicit MalformedResponse(const std::string& message, const std::string& context = "")
        : DeepseekException(ErrorCode::MALFORMED_RESPONSE, message, context) {}
};

class EmptyContent : public DeepseekException {
public:
    explicit EmptyContent(const std::string& message, const std::string& context = "")
        : DeepseekException(ErrorCode::EMPTY_CONTENT, message, context) {}
};

class ExhaustedRetries : public DeepseekException {
public:
    ExhaustedRetries(const std::string& description, int attempts,
                     std::exception_ptr last_error, const std::string& last_message)
        : DeepseekException(ErrorCode::RETRIES_EXHAUSTED,
                            "'" + description + "' failed after " + std::to_string(attempts) + " attempt(s)",
                            "last error: " + last_message)
        , description_(description)
        , attempts_(attempts)
        , last_error_(std::move(last_error))
        , last_message_(last_message) {}

    const std::string& description() const noexcept { return description_; }
    int attempts() const noexcept { return attempts_; }
    std::exception_ptr last_error() const noexcept { return last_error_; }
    const std::string& last_message() const noexcept { return last_message_; }

    [[noreturn]] void rethrow_last_error() const { std::rethrow_exception(last_error_); }

private:
    std::string description_;
    int attempts_;
    std::exception_ptr last_error_;
    std::string last_message_;
};

#define DEEPSEEK_CHECK_ARGUMENT(condition, message) \
    do { \
        if (!(condition)) { \
            throw deepseek::InvalidArgumentError(message, __func__); \
        } \
    } while (0)

} // namespace deepseek
