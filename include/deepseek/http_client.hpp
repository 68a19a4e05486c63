#pragma once

#include "deepseek/config.hpp"
#include "deepseek/logging.hpp"
#include "deepseek/retry_policy.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace deepseek {

struct CaseInsensitiveLess {
    bool operator()(const std::string& lhs, const std::string& rhs) const;
};

using HttpHeaders = std::map<std::string, std::string, CaseInsensitiveLess>;

struct Endpoint {
    std::string scheme;
    std::string host;
    uint16_t port = 443;
    std::string path_prefix;   // no trailing slash, e.g. "/v1"

    bool use_ssl() const { return scheme == "https"; }
    std::string host_header() const;
    std::string target(const std::string& path) const { return path_prefix + path; }
};

// Splits "scheme://host[:port][/prefix]". Throws ConfigurationError for
// anything but http and https URLs.
Endpoint parse_base_url(const std::string& url);

struct HttpRequest {
    std::string method = "POST";
    std::string target;
    HttpHeaders headers;
    std::string body;
};

struct HttpResponse {
    int status = 0;
    HttpHeaders headers;
    std::string body;

    std::optional<std::string> header(const std::string& name) const;
    bool ok() const { return status >= 200 && status < 300; }
};

/**
 * One request/response exchange with no retries.
 *
 * Implementations throw TransportError(CONNECT) when nothing reached the
 * server and TransportError(READ) when the request was sent but no complete
 * response came back (including timeouts).
 */
class HttpSession {
public:
    virtual ~HttpSession() = default;

    virtual HttpResponse send(const HttpRequest& request, std::chrono::seconds timeout) = 0;
};

using Sleeper = std::function<void(std::chrono::duration<double>)>;

// Blocks the calling thread for the given duration.
Sleeper thread_sleeper();

/**
 * Transport layer: drives an HttpSession under a TransportRetryPolicy.
 *
 * Retryable statuses and connection/read failures are retried with
 * exponential backoff (or the server's Retry-After). Other responses are
 * returned as-is, whatever their status. When the budget is spent a
 * TransportError is raised; a failed call is never dropped silently.
 */
class HttpClient {
public:
    HttpClient(std::shared_ptr<HttpSession> session,
               TransportRetryConfig retry_config,
               std::shared_ptr<Logger> logger,
               Sleeper sleeper = thread_sleeper());
    virtual ~HttpClient() = default;

    virtual HttpResponse post(const std::string& target,
                              const std::string& body,
                              const HttpHeaders& headers,
                              std::chrono::seconds timeout);

    HttpResponse execute(const HttpRequest& request, std::chrono::seconds timeout);

    const TransportRetryConfig& retry_config() const { return retry_config_; }

private:
    std::shared_ptr<HttpSession> session_;
    TransportRetryConfig retry_config_;
    std::shared_ptr<Logger> logger_;
    Sleeper sleeper_;
};

} // namespace deepseek
