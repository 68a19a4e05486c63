#include "deepseek/http_client.hpp"
#include "deepseek/error.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace deepseek {

namespace {

std::string format_seconds(std::chrono::duration<double> delay) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(2) << delay.count() << "s";
    return out.str();
}

} // namespace

bool CaseInsensitiveLess::operator()(const std::string& lhs, const std::string& rhs) const {
    return std::lexicographical_compare(
        lhs.begin(), lhs.end(), rhs.begin(), rhs.end(),
        [](unsigned char a, unsigned char b) { return std::tolower(a) < std::tolower(b); });
}

std::string Endpoint::host_header() const {
    bool default_port = (use_ssl() && port == 443) || (!use_ssl() && port == 80);
    return default_port ? host : host + ":" + std::to_string(port);
}

Endpoint parse_base_url(const std::string& url) {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        throw ConfigurationError("Invalid base URL: '" + url + "'", "client.base_url",
                                 "Expected scheme://host[:port][/path]");
    }

    Endpoint endpoint;
    endpoint.scheme = url.substr(0, scheme_end);
    std::transform(endpoint.scheme.begin(), endpoint.scheme.end(), endpoint.scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (endpoint.scheme != "http" && endpoint.scheme != "https") {
        throw ConfigurationError("Unsupported URL scheme: '" + endpoint.scheme + "'", "client.base_url");
    }
    endpoint.port = endpoint.use_ssl() ? 443 : 80;

    std::string rest = url.substr(scheme_end + 3);
    auto path_start = rest.find('/');
    std::string authority = rest.substr(0, path_start);
    if (path_start != std::string::npos) {
        endpoint.path_prefix = rest.substr(path_start);
        while (!endpoint.path_prefix.empty() && endpoint.path_prefix.back() == '/') {
            endpoint.path_prefix.pop_back();
        }
    }

    auto colon = authority.rfind(':');
    if (colon != std::string::npos) {
        std::string port = authority.substr(colon + 1);
        authority = authority.substr(0, colon);
        try {
            std::size_t consumed = 0;
            int value = std::stoi(port, &consumed);
            if (consumed != port.size() || value <= 0 || value > 65535) {
                throw std::out_of_range(port);
            }
            endpoint.port = static_cast<uint16_t>(value);
        } catch (const std::exception&) {
            throw ConfigurationError("Invalid port in base URL: '" + port + "'", "client.base_url");
        }
    }

    if (authority.empty()) {
        throw ConfigurationError("Missing host in base URL: '" + url + "'", "client.base_url");
    }
    endpoint.host = authority;
    return endpoint;
}

std::optional<std::string> HttpResponse::header(const std::string& name) const {
    auto it = headers.find(name);
    if (it == headers.end()) {
        return std::nullopt;
    }
    return it->second;
}

Sleeper thread_sleeper() {
    return [](std::chrono::duration<double> delay) {
        if (delay.count() > 0.0) {
            std::this_thread::sleep_for(delay);
        }
    };
}

HttpClient::HttpClient(std::shared_ptr<HttpSession> session,
                       TransportRetryConfig retry_config,
                       std::shared_ptr<Logger> logger,
                       Sleeper sleeper)
    : session_(std::move(session)),
      retry_config_(std::move(retry_config)),
      logger_(std::move(logger)),
      sleeper_(std::move(sleeper)) {}

HttpResponse HttpClient::post(const std::string& target,
                              const std::string& body,
                              const HttpHeaders& headers,
                              std::chrono::seconds timeout) {
    HttpRequest request;
    request.method = "POST";
    request.target = target;
    request.headers = headers;
    request.body = body;
    return execute(request, timeout);
}

HttpResponse HttpClient::execute(const HttpRequest& request, std::chrono::seconds timeout) {
    if (!session_) {
        throw ConfigurationError("HTTP client has no session");
    }

    TransportRetryPolicy policy(retry_config_);
    const std::string call = request.method + " " + request.target;

    while (true) {
        HttpResponse response;
        try {
            logger_->debug("Sending " + call + " (attempt " + std::to_string(policy.attempts_failed() + 1) + ")");
            response = session_->send(request, timeout);
        } catch (const TransportError& e) {
            bool can_retry = e.kind() == TransportFailure::CONNECT
                ? policy.increment_connect_error()
                : policy.increment_read_error(request.method);
            if (!can_retry) {
                logger_->error("Giving up on " + call + " after " + std::to_string(policy.attempts_failed()) +
                               " " + to_string(e.kind()) + " failure(s): " + e.message());
                throw TransportError(e.kind(), "Max retries exceeded for " + call + ": " + e.message(),
                                     e.http_status(), e.context(), e.timed_out());
            }
            auto delay = policy.backoff_time();
            logger_->warning("Retrying " + call + " after " + to_string(e.kind()) + " error (" + e.message() +
                             "), waiting " + format_seconds(delay));
            sleeper_(delay);
            continue;
        }

        auto retry_after = response.header("Retry-After");
        if (!policy.is_retry(request.method, response.status, retry_after.has_value())) {
            return response;
        }

        if (!policy.increment_status(response.status)) {
            logger_->error("Giving up on " + call + ": too many " + std::to_string(response.status) + " responses");
            if (retry_config_.raise_on_status) {
                throw TransportError(TransportFailure::STATUS,
                                     "Max retries exceeded for " + call + ": too many " +
                                         std::to_string(response.status) + " error responses",
                                     response.status, response.body.substr(0, 200));
            }
            return response;
        }

        auto delay = policy.sleep_time(retry_after);
        logger_->warning("Retrying " + call + " after status " + std::to_string(response.status) +
                         ", waiting " + format_seconds(delay));
        sleeper_(delay);
    }
}

} // namespace deepseek
