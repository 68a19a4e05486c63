#pragma once

#include "deepseek/config.hpp"
#include "deepseek/error.hpp"
#include <chrono>
#include <optional>
#include <string>

namespace deepseek {

/**
 * Transport-tier retry bookkeeping for one logical request.
 *
 * Each failure is charged to the total budget and to its own class budget
 * (connect, read or status). The request is given up as soon as any budget
 * drops below zero, so total=3 allows three retries, i.e. four exchanges.
 *
 * No backoff before the first retry; before the n-th retry (n >= 2) it is
 * backoff_factor * 2^(n-1) seconds, capped at backoff_max. A Retry-After
 * header, when honored, replaces the backoff.
 */
class TransportRetryPolicy {
public:
    explicit TransportRetryPolicy(TransportRetryConfig config = TransportRetryConfig());

    const TransportRetryConfig& config() const { return config_; }

    bool is_method_retryable(const std::string& method) const;

    // Whether a response with this status should be retried.
    bool is_retry(const std::string& method, int status, bool has_retry_after) const;

    // Charges one failure. Returns false when the budget is exhausted.
    bool increment_connect_error();
    bool increment_read_error(const std::string& method);
    bool increment_status(int status);

    bool is_exhausted() const;

    // Number of failures charged so far.
    int attempts_failed() const { return history_; }

    std::chrono::duration<double> backoff_time() const;

    // Delay before the next exchange, preferring Retry-After when honored.
    std::chrono::duration<double> sleep_time(const std::optional<std::string>& retry_after) const;

    // Parses delta-seconds or an IMF-fixdate (RFC 7231). Negative or past
    // values become zero; garbage yields nullopt.
    static std::optional<std::chrono::duration<double>> parse_retry_after(
        const std::string& value,
        std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

    static bool is_retry_after_status(int status);

private:
    TransportRetryConfig config_;
    int total_;
    int connect_;
    int read_;
    int status_;
    int history_;
};

} // namespace deepseek
