#include "deepseek/retry_policy.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <locale>
#include <sstream>
#include <stdexcept>

namespace deepseek {

TransportRetryPolicy::TransportRetryPolicy(TransportRetryConfig config)
    : config_(std::move(config)),
      total_(config_.total),
      connect_(config_.connect),
      read_(config_.read),
      status_(config_.status),
      history_(0) {}

bool TransportRetryPolicy::is_method_retryable(const std::string& method) const {
    return config_.allowed_methods.count(method) > 0;
}

bool TransportRetryPolicy::is_retry_after_status(int status) {
    return status == 413 || status == 429 || status == 503;
}

bool TransportRetryPolicy::is_retry(const std::string& method, int status, bool has_retry_after) const {
    if (!is_method_retryable(method)) {
        return false;
    }
    if (config_.status_forcelist.count(status) > 0) {
        return true;
    }
    return config_.respect_retry_after && has_retry_after && is_retry_after_status(status);
}

bool TransportRetryPolicy::increment_connect_error() {
    --total_;
    --connect_;
    ++history_;
    return !is_exhausted();
}

bool TransportRetryPolicy::increment_read_error(const std::string& method) {
    --total_;
    ++history_;
    // Read errors on methods outside the allowed set are never retried.
    if (!is_method_retryable(method)) {
        return false;
    }
    --read_;
    return !is_exhausted();
}

bool TransportRetryPolicy::increment_status(int /*status*/) {
    --total_;
    --status_;
    ++history_;
    return !is_exhausted();
}

bool TransportRetryPolicy::is_exhausted() const {
    return total_ < 0 || connect_ < 0 || read_ < 0 || status_ < 0;
}

std::chrono::duration<double> TransportRetryPolicy::backoff_time() const {
    // The first retry goes out immediately.
    if (history_ <= 1) {
        return std::chrono::duration<double>(0.0);
    }
    double seconds = config_.backoff_factor * std::pow(2.0, history_ - 1);
    seconds = std::min(seconds, config_.backoff_max.count());
    return std::chrono::duration<double>(std::max(seconds, 0.0));
}

std::chrono::duration<double> TransportRetryPolicy::sleep_time(
    const std::optional<std::string>& retry_after) const {
    if (config_.respect_retry_after && retry_after) {
        auto parsed = parse_retry_after(*retry_after);
        if (parsed && parsed->count() > 0.0) {
            return *parsed;
        }
    }
    return backoff_time();
}

std::optional<std::chrono::duration<double>> TransportRetryPolicy::parse_retry_after(
    const std::string& value, std::chrono::system_clock::time_point now) {
    auto first = value.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return std::nullopt;
    }
    auto last = value.find_last_not_of(" \t");
    std::string trimmed = value.substr(first, last - first + 1);

    bool all_digits = std::all_of(trimmed.begin(), trimmed.end(),
                                  [](unsigned char c) { return std::isdigit(c) != 0; });
    if (all_digits) {
        try {
            return std::chrono::duration<double>(std::stod(trimmed));
        } catch (const std::out_of_range&) {
            return std::nullopt;
        }
    }

    // IMF-fixdate, e.g. "Wed, 21 Oct 2015 07:28:00 GMT"
    std::tm tm = {};
    std::istringstream in(trimmed);
    in.imbue(std::locale::classic());
    in >> std::get_time(&tm, "%a, %d %b %Y %H:%M:%S");
    if (in.fail()) {
        return std::nullopt;
    }
    std::string zone;
    in >> zone;
    if (zone != "GMT" && zone != "UTC") {
        return std::nullopt;
    }

    std::time_t when = timegm(&tm);
    if (when == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    auto delta = std::chrono::system_clock::from_time_t(when) - now;
    double seconds = std::chrono::duration<double>(delta).count();
    return std::chrono::duration<double>(std::max(seconds, 0.0));
}

} // namespace deepseek
