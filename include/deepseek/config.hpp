#pragma once

#include "deepseek/logging.hpp"
#include <chrono>
#include <cstddef>
#include <set>
#include <string>

namespace deepseek {

constexpr const char* kApiKeyEnvVar = "DEEPSEEK_API_KEY";
constexpr const char* kDefaultBaseUrl = "https://api.deepseek.com/v1";

struct ClientConfig {
    std::string base_url = kDefaultBaseUrl;
    std::string api_key;                        // empty: taken from DEEPSEEK_API_KEY
    std::chrono::seconds timeout{90};
    std::string default_model = "deepseek-reasoner";
    std::string user_agent = "deepseek-client/1.0";
};

// Transport-tier retry, counted per failure class.
struct TransportRetryConfig {
    int total = 3;
    int connect = 3;
    int read = 3;
    int status = 3;
    double backoff_factor = 2.0;
    std::chrono::duration<double> backoff_max{120.0};
    std::set<int> status_forcelist = {429, 500, 502, 503, 504};
    std::set<std::string> allowed_methods = {"POST"};
    bool respect_retry_after = true;
    bool raise_on_status = true;
    std::size_t pool_size = 10;
};

// Application-tier retry around a whole completion call.
struct AppRetryConfig {
    int max_attempts = 3;
    std::chrono::duration<double> base_delay{5.0};
    std::string model = "deepseek-reasoner";
    double temperature = 0.2;
};

struct Config {
    ClientConfig client;
    TransportRetryConfig transport;
    AppRetryConfig retry;
    LoggingConfig logging;
    std::string config_file;
};

// Defaults, overlaid with the YAML file when a path is given.
// Throws ConfigurationError if the file cannot be read or a value is invalid.
Config load_config(const std::string& config_file = "");

// Model identifiers the completion endpoint accepts.
const std::set<std::string>& supported_models();

// Explicit key if non-empty, otherwise the DEEPSEEK_API_KEY environment
// variable. Returns an empty string when neither is set.
std::string resolve_api_key(const std::string& explicit_key);

} // namespace deepseek
