#include "deepseek/config.hpp"
#include "deepseek/error.hpp"
#include <yaml-cpp/yaml.h>
#include <cstdlib>
#include <filesystem>
#include <vector>

namespace deepseek {

namespace {

template<typename T>
void read_value(const YAML::Node& node, const char* key, T& target, const std::string& section) {
    if (!node[key]) {
        return;
    }
    try {
        target = node[key].as<T>();
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("Invalid value for '" + section + "." + key + "'", e.what());
    }
}

void read_seconds(const YAML::Node& node, const char* key, std::chrono::duration<double>& target,
                  const std::string& section) {
    double seconds = target.count();
    read_value(node, key, seconds, section);
    if (seconds < 0.0) {
        throw ConfigurationError("'" + section + "." + key + "' must not be negative");
    }
    target = std::chrono::duration<double>(seconds);
}

void read_retry_budget(const YAML::Node& node, const char* key, int& target) {
    read_value(node, key, target, "transport");
    if (target < 0) {
        throw ConfigurationError("'transport." + std::string(key) + "' must not be negative");
    }
}

void check_model(const std::string& model, const std::string& key) {
    if (supported_models().count(model) == 0) {
        throw ConfigurationError("'" + key + "' names an unsupported model: '" + model + "'", "",
                                 "Use deepseek-chat or deepseek-reasoner");
    }
}

void load_client(const YAML::Node& client, ClientConfig& config) {
    read_value(client, "base_url", config.base_url, "client");
    read_value(client, "api_key", config.api_key, "client");
    read_value(client, "default_model", config.default_model, "client");
    check_model(config.default_model, "client.default_model");
    read_value(client, "user_agent", config.user_agent, "client");

    long timeout = static_cast<long>(config.timeout.count());
    read_value(client, "timeout", timeout, "client");
    if (timeout <= 0) {
        throw ConfigurationError("'client.timeout' must be positive");
    }
    config.timeout = std::chrono::seconds(timeout);
}

void load_transport(const YAML::Node& transport, TransportRetryConfig& config) {
    read_retry_budget(transport, "max_retries", config.total);
    read_retry_budget(transport, "connect_retries", config.connect);
    read_retry_budget(transport, "read_retries", config.read);
    read_retry_budget(transport, "status_retries", config.status);
    read_value(transport, "backoff_factor", config.backoff_factor, "transport");
    read_seconds(transport, "backoff_max", config.backoff_max, "transport");
    read_value(transport, "respect_retry_after", config.respect_retry_after, "transport");
    read_value(transport, "raise_on_status", config.raise_on_status, "transport");
    read_value(transport, "pool_size", config.pool_size, "transport");

    if (transport["retry_statuses"]) {
        std::vector<int> statuses;
        read_value(transport, "retry_statuses", statuses, "transport");
        config.status_forcelist = std::set<int>(statuses.begin(), statuses.end());
    }

    if (config.backoff_factor < 0.0) {
        throw ConfigurationError("'transport.backoff_factor' must not be negative");
    }
}

void load_retry(const YAML::Node& retry, AppRetryConfig& config) {
    read_value(retry, "max_attempts", config.max_attempts, "retry");
    read_seconds(retry, "base_delay", config.base_delay, "retry");
    read_value(retry, "model", config.model, "retry");
    check_model(config.model, "retry.model");
    read_value(retry, "temperature", config.temperature, "retry");

    if (config.max_attempts < 1) {
        throw ConfigurationError("'retry.max_attempts' must be at least 1");
    }
}

void load_logging(const YAML::Node& logging, LoggingConfig& config) {
    if (logging["level"]) {
        std::string level;
        read_value(logging, "level", level, "logging");
        config.level = parse_log_level(level);
    }
    read_value(logging, "file", config.file, "logging");
    read_value(logging, "console", config.console, "logging");
}

} // namespace

Config load_config(const std::string& config_file) {
    Config config;
    config.config_file = config_file;

    if (config_file.empty()) {
        return config;
    }

    if (!std::filesystem::exists(config_file)) {
        throw ConfigurationError("Configuration file not found: " + config_file);
    }

    YAML::Node yaml;
    try {
        yaml = YAML::LoadFile(config_file);
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("Failed to parse configuration file: " + config_file, e.what());
    }

    if (yaml["client"]) load_client(yaml["client"], config.client);
    if (yaml["transport"]) load_transport(yaml["transport"], config.transport);
    if (yaml["retry"]) load_retry(yaml["retry"], config.retry);
    if (yaml["logging"]) load_logging(yaml["logging"], config.logging);

    return config;
}

const std::set<std::string>& supported_models() {
    static const std::set<std::string> models = {"deepseek-chat", "deepseek-reasoner"};
    return models;
}

std::string resolve_api_key(const std::string& explicit_key) {
    if (!explicit_key.empty()) {
        return explicit_key;
    }
    const char* env_value = std::getenv(kApiKeyEnvVar);
    if (env_value && *env_value) {
        return env_value;
    }
    return "";
}

} // namespace deepseek
