#pragma once

#include <memory>
#include <string>

namespace deepseek {

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARNING = 3,
    ERROR = 4,
    CRITICAL = 5
};

// Accepts "trace", "debug", "info", "warning"/"warn", "error", "critical"
// in any case. Throws ConfigurationError otherwise.
LogLevel parse_log_level(const std::string& name);
const char* to_string(LogLevel level);

struct LoggingConfig {
    LogLevel level = LogLevel::INFO;
    std::string file;       // empty: no file sink
    bool console = true;
};

/**
 * Named logger handed to each component at construction.
 *
 * Loggers created through child() share the sinks of their parent, so the
 * entry point configures output once and every component writes through it.
 */
class Logger {
public:
    ~Logger();

    static std::shared_ptr<Logger> create(const std::string& name, const LoggingConfig& config);
    static std::shared_ptr<Logger> create_null();

    std::shared_ptr<Logger> child(const std::string& name) const;

    void trace(const std::string& message);
    void debug(const std::string& message);
    void info(const std::string& message);
    void warning(const std::string& message);
    void error(const std::string& message);
    void critical(const std::string& message);

    void set_level(LogLevel level);
    LogLevel level() const;
    const std::string& name() const;

private:
    class Impl;
    struct PrivateTag {};

public:
    // Reachable only through the factories above.
    Logger(PrivateTag, std::unique_ptr<Impl> impl);

private:
    static std::shared_ptr<Logger> wrap(std::unique_ptr<Impl> impl);

    std::unique_ptr<Impl> pImpl;
};

// Builds the root logger. Called once by the entry point; spdlog's global
// registry is left untouched.
std::shared_ptr<Logger> initialize_logging(const LoggingConfig& config);

} // namespace deepseek
