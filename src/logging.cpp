#include "deepseek/logging.hpp"
#include "deepseek/error.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <algorithm>
#include <cctype>
#include <memory>
#include <vector>

namespace deepseek {

namespace {

const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

spdlog::level::level_enum to_spdlog(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return spdlog::level::trace;
        case LogLevel::DEBUG: return spdlog::level::debug;
        case LogLevel::INFO: return spdlog::level::info;
        case LogLevel::WARNING: return spdlog::level::warn;
        case LogLevel::ERROR: return spdlog::level::err;
        case LogLevel::CRITICAL: return spdlog::level::critical;
    }
    return spdlog::level::info;
}

LogLevel from_spdlog(spdlog::level::level_enum level) {
    switch (level) {
        case spdlog::level::trace: return LogLevel::TRACE;
        case spdlog::level::debug: return LogLevel::DEBUG;
        case spdlog::level::info: return LogLevel::INFO;
        case spdlog::level::warn: return LogLevel::WARNING;
        case spdlog::level::err: return LogLevel::ERROR;
        default: return LogLevel::CRITICAL;
    }
}

} // namespace

LogLevel parse_log_level(const std::string& name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "trace") return LogLevel::TRACE;
    if (lowered == "debug") return LogLevel::DEBUG;
    if (lowered == "info") return LogLevel::INFO;
    if (lowered == "warning" || lowered == "warn") return LogLevel::WARNING;
    if (lowered == "error") return LogLevel::ERROR;
    if (lowered == "critical") return LogLevel::CRITICAL;

    throw ConfigurationError("Unknown log level: '" + name + "'", "logging.level",
                             "Use one of trace, debug, info, warning, error, critical");
}

const char* to_string(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "trace";
        case LogLevel::DEBUG: return "debug";
        case LogLevel::INFO: return "info";
        case LogLevel::WARNING: return "warning";
        case LogLevel::ERROR: return "error";
        case LogLevel::CRITICAL: return "critical";
    }
    return "info";
}

class Logger::Impl {
public:
    std::shared_ptr<spdlog::logger> logger;

    explicit Impl(std::shared_ptr<spdlog::logger> l) : logger(std::move(l)) {}
};

Logger::Logger(PrivateTag, std::unique_ptr<Impl> impl) : pImpl(std::move(impl)) {}

std::shared_ptr<Logger> Logger::wrap(std::unique_ptr<Impl> impl) {
    return std::make_shared<Logger>(PrivateTag{}, std::move(impl));
}

Logger::~Logger() = default;

std::shared_ptr<Logger> Logger::create(const std::string& name, const LoggingConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.console) {
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_level(spdlog::level::trace);
        sinks.push_back(console_sink);
    }

    if (!config.file.empty()) {
        try {
            auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.file, false);
            file_sink->set_level(spdlog::level::trace);
            sinks.push_back(file_sink);
        } catch (const spdlog::spdlog_ex& e) {
            throw ConfigurationError("Cannot open log file: " + config.file, e.what());
        }
    }

    if (sinks.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::null_sink_mt>());
    }

    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(to_spdlog(config.level));
    logger->set_pattern(kPattern);
    logger->flush_on(spdlog::level::warn);

    return wrap(std::make_unique<Impl>(std::move(logger)));
}

std::shared_ptr<Logger> Logger::create_null() {
    auto logger = std::make_shared<spdlog::logger>("null", std::make_shared<spdlog::sinks::null_sink_mt>());
    logger->set_level(spdlog::level::off);
    return wrap(std::make_unique<Impl>(std::move(logger)));
}

std::shared_ptr<Logger> Logger::child(const std::string& name) const {
    auto logger = pImpl->logger->clone(pImpl->logger->name() + "." + name);
    return wrap(std::make_unique<Impl>(std::move(logger)));
}

void Logger::trace(const std::string& message) {
    pImpl->logger->trace(message);
}

void Logger::debug(const std::string& message) {
    pImpl->logger->debug(message);
}

void Logger::info(const std::string& message) {
    pImpl->logger->info(message);
}

void Logger::warning(const std::string& message) {
    pImpl->logger->warn(message);
}

void Logger::error(const std::string& message) {
    pImpl->logger->error(message);
}

void Logger::critical(const std::string& message) {
    pImpl->logger->critical(message);
}

void Logger::set_level(LogLevel level) {
    pImpl->logger->set_level(to_spdlog(level));
}

LogLevel Logger::level() const {
    return from_spdlog(pImpl->logger->level());
}

const std::string& Logger::name() const {
    return pImpl->logger->name();
}

std::shared_ptr<Logger> initialize_logging(const LoggingConfig& config) {
    return Logger::create("deepseek", config);
}

} // namespace deepseek
