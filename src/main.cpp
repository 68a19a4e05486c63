#include "deepseek/call_history.hpp"
#include "deepseek/completion_client.hpp"
#include "deepseek/config.hpp"
#include "deepseek/error.hpp"
#include "deepseek/logging.hpp"
#include "deepseek/retry_orchestrator.hpp"
#include <boost/json.hpp>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

struct CliOptions {
    std::string config_file;
    std::string model;
    int attempts = 0;
    std::string output_file;
    std::string history_file;
    bool code = false;
    std::string prompt;
};

void print_usage(const char* program) {
    std::cerr << "Usage: " << program
              << " [--config FILE] [--model ID] [--attempts N] [--output FILE]"
                 " [--history FILE] [--code] PROMPT...\n";
}

bool parse_arguments(int argc, char* argv[], CliOptions& options) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&](std::string& target) {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << "\n";
                return false;
            }
            target = argv[++i];
            return true;
        };

        if (arg == "--config") {
            if (!next(options.config_file)) return false;
        } else if (arg == "--model") {
            if (!next(options.model)) return false;
        } else if (arg == "--output") {
            if (!next(options.output_file)) return false;
        } else if (arg == "--history") {
            if (!next(options.history_file)) return false;
        } else if (arg == "--attempts") {
            std::string value;
            if (!next(value)) return false;
            try {
                options.attempts = std::stoi(value);
            } catch (const std::exception&) {
                std::cerr << "Invalid attempt count: " << value << "\n";
                return false;
            }
        } else if (arg == "--code") {
            options.code = true;
        } else if (arg == "--help" || arg == "-h") {
            return false;
        } else {
            if (!options.prompt.empty()) {
                options.prompt += " ";
            }
            options.prompt += arg;
        }
    }
    return !options.prompt.empty();
}

void write_file(const std::string& path, const std::string& contents) {
    std::ofstream out(path, std::ios::binary);
    if (!out.is_open()) {
        throw std::runtime_error("Cannot open " + path + " for writing");
    }
    out << contents;
    if (!out.good()) {
        throw std::runtime_error("Failed writing " + path);
    }
}

} // namespace

int main(int argc, char* argv[]) {
    CliOptions options;
    if (!parse_arguments(argc, argv, options)) {
        print_usage(argv[0]);
        return 2;
    }

    deepseek::Config config;
    std::shared_ptr<deepseek::Logger> logger;
    try {
        config = deepseek::load_config(options.config_file);
        logger = deepseek::initialize_logging(config.logging);
    } catch (const deepseek::ConfigurationError& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    try {
        if (!options.model.empty()) {
            config.retry.model = options.model;
        }
        if (options.attempts > 0) {
            config.retry.max_attempts = options.attempts;
        }

        auto client = deepseek::make_completion_client(config, logger);
        deepseek::RetryOrchestrator orchestrator(config.retry, logger->child("retry"));

        std::vector<deepseek::Message> messages;
        if (options.code) {
            messages = deepseek::CompletionClient::code_generation_messages(options.prompt);
        } else {
            messages = {{deepseek::Role::USER, options.prompt}};
        }

        std::string text = orchestrator.call_with_retry(*client, messages, options.code ? "code generation" : "prompt");

        if (options.output_file.empty()) {
            std::cout << text << std::endl;
        } else {
            write_file(options.output_file, text);
            logger->info("Response written to " + options.output_file);
        }

        if (!options.history_file.empty()) {
            write_file(options.history_file, boost::json::serialize(client->history().to_json()));
            logger->info("Call history written to " + options.history_file);
        }

        for (const auto& record : client->call_history()) {
            logger->debug("- " + deepseek::format_timestamp(record.timestamp) + ": " + record.model +
                          " (" + std::to_string(record.tokens_used) + " tokens)");
        }
        return 0;

    } catch (const std::exception& e) {
        logger->critical("Fatal error: " + std::string(e.what()));
        return 1;
    }
}
