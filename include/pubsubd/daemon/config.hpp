/**
 * @file config.hpp
 * @brief PubSubD daemon configuration and CLI parsing
 */

#pragma once

#include "pubsubd/core/broker.hpp"

#include <string>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <cstring>
#include <stdexcept>

namespace pubsubd {
namespace daemon {

/**
 * @brief Daemon configuration structure
 */
struct Config {
    std::string bind_addr = "0.0.0.0";
    uint16_t port = 8085;
    std::string log_level = "INFO";
    bool help = false;
    bool error = false;                        ///< Set on unknown option or bad value

    // Ack deadlines
    int32_t default_ack_deadline_s = 60;       ///< Used when a subscription asks for 0
    int32_t max_ack_deadline_s = 600;          ///< Clamp for subscription and lease deadlines

    // Pull settings
    uint32_t max_outstanding_pulls = 16;       ///< Concurrent Pull calls per subscription
    size_t max_blocking_pulls = 256;           ///< Worker threads serving blocking Pulls
    int64_t max_pull_wait_ms = 30000;          ///< Bound of a blocking Pull
    int32_t max_messages_per_pull = 1000;      ///< Clamp for max_messages

    // Redelivery and push
    int64_t sweep_interval_ms = 100;           ///< Expiry sweeper period
    uint32_t push_batch_size = 10;             ///< Messages leased per push cycle
    int64_t push_idle_wait_ms = 1000;          ///< Push loop wait on an empty backlog

    // Control plane
    uint32_t message_log_retention = 1000;     ///< Messages kept per topic log
    int32_t default_page_size = 100;           ///< List page size when 0 is requested
    int32_t max_page_size = 1000;              ///< Clamp for list page size
};

/**
 * @brief Print usage information
 * @param program_name Name of the executable
 */
inline void printUsage(const char* program_name) {
    std::cout << "PubSubD - Publish/Subscribe Delivery Daemon\n\n"
              << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Options:\n"
              << "  --bind <addr>         Bind address for the gRPC server (default: 0.0.0.0)\n"
              << "  --port <port>         gRPC port (default: 8085)\n"
              << "  --log-level <level>   Log level: TRACE, DEBUG, INFO, WARN, ERROR, FATAL (default: INFO)\n"
              << "\nAck Deadline Options:\n"
              << "  --default-ack-deadline <s>    Deadline when a subscription requests 0 (default: 60)\n"
              << "  --max-ack-deadline <s>        Upper bound for ack deadlines (default: 600)\n"
              << "\nPull Options:\n"
              << "  --max-outstanding-pulls <n>   Concurrent Pull calls per subscription (default: 16)\n"
              << "  --max-blocking-pulls <n>      Blocking Pulls served at once (default: 256)\n"
              << "  --max-pull-wait-ms <ms>       Longest blocking Pull wait (default: 30000)\n"
              << "  --max-messages-per-pull <n>   Cap on messages per Pull (default: 1000)\n"
              << "\nRedelivery and Push Options:\n"
              << "  --sweep-interval-ms <ms>      Expired lease sweep period (default: 100)\n"
              << "  --push-batch-size <n>         Messages leased per push cycle (default: 10)\n"
              << "  --push-idle-wait-ms <ms>      Push loop wait on empty backlog (default: 1000)\n"
              << "\nControl Plane Options:\n"
              << "  --message-log-retention <n>   Messages retained per topic (default: 1000)\n"
              << "  --default-page-size <n>       List page size when unspecified (default: 100)\n"
              << "  --max-page-size <n>           Largest list page (default: 1000)\n"
              << "\n  --help                Show this help message\n\n"
              << "Example:\n"
              << "  " << program_name << " --port 8085 --log-level DEBUG\n"
              << "  " << program_name << " --max-outstanding-pulls 64 --sweep-interval-ms 50\n";
}

/**
 * @brief Parse a whole decimal integer within [lo, hi].
 * @throws std::invalid_argument or std::out_of_range otherwise
 */
inline int64_t parseBounded(const char* value, int64_t lo, int64_t hi) {
    size_t consumed = 0;
    long long parsed = std::stoll(value, &consumed);
    if (value[consumed] != '\0') {
        throw std::invalid_argument(value);
    }
    if (parsed < lo || parsed > hi) {
        throw std::out_of_range(value);
    }
    return parsed;
}

/**
 * @brief Parse command line arguments
 * @param argc Argument count
 * @param argv Argument values
 * @return Parsed configuration; help and error flag invalid input
 */
inline Config parseArgs(int argc, char* argv[]) {
    Config config;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            config.help = true;
            return config;
        }

        // Options that require a value
        if (i + 1 >= argc) {
            std::cerr << "Error: Option " << arg << " requires a value\n";
            config.help = true;
            config.error = true;
            return config;
        }

        const char* value = argv[++i];

        try {
            if (std::strcmp(arg, "--bind") == 0) {
                config.bind_addr = value;
            } else if (std::strcmp(arg, "--port") == 0) {
                config.port = static_cast<uint16_t>(parseBounded(value, 1, 65535));
            } else if (std::strcmp(arg, "--log-level") == 0) {
                config.log_level = value;
            } else if (std::strcmp(arg, "--default-ack-deadline") == 0) {
                config.default_ack_deadline_s = static_cast<int32_t>(parseBounded(value, 1, INT32_MAX));
            } else if (std::strcmp(arg, "--max-ack-deadline") == 0) {
                config.max_ack_deadline_s = static_cast<int32_t>(parseBounded(value, 1, INT32_MAX));
            } else if (std::strcmp(arg, "--max-outstanding-pulls") == 0) {
                config.max_outstanding_pulls = static_cast<uint32_t>(parseBounded(value, 1, UINT32_MAX));
            } else if (std::strcmp(arg, "--max-blocking-pulls") == 0) {
                config.max_blocking_pulls = static_cast<size_t>(parseBounded(value, 1, 65536));
            } else if (std::strcmp(arg, "--max-pull-wait-ms") == 0) {
                config.max_pull_wait_ms = parseBounded(value, 1, INT64_MAX);
            } else if (std::strcmp(arg, "--max-messages-per-pull") == 0) {
                config.max_messages_per_pull = static_cast<int32_t>(parseBounded(value, 1, INT32_MAX));
            } else if (std::strcmp(arg, "--sweep-interval-ms") == 0) {
                config.sweep_interval_ms = parseBounded(value, 1, INT64_MAX);
            } else if (std::strcmp(arg, "--push-batch-size") == 0) {
                config.push_batch_size = static_cast<uint32_t>(parseBounded(value, 1, UINT32_MAX));
            } else if (std::strcmp(arg, "--push-idle-wait-ms") == 0) {
                config.push_idle_wait_ms = parseBounded(value, 1, INT64_MAX);
            } else if (std::strcmp(arg, "--message-log-retention") == 0) {
                config.message_log_retention = static_cast<uint32_t>(parseBounded(value, 0, UINT32_MAX));
            } else if (std::strcmp(arg, "--default-page-size") == 0) {
                config.default_page_size = static_cast<int32_t>(parseBounded(value, 1, INT32_MAX));
            } else if (std::strcmp(arg, "--max-page-size") == 0) {
                config.max_page_size = static_cast<int32_t>(parseBounded(value, 1, INT32_MAX));
            } else {
                std::cerr << "Error: Unknown option " << arg << "\n";
                config.help = true;
                config.error = true;
                return config;
            }
        } catch (const std::logic_error&) {
            // parseBounded throws invalid_argument / out_of_range.
            std::cerr << "Error: Invalid value '" << value << "' for option " << arg << "\n";
            config.help = true;
            config.error = true;
            return config;
        }
    }

    return config;
}

/**
 * @brief Map daemon settings onto engine options
 */
inline core::BrokerOptions toBrokerOptions(const Config& config) {
    core::BrokerOptions options;
    options.default_ack_deadline_seconds = config.default_ack_deadline_s;
    options.max_ack_deadline_seconds = config.max_ack_deadline_s;
    options.sweep_interval_ms = config.sweep_interval_ms;
    options.pull.max_outstanding_pulls = config.max_outstanding_pulls;
    options.pull.max_pull_wait_ms = config.max_pull_wait_ms;
    options.pull.max_messages_per_pull = config.max_messages_per_pull;
    options.push.batch_size = config.push_batch_size;
    options.push.idle_wait_ms = config.push_idle_wait_ms;
    options.registry.message_log_retention = config.message_log_retention;
    options.registry.default_page_size = config.default_page_size;
    options.registry.max_page_size = config.max_page_size;
    return options;
}

} // namespace daemon
} // namespace pubsubd
