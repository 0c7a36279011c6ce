/**
 * @file test_config.cpp
 * @brief Unit tests for daemon configuration and CLI parsing
 * 
 * Tests cover:
 * - Default configuration values
 * - CLI argument parsing for every option
 * - Error handling (unknown option, missing or malformed value)
 * - Mapping onto engine options
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <pubsubd/daemon/config.hpp>

#include <vector>
#include <string>
#include <cstring>

using namespace pubsubd::daemon;

class ConfigTest : public ::testing::Test {
protected:
    // Helper to create argc/argv from vector of strings
    std::pair<int, std::vector<char*>> makeArgs(const std::vector<std::string>& args) {
        argv_storage_.clear();
        argv_storage_.reserve(args.size());
        
        for (const auto& arg : args) {
            argv_storage_.push_back(std::vector<char>(arg.begin(), arg.end()));
            argv_storage_.back().push_back('\0');
        }
        
        argv_ptrs_.clear();
        for (auto& storage : argv_storage_) {
            argv_ptrs_.push_back(storage.data());
        }
        
        return {static_cast<int>(argv_ptrs_.size()), argv_ptrs_};
    }
    
private:
    std::vector<std::vector<char>> argv_storage_;
    std::vector<char*> argv_ptrs_;
};

// =============================================================================
// Default Values
// =============================================================================

TEST_F(ConfigTest, DefaultValues) {
    Config config;
    
    EXPECT_EQ(config.bind_addr, "0.0.0.0");
    EXPECT_EQ(config.port, 8085);
    EXPECT_EQ(config.log_level, "INFO");
    EXPECT_FALSE(config.help);
    EXPECT_FALSE(config.error);

    EXPECT_EQ(config.default_ack_deadline_s, 60);
    EXPECT_EQ(config.max_ack_deadline_s, 600);

    EXPECT_EQ(config.max_outstanding_pulls, 16u);
    EXPECT_EQ(config.max_blocking_pulls, 256u);
    EXPECT_EQ(config.max_pull_wait_ms, 30000);
    EXPECT_EQ(config.max_messages_per_pull, 1000);

    EXPECT_EQ(config.sweep_interval_ms, 100);
    EXPECT_EQ(config.push_batch_size, 10u);
    EXPECT_EQ(config.push_idle_wait_ms, 1000);

    EXPECT_EQ(config.message_log_retention, 1000u);
    EXPECT_EQ(config.default_page_size, 100);
    EXPECT_EQ(config.max_page_size, 1000);
}

// =============================================================================
// Basic CLI Parsing
// =============================================================================

TEST_F(ConfigTest, ParseNoArgs) {
    auto [argc, argv] = makeArgs({"pubsubd"});
    Config config = parseArgs(argc, argv.data());
    
    EXPECT_FALSE(config.help);
    EXPECT_EQ(config.port, 8085);
}

TEST_F(ConfigTest, ParseHelp) {
    auto [argc, argv] = makeArgs({"pubsubd", "--help"});
    Config config = parseArgs(argc, argv.data());
    
    EXPECT_TRUE(config.help);
    EXPECT_FALSE(config.error);
}

TEST_F(ConfigTest, ParseHelpShort) {
    auto [argc, argv] = makeArgs({"pubsubd", "-h"});
    Config config = parseArgs(argc, argv.data());
    
    EXPECT_TRUE(config.help);
}

// =============================================================================
// Network Options
// =============================================================================

TEST_F(ConfigTest, ParseBindAndPort) {
    auto [argc, argv] = makeArgs({"pubsubd", "--bind", "127.0.0.1", "--port", "9000"});
    Config config = parseArgs(argc, argv.data());
    
    EXPECT_EQ(config.bind_addr, "127.0.0.1");
    EXPECT_EQ(config.port, 9000);
}

TEST_F(ConfigTest, ParseLogLevel) {
    auto [argc, argv] = makeArgs({"pubsubd", "--log-level", "DEBUG"});
    Config config = parseArgs(argc, argv.data());
    
    EXPECT_EQ(config.log_level, "DEBUG");
}

// =============================================================================
// Engine Options
// =============================================================================

TEST_F(ConfigTest, ParseAckDeadlines) {
    auto [argc, argv] = makeArgs({"pubsubd",
        "--default-ack-deadline", "30",
        "--max-ack-deadline", "120"});
    Config config = parseArgs(argc, argv.data());
    
    EXPECT_EQ(config.default_ack_deadline_s, 30);
    EXPECT_EQ(config.max_ack_deadline_s, 120);
}

TEST_F(ConfigTest, ParsePullOptions) {
    auto [argc, argv] = makeArgs({"pubsubd",
        "--max-outstanding-pulls", "4",
        "--max-blocking-pulls", "8",
        "--max-pull-wait-ms", "2500",
        "--max-messages-per-pull", "50"});
    Config config = parseArgs(argc, argv.data());
    
    EXPECT_EQ(config.max_outstanding_pulls, 4u);
    EXPECT_EQ(config.max_blocking_pulls, 8u);
    EXPECT_EQ(config.max_pull_wait_ms, 2500);
    EXPECT_EQ(config.max_messages_per_pull, 50);
}

TEST_F(ConfigTest, ParseRedeliveryAndPushOptions) {
    auto [argc, argv] = makeArgs({"pubsubd",
        "--sweep-interval-ms", "25",
        "--push-batch-size", "3",
        "--push-idle-wait-ms", "200"});
    Config config = parseArgs(argc, argv.data());
    
    EXPECT_EQ(config.sweep_interval_ms, 25);
    EXPECT_EQ(config.push_batch_size, 3u);
    EXPECT_EQ(config.push_idle_wait_ms, 200);
}

TEST_F(ConfigTest, ParseControlPlaneOptions) {
    auto [argc, argv] = makeArgs({"pubsubd",
        "--message-log-retention", "10",
        "--default-page-size", "5",
        "--max-page-size", "20"});
    Config config = parseArgs(argc, argv.data());
    
    EXPECT_EQ(config.message_log_retention, 10u);
    EXPECT_EQ(config.default_page_size, 5);
    EXPECT_EQ(config.max_page_size, 20);
}

TEST_F(ConfigTest, ToBrokerOptions) {
    auto [argc, argv] = makeArgs({"pubsubd",
        "--default-ack-deadline", "15",
        "--max-outstanding-pulls", "2",
        "--push-batch-size", "7",
        "--max-page-size", "9"});
    Config config = parseArgs(argc, argv.data());
    auto options = toBrokerOptions(config);

    EXPECT_EQ(options.default_ack_deadline_seconds, 15);
    EXPECT_EQ(options.max_ack_deadline_seconds, 600);
    EXPECT_EQ(options.pull.max_outstanding_pulls, 2u);
    EXPECT_EQ(options.pull.max_pull_wait_ms, 30000);
    EXPECT_EQ(options.push.batch_size, 7u);
    EXPECT_EQ(options.registry.max_page_size, 9);
    EXPECT_EQ(options.sweep_interval_ms, 100);
}

// =============================================================================
// Error Handling
// =============================================================================

TEST_F(ConfigTest, UnknownOption) {
    auto [argc, argv] = makeArgs({"pubsubd", "--cluster", "prod"});
    Config config = parseArgs(argc, argv.data());
    
    EXPECT_TRUE(config.help);
    EXPECT_TRUE(config.error);
}

TEST_F(ConfigTest, MissingValue) {
    auto [argc, argv] = makeArgs({"pubsubd", "--port"});
    Config config = parseArgs(argc, argv.data());
    
    EXPECT_TRUE(config.help);
    EXPECT_TRUE(config.error);
}

TEST_F(ConfigTest, MalformedNumber) {
    auto [argc, argv] = makeArgs({"pubsubd", "--max-pull-wait-ms", "soon"});
    Config config = parseArgs(argc, argv.data());
    
    EXPECT_TRUE(config.help);
    EXPECT_TRUE(config.error);
    EXPECT_EQ(config.max_pull_wait_ms, 30000);
}

TEST_F(ConfigTest, TrailingGarbageRejected) {
    auto [argc, argv] = makeArgs({"pubsubd", "--push-batch-size", "10x"});
    Config config = parseArgs(argc, argv.data());

    EXPECT_TRUE(config.error);
    EXPECT_EQ(config.push_batch_size, 10u);
}

TEST_F(ConfigTest, ZeroLimitsRejected) {
    const std::vector<std::string> options = {
        "--default-ack-deadline", "--max-ack-deadline",
        "--max-outstanding-pulls", "--max-blocking-pulls",
        "--max-pull-wait-ms", "--max-messages-per-pull",
        "--sweep-interval-ms", "--push-batch-size", "--push-idle-wait-ms",
        "--default-page-size", "--max-page-size", "--port"};

    for (const auto& option : options) {
        auto [argc, argv] = makeArgs({"pubsubd", option, "0"});
        Config config = parseArgs(argc, argv.data());
        EXPECT_TRUE(config.error) << option;
        EXPECT_TRUE(config.help) << option;
    }
}

TEST_F(ConfigTest, NegativeLimitsRejected) {
    // Unsigned fields must not wrap around to huge values.
    const std::vector<std::string> options = {
        "--max-outstanding-pulls", "--push-batch-size",
        "--message-log-retention", "--max-messages-per-pull",
        "--max-pull-wait-ms", "--sweep-interval-ms"};

    for (const auto& option : options) {
        auto [argc, argv] = makeArgs({"pubsubd", option, "-1"});
        Config config = parseArgs(argc, argv.data());
        EXPECT_TRUE(config.error) << option;
    }

    auto [argc, argv] = makeArgs({"pubsubd", "--max-outstanding-pulls", "-1"});
    EXPECT_EQ(parseArgs(argc, argv.data()).max_outstanding_pulls, 16u);
}

TEST_F(ConfigTest, ZeroRetentionAccepted) {
    auto [argc, argv] = makeArgs({"pubsubd", "--message-log-retention", "0"});
    Config config = parseArgs(argc, argv.data());

    EXPECT_FALSE(config.error);
    EXPECT_EQ(config.message_log_retention, 0u);
}

TEST_F(ConfigTest, PortOutOfRangeRejected) {
    auto [argc, argv] = makeArgs({"pubsubd", "--port", "70000"});
    Config config = parseArgs(argc, argv.data());

    EXPECT_TRUE(config.error);
    EXPECT_EQ(config.port, 8085);
}

// =============================================================================
// Usage
// =============================================================================

TEST_F(ConfigTest, PrintUsageListsOptions) {
    testing::internal::CaptureStdout();
    printUsage("pubsubd");
    std::string output = testing::internal::GetCapturedStdout();
    
    EXPECT_THAT(output, ::testing::HasSubstr("--max-outstanding-pulls"));
    EXPECT_THAT(output, ::testing::HasSubstr("--sweep-interval-ms"));
    EXPECT_THAT(output, ::testing::HasSubstr("--port"));
}
