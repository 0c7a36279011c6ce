/**
 * @file main.cpp
 * @brief PubSubD daemon entry point
 * 
 * This is the thin executable that wires together all the library components:
 * - Broker (registry, pull and push dispatchers, expiry sweeper)
 * - HTTP push transport
 * - Publisher and Subscriber gRPC services
 */

#include <pubsubd/daemon/config.hpp>
#include <pubsubd/utils/logger.hpp>
#include <pubsubd/core/broker.hpp>
#include <pubsubd/services/http_push_transport.hpp>
#include <pubsubd/services/publisher_service.hpp>
#include <pubsubd/services/subscriber_service.hpp>

#include <grpcpp/grpcpp.h>
#include <grpcpp/server_builder.h>

#include <csignal>
#include <atomic>
#include <memory>
#include <thread>
#include <chrono>

using namespace pubsubd;
using namespace pubsubd::daemon;

// Global shutdown flag
static std::atomic<bool> g_shutdown{false};

// Signal handler
void signalHandler(int signal) {
    g_shutdown.store(true);
}

int main(int argc, char* argv[]) {
    // Parse command line arguments
    Config config = parseArgs(argc, argv);

    if (config.help) {
        printUsage(argv[0]);
        return config.error ? 2 : 0;
    }

    // Configure logging
    utils::Logger::instance().setLevel(utils::Logger::parseLevel(config.log_level));

    LOG_INFO("Daemon", "PubSubD starting...");
    LOG_INFO("Daemon", "Ack deadline: default {}s, max {}s",
             config.default_ack_deadline_s, config.max_ack_deadline_s);
    LOG_INFO("Daemon", "Pull: max outstanding {}, max blocking {}, max wait {}ms",
             config.max_outstanding_pulls, config.max_blocking_pulls, config.max_pull_wait_ms);

    // Install signal handlers
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    try {
        auto broker = std::make_shared<core::Broker>(
            toBrokerOptions(config),
            std::make_shared<services::HttpPushTransport>()
        );
        broker->start();

        auto publisher_service = std::make_unique<services::PublisherServiceImpl>(broker);
        auto subscriber_service = std::make_unique<services::SubscriberServiceImpl>(
            broker, config.max_blocking_pulls);

        // Build and start gRPC server
        std::string addr = config.bind_addr + ":" + std::to_string(config.port);
        grpc::ServerBuilder builder;
        builder.AddListeningPort(addr, grpc::InsecureServerCredentials());
        builder.RegisterService(publisher_service.get());
        builder.RegisterService(subscriber_service.get());
        auto server = builder.BuildAndStart();

        if (!server) {
            LOG_ERROR("Daemon", "Failed to start gRPC server on {}", addr);
            broker->stop();
            return 1;
        }
        LOG_INFO("Daemon", "gRPC server listening on {}", addr);
        LOG_INFO("Daemon", "PubSubD is ready");

        // Main loop - wait for shutdown signal
        while (!g_shutdown.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        // Graceful shutdown
        LOG_INFO("Daemon", "Shutting down...");

        // Cancels waiting Pull calls and drains in-flight RPCs
        auto deadline = std::chrono::system_clock::now() + std::chrono::seconds(5);
        server->Shutdown(deadline);

        broker->stop();
        broker->logStats();

        LOG_INFO("Daemon", "PubSubD stopped");
        return 0;

    } catch (const std::exception& e) {
        LOG_ERROR("Daemon", "Fatal error: {}", e.what());
        return 1;
    }
}
