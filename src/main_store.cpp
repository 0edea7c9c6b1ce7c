/*******************************************************************************
    Project: Fleetwatch - Session Fleet Coordination & Recovery Core
    Date: October 19, 2026

    File: main_store.cpp

    Description:
        Entry point of fleetwatch_stored, the shared store daemon that
        holds locks, worker records and pub/sub channels for every
        session, worker and supervisor process.

        Usage:
            $ ./fleetwatch_stored
            $ ./fleetwatch_stored --port 6390 --max-clients 128 --log-level debug

        Lifecycle:
            1. Parse argv, install signal handlers (SIGPIPE ignored, a peer
               that vanishes mid-send just fails that send)
            2. Start the StoreServer (accept + sweep threads)
            3. Log statistics every 30 seconds until SIGINT/SIGTERM
            4. Stop the server, which closes every client connection

        Exit Codes:
            0: clean shutdown
            1: bad arguments or the port could not be bound
*******************************************************************************/

#include "store/store_server.h"
#include "common/logger.h"

#include <signal.h>

#include <atomic>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <thread>

using namespace fleetwatch;

std::atomic<bool> shutdown_requested(false);

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        shutdown_requested = true;
    }
}

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options]\n"
              << "Options:\n"
              << "  --port PORT          Listen port (default: 6390)\n"
              << "  --max-clients N      Concurrent connections (default: 64)\n"
              << "  --sweep-ms MS        Expired key sweep interval (default: 1000)\n"
              << "  --log-level LEVEL    debug | info | warning | error (default: info)\n"
              << "  --help               Show this help message\n";
}

int main(int argc, char* argv[]) {
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
    signal(SIGPIPE, SIG_IGN);

    StoreServerConfig config;
    LogLevel level = LogLevel::INFO;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "--help") {
                print_usage(argv[0]);
                return 0;
            } else if (arg == "--port" && i + 1 < argc) {
                config.listen_port = static_cast<uint16_t>(std::stoi(argv[++i]));
            } else if (arg == "--max-clients" && i + 1 < argc) {
                config.max_clients = std::stoi(argv[++i]);
            } else if (arg == "--sweep-ms" && i + 1 < argc) {
                config.sweep_interval_ms = std::stoi(argv[++i]);
            } else if (arg == "--log-level" && i + 1 < argc) {
                level = Logger::parse_level(argv[++i]);
            } else {
                std::cerr << "Unknown option: " << arg << "\n";
                print_usage(argv[0]);
                return 1;
            }
        }
    } catch (const std::logic_error& e) {
        std::cerr << "Invalid option value: " << e.what() << "\n";
        print_usage(argv[0]);
        return 1;
    }

    Logger::set_level(level);
    Logger::info("=== Fleetwatch Shared Store ===");

    StoreServer server(config);
    if (!server.start()) {
        Logger::error("Failed to start store server");
        return 1;
    }

    Logger::info("Store running on port " + std::to_string(server.port()) +
                 ". Press Ctrl+C to stop.");

    int ticks = 0;
    while (!shutdown_requested && server.is_running()) {
        std::this_thread::sleep_for(std::chrono::seconds(1));
        if (++ticks % 30 == 0) {
            Logger::info("Connections: " + std::to_string(server.connection_count()) +
                         ", keys: " + std::to_string(server.engine().key_count()) +
                         ", requests served: " + std::to_string(server.requests_served()));
        }
    }

    Logger::info("Shutting down...");
    server.stop();
    Logger::info("Store shutdown complete");
    return 0;
}
