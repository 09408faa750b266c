#include "dualstore/bot.hpp"
#include "dualstore/config.hpp"
#include "dualstore/errors.hpp"
#include "dualstore/pg_database.hpp"
#include "dualstore/resilient_manager.hpp"
#include "dualstore/utils/logger.hpp"
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

static volatile std::sig_atomic_t g_running = 1;

void signal_handler(int signum) {
    (void)signum;
    g_running = 0;
}

int main() {
    // Setup signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::cout << "Discord Bot starting..." << std::endl;
    std::cout << "==========================" << std::endl;

    dualstore::Config config;
    if (!config.load()) {
        dualstore::log_warn("config", "No .env file found, using environment variables");
    }
    dualstore::set_log_level(config.get_log_level());

    if (!config.is_valid()) {
        dualstore::log_error("config", "DISCORD_BOT_TOKEN is required");
        return 1;
    }

    std::unique_ptr<dualstore::RemoteDatabase> remote;
    if (!config.get_resilience_settings().force_offline) {
        remote = std::make_unique<dualstore::PgDatabase>(config.get_remote_settings());
    }

    dualstore::ResilientManager manager(config.get_resilience_settings(), std::move(remote));
    try {
        manager.initialize();
    } catch (const dualstore::StoreError& e) {
        dualstore::log_error("database", std::string("Local store unavailable: ") + e.what());
        return 1;
    }

    dualstore::Bot bot(config.get_token(), manager);
    if (!bot.initialize()) {
        std::cerr << "Failed to initialize bot" << std::endl;
        manager.shutdown();
        return 1;
    }

    // Run the bot
    bot.run();

    while (g_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cout << "\nShutting down..." << std::endl;

    // Cleanup
    bot.stop();
    manager.shutdown();

    std::cout << "Bot shutdown complete" << std::endl;
    return 0;
}
