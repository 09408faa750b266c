#pragma once

#include <dpp/dpp.h>
#include <memory>
#include <string>

namespace dualstore {

class ResilientManager;
class StoreCommands;

class Bot {
public:
    Bot(std::string token, ResilientManager& manager);
    ~Bot();

    // Create the cluster and wire the handlers
    bool initialize();

    // Connects and returns; events run on D++ threads until stop()
    void run();
    void stop();

    // Get the DPP cluster
    dpp::cluster& get_cluster() { return *cluster_; }

    // Register slash commands
    void register_commands();

private:
    std::string token_;
    ResilientManager& manager_;
    std::unique_ptr<dpp::cluster> cluster_;

    // Modules
    std::unique_ptr<StoreCommands> store_commands_;

    // Event handlers
    void setup_event_handlers();
    void on_ready(const dpp::ready_t& event);
    void on_slashcommand(const dpp::slashcommand_t& event);
    void on_message_create(const dpp::message_create_t& event);
    void on_guild_member_add(const dpp::guild_member_add_t& event);
};

} // namespace dualstore
