#pragma once

#include <dpp/dpp.h>
#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace dualstore {

class ResilientManager;

// Slash commands and message hooks backed by the resilient data manager
class StoreCommands {
public:
    StoreCommands(dpp::cluster& bot, ResilientManager& manager);

    // Register slash commands
    std::vector<dpp::slashcommand> get_commands();

    bool handles(const std::string& command_name) const;

    // Handle slash commands
    void handle_command(const dpp::slashcommand_t& event);

    // Award message XP and announce level ups
    void handle_message(const dpp::message_create_t& event);

    // Greet new members in the configured welcome channel
    void handle_member_join(const dpp::guild_member_add_t& event);

private:
    dpp::cluster& bot_;
    ResilientManager& manager_;

    std::mutex cooldown_mutex_;
    std::map<dpp::snowflake, std::chrono::steady_clock::time_point> xp_cooldowns_;

    // Command handlers
    void cmd_language(const dpp::slashcommand_t& event);
    void cmd_prefix(const dpp::slashcommand_t& event);
    void cmd_welcomechannel(const dpp::slashcommand_t& event);
    void cmd_balance(const dpp::slashcommand_t& event);
    void cmd_pay(const dpp::slashcommand_t& event);
    void cmd_rank(const dpp::slashcommand_t& event);
    void cmd_dbstats(const dpp::slashcommand_t& event);

    bool on_cooldown(dpp::snowflake user_id);
};

} // namespace dualstore
