#include "dualstore/modules/store_commands.hpp"
#include "dualstore/resilient_manager.hpp"
#include "dualstore/utils/common.hpp"
#include "dualstore/utils/logger.hpp"
#include "dualstore/utils/string_utils.hpp"
#include <random>

namespace dualstore {

namespace {

const char* LOG_COMPONENT = "bot";

constexpr int XP_MIN = 15;
constexpr int XP_MAX = 25;
constexpr auto XP_COOLDOWN = std::chrono::seconds(60);
constexpr size_t MAX_PREFIX_LENGTH = 5;

std::string mention(dpp::snowflake user_id) {
    return "<@" + snowflake_to_string(user_id) + ">";
}

std::string language_label(const std::string& code) {
    std::string label;
    auto flag = LANGUAGE_FLAGS.find(code);
    if (flag != LANGUAGE_FLAGS.end()) {
        label = flag->second + " ";
    }
    auto name = SUPPORTED_LANGUAGES.find(code);
    label += name != SUPPORTED_LANGUAGES.end() ? name->second : string_utils::to_upper(code);
    return label;
}

} // namespace

StoreCommands::StoreCommands(dpp::cluster& bot, ResilientManager& manager)
    : bot_(bot), manager_(manager) {}

std::vector<dpp::slashcommand> StoreCommands::get_commands() {
    std::vector<dpp::slashcommand> commands;

    // /language command
    dpp::command_option lang_option(dpp::co_string, "lang", "Server language", true);
    for (const auto& [code, name] : SUPPORTED_LANGUAGES) {
        lang_option.add_choice(dpp::command_option_choice(name, code));
    }
    commands.push_back(
        dpp::slashcommand("language", "Set the server language", bot_.me.id)
            .add_option(lang_option)
            .set_default_permissions(dpp::p_manage_guild)
    );

    // /prefix command
    commands.push_back(
        dpp::slashcommand("prefix", "Set the server command prefix", bot_.me.id)
            .add_option(dpp::command_option(dpp::co_string, "prefix", "New prefix (max 5 characters)", true))
            .set_default_permissions(dpp::p_manage_guild)
    );

    // /welcomechannel command
    commands.push_back(
        dpp::slashcommand("welcomechannel", "Set or clear the welcome channel", bot_.me.id)
            .add_option(dpp::command_option(dpp::co_channel, "channel", "Channel (leave empty to disable)", false))
            .set_default_permissions(dpp::p_manage_guild)
    );

    // /balance command
    commands.push_back(
        dpp::slashcommand("balance", "View your or another user's balance", bot_.me.id)
            .add_option(dpp::command_option(dpp::co_user, "user", "The user to check", false))
    );

    // /pay command
    commands.push_back(
        dpp::slashcommand("pay", "Send coins to another user", bot_.me.id)
            .add_option(dpp::command_option(dpp::co_user, "user", "Who receives the coins", true))
            .add_option(dpp::command_option(dpp::co_integer, "amount", "How many coins", true)
                .set_min_value(1))
    );

    // /rank command
    commands.push_back(
        dpp::slashcommand("rank", "View your or another user's level", bot_.me.id)
            .add_option(dpp::command_option(dpp::co_user, "user", "The user to check", false))
    );

    // /dbstats command
    commands.push_back(
        dpp::slashcommand("dbstats", "Show data store and cache statistics", bot_.me.id)
            .set_default_permissions(dpp::p_manage_guild)
    );

    return commands;
}

bool StoreCommands::handles(const std::string& command_name) const {
    return command_name == "language" || command_name == "prefix" || command_name == "welcomechannel" ||
           command_name == "balance" || command_name == "pay" || command_name == "rank" ||
           command_name == "dbstats";
}

void StoreCommands::handle_command(const dpp::slashcommand_t& event) {
    std::string cmd = event.command.get_command_name();

    try {
        if (cmd == "language") {
            cmd_language(event);
        } else if (cmd == "prefix") {
            cmd_prefix(event);
        } else if (cmd == "welcomechannel") {
            cmd_welcomechannel(event);
        } else if (cmd == "balance") {
            cmd_balance(event);
        } else if (cmd == "pay") {
            cmd_pay(event);
        } else if (cmd == "rank") {
            cmd_rank(event);
        } else if (cmd == "dbstats") {
            cmd_dbstats(event);
        }
    } catch (const std::exception& e) {
        log_error(LOG_COMPONENT, "/" + cmd + " failed: " + e.what());
        event.reply(error_embed("Error", "Something went wrong while saving your data. Please try again.")
                        .set_flags(dpp::m_ephemeral));
    }
}

void StoreCommands::cmd_language(const dpp::slashcommand_t& event) {
    if (!event.command.guild_id) {
        event.reply(error_embed("Error", "This command can only be used in a server"));
        return;
    }

    std::string lang = std::get<std::string>(event.get_parameter("lang"));
    if (SUPPORTED_LANGUAGES.find(lang) == SUPPORTED_LANGUAGES.end()) {
        event.reply(error_embed("Error", "Unsupported language: " + lang));
        return;
    }

    manager_.set_guild_lang(snowflake_to_string(event.command.guild_id), lang);
    log_info(LOG_COMPONENT, "Language -> " + lang + " in guild " + snowflake_to_string(event.command.guild_id));

    event.reply(success_embed("Language Updated", "Server language set to " + language_label(lang)));
}

void StoreCommands::cmd_prefix(const dpp::slashcommand_t& event) {
    if (!event.command.guild_id) {
        event.reply(error_embed("Error", "This command can only be used in a server"));
        return;
    }

    std::string prefix = string_utils::trim(std::get<std::string>(event.get_parameter("prefix")));
    if (prefix.empty() || prefix.size() > MAX_PREFIX_LENGTH || prefix.find(' ') != std::string::npos) {
        event.reply(error_embed("Invalid Prefix", "The prefix must be 1 to 5 characters without spaces"));
        return;
    }

    manager_.set_guild_prefix(snowflake_to_string(event.command.guild_id), prefix);
    event.reply(success_embed("Prefix Updated", "Server prefix set to `" + prefix + "`"));
}

void StoreCommands::cmd_welcomechannel(const dpp::slashcommand_t& event) {
    if (!event.command.guild_id) {
        event.reply(error_embed("Error", "This command can only be used in a server"));
        return;
    }

    std::string guild_id = snowflake_to_string(event.command.guild_id);
    auto channel_param = event.get_parameter("channel");

    if (std::holds_alternative<dpp::snowflake>(channel_param)) {
        dpp::snowflake channel_id = std::get<dpp::snowflake>(channel_param);
        manager_.set_welcome_channel(guild_id, snowflake_to_string(channel_id));
        event.reply(success_embed("Welcome Channel", "New members will be greeted in <#" +
                                  snowflake_to_string(channel_id) + ">"));
    } else {
        manager_.set_welcome_channel(guild_id, std::nullopt);
        event.reply(success_embed("Welcome Channel", "Welcome messages disabled"));
    }
}

void StoreCommands::cmd_balance(const dpp::slashcommand_t& event) {
    dpp::snowflake user_id = event.command.get_issuing_user().id;

    auto user_param = event.get_parameter("user");
    if (std::holds_alternative<dpp::snowflake>(user_param)) {
        user_id = std::get<dpp::snowflake>(user_param);
    }

    int64_t balance = manager_.get_balance(snowflake_to_string(user_id));
    event.reply(info_embed("Balance", mention(user_id) + " has **" + std::to_string(balance) + "** coins"));
}

void StoreCommands::cmd_pay(const dpp::slashcommand_t& event) {
    dpp::snowflake payer = event.command.get_issuing_user().id;
    dpp::snowflake target = std::get<dpp::snowflake>(event.get_parameter("user"));
    int64_t amount = std::get<int64_t>(event.get_parameter("amount"));

    if (target == payer) {
        event.reply(error_embed("Error", "You cannot pay yourself").set_flags(dpp::m_ephemeral));
        return;
    }
    if (amount <= 0) {
        event.reply(error_embed("Error", "Amount must be positive").set_flags(dpp::m_ephemeral));
        return;
    }

    auto remaining = manager_.transfer_money(snowflake_to_string(payer), snowflake_to_string(target), amount);
    if (!remaining) {
        event.reply(error_embed("Insufficient Funds", "You do not have " + std::to_string(amount) + " coins")
                        .set_flags(dpp::m_ephemeral));
        return;
    }


    event.reply(success_embed("Payment Sent", mention(payer) + " sent **" + std::to_string(amount) +
                              "** coins to " + mention(target) + "\nRemaining balance: " +
                              std::to_string(*remaining)));
}

void StoreCommands::cmd_rank(const dpp::slashcommand_t& event) {
    dpp::snowflake user_id = event.command.get_issuing_user().id;

    auto user_param = event.get_parameter("user");
    if (std::holds_alternative<dpp::snowflake>(user_param)) {
        user_id = std::get<dpp::snowflake>(user_param);
    }

    LevelRecord record = manager_.get_level(snowflake_to_string(user_id));

    int64_t progress_xp = record.xp % XP_PER_LEVEL;
    if (progress_xp < 0) {
        progress_xp = 0;
    }

    // Progress bar
    int bar_length = 20;
    int filled = static_cast<int>((progress_xp * bar_length) / XP_PER_LEVEL);
    std::string progress_bar;
    for (int i = 0; i < filled; i++) progress_bar += "█";
    for (int i = filled; i < bar_length; i++) progress_bar += "░";

    dpp::embed embed;
    embed.set_title("📊 Rank Card")
         .set_color(0x0099ff)
         .add_field("User", mention(user_id), true)
         .add_field("Level", std::to_string(record.level), true)
         .add_field("XP", std::to_string(record.xp) + " total", true)
         .add_field("Progress", progress_bar + "\n" + std::to_string(progress_xp) + " / " +
                    std::to_string(XP_PER_LEVEL), false);

    event.reply(dpp::message().add_embed(embed));
}

void StoreCommands::cmd_dbstats(const dpp::slashcommand_t& event) {
    ManagerStats stats = manager_.get_stats();

    uint64_t hits = 0;
    uint64_t misses = 0;
    if (stats.remote_cache) {
        hits = stats.remote_cache->hits;
        misses = stats.remote_cache->misses;
    }
    uint64_t total = hits + misses;

    dpp::embed embed;
    embed.set_title("ℹ️ Data Store Statistics")
         .set_description("Cache and synchronization status")
         .set_color(0x0099ff)
         .add_field("Hit Rate", string_utils::format_percent(hits, total) + " (" + std::to_string(hits) + "/" +
                    std::to_string(total) + ")", true)
         .add_field("Misses", std::to_string(misses), true)
         .add_field("Mode", "`" + string_utils::to_upper(to_string(stats.mode)) + "`", true)
         .add_field("Sync Queue", std::to_string(stats.sync_queue_size) + " pending", true)
         .add_field("Status", stats.available ? "🟢 Online" : "🔴 Offline", true);

    event.reply(dpp::message().add_embed(embed));
}

bool StoreCommands::on_cooldown(dpp::snowflake user_id) {
    std::lock_guard<std::mutex> lock(cooldown_mutex_);
    auto now = std::chrono::steady_clock::now();

    auto it = xp_cooldowns_.find(user_id);
    if (it != xp_cooldowns_.end() && now - it->second < XP_COOLDOWN) {
        return true;
    }
    xp_cooldowns_[user_id] = now;
    return false;
}

void StoreCommands::handle_message(const dpp::message_create_t& event) {
    if (event.msg.author.is_bot() || !event.msg.guild_id) {
        return;
    }

    if (on_cooldown(event.msg.author.id)) {
        return;
    }

    // Award random XP
    static std::random_device rd;
    static std::mt19937 gen(rd());
    static std::mutex gen_mutex;
    int xp_gained;
    {
        std::lock_guard<std::mutex> lock(gen_mutex);
        std::uniform_int_distribution<> dis(XP_MIN, XP_MAX);
        xp_gained = dis(gen);
    }

    std::string user_id = snowflake_to_string(event.msg.author.id);
    try {
        LevelUpdate update = manager_.add_xp(user_id, xp_gained);
        if (!update.level_up) {
            return;
        }

        UserSettings settings = manager_.get_user_settings(user_id);
        if (!settings.level_up_messages) {
            return;
        }

        dpp::embed embed;
        embed.set_title("🎉 Level Up!")
             .set_description(mention(event.msg.author.id) + " reached level **" +
                              std::to_string(update.level) + "**!")
             .set_color(0x00ff00);

        bot_.message_create(dpp::message(event.msg.channel_id, "").add_embed(embed));
    } catch (const std::exception& e) {
        log_error(LOG_COMPONENT, "XP award failed for " + user_id + ": " + e.what());
    }
}

void StoreCommands::handle_member_join(const dpp::guild_member_add_t& event) {
    std::string guild_id = snowflake_to_string(event.adding_guild->id);

    std::optional<std::string> channel;
    try {
        channel = manager_.get_welcome_channel(guild_id);
    } catch (const std::exception& e) {
        log_error(LOG_COMPONENT, "Welcome channel lookup failed for " + guild_id + ": " + e.what());
        return;
    }

    dpp::snowflake channel_id = channel ? string_to_snowflake(*channel) : dpp::snowflake(0);
    if (channel_id == 0) {
        return;
    }

    dpp::embed embed;
    embed.set_title("👋 Welcome!")
         .set_description("Welcome to **" + event.adding_guild->name + "**, " + mention(event.added.user_id) + "!")
         .set_color(0x00ff00);

    bot_.message_create(dpp::message(channel_id, "").add_embed(embed));
}

} // namespace dualstore
