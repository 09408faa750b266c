#include "dualstore/bot.hpp"
#include "dualstore/modules/store_commands.hpp"
#include "dualstore/resilient_manager.hpp"
#include "dualstore/utils/logger.hpp"

namespace dualstore {

namespace {

const char* LOG_COMPONENT = "bot";

} // namespace

Bot::Bot(std::string token, ResilientManager& manager)
    : token_(std::move(token)), manager_(manager) {}

Bot::~Bot() {
    stop();
}

bool Bot::initialize() {
    if (token_.empty()) {
        log_error(LOG_COMPONENT, "DISCORD_BOT_TOKEN is not set");
        return false;
    }

    // Create bot cluster
    cluster_ = std::make_unique<dpp::cluster>(
        token_,
        dpp::i_default_intents | dpp::i_message_content | dpp::i_guild_members
    );

    cluster_->on_log(dpp::utility::cout_logger());

    store_commands_ = std::make_unique<StoreCommands>(*cluster_, manager_);

    // Setup event handlers
    setup_event_handlers();

    log_info(LOG_COMPONENT, "Bot initialized successfully");
    return true;
}

void Bot::run() {
    if (!cluster_) {
        log_error(LOG_COMPONENT, "Bot not initialized");
        return;
    }

    cluster_->start(dpp::st_return);
}

void Bot::stop() {
    if (cluster_) {
        cluster_->shutdown();
        cluster_.reset();
        store_commands_.reset();
    }
}

void Bot::setup_event_handlers() {
    cluster_->on_ready([this](const dpp::ready_t& event) {
        on_ready(event);
    });

    cluster_->on_slashcommand([this](const dpp::slashcommand_t& event) {
        on_slashcommand(event);
    });

    cluster_->on_message_create([this](const dpp::message_create_t& event) {
        on_message_create(event);
    });

    cluster_->on_guild_member_add([this](const dpp::guild_member_add_t& event) {
        on_guild_member_add(event);
    });
}

void Bot::register_commands() {
    std::vector<dpp::slashcommand> commands = store_commands_->get_commands();

    cluster_->global_bulk_command_create(commands, [](const dpp::confirmation_callback_t& callback) {
        if (callback.is_error()) {
            log_error(LOG_COMPONENT, "Failed to register commands: " + callback.get_error().message);
        } else {
            log_info(LOG_COMPONENT, "Slash commands registered successfully");
        }
    });
}

void Bot::on_ready(const dpp::ready_t& event) {
    if (dpp::run_once<struct register_bot_commands>()) {
        log_info(LOG_COMPONENT, cluster_->me.username + " has connected to Discord!");
        log_info(LOG_COMPONENT, std::string("Data store mode: ") + to_string(manager_.mode()));

        register_commands();
    }
}

void Bot::on_slashcommand(const dpp::slashcommand_t& event) {
    std::string cmd = event.command.get_command_name();

    if (store_commands_->handles(cmd)) {
        store_commands_->handle_command(event);
    }
}

void Bot::on_message_create(const dpp::message_create_t& event) {
    store_commands_->handle_message(event);
}

void Bot::on_guild_member_add(const dpp::guild_member_add_t& event) {
    store_commands_->handle_member_join(event);
}

} // namespace dualstore
