#include "dualstore/resilient_manager.hpp"
#include "fake_remote_database.hpp"
#include "temp_dir.hpp"

#include <gtest/gtest.h>
#include <fstream>
#include <thread>

using namespace dualstore;
using namespace std::chrono_literals;
using dualstore::test::unique_temp_dir;

namespace fs = std::filesystem;

class ResilientManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = unique_temp_dir("dualstore-manager");

        settings_.local_db_path = (dir_ / "local.db").string();
        settings_.initial_health_timeout = 500ms;
        settings_.health_timeout = 500ms;
        settings_.read_timeout = 300ms;
        settings_.write_timeout = 300ms;
        // Timers stay out of the way unless a test shortens them
        settings_.sync_interval = std::chrono::hours(1);
        settings_.health_check_interval = std::chrono::hours(1);
        settings_.reconnect_interval = std::chrono::hours(1);
        settings_.caches.cleanup_interval = 0ms;

        auto remote = std::make_unique<test::FakeRemoteDatabase>();
        fake_ = remote.get();
        remote_ = std::move(remote);
    }

    void TearDown() override {
        manager_.reset();
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    ResilientManager& create() {
        manager_ = std::make_unique<ResilientManager>(settings_, std::move(remote_));
        return *manager_;
    }

    ResilientManager& start() {
        create().initialize();
        return *manager_;
    }

    template<typename Pred>
    bool wait_for(Pred pred, std::chrono::milliseconds timeout = 3s) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (pred()) {
                return true;
            }
            std::this_thread::sleep_for(5ms);
        }
        return pred();
    }

    fs::path dir_;
    ResilienceSettings settings_;
    std::unique_ptr<RemoteDatabase> remote_;
    test::FakeRemoteDatabase* fake_ = nullptr;  // owned by the manager once created
    std::unique_ptr<ResilientManager> manager_;
};

// ==================== Modes ====================

TEST_F(ResilientManagerTest, HealthyRemoteStartsInRemoteMode) {
    ResilientManager& manager = start();
    EXPECT_EQ(manager.mode(), Mode::remote);
    EXPECT_TRUE(manager.is_available());
    EXPECT_EQ(fake_->pings.load(), 1);
}

TEST_F(ResilientManagerTest, ForcedOfflineNeverTouchesRemote) {
    settings_.force_offline = true;
    ResilientManager& manager = start();

    EXPECT_EQ(manager.mode(), Mode::disabled);
    EXPECT_TRUE(manager.is_available());

    manager.set_guild_lang("g1", "es");
    EXPECT_EQ(manager.get_guild_lang("g1"), "es");
    EXPECT_EQ(manager.local_store().sync_queue_size(), 1);

    // Disabled is terminal
    EXPECT_FALSE(manager.attempt_reconnect());
    EXPECT_EQ(manager.mode(), Mode::disabled);
    EXPECT_EQ(fake_->pings.load(), 0);
    EXPECT_EQ(fake_->fetches.load(), 0);
}

TEST_F(ResilientManagerTest, MissingRemoteBehavesAsDisabled) {
    manager_ = std::make_unique<ResilientManager>(settings_, nullptr);
    manager_->initialize();

    EXPECT_EQ(manager_->mode(), Mode::disabled);
    EXPECT_EQ(manager_->add_money("u1", 5), 5);
    EXPECT_EQ(manager_->get_balance("u1"), 5);
}

TEST_F(ResilientManagerTest, UnreachableRemoteStartsInLocalMode) {
    fake_->healthy = false;
    ResilientManager& manager = start();
    EXPECT_EQ(manager.mode(), Mode::local);
    EXPECT_TRUE(manager.is_available());
}

TEST_F(ResilientManagerTest, SecondInitializeIsIgnored) {
    ResilientManager& manager = start();
    manager.initialize();
    EXPECT_EQ(manager.mode(), Mode::remote);
    EXPECT_EQ(fake_->pings.load(), 1);
}

TEST_F(ResilientManagerTest, LocalStoreFailureIsFatalBeforeAnyPing) {
    fs::create_directories(dir_);
    {
        std::ofstream blocker(dir_ / "blocker");
        blocker << "not a directory";
    }
    settings_.local_db_path = (dir_ / "blocker" / "local.db").string();

    ResilientManager& manager = create();
    EXPECT_THROW(manager.initialize(), StoreError);
    EXPECT_EQ(manager.mode(), Mode::unknown);
    EXPECT_FALSE(manager.is_available());
    EXPECT_EQ(fake_->pings.load(), 0);
}

TEST_F(ResilientManagerTest, DirectTransitionsFollowHealthResults) {
    fake_->script_health({false, false, true, false});
    ResilientManager& manager = start();
    EXPECT_EQ(manager.mode(), Mode::local);

    EXPECT_FALSE(manager.attempt_reconnect());
    EXPECT_EQ(manager.mode(), Mode::local);

    EXPECT_TRUE(manager.attempt_reconnect());
    EXPECT_EQ(manager.mode(), Mode::remote);

    EXPECT_FALSE(manager.check_remote_health());
    EXPECT_EQ(manager.mode(), Mode::local);

    EXPECT_EQ(fake_->pings.load(), 4);
}

TEST_F(ResilientManagerTest, HealthCheckIsNoOpOutsideRemoteMode) {
    fake_->healthy = false;
    ResilientManager& manager = start();
    int pings = fake_->pings.load();

    EXPECT_FALSE(manager.check_remote_health());
    EXPECT_EQ(fake_->pings.load(), pings);
}

TEST_F(ResilientManagerTest, TimersDriveTheSameTransitions) {
    settings_.reconnect_interval = 40ms;
    settings_.health_check_interval = 300ms;
    fake_->script_health({false, false, true, false});

    ResilientManager& manager = start();
    EXPECT_EQ(manager.mode(), Mode::local);

    // Second reconnect tick succeeds
    ASSERT_TRUE(wait_for([&manager] { return manager.mode() == Mode::remote; }));
    fake_->healthy = false;

    // First health tick consumes the scripted failure
    ASSERT_TRUE(wait_for([&manager] { return manager.mode() == Mode::local; }));
    EXPECT_GE(fake_->pings.load(), 4);

    // Keeps retrying while the remote stays down
    int pings = fake_->pings.load();
    ASSERT_TRUE(wait_for([this, pings] { return fake_->pings.load() > pings; }));
    EXPECT_EQ(manager.mode(), Mode::local);
}

// ==================== Reads and writes ====================

TEST_F(ResilientManagerTest, RemoteModeWritesBothStores) {
    ResilientManager& manager = start();

    manager.set_guild_lang("g1", "es");
    manager.set_guild_prefix("g1", "!");

    EXPECT_EQ(fake_->guild("g1")->lang, "es");
    EXPECT_EQ(fake_->guild("g1")->prefix, "!");
    EXPECT_EQ(manager.local_store().get_guild_lang("g1"), "es");
    EXPECT_EQ(manager.local_store().sync_queue_size(), 0);

    EXPECT_EQ(manager.get_guild_lang("g1"), "es");
    EXPECT_EQ(manager.get_guild_settings("g1").prefix, "!");
}

TEST_F(ResilientManagerTest, LocalModeWritesAreQueued) {
    fake_->healthy = false;
    ResilientManager& manager = start();

    manager.set_guild_lang("g1", "es");
    manager.add_money("u1", 30);

    EXPECT_EQ(manager.get_guild_lang("g1"), "es");
    EXPECT_EQ(manager.get_balance("u1"), 30);
    EXPECT_EQ(manager.local_store().sync_queue_size(), 2);
    EXPECT_FALSE(fake_->guild("g1").has_value());
    EXPECT_EQ(fake_->writes.load(), 0);
}

TEST_F(ResilientManagerTest, FailedReadFallsBackToLocal) {
    ResilientManager& manager = start();
    GuildSettings remote_row;
    remote_row.guild_id = "g1";
    remote_row.lang = "de";
    fake_->seed_guild(remote_row);
    manager.local_store().set_guild_lang("g1", "es", false);

    fake_->fail_reads = true;
    EXPECT_EQ(manager.get_guild_lang("g1"), "es");

    fake_->fail_reads = false;
    EXPECT_EQ(manager.get_guild_lang("g1"), "de");
}

TEST_F(ResilientManagerTest, SlowReadFallsBackWithinDeadline) {
    ResilientManager& manager = start();
    manager.local_store().add_money("u1", 12, false);
    fake_->seed_balance("u1", 99);
    fake_->latency_ms = 800;

    auto begin = std::chrono::steady_clock::now();
    EXPECT_EQ(manager.get_balance("u1"), 12);
    EXPECT_LT(std::chrono::steady_clock::now() - begin, 700ms);
    EXPECT_EQ(manager.mode(), Mode::remote);
}

TEST_F(ResilientManagerTest, FailedRemoteWriteIsQueued) {
    ResilientManager& manager = start();
    fake_->fail_writes = true;

    EXPECT_NO_THROW(manager.set_guild_prefix("g1", "?"));
    EXPECT_EQ(manager.local_store().get_guild_prefix("g1"), "?");

    auto queue = manager.local_store().get_sync_queue();
    ASSERT_EQ(queue.size(), 1u);
    EXPECT_EQ(queue[0].data["prefix"], "?");

    fake_->fail_writes = false;
    SyncResult result = manager.sync_to_remote();
    EXPECT_EQ(result.synced, 1);
    EXPECT_EQ(result.failed, 0);
    EXPECT_EQ(fake_->guild("g1")->prefix, "?");
    EXPECT_EQ(manager.local_store().sync_queue_size(), 0);
}

TEST_F(ResilientManagerTest, TimedOutOverwriteIsQueued) {
    ResilientManager& manager = start();
    fake_->latency_ms = 600;

    manager.set_guild_lang("g1", "fr");
    EXPECT_EQ(manager.local_store().sync_queue_size(), 1);
}

TEST_F(ResilientManagerTest, RequeueCanBeDisabled) {
    settings_.requeue_failed_remote_writes = false;
    ResilientManager& manager = start();
    fake_->fail_writes = true;

    manager.set_guild_prefix("g1", "?");
    EXPECT_EQ(manager.local_store().get_guild_prefix("g1"), "?");
    EXPECT_EQ(manager.local_store().sync_queue_size(), 0);
}

TEST_F(ResilientManagerTest, FireAndForgetWritesLandRemotely) {
    ResilientManager& manager = start();

    EXPECT_EQ(manager.add_money("u1", 50), 50);
    ASSERT_TRUE(wait_for([this] { return fake_->balance("u1") == 50; }));

    EXPECT_EQ(manager.remove_money("u1", 20), std::optional<int64_t>(30));
    LevelUpdate update = manager.add_xp("u1", 1200);
    EXPECT_TRUE(update.level_up);

    ASSERT_TRUE(wait_for([this] { return fake_->balance("u1") == 30; }));
    ASSERT_TRUE(wait_for([this] { return fake_->level("u1").level == 2; }));
    EXPECT_EQ(manager.local_store().sync_queue_size(), 0);
}

TEST_F(ResilientManagerTest, InsufficientLocalFundsSkipRemote) {
    ResilientManager& manager = start();
    EXPECT_FALSE(manager.remove_money("u1", 5).has_value());

    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(fake_->writes.load(), 0);
    EXPECT_EQ(manager.local_store().sync_queue_size(), 0);
}

TEST_F(ResilientManagerTest, FailedFireAndForgetIsQueued) {
    ResilientManager& manager = start();
    fake_->fail_writes = true;

    EXPECT_EQ(manager.add_money("u1", 10), 10);
    ASSERT_TRUE(wait_for([&manager] { return manager.local_store().sync_queue_size() == 1; }));

    auto queue = manager.local_store().get_sync_queue();
    ASSERT_EQ(queue.size(), 1u);
    EXPECT_EQ(queue[0].table_name, "economy");
    EXPECT_EQ(queue[0].operation, "ADD");
    EXPECT_EQ(queue[0].data["amount"], 10);
}

TEST_F(ResilientManagerTest, RemoteModeReadsSeeOwnWrites) {
    ResilientManager& manager = start();
    EXPECT_EQ(manager.get_balance("u1"), 0);
    EXPECT_EQ(manager.get_level("u1").xp, 0);

    // Reads right after the write, before the detached remote write lands
    fake_->latency_ms = 100;
    EXPECT_EQ(manager.add_money("u1", 50), 50);
    EXPECT_EQ(manager.get_balance("u1"), 50);

    LevelUpdate update = manager.add_xp("u1", 1500);
    EXPECT_TRUE(update.level_up);
    LevelRecord level = manager.get_level("u1");
    EXPECT_EQ(level.xp, 1500);
    EXPECT_EQ(level.level, 2);

    UserSettings settings;
    settings.user_id = "u1";
    settings.timezone = "Asia/Tokyo";
    manager.set_user_settings(settings);
    EXPECT_EQ(manager.get_user_settings("u1").timezone, "Asia/Tokyo");

    ASSERT_TRUE(wait_for([this] { return fake_->balance("u1") == 50; }));
    ASSERT_TRUE(wait_for([this] { return fake_->level("u1").level == 2; }));
    EXPECT_EQ(manager.get_balance("u1"), 50);
}

TEST_F(ResilientManagerTest, FailedRemoteWriteDoesNotLeaveStaleReads) {
    ResilientManager& manager = start();
    EXPECT_EQ(manager.get_guild_lang("g1"), "en");
    EXPECT_FALSE(manager.get_guild_settings("g1").welcome_channel_id.has_value());
    EXPECT_EQ(manager.get_user_settings("u1").timezone, "UTC");
    manager.add_money("u1", 50);
    ASSERT_TRUE(wait_for([this] { return fake_->balance("u1") == 50; }));

    fake_->fail_writes = true;
    manager.set_guild_lang("g1", "es");
    manager.set_welcome_channel("g1", std::string("c7"));
    UserSettings settings;
    settings.user_id = "u1";
    settings.dm_notifications = false;
    manager.set_user_settings(settings);
    EXPECT_EQ(manager.remove_money("u1", 20), std::optional<int64_t>(30));

    EXPECT_EQ(manager.get_guild_lang("g1"), "es");
    EXPECT_EQ(manager.get_welcome_channel("g1"), std::optional<std::string>("c7"));
    EXPECT_EQ(manager.get_guild_settings("g1").lang, "es");
    EXPECT_FALSE(manager.get_user_settings("u1").dm_notifications);
    EXPECT_EQ(manager.get_balance("u1"), 30);

    // Every failed write is waiting for the sync worker
    ASSERT_TRUE(wait_for([&manager] { return manager.local_store().sync_queue_size() == 4; }));
}

TEST_F(ResilientManagerTest, TransferFollowsReportedBalance) {
    ResilientManager& manager = start();

    // Only the local copy holds the funds; reads report the remote balance
    manager.local_store().add_money("u1", 100, false);
    EXPECT_EQ(manager.get_balance("u1"), 0);
    EXPECT_FALSE(manager.transfer_money("u1", "u2", 40).has_value());
    EXPECT_EQ(manager.local_store().get_balance("u1"), 100);

    manager.add_money("u3", 100);
    ASSERT_TRUE(wait_for([this] { return fake_->balance("u3") == 100; }));

    EXPECT_FALSE(manager.transfer_money("u3", "u2", 0).has_value());
    EXPECT_FALSE(manager.transfer_money("u3", "u2", 101).has_value());
    EXPECT_EQ(manager.transfer_money("u3", "u2", 40), std::optional<int64_t>(60));
    EXPECT_EQ(manager.get_balance("u3"), 60);
    EXPECT_EQ(manager.get_balance("u2"), 40);

    ASSERT_TRUE(wait_for([this] { return fake_->balance("u3") == 60 && fake_->balance("u2") == 40; }));
}

// ==================== Sync ====================

TEST_F(ResilientManagerTest, QueueConvergesAfterReconnect) {
    fake_->healthy = false;
    ResilientManager& manager = start();

    manager.set_guild_lang("g1", "es");
    manager.set_guild_prefix("g1", "!");
    manager.set_welcome_channel("g1", std::string("c1"));

    UserSettings settings;
    settings.user_id = "u1";
    settings.level_up_messages = false;
    manager.set_user_settings(settings);

    manager.add_money("u1", 100);
    manager.remove_money("u1", 30);
    manager.add_xp("u1", 1200);
    EXPECT_EQ(manager.local_store().sync_queue_size(), 7);

    fake_->healthy = true;
    EXPECT_TRUE(manager.attempt_reconnect());
    EXPECT_EQ(manager.mode(), Mode::remote);
    EXPECT_EQ(manager.local_store().sync_queue_size(), 0);

    auto guild = fake_->guild("g1");
    ASSERT_TRUE(guild.has_value());
    EXPECT_EQ(guild->lang, "es");
    EXPECT_EQ(guild->prefix, "!");
    EXPECT_EQ(guild->welcome_channel_id, std::optional<std::string>("c1"));
    EXPECT_FALSE(fake_->user("u1")->level_up_messages);
    EXPECT_EQ(fake_->balance("u1"), 70);
    EXPECT_EQ(fake_->level("u1").xp, 1200);
    EXPECT_EQ(fake_->level("u1").level, 2);
}

TEST_F(ResilientManagerTest, SyncIsNoOpOutsideRemoteMode) {
    fake_->healthy = false;
    ResilientManager& manager = start();
    manager.set_guild_lang("g1", "es");

    SyncResult result = manager.sync_to_remote();
    EXPECT_EQ(result.synced, 0);
    EXPECT_EQ(result.failed, 0);
    EXPECT_EQ(manager.local_store().sync_queue_size(), 1);
}

TEST_F(ResilientManagerTest, GuildReplayIsIdempotent) {
    ResilientManager& manager = start();
    manager.set_guild_lang("g1", "es");

    manager.local_store().enqueue_sync("guild_settings", "UPDATE", {{"guild_id", "g1"}, {"lang", "es"}});
    manager.local_store().enqueue_sync("guild_settings", "UPDATE", {{"guild_id", "g1"}, {"lang", "es"}});

    SyncResult result = manager.sync_to_remote();
    EXPECT_EQ(result.synced, 2);
    EXPECT_EQ(fake_->guild("g1")->lang, "es");
    EXPECT_EQ(manager.get_guild_lang("g1"), "es");
}

TEST_F(ResilientManagerTest, TimedOutAdditiveReplayIsAppliedTwice) {
    settings_.initial_health_timeout = 2s;
    settings_.write_timeout = 100ms;
    fake_->healthy = false;
    ResilientManager& manager = start();
    manager.add_money("u1", 50);

    // The replay outlives write_timeout but still lands
    fake_->healthy = true;
    fake_->latency_ms = 300;
    EXPECT_TRUE(manager.attempt_reconnect());
    ASSERT_TRUE(wait_for([this] { return fake_->balance("u1") == 50; }));

    auto queue = manager.local_store().get_sync_queue();
    ASSERT_EQ(queue.size(), 1u);
    EXPECT_EQ(queue[0].retries, 1);

    fake_->latency_ms = 0;
    SyncResult result = manager.sync_to_remote();
    EXPECT_EQ(result.synced, 1);
    EXPECT_EQ(fake_->balance("u1"), 100);
    EXPECT_EQ(manager.local_store().get_balance("u1"), 50);
}

TEST_F(ResilientManagerTest, UncoveredRemoteDebitIsDropped) {
    ResilientManager& manager = start();
    manager.local_store().enqueue_sync("economy", "REMOVE", {{"user_id", "u1"}, {"amount", 40}});

    SyncResult result = manager.sync_to_remote();
    EXPECT_EQ(result.synced, 1);
    EXPECT_EQ(manager.local_store().sync_queue_size(), 0);
    EXPECT_EQ(fake_->balance("u1"), 0);
}

TEST_F(ResilientManagerTest, UnknownOperationIsMarkedFailed) {
    ResilientManager& manager = start();
    int64_t id = manager.local_store().enqueue_sync("reaction_roles", "DELETE", {{"id", 1}});

    SyncResult result = manager.sync_to_remote();
    EXPECT_EQ(result.failed, 1);

    auto queue = manager.local_store().get_sync_queue();
    ASSERT_EQ(queue.size(), 1u);
    EXPECT_EQ(queue[0].id, id);
    EXPECT_EQ(queue[0].retries, 1);
    ASSERT_TRUE(queue[0].last_error.has_value());
    EXPECT_NE(queue[0].last_error->find("unsupported"), std::string::npos);
}

TEST_F(ResilientManagerTest, DeadItemsAreReapedEveryNSyncs) {
    settings_.reap_every_syncs = 2;
    ResilientManager& manager = start();
    LocalStore& local = manager.local_store();

    int64_t id = local.enqueue_sync("economy", "ADD", {{"user_id", "u1"}, {"amount", 1}});
    for (int i = 0; i < settings_.max_retries; ++i) {
        local.mark_sync_failed(id, "timeout");
    }

    manager.sync_to_remote();
    EXPECT_EQ(local.get_sync_queue(100, 100).size(), 1u);

    manager.sync_to_remote();
    EXPECT_TRUE(local.get_sync_queue(100, 100).empty());
    EXPECT_EQ(fake_->balance("u1"), 0);
}

TEST_F(ResilientManagerTest, SyncTimerDrainsQueue) {
    settings_.sync_interval = 30ms;
    ResilientManager& manager = start();
    manager.local_store().enqueue_sync("guild_settings", "UPDATE", {{"guild_id", "g1"}, {"prefix", "$"}});

    ASSERT_TRUE(wait_for([this] {
        auto guild = fake_->guild("g1");
        return guild && guild->prefix == "$";
    }));
    ASSERT_TRUE(wait_for([&manager] { return manager.local_store().sync_queue_size() == 0; }));
}

TEST_F(ResilientManagerTest, FailedReplayHoldsLaterChangesToSameRow) {
    fake_->healthy = false;
    ResilientManager& manager = start();
    manager.set_guild_lang("g1", "es");
    manager.set_guild_lang("g1", "fr");
    manager.set_guild_prefix("g2", "$");

    // The oldest item ("es") fails once
    fake_->healthy = true;
    fake_->fail_next_writes = 1;
    EXPECT_TRUE(manager.attempt_reconnect());

    EXPECT_FALSE(fake_->guild("g1").has_value());
    EXPECT_EQ(fake_->guild("g2")->prefix, "$");
    EXPECT_EQ(manager.local_store().sync_queue_size(), 2);

    SyncResult result = manager.sync_to_remote();
    EXPECT_EQ(result.synced, 2);
    EXPECT_EQ(result.failed, 0);
    EXPECT_EQ(fake_->guild("g1")->lang, "fr");
    EXPECT_EQ(manager.local_store().get_guild_lang("g1"), "fr");
    EXPECT_EQ(manager.local_store().sync_queue_size(), 0);
}

TEST_F(ResilientManagerTest, FailedCreditHoldsLaterDebit) {
    fake_->healthy = false;
    ResilientManager& manager = start();
    manager.add_money("u1", 100);
    manager.remove_money("u1", 30);

    fake_->healthy = true;
    fake_->fail_next_writes = 1;
    EXPECT_TRUE(manager.attempt_reconnect());
    EXPECT_EQ(fake_->balance("u1"), 0);
    EXPECT_EQ(manager.local_store().sync_queue_size(), 2);

    manager.sync_to_remote();
    EXPECT_EQ(fake_->balance("u1"), 70);
    EXPECT_EQ(manager.local_store().get_balance("u1"), 70);
    EXPECT_EQ(manager.local_store().sync_queue_size(), 0);
}

// ==================== Stats / shutdown ====================

TEST_F(ResilientManagerTest, StatsReflectMode) {
    ResilientManager& manager = start();
    manager.get_guild_lang("g1");

    ManagerStats stats = manager.get_stats();
    EXPECT_EQ(stats.mode, Mode::remote);
    EXPECT_TRUE(stats.available);
    ASSERT_TRUE(stats.remote_cache.has_value());
    EXPECT_EQ(stats.remote_cache->misses, 1u);

    json j = stats;
    EXPECT_EQ(j["mode"], "remote");
    EXPECT_EQ(j["sync_queue_size"], 0);
    EXPECT_TRUE(j.contains("remote_cache"));

    fake_->healthy = false;
    manager.check_remote_health();
    manager.set_guild_lang("g1", "es");

    json local = manager.get_stats();
    EXPECT_EQ(local["mode"], "local");
    EXPECT_EQ(local["sync_queue_size"], 1);
    EXPECT_FALSE(local.contains("remote_cache"));
}

TEST_F(ResilientManagerTest, ShutdownDrainsAndClosesOnce) {
    ResilientManager& manager = start();
    manager.local_store().enqueue_sync("guild_settings", "UPDATE", {{"guild_id", "g1"}, {"lang", "pt"}});

    manager.shutdown();
    EXPECT_EQ(fake_->guild("g1")->lang, "pt");
    EXPECT_TRUE(fake_->closed.load());
    EXPECT_FALSE(manager.is_available());
    EXPECT_FALSE(manager.local_store().is_open());

    manager.shutdown();
    EXPECT_THROW(manager.initialize(), StoreError);
}
