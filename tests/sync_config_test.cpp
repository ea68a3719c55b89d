#include <gtest/gtest.h>

#include <string>

#include "sync_config.h"
#include "test_support.h"

class SyncConfigTest : public ::testing::Test
{
protected:
    TestWorkspace mWorkspace;
};

TEST_F(SyncConfigTest, DefaultsBeforeAnythingIsStored)
{
    SyncConfigStore store(mWorkspace.vfs());
    ASSERT_TRUE(store.load().ok());

    const SyncConfiguration config = store.get();
    EXPECT_TRUE(config.endpoint().empty());
    EXPECT_EQ(config.strategy(), "manual");
    EXPECT_EQ(config.conflict_resolution(), "server-wins");
    EXPECT_FALSE(config.auto_sync());
    EXPECT_EQ(config.auto_sync_interval_minutes(), DEFAULT_AUTO_SYNC_INTERVAL_MINUTES);
    EXPECT_EQ(config.transport(), "auto");
    EXPECT_TRUE(config.chunking().enabled());
    EXPECT_EQ(config.chunking().chunk_size(), ONE_MIB);
    EXPECT_EQ(config.chunking().threshold(), 5 * ONE_MIB);
    EXPECT_EQ(config.compression().algorithm(), "gzip");
    EXPECT_EQ(config.compression().min_size(), ONE_KIB);
    EXPECT_EQ(config.filters().max_file_size(), 100 * ONE_MIB);
    EXPECT_EQ(config.retry().max_retries(), 3u);
    EXPECT_EQ(config.retry().retry_delay_ms(), 1000u);
    EXPECT_EQ(config.realtime().port(), 8090u);
}

TEST_F(SyncConfigTest, SavedConfigurationSurvivesReload)
{
    SyncConfiguration config;
    config.set_endpoint("https://peer.example:9443/api");
    config.set_username("alice");
    config.set_strategy("bidirectional");
    config.set_conflict_resolution("newer-wins");
    config.set_auto_sync(true);
    config.set_auto_sync_interval_minutes(5);
    config.mutable_filters()->add_exclude_paths("*.tmp");
    config.mutable_retry()->set_max_retries(0);

    {
        SyncConfigStore store(mWorkspace.vfs());
        ASSERT_TRUE(store.save(config).ok());
    }
    EXPECT_TRUE(mWorkspace.exists("/__config/sync_config.json"));

    SyncConfigStore reloaded(mWorkspace.vfs());
    ASSERT_TRUE(reloaded.load().ok());
    const SyncConfiguration loaded = reloaded.get();
    EXPECT_EQ(loaded.endpoint(), "https://peer.example:9443/api");
    EXPECT_EQ(loaded.username(), "alice");
    EXPECT_EQ(SyncConfigStore::strategy(loaded), SyncStrategy::BIDIRECTIONAL);
    EXPECT_EQ(SyncConfigStore::conflictPolicy(loaded), ConflictPolicy::NEWER_WINS);
    EXPECT_TRUE(loaded.auto_sync());
    EXPECT_EQ(loaded.auto_sync_interval_minutes(), 5u);
    ASSERT_EQ(loaded.filters().exclude_paths_size(), 1);
    EXPECT_EQ(loaded.filters().exclude_paths(0), "*.tmp");
    EXPECT_EQ(loaded.retry().max_retries(), 0u);
    // unset fields come back as defaults
    EXPECT_EQ(loaded.transport(), "auto");
    EXPECT_EQ(loaded.chunking().chunk_size(), ONE_MIB);
}

TEST_F(SyncConfigTest, DocumentUsesSettingsNames)
{
    SyncConfiguration config;
    config.set_conflict_resolution("client-wins");
    config.set_auto_sync_interval_minutes(30);

    std::string json;
    ASSERT_TRUE(SyncConfigStore::toJson(SyncConfigStore::withDefaults(config), json).ok());
    EXPECT_NE(json.find("\"conflictResolution\""), std::string::npos);
    EXPECT_NE(json.find("\"client-wins\""), std::string::npos);
    EXPECT_NE(json.find("\"autoSyncIntervalMinutes\""), std::string::npos);
}

TEST_F(SyncConfigTest, PartialDocumentKeepsDefaults)
{
    mWorkspace.write("/__config/sync_config.json", R"({"endpoint": "http://peer.test", "autoSync": true, "unknownKey": 1})");

    SyncConfigStore store(mWorkspace.vfs());
    ASSERT_TRUE(store.load().ok());
    EXPECT_EQ(store.get().endpoint(), "http://peer.test");
    EXPECT_TRUE(store.get().auto_sync());
    EXPECT_EQ(store.get().auto_sync_interval_minutes(), DEFAULT_AUTO_SYNC_INTERVAL_MINUTES);
}

TEST_F(SyncConfigTest, PeerIdIsCreatedOnceAndKept)
{
    std::string peerId;
    {
        SyncConfigStore store(mWorkspace.vfs());
        peerId = store.get().peer_id();
        ASSERT_EQ(peerId.rfind("client_", 0), 0u);
        EXPECT_EQ(peerId.size(), peerId.rfind('_') + 9);

        SyncConfiguration config;
        config.set_endpoint("http://peer.test");
        ASSERT_TRUE(store.save(config).ok());
        EXPECT_EQ(store.get().peer_id(), peerId);
    }

    SyncConfigStore reloaded(mWorkspace.vfs());
    EXPECT_NE(reloaded.get().peer_id(), peerId);
    ASSERT_TRUE(reloaded.load().ok());
    EXPECT_EQ(reloaded.get().peer_id(), peerId);
    EXPECT_NE(mWorkspace.read("/__config/sync_config.json").find("\"peerId\""), std::string::npos);
}

TEST_F(SyncConfigTest, DocumentWithoutPeerIdGetsOneWrittenBack)
{
    mWorkspace.write("/__config/sync_config.json", R"({"endpoint": "http://peer.test"})");

    SyncConfigStore store(mWorkspace.vfs());
    ASSERT_TRUE(store.load().ok());
    const std::string peerId = store.get().peer_id();
    EXPECT_FALSE(peerId.empty());
    EXPECT_NE(mWorkspace.read("/__config/sync_config.json").find(peerId), std::string::npos);
}

TEST_F(SyncConfigTest, MalformedDocumentIsAConfigurationError)
{
    mWorkspace.write("/__config/sync_config.json", "{ not json");

    SyncConfigStore store(mWorkspace.vfs());
    EXPECT_EQ(store.load().code, SYNC_ERR_CONFIGURATION);
    EXPECT_TRUE(store.get().endpoint().empty());
}

TEST_F(SyncConfigTest, RejectsInvalidSettings)
{
    SyncConfigStore store(mWorkspace.vfs());

    SyncConfiguration badEndpoint;
    badEndpoint.set_endpoint("ftp://peer");
    EXPECT_EQ(store.save(badEndpoint).code, SYNC_ERR_CONFIGURATION);

    SyncConfiguration badPolicy;
    badPolicy.set_conflict_resolution("coin-flip");
    EXPECT_EQ(store.save(badPolicy).code, SYNC_ERR_CONFIGURATION);

    SyncConfiguration badInterval;
    badInterval.set_auto_sync_interval_minutes(0);
    EXPECT_EQ(store.save(badInterval).code, SYNC_ERR_CONFIGURATION);

    SyncConfiguration badAlgorithm;
    badAlgorithm.mutable_compression()->set_algorithm("brotli");
    EXPECT_EQ(store.save(badAlgorithm).code, SYNC_ERR_CONFIGURATION);

    EXPECT_FALSE(mWorkspace.exists("/__config/sync_config.json"));
}
