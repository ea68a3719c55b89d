#include "sync_state_machine.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <future>
#include <iterator>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "snapshot_manager.h"
#include "sync_config.h"
#include "test_support.h"
#include "util/event_bus.h"
#include "util/sync_log.h"

using namespace std::chrono_literals;

namespace
{
    constexpr auto PASS_TIMEOUT = 10s;

    // push channel that never reaches a socket, the test drives its handlers directly
    class DetachedChannel : public PushChannel
    {
    public:
        using PushChannel::PushChannel;

    protected:
        int openSocket(int &fd) override
        {
            fd = -1;
            return -1;
        }
    };

    class EventLog
    {
    public:
        void record(const SyncEvent &event)
        {
            std::lock_guard<std::mutex> lock(mMutex);
            mEvents.push_back(event);
        }

        std::vector<SyncEvent> ofType(SyncEventType type) const
        {
            std::lock_guard<std::mutex> lock(mMutex);
            std::vector<SyncEvent> out;
            std::copy_if(mEvents.begin(), mEvents.end(), std::back_inserter(out),
                         [type](const SyncEvent &event) { return event.type == type; });
            return out;
        }

        std::vector<SyncState> states() const
        {
            std::vector<SyncState> out;
            for (const auto &event : ofType(SyncEventType::STATE_CHANGE))
                out.push_back(*event.state);
            return out;
        }

    private:
        mutable std::mutex mMutex;
        std::vector<SyncEvent> mEvents;
    };
}

class SyncStateMachineTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_EQ(mConfigStore.save(baseConfig()).code, SYNC_OK);
        mEngine = std::make_unique<SyncStateMachine>(
            mWorkspace.vfs(), mWorkspace.store(), mConfigStore, mLog, mEvents, mScheduler,
            [this](const SyncConfiguration &config, SyncError &) -> std::shared_ptr<Transport> {
                std::lock_guard<std::mutex> lock(mFactoryMutex);
                mEndpoints.push_back(config.endpoint());
                return mPeer;
            });
        mEngine->setChannelFactory([this](const PushChannel::Options &options, PushChannel::MessageHandler onMessage,
                                          PushChannel::StateHandler onState) {
            mOnMessage = onMessage;
            mOnState = onState;
            return std::make_unique<DetachedChannel>(options, mScheduler, onMessage, onState);
        });
        for (const SyncEventType type : {SyncEventType::STATE_CHANGE, SyncEventType::PROGRESS,
                                         SyncEventType::CONFLICT, SyncEventType::ERROR, SyncEventType::COMPLETED,
                                         SyncEventType::CONNECTED, SyncEventType::DISCONNECTED})
            mEvents.on(type, [this](const SyncEvent &event) { mRecorded.record(event); });
    }

    void TearDown() override
    {
        if (mEngine)
            mEngine->dispose();
    }

    static SyncConfiguration baseConfig()
    {
        SyncConfiguration config = SyncConfigStore::defaults();
        config.set_endpoint("http://peer.test");
        config.set_username("alice");
        config.set_password("secret");
        config.set_strategy(toString(SyncStrategy::BIDIRECTIONAL));
        config.mutable_retry()->set_max_retries(0);
        return config;
    }

    void configure(const SyncConfiguration &config)
    {
        ASSERT_EQ(mEngine->saveConfig(config).code, SYNC_OK);
    }

    void runSync(SyncMode mode = SyncMode::STANDARD)
    {
        ASSERT_EQ(mEngine->triggerSync(mode).code, SYNC_OK);
        ASSERT_TRUE(mEngine->waitForIdle(PASS_TIMEOUT));
    }

    void advanceAndWait(std::chrono::milliseconds duration)
    {
        mScheduler.advance(duration);
        ASSERT_TRUE(mEngine->waitForIdle(PASS_TIMEOUT));
    }

    EventLog mRecorded;
    TestWorkspace mWorkspace;
    SyncLog mLog{SYNC_LOG_CAPACITY, false};
    EventBus mEvents;
    ManualScheduler mScheduler;
    SyncConfigStore mConfigStore{mWorkspace.vfs()};
    std::shared_ptr<FakeRemotePeer> mPeer = std::make_shared<FakeRemotePeer>();

    std::mutex mFactoryMutex;
    std::vector<std::string> mEndpoints;
    PushChannel::MessageHandler mOnMessage;
    PushChannel::StateHandler mOnState;

    std::unique_ptr<SyncStateMachine> mEngine;
};

TEST_F(SyncStateMachineTest, FirstPassUploadsAndDownloads)
{
    mWorkspace.write("/notes/local.md", "written here");
    mPeer->put("/notes/remote.md", "written there");

    runSync();

    EXPECT_EQ(mEngine->state(), SyncState::SUCCESS);
    EXPECT_EQ(mPeer->content("/notes/local.md"), "written here");
    EXPECT_EQ(mWorkspace.read("/notes/remote.md"), "written there");

    const SyncStatus status = mEngine->getStatus();
    EXPECT_TRUE(status.lastSyncTime.has_value());
    EXPECT_FALSE(status.errorMessage.has_value());
    EXPECT_FALSE(status.progress.has_value());
    ASSERT_TRUE(status.connection.has_value());
    EXPECT_EQ(status.connection->type, "http");
    EXPECT_TRUE(status.connection->connected);

    EXPECT_EQ(mRecorded.states(), (std::vector<SyncState>{SyncState::SYNCING, SyncState::SUCCESS}));
    const auto progress = mRecorded.ofType(SyncEventType::PROGRESS);
    ASSERT_FALSE(progress.empty());
    EXPECT_EQ(progress.front().progress->phase, SyncPhase::PREPARING);
    EXPECT_EQ(progress.back().progress->phase, SyncPhase::FINALIZING);
    const auto completed = mRecorded.ofType(SyncEventType::COMPLETED);
    ASSERT_EQ(completed.size(), 1u);
    EXPECT_EQ(completed[0].code, SYNC_OK);
}

TEST_F(SyncStateMachineTest, SecondPassTransfersNothing)
{
    mWorkspace.write("/notes/local.md", "written here");
    mPeer->put("/notes/remote.md", "written there");
    runSync();

    const int uploads = mPeer->uploadRequests.load();
    const int downloads = mPeer->downloadRequests.load();
    runSync();

    EXPECT_EQ(mEngine->state(), SyncState::SUCCESS);
    EXPECT_EQ(mPeer->uploadRequests.load(), uploads);
    EXPECT_EQ(mPeer->downloadRequests.load(), downloads);
    EXPECT_EQ(mPeer->logins.load(), 1);
}

TEST_F(SyncStateMachineTest, RemoteEntriesOutsideFiltersAreNotDownloaded)
{
    SyncConfiguration config = baseConfig();
    config.mutable_filters()->add_exclude_paths("*.tmp");
    configure(config);
    mPeer->put("/notes/kept.md", "kept");
    mPeer->put("/notes/scratch.tmp", "scratch");
    mPeer->put("/__config/sync_config.json", "{\"endpoint\":\"http://evil\"}");

    runSync();
    EXPECT_EQ(mEngine->state(), SyncState::SUCCESS);
    EXPECT_EQ(mPeer->downloadRequests.load(), 1);
    runSync();
    EXPECT_EQ(mPeer->downloadRequests.load(), 1);

    EXPECT_EQ(mWorkspace.read("/notes/kept.md"), "kept");
    EXPECT_FALSE(mWorkspace.exists("/notes/scratch.tmp"));
    EXPECT_EQ(mEngine->getConfig().endpoint(), "http://peer.test");
    ASSERT_EQ(mConfigStore.load().code, SYNC_OK);
    EXPECT_EQ(mConfigStore.get().endpoint(), "http://peer.test");
}

TEST_F(SyncStateMachineTest, PeerIdIsSentAndStable)
{
    const std::string peerId = mEngine->getConfig().peer_id();
    ASSERT_EQ(peerId.rfind("client_", 0), 0u);

    runSync();
    EXPECT_EQ(mPeer->loginPeerId(), peerId);
    EXPECT_EQ(mPeer->checkPeerId(), peerId);

    // a saved configuration without an id keeps the existing one
    configure(baseConfig());
    runSync();
    EXPECT_EQ(mEngine->getConfig().peer_id(), peerId);
    EXPECT_EQ(mPeer->checkPeerId(), peerId);
}

TEST_F(SyncStateMachineTest, TriggerWhileRunningIsBusy)
{
    mPeer->holdChecks();
    ASSERT_EQ(mEngine->triggerSync().code, SYNC_OK);
    mPeer->waitForHeldCheck();

    EXPECT_EQ(mEngine->state(), SyncState::SYNCING);
    EXPECT_EQ(mEngine->triggerSync().code, SYNC_ERR_BUSY);
    EXPECT_EQ(mEngine->pause().code, SYNC_ERR_BUSY);
    EXPECT_TRUE(mEngine->getStatus().progress.has_value());

    mPeer->release();
    ASSERT_TRUE(mEngine->waitForIdle(PASS_TIMEOUT));
    EXPECT_EQ(mEngine->state(), SyncState::SUCCESS);
    EXPECT_EQ(mPeer->checks.load(), 1);
}

TEST_F(SyncStateMachineTest, MissingEndpointIsConfigurationError)
{
    SyncConfiguration config = baseConfig();
    config.set_endpoint("");
    configure(config);

    EXPECT_EQ(mEngine->triggerSync().code, SYNC_ERR_CONFIGURATION);
    EXPECT_EQ(mEngine->state(), SyncState::IDLE);
    EXPECT_EQ(mPeer->checks.load(), 0);
    EXPECT_FALSE(mEngine->getStatus().connection.has_value());
}

TEST_F(SyncStateMachineTest, PushStrategyNeverDownloads)
{
    SyncConfiguration config = baseConfig();
    config.set_strategy(toString(SyncStrategy::PUSH));
    configure(config);
    mWorkspace.write("/notes/local.md", "written here");
    mPeer->put("/notes/remote.md", "written there");

    runSync();

    EXPECT_TRUE(mPeer->has("/notes/local.md"));
    EXPECT_FALSE(mWorkspace.exists("/notes/remote.md"));
    EXPECT_EQ(mPeer->downloadRequests.load(), 0);
}

TEST_F(SyncStateMachineTest, PullStrategyNeverUploads)
{
    SyncConfiguration config = baseConfig();
    config.set_strategy(toString(SyncStrategy::PULL));
    configure(config);
    mWorkspace.write("/notes/local.md", "written here");
    mPeer->put("/notes/remote.md", "written there");

    runSync();

    EXPECT_FALSE(mPeer->has("/notes/local.md"));
    EXPECT_EQ(mWorkspace.read("/notes/remote.md"), "written there");
    EXPECT_EQ(mPeer->uploadRequests.load(), 0);
}

TEST_F(SyncStateMachineTest, ForcePullOverwritesLocalCopies)
{
    mWorkspace.write("/notes/shared.md", "local edit");
    mWorkspace.write("/notes/only-here.md", "kept");
    mPeer->put("/notes/shared.md", "remote version");

    runSync(SyncMode::FORCE_PULL);

    EXPECT_EQ(mEngine->state(), SyncState::SUCCESS);
    EXPECT_EQ(mWorkspace.read("/notes/shared.md"), "remote version");
    EXPECT_EQ(mWorkspace.read("/notes/only-here.md"), "kept");
    EXPECT_EQ(mPeer->uploadRequests.load(), 0);
}

TEST_F(SyncStateMachineTest, ForcePushUploadsEverything)
{
    mWorkspace.write("/notes/a.md", "same");
    mWorkspace.write("/notes/b.md", "fresh");
    mPeer->put("/notes/a.md", "same");
    mPeer->put("/notes/remote.md", "stays remote");

    runSync(SyncMode::FORCE_PUSH);

    EXPECT_EQ(mEngine->state(), SyncState::SUCCESS);
    EXPECT_EQ(mPeer->checks.load(), 0);
    EXPECT_EQ(mPeer->uploadRequests.load(), 2);
    EXPECT_EQ(mPeer->content("/notes/b.md"), "fresh");
    EXPECT_FALSE(mWorkspace.exists("/notes/remote.md"));
}

TEST_F(SyncStateMachineTest, ServerWinsDownloadsDivergentFile)
{
    mWorkspace.write("/notes/a.md", "local edit");
    mPeer->put("/notes/a.md", "remote edit");

    runSync();

    EXPECT_EQ(mWorkspace.read("/notes/a.md"), "remote edit");
    EXPECT_EQ(mPeer->content("/notes/a.md"), "remote edit");
    EXPECT_TRUE(mEngine->getConflicts().empty());
}

TEST_F(SyncStateMachineTest, ManualPolicyRaisesConflictAndResolvesRemote)
{
    SyncConfiguration config = baseConfig();
    config.set_conflict_resolution(toString(ConflictPolicy::MANUAL));
    configure(config);
    mWorkspace.write("/notes/a.md", "local edit");
    mPeer->put("/notes/a.md", "remote edit");

    runSync();

    EXPECT_EQ(mEngine->state(), SyncState::SUCCESS);
    EXPECT_EQ(mWorkspace.read("/notes/a.md"), "local edit");
    EXPECT_EQ(mPeer->content("/notes/a.md"), "remote edit");

    const auto conflicts = mEngine->getConflicts();
    ASSERT_EQ(conflicts.size(), 1u);
    EXPECT_EQ(conflicts[0].path, "/notes/a.md");
    EXPECT_EQ(conflicts[0].id.rfind("conflict_", 0), 0u);
    EXPECT_EQ(mRecorded.ofType(SyncEventType::CONFLICT).size(), 1u);

    EXPECT_EQ(mEngine->resolveConflict(conflicts[0].id, Resolution::REMOTE).get().code, SYNC_OK);
    EXPECT_EQ(mWorkspace.read("/notes/a.md"), "remote edit");
    EXPECT_TRUE(mEngine->getConflicts().empty());
    ASSERT_EQ(mPeer->resolutions.size(), 1u);
    EXPECT_EQ(mPeer->resolutions[0].first, conflicts[0].id);
    EXPECT_EQ(mPeer->resolutions[0].second, Resolution::REMOTE);
}

TEST_F(SyncStateMachineTest, LocalResolutionUploadsOnNextPass)
{
    SyncConfiguration config = baseConfig();
    config.set_conflict_resolution(toString(ConflictPolicy::MANUAL));
    configure(config);
    mWorkspace.write("/notes/a.md", "local edit");
    mPeer->put("/notes/a.md", "remote edit");
    runSync();

    const auto conflicts = mEngine->getConflicts();
    ASSERT_EQ(conflicts.size(), 1u);
    EXPECT_EQ(mEngine->resolveConflict(conflicts[0].id, Resolution::LOCAL).get().code, SYNC_OK);
    EXPECT_EQ(mWorkspace.read("/notes/a.md"), "local edit");

    runSync();

    EXPECT_EQ(mPeer->content("/notes/a.md"), "local edit");
    EXPECT_TRUE(mEngine->getConflicts().empty());
    EXPECT_EQ(mRecorded.ofType(SyncEventType::CONFLICT).size(), 1u);
}

TEST_F(SyncStateMachineTest, UnknownConflictIdIsNotFound)
{
    EXPECT_EQ(mEngine->resolveConflict("conflict_0_0", Resolution::LOCAL).get().code, SYNC_ERR_NOT_FOUND);
}

TEST_F(SyncStateMachineTest, RemoteConflictsAreAdoptedOnce)
{
    com::workspacesync::RemoteConflict remote;
    remote.set_id("srv-7");
    remote.set_path("/notes/a.md");
    remote.set_type("content");
    mWorkspace.write("/notes/a.md", "local edit");
    mPeer->put("/notes/a.md", "remote edit");
    mPeer->reportConflict(remote);

    runSync();
    runSync();

    const auto conflicts = mEngine->getConflicts();
    ASSERT_EQ(conflicts.size(), 1u);
    EXPECT_EQ(conflicts[0].remoteId, "srv-7");
    EXPECT_EQ(mWorkspace.read("/notes/a.md"), "local edit");

    EXPECT_EQ(mEngine->resolveAllConflicts(Resolution::LOCAL).get(), 0u);
    ASSERT_EQ(mPeer->resolutions.size(), 1u);
    EXPECT_EQ(mPeer->resolutions[0].first, "srv-7");
}

TEST_F(SyncStateMachineTest, PartialFailureEndsInError)
{
    for (int i = 1; i <= 5; ++i)
        mWorkspace.write("/notes/file" + std::to_string(i) + ".md", "content " + std::to_string(i));
    mPeer->failUploadsOf("/notes/file3.md");

    runSync();

    EXPECT_EQ(mEngine->state(), SyncState::ERROR);
    const SyncStatus status = mEngine->getStatus();
    ASSERT_TRUE(status.errorMessage.has_value());
    EXPECT_NE(status.errorMessage->find("1 of 5"), std::string::npos);
    EXPECT_FALSE(status.lastSyncTime.has_value());

    for (int i : {1, 2, 4, 5})
        EXPECT_TRUE(mPeer->has("/notes/file" + std::to_string(i) + ".md")) << i;
    EXPECT_FALSE(mPeer->has("/notes/file3.md"));

    const auto errors = mRecorded.ofType(SyncEventType::ERROR);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].code, SYNC_ERR_NETWORK);

    // the next pass may start from ERROR
    runSync();
    EXPECT_EQ(mPeer->checks.load(), 2);
}

TEST_F(SyncStateMachineTest, RejectedCredentialsFailWithAuth)
{
    mPeer->setRejectCredentials(true);
    runSync();

    EXPECT_EQ(mEngine->state(), SyncState::ERROR);
    const auto errors = mRecorded.ofType(SyncEventType::ERROR);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].code, SYNC_ERR_AUTH);
    EXPECT_EQ(mPeer->checks.load(), 0);

    mPeer->setRejectCredentials(false);
    runSync();
    EXPECT_EQ(mEngine->state(), SyncState::SUCCESS);
    EXPECT_EQ(mPeer->logins.load(), 2);
}

TEST_F(SyncStateMachineTest, ConfiguredTokenSkipsLogin)
{
    SyncConfiguration config = baseConfig();
    config.set_token("preissued");
    configure(config);

    runSync();

    EXPECT_EQ(mEngine->state(), SyncState::SUCCESS);
    EXPECT_EQ(mPeer->logins.load(), 0);
}

TEST_F(SyncStateMachineTest, IntervalTimerFiresAtFixedRate)
{
    SyncConfiguration config = baseConfig();
    config.set_auto_sync(true);
    config.set_auto_sync_interval_minutes(15);
    configure(config);
    mEngine->start();

    advanceAndWait(15min);
    EXPECT_EQ(mPeer->checks.load(), 1);

    // a tick that lands on a running pass is skipped, the next one is not
    mPeer->holdChecks();
    mScheduler.advance(15min);
    mPeer->waitForHeldCheck();
    mScheduler.advance(15min);
    mPeer->release();
    ASSERT_TRUE(mEngine->waitForIdle(PASS_TIMEOUT));
    EXPECT_EQ(mPeer->checks.load(), 2);

    advanceAndWait(15min);
    EXPECT_EQ(mPeer->checks.load(), 3);

    const auto deadlines = mScheduler.deadlines();
    ASSERT_EQ(deadlines.size(), 1u);
    EXPECT_EQ(deadlines[0], mScheduler.now() + std::chrono::milliseconds(15min));
}

TEST_F(SyncStateMachineTest, LocalEditsAreDebounced)
{
    SyncConfiguration config = baseConfig();
    config.set_auto_sync(true);
    config.set_auto_sync_interval_minutes(60);
    configure(config);
    mEngine->start();

    mWorkspace.write("/notes/a.md", "one");
    mScheduler.advance(500ms);
    mWorkspace.write("/notes/b.md", "two");
    mScheduler.advance(500ms);
    mWorkspace.write("/notes/c.md", "three");

    advanceAndWait(CHANGE_DEBOUNCE_DELAY - 1ms);
    EXPECT_EQ(mPeer->checks.load(), 0);

    advanceAndWait(1ms);
    EXPECT_EQ(mPeer->checks.load(), 1);
    EXPECT_TRUE(mPeer->has("/notes/c.md"));
}

TEST_F(SyncStateMachineTest, DownloadedFilesDoNotRetrigger)
{
    SyncConfiguration config = baseConfig();
    config.set_auto_sync(true);
    config.set_auto_sync_interval_minutes(60);
    configure(config);
    mEngine->start();
    mPeer->put("/notes/remote.md", "written there");

    runSync();
    ASSERT_EQ(mWorkspace.read("/notes/remote.md"), "written there");

    // only the interval timer is left
    EXPECT_EQ(mScheduler.pending(), 1u);
    advanceAndWait(CHANGE_DEBOUNCE_DELAY * 2);
    EXPECT_EQ(mPeer->checks.load(), 1);
}

TEST_F(SyncStateMachineTest, AutoSyncOffIgnoresEdits)
{
    mEngine->start();
    mWorkspace.write("/notes/a.md", "one");

    EXPECT_EQ(mScheduler.pending(), 0u);
    advanceAndWait(1h);
    EXPECT_EQ(mPeer->checks.load(), 0);
}

TEST_F(SyncStateMachineTest, SavingConfigRearmsTimers)
{
    mEngine->start();
    EXPECT_EQ(mScheduler.pending(), 0u);

    SyncConfiguration config = baseConfig();
    config.set_auto_sync(true);
    config.set_auto_sync_interval_minutes(1);
    configure(config);
    EXPECT_EQ(mScheduler.pending(), 1u);

    advanceAndWait(1min);
    EXPECT_EQ(mPeer->checks.load(), 1);

    config.set_auto_sync(false);
    configure(config);
    EXPECT_EQ(mScheduler.pending(), 0u);
}

TEST_F(SyncStateMachineTest, PauseBlocksPassesUntilResumed)
{
    SyncConfiguration config = baseConfig();
    config.set_auto_sync(true);
    config.set_auto_sync_interval_minutes(5);
    configure(config);
    mEngine->start();

    EXPECT_EQ(mEngine->resume().code, SYNC_ERR_INVALID_STATE);
    ASSERT_EQ(mEngine->pause().code, SYNC_OK);
    EXPECT_EQ(mEngine->pause().code, SYNC_OK);
    EXPECT_EQ(mEngine->state(), SyncState::PAUSED);

    EXPECT_EQ(mEngine->triggerSync().code, SYNC_ERR_INVALID_STATE);
    mWorkspace.write("/notes/a.md", "edited while paused");
    advanceAndWait(5min);
    EXPECT_EQ(mPeer->checks.load(), 0);

    ASSERT_EQ(mEngine->resume().code, SYNC_OK);
    EXPECT_EQ(mEngine->state(), SyncState::IDLE);
    runSync();
    EXPECT_TRUE(mPeer->has("/notes/a.md"));
}

TEST_F(SyncStateMachineTest, RealtimeDropGoesOffline)
{
    SyncConfiguration config = baseConfig();
    config.set_auto_sync(true);
    config.set_transport(toString(TransportKind::REALTIME));
    configure(config);
    mEngine->start();
    ASSERT_TRUE(mOnState);

    mOnState(false);
    EXPECT_EQ(mEngine->state(), SyncState::OFFLINE);
    EXPECT_EQ(mEngine->triggerSync().code, SYNC_ERR_INVALID_STATE);
    const SyncStatus status = mEngine->getStatus();
    ASSERT_TRUE(status.connection.has_value());
    EXPECT_EQ(status.connection->type, "realtime");
    EXPECT_FALSE(status.connection->connected);
    EXPECT_EQ(mRecorded.ofType(SyncEventType::DISCONNECTED).size(), 1u);

    // offline may still be paused, resuming stays offline while the channel is down
    ASSERT_EQ(mEngine->pause().code, SYNC_OK);
    ASSERT_EQ(mEngine->resume().code, SYNC_OK);
    EXPECT_EQ(mEngine->state(), SyncState::OFFLINE);

    mOnState(false);
    EXPECT_EQ(mEngine->state(), SyncState::OFFLINE);
    mOnState(true);
    EXPECT_EQ(mEngine->state(), SyncState::IDLE);
    EXPECT_EQ(mRecorded.ofType(SyncEventType::CONNECTED).size(), 1u);
    runSync();
    EXPECT_EQ(mEngine->state(), SyncState::SUCCESS);
}

TEST_F(SyncStateMachineTest, RealtimeDropDuringPassEndsOffline)
{
    SyncConfiguration config = baseConfig();
    config.set_auto_sync(true);
    config.set_auto_sync_interval_minutes(60);
    config.set_transport(toString(TransportKind::REALTIME));
    configure(config);
    mEngine->start();
    ASSERT_TRUE(mOnState);
    mOnState(true);

    mPeer->holdChecks();
    ASSERT_EQ(mEngine->triggerSync().code, SYNC_OK);
    mPeer->waitForHeldCheck();
    mOnState(false);
    EXPECT_EQ(mEngine->state(), SyncState::SYNCING);
    mPeer->release();
    ASSERT_TRUE(mEngine->waitForIdle(PASS_TIMEOUT));

    EXPECT_EQ(mEngine->state(), SyncState::OFFLINE);
    const auto states = mRecorded.states();
    ASSERT_GE(states.size(), 2u);
    EXPECT_EQ(states[states.size() - 2], SyncState::SUCCESS);
    EXPECT_EQ(states.back(), SyncState::OFFLINE);
    EXPECT_EQ(mEngine->triggerSync().code, SYNC_ERR_INVALID_STATE);

    mOnState(true);
    EXPECT_EQ(mEngine->state(), SyncState::IDLE);
}

TEST_F(SyncStateMachineTest, AutoTransportStaysOnlineWithoutChannel)
{
    SyncConfiguration config = baseConfig();
    config.set_auto_sync(true);
    config.set_transport(toString(TransportKind::AUTO));
    config.mutable_realtime()->set_enabled(true);
    configure(config);
    mEngine->start();
    ASSERT_TRUE(mOnState);

    mOnState(false);
    EXPECT_EQ(mEngine->state(), SyncState::IDLE);
    runSync();
    EXPECT_EQ(mEngine->state(), SyncState::SUCCESS);
}

TEST_F(SyncStateMachineTest, HttpTransportOpensNoChannel)
{
    SyncConfiguration config = baseConfig();
    config.set_transport(toString(TransportKind::HTTP));
    configure(config);
    mEngine->start();

    EXPECT_FALSE(mOnState);
    EXPECT_EQ(mEngine->reconnect().code, SYNC_ERR_CONFIGURATION);
}

TEST_F(SyncStateMachineTest, ChannelMessagesFeedTheEngine)
{
    SyncConfiguration config = baseConfig();
    config.set_auto_sync(true);
    config.set_auto_sync_interval_minutes(60);
    config.set_transport(toString(TransportKind::REALTIME));
    configure(config);
    mEngine->start();
    ASSERT_TRUE(mOnMessage);
    mPeer->put("/notes/pushed.md", "from another device");

    ChannelMessage changes;
    changes.set_type("sync:changes");
    changes.add_changes()->set_path("/notes/pushed.md");
    mOnMessage(changes);
    advanceAndWait(CHANGE_DEBOUNCE_DELAY);
    EXPECT_EQ(mPeer->checks.load(), 1);
    EXPECT_EQ(mWorkspace.read("/notes/pushed.md"), "from another device");

    ChannelMessage conflict;
    conflict.set_type("sync:conflict");
    conflict.mutable_conflict()->set_id("srv-1");
    conflict.mutable_conflict()->set_path("/notes/pushed.md");
    mOnMessage(conflict);
    ASSERT_EQ(mEngine->getConflicts().size(), 1u);
    EXPECT_EQ(mEngine->getConflicts()[0].remoteId, "srv-1");

    ChannelMessage progress;
    progress.set_type("sync:progress");
    progress.set_phase("uploading");
    progress.set_current(2);
    progress.set_total(4);
    mOnMessage(progress);
    const auto events = mRecorded.ofType(SyncEventType::PROGRESS);
    ASSERT_FALSE(events.empty());
    EXPECT_EQ(events.back().progress->phase, SyncPhase::UPLOADING);
    EXPECT_EQ(events.back().progress->total, 4u);
}

TEST_F(SyncStateMachineTest, TestConnectionUsesGivenEndpoint)
{
    EXPECT_EQ(mEngine->testConnection("http://other.test", "bob", "").code, SYNC_OK);
    {
        std::lock_guard<std::mutex> lock(mFactoryMutex);
        ASSERT_FALSE(mEndpoints.empty());
        EXPECT_EQ(mEndpoints.back(), "http://other.test");
    }
    EXPECT_EQ(mEngine->getConfig().endpoint(), "http://peer.test");

    mPeer->setUnreachable(true);
    EXPECT_EQ(mEngine->testConnection("http://other.test", "bob", "").code, SYNC_ERR_NETWORK);
    EXPECT_EQ(mPeer->pings.load(), 2);
}

TEST_F(SyncStateMachineTest, LogsAreNewestFirstAndClearable)
{
    runSync();

    const auto entries = mEngine->getLogs(1);
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].message, "Sync completed");
    EXPECT_EQ(entries[0].level, LogLevel::SUCCESS);

    mEngine->clearLogs();
    EXPECT_TRUE(mEngine->getLogs().empty());
}

TEST_F(SyncStateMachineTest, LogEntriesArePublished)
{
    std::vector<std::string> messages;
    std::mutex mutex;
    Subscription subscription = mEngine->on(SyncEventType::LOG, [&](const SyncEvent &event) {
        std::lock_guard<std::mutex> lock(mutex);
        messages.push_back(event.log->message);
    });

    runSync();
    subscription.unsubscribe();
    size_t seen = 0;
    {
        std::lock_guard<std::mutex> lock(mutex);
        seen = messages.size();
        EXPECT_NE(std::find(messages.begin(), messages.end(), "Sync completed"), messages.end());
    }

    runSync();
    std::lock_guard<std::mutex> lock(mutex);
    EXPECT_EQ(messages.size(), seen);
}

TEST_F(SyncStateMachineTest, RestoreDropsConflicts)
{
    SyncConfiguration config = baseConfig();
    config.set_conflict_resolution(toString(ConflictPolicy::MANUAL));
    configure(config);
    mWorkspace.write("/notes/a.md", "local edit");
    mPeer->put("/notes/a.md", "remote edit");
    runSync();
    ASSERT_EQ(mEngine->getConflicts().size(), 1u);

    mEngine->onDatasetRestored("snapshot_1000");
    EXPECT_TRUE(mEngine->getConflicts().empty());
}

TEST_F(SyncStateMachineTest, RestoreWaitsForRunningPass)
{
    SnapshotManager snapshots(mWorkspace.store(), mLog);
    Snapshot snapshot;
    ASSERT_TRUE(snapshots.createSnapshot(&snapshot).ok());

    mPeer->holdChecks();
    ASSERT_EQ(mEngine->triggerSync().code, SYNC_OK);
    mPeer->waitForHeldCheck();

    auto restore = std::async(std::launch::async, [&]() { return snapshots.restoreSnapshot(snapshot.name); });
    EXPECT_EQ(restore.wait_for(100ms), std::future_status::timeout);
    EXPECT_EQ(mEngine->state(), SyncState::SYNCING);

    mPeer->release();
    ASSERT_TRUE(mEngine->waitForIdle(PASS_TIMEOUT));
    EXPECT_EQ(restore.get().code, SYNC_OK);
    EXPECT_EQ(mEngine->state(), SyncState::SUCCESS);
}

TEST_F(SyncStateMachineTest, DisposeIsIdempotent)
{
    SyncConfiguration config = baseConfig();
    config.set_auto_sync(true);
    configure(config);
    mEngine->start();
    ASSERT_EQ(mScheduler.pending(), 1u);

    mEngine->dispose();
    mEngine->dispose();

    EXPECT_EQ(mScheduler.pending(), 0u);
    EXPECT_EQ(mEngine->triggerSync().code, SYNC_ERR_INVALID_STATE);
    EXPECT_EQ(mEngine->resolveConflict("conflict_0_0", Resolution::LOCAL).get().code, SYNC_ERR_INVALID_STATE);
}
