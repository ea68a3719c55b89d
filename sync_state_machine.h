// *****************************************************************************
// Sync State Machine
// *****************************************************************************

#ifndef _SYNC_STATE_MACHINE_H_
#define _SYNC_STATE_MACHINE_H_

// Section 1: Includes
// C++ Standard Library
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <initializer_list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Project Includes
#include "change_indexer.h"
#include "conflict_resolver.h"
#include "error_codes.h"
#include "sync_config.h"
#include "sync_types.h"
#include "transfer_executor.h"
#include "transport/push_channel.h"
#include "transport/transport.h"
#include "util/event_bus.h"
#include "util/scheduler.h"
#include "util/sync_log.h"
#include "util/thread_pool.h"

// Section 2: Defines and Macros
constexpr std::chrono::milliseconds CHANGE_DEBOUNCE_DELAY{1500};

class DatasetStore;
class VirtualFileSystem;
struct VfsChange;

// Section 3: Class Definition
/**
 * Orchestrates sync passes against the remote peer and owns the engine state.
 *
 * Passes and conflict resolutions run one at a time on a private worker
 * thread. triggerSync() only checks and flips the state, it never waits on
 * the network. Auto-sync combines a fixed-rate timer with a debounced
 * listener on local changes; both are re-armed by saveConfig().
 */
class SyncStateMachine
{
public:
    using TransportFactory = std::function<std::shared_ptr<Transport>(const SyncConfiguration &, SyncError &)>;
    using ChannelFactory = std::function<std::unique_ptr<PushChannel>(const PushChannel::Options &,
                                                                      PushChannel::MessageHandler,
                                                                      PushChannel::StateHandler)>;

    /**
     * @param transportFactory Builds a transport for the given configuration, once per job
     * @param hashPool Optional pool the indexer hashes on
     */
    SyncStateMachine(VirtualFileSystem &vfs, DatasetStore &store, SyncConfigStore &config, SyncLog &log,
                     EventBus &events, Scheduler &scheduler, TransportFactory transportFactory,
                     ThreadPool *hashPool = nullptr);
    ~SyncStateMachine();

    SyncStateMachine(const SyncStateMachine &) = delete;
    SyncStateMachine &operator=(const SyncStateMachine &) = delete;

    /**
     * Replaces the push channel construction, must be called before start()
     */
    void setChannelFactory(ChannelFactory factory) { mChannelFactory = std::move(factory); }

    /**
     * Subscribes to workspace changes, arms the auto-sync timer and opens the
     * push channel when the configuration asks for one
     */
    void start();

    /**
     * Cancels both timers, closes the channel and drains the worker. Idempotent.
     */
    void dispose();

    // caller API
    [[nodiscard]] SyncConfiguration getConfig() const;
    SyncError saveConfig(const SyncConfiguration &config);
    [[nodiscard]] SyncStatus getStatus() const;

    /**
     * Starts a pass in the background
     * @return SYNC_ERR_BUSY while a pass runs, SYNC_ERR_CONFIGURATION without
     *         an endpoint, SYNC_ERR_INVALID_STATE while offline, paused or connecting
     */
    SyncError triggerSync(SyncMode mode = SyncMode::STANDARD);

    /**
     * Pings an endpoint that is not necessarily the configured one
     */
    SyncError testConnection(const std::string &url, const std::string &username, const std::string &token);

    [[nodiscard]] std::vector<SyncConflict> getConflicts() const;
    std::future<SyncError> resolveConflict(const std::string &id, Resolution resolution);

    /**
     * @return future holding the number of conflicts that failed to resolve
     */
    std::future<size_t> resolveAllConflicts(Resolution resolution);

    [[nodiscard]] std::vector<SyncLogEntry> getLogs(size_t limit = SYNC_LOG_DEFAULT_LIMIT) const;
    void clearLogs();
    Subscription on(SyncEventType type, EventBus::Handler handler);

    /**
     * Re-opens the push channel after it went offline or gave up
     */
    SyncError reconnect();

    SyncError pause();
    SyncError resume();

    /**
     * Blocks until no pass or resolution is queued or running
     * @return false on timeout
     */
    bool waitForIdle(std::chrono::milliseconds timeout = std::chrono::milliseconds::max());

    /**
     * Forgets conflicts and cached state after the live dataset was replaced
     */
    void onDatasetRestored(const std::string &snapshot);

    [[nodiscard]] SyncState state() const { return mState.load(); }
    [[nodiscard]] ChangeIndexer &indexer() { return mIndexer; }

    /**
     * Transport factory talking HTTP(S) to config.endpoint()
     */
    static TransportFactory httpTransportFactory();

private:
    // pass, in sync_pass.cpp
    SyncError runPass(SyncMode mode);
    SyncError authenticate(Transport &transport, const SyncConfiguration &config);
    SyncError planPass(Transport &transport, const SyncConfiguration &config, SyncMode mode, Manifest &local,
                       SyncPlan &plan);
    void finishPass(const SyncError &result);

    // jobs
    template <typename F>
    auto enqueue(F &&job) -> std::future<std::invoke_result_t<F>>;
    void jobFinished();
    SyncError resolveOne(const std::string &id, Resolution resolution);
    size_t resolveEvery(Resolution resolution);

    // state and events
    void setState(SyncState state);
    bool transition(std::initializer_list<SyncState> from, SyncState to);
    void publishProgress(const SyncProgress &progress);
    void publishConflict(const SyncConflict &conflict);
    void publishError(const SyncError &error);

    // auto-sync
    void armTimers();
    void cancelTimers();
    void onLocalChange(const VfsChange &change);
    void scheduleDebouncedSync(const char *reason);
    void autoTrigger(const char *reason);

    // push channel
    void openChannel();
    void closeChannel();
    void onChannelMessage(const ChannelMessage &message);
    void onChannelState(bool connected);

    VirtualFileSystem &mVfs;
    DatasetStore &mStore;
    SyncConfigStore &mConfig;
    SyncLog &mLog;
    EventBus &mEvents;
    Scheduler &mScheduler;
    TransportFactory mTransportFactory;
    ChannelFactory mChannelFactory;

    ChangeIndexer mIndexer;
    ConflictResolver mResolver;
    TransferExecutor mExecutor;

    std::atomic<SyncState> mState{SyncState::IDLE};
    std::atomic<bool> mStarted{false};
    std::atomic<bool> mDisposed{false};

    mutable std::mutex mStatusMutex;
    std::optional<int64_t> mLastSyncTime;
    std::optional<std::string> mErrorMessage;
    std::optional<SyncProgress> mProgress;
    bool mHttpReachable = false;
    std::string mToken;                     ///< obtained by login, config token takes precedence

    std::mutex mJobsMutex;
    std::condition_variable mJobsIdle;
    size_t mPendingJobs = 0;
    std::unique_ptr<ThreadPool> mWorker;

    TaskGuard mTaskGuard;
    std::mutex mTimersMutex;
    Scheduler::TaskId mIntervalTask = Scheduler::INVALID_TASK;
    Scheduler::TaskId mDebounceTask = Scheduler::INVALID_TASK;
    Subscription mVfsSubscription;

    mutable std::mutex mChannelMutex;
    std::shared_ptr<PushChannel> mChannel;
    std::atomic<bool> mChannelLost{false};   ///< dropped while realtime sync relies on it
};

// Section 4: Template Definitions
template <typename F>
auto SyncStateMachine::enqueue(F &&job) -> std::future<std::invoke_result_t<F>>
{
    std::lock_guard<std::mutex> lock(mJobsMutex);
    if (!mWorker)
        return {};

    ++mPendingJobs;
    auto result = mWorker->submit([this, job = std::forward<F>(job)]() mutable {
        struct Done {
            SyncStateMachine *self;
            ~Done() { self->jobFinished(); }
        } done{this};
        return job();
    });
    if (!result.valid())
        --mPendingJobs;
    return result;
}

#endif // _SYNC_STATE_MACHINE_H_
