// *****************************************************************************
// Sync State Machine
// *****************************************************************************

// Section 1: Main Header
#include "sync_state_machine.h"

// Section 2: Includes
// C++ Standard Library
#include <iostream>

// Third-Party Includes
#include "termcolor/termcolor.hpp"

// Project Includes
#include "transport/http_message.h"
#include "transport/http_transport.h"
#include "vfs/dataset_lock.h"
#include "vfs/dataset_store.h"
#include "vfs/virtual_file_system.h"

// Section 3: Static Helpers
namespace
{
    bool credentialsChanged(const SyncConfiguration &a, const SyncConfiguration &b)
    {
        return a.endpoint() != b.endpoint() || a.username() != b.username() || a.password() != b.password() ||
               a.token() != b.token();
    }

    bool channelSettingsChanged(const SyncConfiguration &a, const SyncConfiguration &b)
    {
        return a.endpoint() != b.endpoint() || a.transport() != b.transport() ||
               a.realtime().SerializeAsString() != b.realtime().SerializeAsString();
    }

    template <typename T>
    std::future<T> readyFuture(T value)
    {
        std::promise<T> promise;
        promise.set_value(std::move(value));
        return promise.get_future();
    }
}

// Section 4: Constructors/Destructors
SyncStateMachine::SyncStateMachine(VirtualFileSystem &vfs, DatasetStore &store, SyncConfigStore &config, SyncLog &log,
                                   EventBus &events, Scheduler &scheduler, TransportFactory transportFactory,
                                   ThreadPool *hashPool) :
    mVfs(vfs),
    mStore(store),
    mConfig(config),
    mLog(log),
    mEvents(events),
    mScheduler(scheduler),
    mTransportFactory(std::move(transportFactory)),
    mIndexer(vfs, &log, hashPool),
    mResolver(log),
    mExecutor(vfs, log),
    mWorker(std::make_unique<ThreadPool>(1))
{
    mStore.registerClient(&mIndexer);
    mExecutor.setProgressCallback([this](const SyncProgress &progress) { publishProgress(progress); });
    mLog.setSink([this](const SyncLogEntry &entry) {
        SyncEvent event;
        event.type = SyncEventType::LOG;
        event.log = entry;
        mEvents.emit(event);
    });
}

SyncStateMachine::~SyncStateMachine()
{
    dispose();
}

// Section 5: Lifecycle
void SyncStateMachine::start()
{
    if (mDisposed || mStarted.exchange(true))
        return;

    mVfsSubscription = mVfs.subscribe([this](const VfsChange &change) { onLocalChange(change); });
    armTimers();
    openChannel();
    mLog.info("Sync engine started");
}

void SyncStateMachine::dispose()
{
    if (mDisposed.exchange(true))
        return;

    mTaskGuard.revoke();
    cancelTimers();
    mVfsSubscription.unsubscribe();
    closeChannel();

    std::unique_ptr<ThreadPool> worker;
    {
        std::lock_guard<std::mutex> lock(mJobsMutex);
        worker = std::move(mWorker);
    }
    worker.reset();     // runs what is still queued

    mStore.unregisterClient(&mIndexer);
    mLog.setSink({});
}

// Section 6: Caller API
SyncConfiguration SyncStateMachine::getConfig() const
{
    return mConfig.get();
}

SyncError SyncStateMachine::saveConfig(const SyncConfiguration &config)
{
    const SyncConfiguration previous = mConfig.get();
    SyncError err = mConfig.save(config);
    if (!err.ok()) {
        mLog.error("Configuration rejected: " + err.message);
        return err;
    }

    const SyncConfiguration current = mConfig.get();
    if (credentialsChanged(previous, current)) {
        std::lock_guard<std::mutex> lock(mStatusMutex);
        mToken.clear();
        mHttpReachable = false;
    }
    mLog.info("Configuration saved");

    if (mStarted && !mDisposed) {
        armTimers();
        if (channelSettingsChanged(previous, current)) {
            closeChannel();
            openChannel();
            bool hasChannel;
            {
                std::lock_guard<std::mutex> lock(mChannelMutex);
                hasChannel = static_cast<bool>(mChannel);
            }
            if (!hasChannel && transition({SyncState::OFFLINE, SyncState::CONNECTING}, SyncState::IDLE))
                mLog.info("Push channel no longer used, sync is back online");
        }
    }
    return SyncError::success();
}

SyncStatus SyncStateMachine::getStatus() const
{
    SyncStatus status;
    status.state = mState.load();
    const bool hasEndpoint = SyncConfigStore::hasEndpoint(mConfig.get());

    bool httpReachable = false;
    {
        std::lock_guard<std::mutex> lock(mStatusMutex);
        status.lastSyncTime = mLastSyncTime;
        status.errorMessage = mErrorMessage;
        if (status.state == SyncState::SYNCING)
            status.progress = mProgress;
        httpReachable = mHttpReachable;
    }

    std::shared_ptr<PushChannel> channel;
    {
        std::lock_guard<std::mutex> lock(mChannelMutex);
        channel = mChannel;
    }
    if (channel)
        status.connection = ConnectionInfo{toString(TransportKind::REALTIME), channel->isConnected()};
    else if (hasEndpoint)
        status.connection = ConnectionInfo{toString(TransportKind::HTTP), httpReachable};
    return status;
}

SyncError SyncStateMachine::triggerSync(SyncMode mode)
{
    if (mDisposed)
        return SyncError::make(SYNC_ERR_INVALID_STATE, "sync engine is disposed");

    if (!SyncConfigStore::hasEndpoint(mConfig.get())) {
        SyncError err = SyncError::make(SYNC_ERR_CONFIGURATION, "no endpoint configured");
        mLog.error("Cannot sync: " + err.message);
        return err;
    }

    SyncState current = mState.load();
    for (;;) {
        if (current == SyncState::SYNCING)
            return SyncError::make(SYNC_ERR_BUSY, "a sync pass is already running");
        if (current != SyncState::IDLE && current != SyncState::SUCCESS && current != SyncState::ERROR)
            return SyncError::make(SYNC_ERR_INVALID_STATE, std::string("cannot sync while ") + toString(current));
        if (mState.compare_exchange_weak(current, SyncState::SYNCING))
            break;
    }

    {
        std::lock_guard<std::mutex> lock(mStatusMutex);
        mErrorMessage.reset();
        mProgress = SyncProgress{};
    }
    setState(SyncState::SYNCING);

    auto pass = enqueue([this, mode]() { finishPass(runPass(mode)); });
    if (!pass.valid()) {
        setState(SyncState::IDLE);
        return SyncError::make(SYNC_ERR_INVALID_STATE, "sync engine is stopping");
    }
    return SyncError::success();
}

SyncError SyncStateMachine::testConnection(const std::string &url, const std::string &username,
                                           const std::string &token)
{
    SyncConfiguration probe = mConfig.get();
    probe.set_endpoint(url);
    probe.set_username(username);
    probe.set_token(token);

    SyncError err;
    std::shared_ptr<Transport> transport = mTransportFactory(probe, err);
    if (!transport) {
        mLog.error("Connection test failed: " + err.message);
        return err.ok() ? SyncError::make(SYNC_ERR_CONFIGURATION, "no transport for " + url) : err;
    }

    transport->setPeerId(probe.peer_id());
    err = transport->ping();
    if (err.ok())
        mLog.success("Connection to " + url + " succeeded");
    else
        mLog.error("Connection test failed: " + err.message);
    return err;
}

std::vector<SyncConflict> SyncStateMachine::getConflicts() const
{
    return mResolver.active();
}

std::future<SyncError> SyncStateMachine::resolveConflict(const std::string &id, Resolution resolution)
{
    auto result = enqueue([this, id, resolution]() { return resolveOne(id, resolution); });
    if (!result.valid())
        return readyFuture(SyncError::make(SYNC_ERR_INVALID_STATE, "sync engine is stopping"));
    return result;
}

std::future<size_t> SyncStateMachine::resolveAllConflicts(Resolution resolution)
{
    auto result = enqueue([this, resolution]() { return resolveEvery(resolution); });
    if (!result.valid())
        return readyFuture(mResolver.size());
    return result;
}

std::vector<SyncLogEntry> SyncStateMachine::getLogs(size_t limit) const
{
    return mLog.entries(limit);
}

void SyncStateMachine::clearLogs()
{
    mLog.clear();
}

Subscription SyncStateMachine::on(SyncEventType type, EventBus::Handler handler)
{
    return mEvents.on(type, std::move(handler));
}

SyncError SyncStateMachine::reconnect()
{
    std::shared_ptr<PushChannel> channel;
    {
        std::lock_guard<std::mutex> lock(mChannelMutex);
        channel = mChannel;
    }
    if (!channel) {
        openChannel();
        std::lock_guard<std::mutex> lock(mChannelMutex);
        if (!mChannel)
            return SyncError::make(SYNC_ERR_CONFIGURATION, "no push channel configured");
        return SyncError::success();
    }

    transition({SyncState::OFFLINE}, SyncState::CONNECTING);
    if (channel->reconnect() != 0) {
        transition({SyncState::CONNECTING}, SyncState::OFFLINE);
        return SyncError::make(SYNC_ERR_NETWORK, "push channel unreachable");
    }
    return SyncError::success();
}

SyncError SyncStateMachine::pause()
{
    if (transition({SyncState::IDLE, SyncState::SUCCESS, SyncState::ERROR, SyncState::OFFLINE}, SyncState::PAUSED)) {
        std::lock_guard<std::mutex> lock(mTimersMutex);
        if (mDebounceTask != Scheduler::INVALID_TASK)
            mScheduler.cancel(mDebounceTask);
        mDebounceTask = Scheduler::INVALID_TASK;
        mLog.info("Sync paused");
        return SyncError::success();
    }

    const SyncState current = mState.load();
    if (current == SyncState::PAUSED)
        return SyncError::success();
    if (current == SyncState::SYNCING)
        return SyncError::make(SYNC_ERR_BUSY, "a sync pass is running");
    return SyncError::make(SYNC_ERR_INVALID_STATE, std::string("cannot pause while ") + toString(current));
}

SyncError SyncStateMachine::resume()
{
    const SyncState next = mChannelLost ? SyncState::OFFLINE : SyncState::IDLE;
    if (!transition({SyncState::PAUSED}, next))
        return SyncError::make(SYNC_ERR_INVALID_STATE, "sync is not paused");
    mLog.info(next == SyncState::OFFLINE ? "Sync resumed, still offline" : "Sync resumed");
    return SyncError::success();
}

bool SyncStateMachine::waitForIdle(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(mJobsMutex);
    const auto idle = [this]() { return mPendingJobs == 0; };
    if (timeout == std::chrono::milliseconds::max()) {
        mJobsIdle.wait(lock, idle);
        return true;
    }
    return mJobsIdle.wait_for(lock, timeout, idle);
}

void SyncStateMachine::onDatasetRestored(const std::string &snapshot)
{
    mResolver.clear();
    {
        std::lock_guard<std::mutex> lock(mStatusMutex);
        mProgress.reset();
    }
    mLog.info("Workspace restored from " + snapshot + ", outstanding conflicts dropped");
}

SyncStateMachine::TransportFactory SyncStateMachine::httpTransportFactory()
{
    return [](const SyncConfiguration &config, SyncError &err) -> std::shared_ptr<Transport> {
        return HttpTransport::create(config.endpoint(), config.token(), err);
    };
}

// Section 7: Jobs
void SyncStateMachine::jobFinished()
{
    std::lock_guard<std::mutex> lock(mJobsMutex);
    if (mPendingJobs > 0)
        --mPendingJobs;
    if (mPendingJobs == 0)
        mJobsIdle.notify_all();
}

SyncError SyncStateMachine::resolveOne(const std::string &id, Resolution resolution)
{
    const SyncConfiguration config = mConfig.get();
    SharedDatasetGuard guard(mStore.lock());

    SyncError err;
    std::shared_ptr<Transport> transport = mTransportFactory(config, err);
    if (!transport) {
        mLog.error("Cannot resolve " + id + ": " + err.message);
        return err;
    }
    err = authenticate(*transport, config);
    if (!err.ok()) {
        mLog.error("Cannot resolve " + id + ": " + err.message);
        return err;
    }

    err = mResolver.resolve(id, resolution, mExecutor, *transport, config);
    if (!err.ok())
        mLog.error("Resolving " + id + " failed: " + err.message);
    return err;
}

size_t SyncStateMachine::resolveEvery(Resolution resolution)
{
    const SyncConfiguration config = mConfig.get();
    SharedDatasetGuard guard(mStore.lock());

    SyncError err;
    std::shared_ptr<Transport> transport = mTransportFactory(config, err);
    if (transport)
        err = authenticate(*transport, config);
    if (!transport || !err.ok()) {
        mLog.error("Cannot resolve conflicts: " + err.message);
        return mResolver.size();
    }

    const size_t failures = mResolver.resolveAll(resolution, mExecutor, *transport, config);
    if (failures > 0)
        mLog.warn(std::to_string(failures) + " conflicts left unresolved");
    return failures;
}

// Section 8: State and Events
void SyncStateMachine::setState(SyncState state)
{
    mState = state;
    SyncEvent event;
    event.type = SyncEventType::STATE_CHANGE;
    event.state = state;
    mEvents.emit(event);
}

bool SyncStateMachine::transition(std::initializer_list<SyncState> from, SyncState to)
{
    SyncState current = mState.load();
    for (;;) {
        bool allowed = false;
        for (const SyncState state : from)
            allowed = allowed || state == current;
        if (!allowed)
            return false;
        if (mState.compare_exchange_weak(current, to))
            break;
    }

    SyncEvent event;
    event.type = SyncEventType::STATE_CHANGE;
    event.state = to;
    mEvents.emit(event);
    return true;
}

void SyncStateMachine::publishProgress(const SyncProgress &progress)
{
    {
        std::lock_guard<std::mutex> lock(mStatusMutex);
        mProgress = progress;
    }
    SyncEvent event;
    event.type = SyncEventType::PROGRESS;
    event.progress = progress;
    mEvents.emit(event);
}

void SyncStateMachine::publishConflict(const SyncConflict &conflict)
{
    SyncEvent event;
    event.type = SyncEventType::CONFLICT;
    event.conflict = conflict;
    mEvents.emit(event);
}

void SyncStateMachine::publishError(const SyncError &error)
{
    SyncEvent event;
    event.type = SyncEventType::ERROR;
    event.code = error.code;
    event.message = error.message;
    mEvents.emit(event);
}

// Section 9: Auto-sync
void SyncStateMachine::armTimers()
{
    const SyncConfiguration config = mConfig.get();

    std::lock_guard<std::mutex> lock(mTimersMutex);
    if (mIntervalTask != Scheduler::INVALID_TASK)
        mScheduler.cancel(mIntervalTask);
    if (mDebounceTask != Scheduler::INVALID_TASK)
        mScheduler.cancel(mDebounceTask);
    mIntervalTask = Scheduler::INVALID_TASK;
    mDebounceTask = Scheduler::INVALID_TASK;

    if (!config.auto_sync() || config.auto_sync_interval_minutes() == 0)
        return;

    mIntervalTask = mScheduler.scheduleAtFixedRate(std::chrono::minutes(config.auto_sync_interval_minutes()),
                                                   mTaskGuard.wrap([this]() { autoTrigger("interval"); }));
}

void SyncStateMachine::cancelTimers()
{
    std::lock_guard<std::mutex> lock(mTimersMutex);
    if (mIntervalTask != Scheduler::INVALID_TASK)
        mScheduler.cancel(mIntervalTask);
    if (mDebounceTask != Scheduler::INVALID_TASK)
        mScheduler.cancel(mDebounceTask);
    mIntervalTask = Scheduler::INVALID_TASK;
    mDebounceTask = Scheduler::INVALID_TASK;
}

void SyncStateMachine::onLocalChange(const VfsChange &change)
{
    if (change.fromSync || VirtualFileSystem::isSystemModule(change.module))
        return;
    if (!mConfig.get().auto_sync() || mState.load() == SyncState::PAUSED)
        return;
    scheduleDebouncedSync("local changes");
}

void SyncStateMachine::scheduleDebouncedSync(const char *reason)
{
    if (mDisposed)
        return;

    std::lock_guard<std::mutex> lock(mTimersMutex);
    if (mDebounceTask != Scheduler::INVALID_TASK)
        mScheduler.cancel(mDebounceTask);
    mDebounceTask = mScheduler.scheduleOnce(CHANGE_DEBOUNCE_DELAY, mTaskGuard.wrap([this, reason]() {
        {
            std::lock_guard<std::mutex> taskLock(mTimersMutex);
            mDebounceTask = Scheduler::INVALID_TASK;
        }
        autoTrigger(reason);
    }));
}

void SyncStateMachine::autoTrigger(const char *reason)
{
    if (!SyncConfigStore::hasEndpoint(mConfig.get()))
        return;

    const SyncState current = mState.load();
    if (current != SyncState::IDLE && current != SyncState::SUCCESS && current != SyncState::ERROR)
        return;

    const SyncError err = triggerSync(SyncMode::STANDARD);
    if (err.ok())
        mLog.info(std::string("Auto-sync started (") + reason + ")");
    else if (err.code != SYNC_ERR_BUSY)
        mLog.warn(std::string("Auto-sync skipped (") + reason + "): " + err.message);
}

// Section 10: Push Channel
void SyncStateMachine::openChannel()
{
    const SyncConfiguration config = mConfig.get();
    const TransportKind kind = SyncConfigStore::transport(config);
    const bool wanted = kind == TransportKind::REALTIME || (kind == TransportKind::AUTO && config.realtime().enabled());
    if (!wanted || !SyncConfigStore::hasEndpoint(config))
        return;

    HttpUrl url;
    if (!HttpUrl::parse(config.endpoint(), url)) {
        mLog.warn("Push channel disabled: endpoint " + config.endpoint() + " is not a valid URL");
        return;
    }

    PushChannel::Options options;
    options.host = url.host;
    options.port = static_cast<uint16_t>(config.realtime().port());
    options.heartbeatMs = config.realtime().heartbeat_interval_ms();
    options.baseDelayMs = config.realtime().reconnect_base_delay_ms();
    options.maxAttempts = config.realtime().max_reconnect_attempts();

    auto onMessage = [this](const ChannelMessage &message) { onChannelMessage(message); };
    auto onState = [this](bool connected) { onChannelState(connected); };

    std::shared_ptr<PushChannel> channel;
    if (mChannelFactory)
        channel = mChannelFactory(options, onMessage, onState);
    else
        channel = std::make_shared<PushChannel>(options, mScheduler, onMessage, onState);
    if (!channel)
        return;

    {
        std::lock_guard<std::mutex> lock(mChannelMutex);
        mChannel = channel;
    }

    std::weak_ptr<PushChannel> weak = channel;
    mScheduler.scheduleOnce(std::chrono::milliseconds(0), mTaskGuard.wrap([weak]() {
        if (const auto ch = weak.lock()) {
            if (ch->connect() != 0)
                std::cout << termcolor::yellow << "Push channel not available yet, retrying in the background"
                          << "\r\n" << termcolor::reset;
        }
    }));
}

void SyncStateMachine::closeChannel()
{
    std::shared_ptr<PushChannel> channel;
    {
        std::lock_guard<std::mutex> lock(mChannelMutex);
        channel = std::move(mChannel);
    }
    if (channel)
        channel->close();
    mChannelLost = false;
}

void SyncStateMachine::onChannelMessage(const ChannelMessage &message)
{
    const std::string &type = message.type();
    if (type == "sync:changes") {
        mLog.info("Remote peer reported " + std::to_string(message.changes_size()) + " changes");
        if (mConfig.get().auto_sync() && mState.load() != SyncState::PAUSED)
            scheduleDebouncedSync("remote changes");
    }
    else if (type == "sync:conflict") {
        SyncPlan plan;
        plan.remoteConflicts.push_back(message.conflict());
        DiffPlanner::restrictTo(plan, PathFilter(mConfig.get().filters()));
        for (const auto &conflict : mResolver.adoptRemote(plan))
            publishConflict(conflict);
    }
    else if (type == "sync:progress") {
        SyncProgress progress;
        progress.phase = parseSyncPhase(message.phase()).value_or(SyncPhase::PREPARING);
        progress.current = message.current();
        progress.total = message.total();
        if (!message.current_file().empty())
            progress.currentFile = message.current_file();
        if (message.bytes_transferred() > 0)
            progress.bytesTransferred = message.bytes_transferred();

        SyncEvent event;
        event.type = SyncEventType::PROGRESS;
        event.progress = progress;
        mEvents.emit(event);
    }
}

void SyncStateMachine::onChannelState(bool connected)
{
    SyncEvent event;
    event.type = connected ? SyncEventType::CONNECTED : SyncEventType::DISCONNECTED;
    mEvents.emit(event);

    if (connected) {
        mChannelLost = false;
        if (transition({SyncState::OFFLINE, SyncState::CONNECTING}, SyncState::IDLE))
            mLog.success("Back online");
        return;
    }

    // with transport auto, passes keep running over HTTP without the channel
    const SyncConfiguration config = mConfig.get();
    if (!config.auto_sync() || SyncConfigStore::transport(config) != TransportKind::REALTIME) {
        mLog.warn("Push channel lost");
        return;
    }
    // a running pass settles into OFFLINE when it finishes
    mChannelLost = true;
    if (transition({SyncState::IDLE, SyncState::SUCCESS, SyncState::ERROR, SyncState::CONNECTING}, SyncState::OFFLINE))
        mLog.warn("Connection to the remote peer lost, sync is offline");
    else if (mState.load() == SyncState::SYNCING)
        mLog.warn("Connection to the remote peer lost, going offline after the running pass");
}
