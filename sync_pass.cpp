// *****************************************************************************
// Sync Pass
// *****************************************************************************

// Section 1: Main Header
#include "sync_state_machine.h"

// Section 2: Includes
// C++ Standard Library
#include <algorithm>

// Project Includes
#include "diff_planner.h"
#include "transfer_command.h"
#include "vfs/dataset_lock.h"
#include "vfs/dataset_store.h"

// Section 3: Pass
/**
 * One pass: authenticate, index, ask the remote what differs, settle
 * divergent paths, then move the files. Runs on the worker thread with the
 * dataset held shared.
 */
SyncError SyncStateMachine::runPass(SyncMode mode)
{
    const SyncConfiguration config = mConfig.get();
    SharedDatasetGuard guard(mStore.lock());

    mLog.info(std::string("Sync started (") + toString(mode) + ")");
    publishProgress(SyncProgress{});

    SyncError err;
    std::shared_ptr<Transport> transport = mTransportFactory(config, err);
    if (!transport)
        return err.ok() ? SyncError::make(SYNC_ERR_CONFIGURATION, "no transport for " + config.endpoint()) : err;

    err = authenticate(*transport, config);
    if (!err.ok())
        return err;

    Manifest local;
    SyncPlan plan;
    err = planPass(*transport, config, mode, local, plan);
    {
        std::lock_guard<std::mutex> lock(mStatusMutex);
        mHttpReachable = err.code != SYNC_ERR_NETWORK;
    }
    if (!err.ok())
        return err;

    for (const auto &conflict : mResolver.adoptRemote(plan))
        publishConflict(conflict);

    // paths the user resolved in favour of the local copy go up with this pass
    if (directionFor(SyncConfigStore::strategy(config), mode) != SyncDirection::PULL) {
        for (const auto &path : mResolver.takePendingUploads()) {
            const auto it = std::find_if(local.files().begin(), local.files().end(),
                                         [&path](const ManifestEntry &entry) { return entry.path() == path; });
            if (it == local.files().end())
                continue;
            std::erase_if(plan.divergent, [&path](const Divergence &divergence) { return divergence.path == path; });
            plan.dropUpload(path);
            plan.dropDownload(path);
            plan.uploads.push_back(*it);
        }
    }

    for (const auto &conflict : mResolver.apply(SyncConfigStore::conflictPolicy(config), plan))
        publishConflict(conflict);

    TransferCommands commands = TransferCommands::fromPlan(plan);
    if (commands.empty())
        mLog.info("Workspace is up to date");
    else
        mLog.info(std::to_string(commands.countOf(TransferCommand::KIND_UPLOAD)) + " uploads, " +
                  std::to_string(commands.countOf(TransferCommand::KIND_DOWNLOAD)) + " downloads, " +
                  std::to_string(commands.countOf(TransferCommand::KIND_REMOVE)) + " removals");

    const TransferExecutor::Report report = mExecutor.execute(commands, *transport, config);

    SyncProgress finalizing;
    finalizing.phase = SyncPhase::FINALIZING;
    finalizing.current = commands.size();
    finalizing.total = commands.size();
    finalizing.bytesTransferred = report.bytesTransferred;
    publishProgress(finalizing);

    if (report.aborted)
        return report.firstError;
    if (report.failed > 0)
        return SyncError::make(report.firstError.code, std::to_string(report.failed) + " of " +
                               std::to_string(commands.size()) + " transfers failed, first: " +
                               report.firstError.message);
    return SyncError::success();
}

SyncError SyncStateMachine::authenticate(Transport &transport, const SyncConfiguration &config)
{
    transport.setPeerId(config.peer_id());
    if (!config.token().empty())
        return SyncError::success();

    std::string token;
    {
        std::lock_guard<std::mutex> lock(mStatusMutex);
        token = mToken;
    }

    if (token.empty() && !config.username().empty()) {
        SyncError err = transport.login(config.username(), config.password(), token);
        if (!err.ok())
            return err;
        {
            std::lock_guard<std::mutex> lock(mStatusMutex);
            mToken = token;
        }
        mLog.info("Logged in as " + config.username());
    }

    if (!token.empty())
        transport.setToken(token);
    return SyncError::success();
}

SyncError SyncStateMachine::planPass(Transport &transport, const SyncConfiguration &config, SyncMode mode,
                                     Manifest &local, SyncPlan &plan)
{
    if (mIndexer.index(config.filters(), local) != 0)
        return SyncError::make(SYNC_ERR_IO, "could not index the workspace");
    mLog.info("Indexed " + std::to_string(local.files_size()) + " local files");

    if (mode == SyncMode::FORCE_PUSH) {
        plan = DiffPlanner::uploadAll(local);
        return SyncError::success();
    }

    // force_pull presents an empty workspace so the remote sends everything
    const Manifest empty;
    const Manifest &sent = mode == SyncMode::FORCE_PULL ? empty : local;

    CheckResponse response;
    SyncError err = transport.check(sent, response);
    if (!err.ok())
        return err;

    plan = DiffPlanner::fromCheckResponse(sent, response, directionFor(SyncConfigStore::strategy(config), mode));
    const size_t dropped = DiffPlanner::restrictTo(plan, PathFilter(config.filters()));
    if (dropped > 0)
        mLog.info("Ignored " + std::to_string(dropped) + " remote entries outside the sync filters");
    return SyncError::success();
}

void SyncStateMachine::finishPass(const SyncError &result)
{
    {
        std::lock_guard<std::mutex> lock(mStatusMutex);
        mProgress.reset();
        if (result.ok()) {
            mLastSyncTime = nowMillis();
            mErrorMessage.reset();
        }
        else {
            mErrorMessage = result.message;
        }
        if (result.code == SYNC_ERR_AUTH)
            mToken.clear();
    }

    if (result.ok()) {
        mLog.success("Sync completed");
        setState(SyncState::SUCCESS);
    }
    else {
        mLog.error(std::string("Sync failed (") + syncErrorName(result.code) + "): " + result.message);
        setState(SyncState::ERROR);
        publishError(result);
    }

    SyncEvent completed;
    completed.type = SyncEventType::COMPLETED;
    completed.code = result.code;
    completed.message = result.message;
    mEvents.emit(completed);

    if (mChannelLost && transition({SyncState::SUCCESS, SyncState::ERROR}, SyncState::OFFLINE))
        mLog.warn("Push channel is down, sync is offline");
}
