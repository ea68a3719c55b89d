// Section 1: Main Header
#include "conflict_resolver.h"

// Section 2: Includes
#include <algorithm>
#include <utility>

// Project Includes
#include "transfer_executor.h"
#include "transport/transport.h"
#include "util/sync_log.h"

// Section 3: Defines and Macros
// (none)

// Section 4: Static Variables
std::atomic<uint64_t> ConflictResolver::sCounter{0};

// Section 5: Constructors and Destructors
ConflictResolver::ConflictResolver(SyncLog &log) : mLog(log) {}

// Section 6: Static Methods
std::optional<Resolution> ConflictResolver::decide(ConflictPolicy policy, const Divergence &divergence)
{
    switch (policy) {
        case ConflictPolicy::SERVER_WINS:
            return Resolution::REMOTE;
        case ConflictPolicy::CLIENT_WINS:
            return Resolution::LOCAL;
        case ConflictPolicy::NEWER_WINS:
            if (divergence.local.mtime() > divergence.remote.mtime())
                return Resolution::LOCAL;
            if (divergence.remote.mtime() > divergence.local.mtime())
                return Resolution::REMOTE;
            // equal timestamps carry no ordering, a human decides
            return std::nullopt;
        case ConflictPolicy::MANUAL:
            return std::nullopt;
    }
    return std::nullopt;
}

std::string ConflictResolver::nextConflictId()
{
    return "conflict_" + std::to_string(nowMillis()) + "_" + std::to_string(++sCounter);
}

// Section 7: Public Methods
std::vector<SyncConflict> ConflictResolver::apply(ConflictPolicy policy, SyncPlan &plan)
{
    std::vector<SyncConflict> created;
    for (const auto &divergence : plan.divergent)
    {
        const auto decision = decide(policy, divergence);
        if (decision == Resolution::REMOTE) {
            plan.dropUpload(divergence.path);
            mLog.info("Conflict on " + divergence.path + " resolved: remote wins (" + toString(policy) + ")");
            continue;
        }
        if (decision == Resolution::LOCAL) {
            plan.dropDownload(divergence.path);
            mLog.info("Conflict on " + divergence.path + " resolved: local wins (" + toString(policy) + ")");
            continue;
        }

        plan.dropUpload(divergence.path);
        plan.dropDownload(divergence.path);
        SyncConflict conflict = makeConflict(divergence.path, ConflictType::CONTENT, divergence.local, divergence.remote, "");
        if (insert(conflict)) {
            mLog.warn("Conflict detected on " + divergence.path + ", waiting for a decision");
            created.push_back(conflict);
        }
    }
    plan.divergent.clear();
    return created;
}

std::vector<SyncConflict> ConflictResolver::adoptRemote(SyncPlan &plan)
{
    std::vector<SyncConflict> created;
    for (const auto &remote : plan.remoteConflicts)
    {
        plan.dropUpload(remote.path());
        plan.dropDownload(remote.path());
        std::erase_if(plan.divergent, [&remote](const Divergence &divergence) { return divergence.path == remote.path(); });

        ManifestEntry local;
        local.set_path(remote.path());
        local.set_mtime(remote.local().timestamp());
        local.set_size(remote.local().size());
        local.set_hash(remote.local().hash());

        ManifestEntry other;
        other.set_path(remote.path());
        other.set_mtime(remote.remote().timestamp());
        other.set_size(remote.remote().size());
        other.set_hash(remote.remote().hash());

        const ConflictType type = parseConflictType(remote.type()).value_or(ConflictType::CONTENT);
        SyncConflict conflict = makeConflict(remote.path(), type, local, other, remote.id());
        if (insert(conflict)) {
            mLog.warn("Remote reported a conflict on " + remote.path());
            created.push_back(conflict);
        }
    }
    plan.remoteConflicts.clear();
    return created;
}

SyncError ConflictResolver::resolve(const std::string &id, Resolution resolution, TransferExecutor &executor,
                                    Transport &transport, const SyncConfiguration &config)
{
    const auto conflict = find(id);
    if (!conflict)
        return SyncError::make(SYNC_ERR_NOT_FOUND, "no conflict with id " + id);

    if (resolution == Resolution::REMOTE) {
        ManifestEntry entry;
        entry.set_path(conflict->path);
        entry.set_hash(conflict->remoteChange.hash);
        entry.set_mtime(conflict->remoteChange.timestamp);
        entry.set_size(conflict->remoteChange.size);
        if (conflict->type == ConflictType::DELETE && conflict->remoteChange.hash.empty())
            entry.set_is_deleted(true);

        uint64_t bytes = 0;
        SyncError err = executor.downloadFile(entry, transport, config, bytes);
        if (!err.ok())
            return err;
    }

    SyncError err = transport.resolveConflict(conflict->remoteId.empty() ? conflict->id : conflict->remoteId, resolution);
    if (!err.ok()) {
        mLog.error("Could not report resolution of " + conflict->path + ": " + err.message);
        return err;
    }

    std::lock_guard<std::mutex> lock(mMutex);
    mActive.erase(id);
    if (resolution == Resolution::LOCAL)
        mPendingUploads.insert(conflict->path);
    mLog.success("Conflict on " + conflict->path + " resolved: " + toString(resolution));
    return SyncError::success();
}

size_t ConflictResolver::resolveAll(Resolution resolution, TransferExecutor &executor, Transport &transport,
                                    const SyncConfiguration &config)
{
    size_t failures = 0;
    for (const auto &conflict : active())
    {
        SyncError err = resolve(conflict.id, resolution, executor, transport, config);
        if (!err.ok()) {
            ++failures;
            mLog.error("Resolving " + conflict.path + " failed: " + err.message);
        }
    }
    return failures;
}

std::vector<SyncConflict> ConflictResolver::active() const
{
    std::lock_guard<std::mutex> lock(mMutex);
    std::vector<SyncConflict> conflicts;
    conflicts.reserve(mActive.size());
    for (const auto &[id, conflict] : mActive)
        conflicts.push_back(conflict);
    std::sort(conflicts.begin(), conflicts.end(),
              [](const SyncConflict &a, const SyncConflict &b) { return a.path < b.path; });
    return conflicts;
}

std::optional<SyncConflict> ConflictResolver::find(const std::string &id) const
{
    std::lock_guard<std::mutex> lock(mMutex);
    auto it = mActive.find(id);
    if (it == mActive.end())
        return std::nullopt;
    return it->second;
}

size_t ConflictResolver::size() const
{
    std::lock_guard<std::mutex> lock(mMutex);
    return mActive.size();
}

std::set<std::string> ConflictResolver::takePendingUploads()
{
    std::lock_guard<std::mutex> lock(mMutex);
    return std::exchange(mPendingUploads, {});
}

void ConflictResolver::clear()
{
    std::lock_guard<std::mutex> lock(mMutex);
    mActive.clear();
    mPendingUploads.clear();
}

// Section 8: Private Methods
SyncConflict ConflictResolver::makeConflict(const std::string &path, ConflictType type, const ManifestEntry &local,
                                            const ManifestEntry &remote, const std::string &remoteId)
{
    SyncConflict conflict;
    conflict.id = nextConflictId();
    conflict.path = path;
    conflict.type = type;
    conflict.localChange = {local.mtime(), local.size(), local.hash()};
    conflict.remoteChange = {remote.mtime(), remote.size(), remote.hash()};
    conflict.remoteId = remoteId;
    return conflict;
}

bool ConflictResolver::insert(SyncConflict &conflict)
{
    std::lock_guard<std::mutex> lock(mMutex);
    for (auto it = mActive.begin(); it != mActive.end(); ++it)
    {
        if (it->second.path != conflict.path)
            continue;
        if (it->second.localChange.hash == conflict.localChange.hash &&
            it->second.remoteChange.hash == conflict.remoteChange.hash)
            return false;
        // the divergence moved on, the stale conflict is replaced
        mActive.erase(it);
        break;
    }
    mActive.emplace(conflict.id, conflict);
    return true;
}
