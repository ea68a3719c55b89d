// Section 1: Compilation Guards
#ifndef _CONFLICT_RESOLVER_H_
#define _CONFLICT_RESOLVER_H_

// Section 2: Includes
#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "diff_planner.h"
#include "error_codes.h"
#include "sync_config.h"
#include "sync_types.h"

// Section 3: Defines and Macros
// (none)

// Section 4: Classes
class SyncLog;
class TransferExecutor;
class Transport;

/**
 * Keeps the set of outstanding conflicts and settles divergent paths.
 *
 * A resolved conflict leaves the set and is never touched again; the same
 * path diverging later gets a new conflict with a new id.
 */
class ConflictResolver {
public:
    explicit ConflictResolver(SyncLog &log);

    /**
     * Settles every divergent path of the plan according to policy. Paths the
     * policy cannot decide are removed from the transfers and become conflicts.
     * @param plan Modified in place
     * @return conflicts created by this call
     */
    std::vector<SyncConflict> apply(ConflictPolicy policy, SyncPlan &plan);

    /**
     * Adds conflicts the remote peer reported and removes their paths from the plan
     * @return conflicts added by this call
     */
    std::vector<SyncConflict> adoptRemote(SyncPlan &plan);

    /**
     * Applies the caller's decision for one conflict
     * @param id Conflict id
     * @param resolution REMOTE downloads the remote content now, LOCAL keeps the
     *                   local content and re-uploads it on the next pass
     * @return 0 on success, SYNC_ERR_NOT_FOUND for an unknown id, or the
     *         transfer/notification error, in which case the conflict stays active
     */
    SyncError resolve(const std::string &id, Resolution resolution, TransferExecutor &executor,
                      Transport &transport, const SyncConfiguration &config);

    /**
     * Resolves every outstanding conflict independently
     * @return number of conflicts that could not be resolved
     */
    size_t resolveAll(Resolution resolution, TransferExecutor &executor, Transport &transport,
                      const SyncConfiguration &config);

    [[nodiscard]] std::vector<SyncConflict> active() const;
    [[nodiscard]] std::optional<SyncConflict> find(const std::string &id) const;
    [[nodiscard]] size_t size() const;

    /**
     * Paths resolved in favour of the local copy, uploaded by the next pass
     */
    std::set<std::string> takePendingUploads();

    /**
     * Forgets everything, used after a snapshot restore
     */
    void clear();

    /**
     * Decision for one divergent path, nullopt if it needs a human
     */
    static std::optional<Resolution> decide(ConflictPolicy policy, const Divergence &divergence);

    static std::string nextConflictId();

private:
    SyncConflict makeConflict(const std::string &path, ConflictType type, const ManifestEntry &local,
                              const ManifestEntry &remote, const std::string &remoteId);

    /**
     * Inserts unless an identical unresolved conflict already exists
     * @return true if inserted
     */
    bool insert(SyncConflict &conflict);

    SyncLog &mLog;
    mutable std::mutex mMutex;
    std::map<std::string, SyncConflict> mActive;
    std::set<std::string> mPendingUploads;

    static std::atomic<uint64_t> sCounter;
};

#endif // _CONFLICT_RESOLVER_H_
