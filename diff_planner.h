// Section 1: Compilation Guards
#ifndef _DIFF_PLANNER_H_
#define _DIFF_PLANNER_H_

// Section 2: Includes
#include <string>
#include <vector>

#include "manifest.pb.h"
#include "path_filter.h"
#include "sync_types.h"

// Section 3: Defines and Macros
// (none)

// Section 4: Classes
using Manifest = com::workspacesync::Manifest;
using ManifestEntry = com::workspacesync::ManifestEntry;
using CheckResponse = com::workspacesync::CheckResponse;
using RemoteConflict = com::workspacesync::RemoteConflict;

/**
 * A path whose content differs on the two sides
 */
struct Divergence {
    std::string path;
    ManifestEntry local;
    ManifestEntry remote;
};

/**
 * What one pass has to transfer
 */
struct SyncPlan {
    std::vector<ManifestEntry> uploads;          ///< local entries to send
    std::vector<ManifestEntry> downloads;        ///< remote entries to fetch, is_deleted ones are removed locally
    std::vector<Divergence> divergent;           ///< also present in uploads and downloads
    std::vector<RemoteConflict> remoteConflicts; ///< reported by the remote peer

    [[nodiscard]] bool empty() const { return uploads.empty() && downloads.empty() && remoteConflicts.empty(); }

    /**
     * Removes a path from the upload list
     * @return true if it was there
     */
    bool dropUpload(const std::string &path);
    bool dropDownload(const std::string &path);
};

/**
 * Compares manifests. Stateless, no common ancestor is consulted: a path that
 * differs on both sides is reported as divergent and left to the resolver.
 */
class DiffPlanner {
public:
    /**
     * @param local Local manifest
     * @param remote Remote manifest
     * @param direction PUSH keeps only uploads, PULL only downloads
     */
    static SyncPlan plan(const Manifest &local, const Manifest &remote, SyncDirection direction);

    /**
     * Same plan built from the remote peer's answer to a check request
     * @param local Manifest that was sent with the check
     * @param response files_to_upload, files_to_download and conflicts
     * @param direction Applied on top of what the remote asked for
     */
    static SyncPlan fromCheckResponse(const Manifest &local, const CheckResponse &response, SyncDirection direction);

    /**
     * Every local entry as an upload, used by force_push
     */
    static SyncPlan uploadAll(const Manifest &local);

    /**
     * Drops every path the filter rejects or that lives in a reserved module,
     * whichever side asked for it
     * @return number of entries dropped
     */
    static size_t restrictTo(SyncPlan &plan, const PathFilter &filter);

    /**
     * False for reserved modules and paths the filter rejects
     */
    static bool syncable(const ManifestEntry &entry, const PathFilter &filter);

private:
    static void applyDirection(SyncPlan &plan, SyncDirection direction);
    static void collectDivergent(SyncPlan &plan);
};

#endif // _DIFF_PLANNER_H_
