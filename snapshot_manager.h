// Section 1: Compilation Guards
#ifndef _SNAPSHOT_MANAGER_H_
#define _SNAPSHOT_MANAGER_H_

// Section 2: Includes
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "error_codes.h"
#include "sync_types.h"

// Section 3: Defines and Macros
#define SNAPSHOT_EXPORT_VERSION "1.0"

// Section 4: Classes
class DatasetStore;
class SyncLog;

/**
 * Whole-dataset point-in-time copies of the live workspace, stored next to it
 * as snapshot_<createdAtMillis>.
 */
class SnapshotManager {
public:
    using Clock = std::function<int64_t()>;

    /**
     * @param clock Epoch millis source, wall clock when empty
     */
    SnapshotManager(DatasetStore &store, SyncLog &log, Clock clock = {});

    /**
     * Copies the live dataset. The snapshot is durable and complete when this returns.
     * @return SYNC_ERR_ALREADY_EXISTS if a snapshot was already taken this millisecond
     */
    SyncError createSnapshot(Snapshot *created = nullptr);

    /**
     * Most recent first
     */
    [[nodiscard]] std::vector<Snapshot> listSnapshots() const;

    /**
     * Replaces the live dataset by the snapshot. Blocks every other dataset
     * access for its whole duration and closes/reopens the dataset clients.
     */
    SyncError restoreSnapshot(const std::string &name);

    /**
     * Writes the snapshot as one JSON document: {meta: {name, exportedAt, version}, data: {path: content}}.
     * Files that are not text go to binaryData, base64 encoded.
     * @return SYNC_ERR_NOT_FOUND for an unknown snapshot, SYNC_ERR_IO when the file cannot be written
     */
    SyncError exportSnapshot(const std::string &name, const std::filesystem::path &path);

    /**
     * @return SYNC_ERR_SNAPSHOT_BLOCKED while the snapshot has open handles
     */
    SyncError deleteSnapshot(const std::string &name);

    /**
     * Called after a successful restore, with the exclusive lock still held
     */
    void setRestoreListener(std::function<void(const std::string &)> listener) { mRestoreListener = std::move(listener); }

    static bool isSnapshotName(const std::string &name);
    static std::optional<int64_t> timestampOf(const std::string &name);

private:
    DatasetStore &mStore;
    SyncLog &mLog;
    Clock mClock;
    std::mutex mMutex;  ///< one snapshot operation at a time
    std::function<void(const std::string &)> mRestoreListener;
};

#endif // _SNAPSHOT_MANAGER_H_
