// Section 1: Main Header
#include "snapshot_manager.h"

// Section 2: Includes
#include <algorithm>
#include <charconv>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <sstream>

#include <google/protobuf/util/json_util.h>

// Project Includes
#include "human_readable.h"
#include "path_filter.h"
#include "snapshot.pb.h"
#include "util/sync_log.h"
#include "vfs/dataset_store.h"

// Section 3: Defines and Macros
// (none)

// Section 4: Static Variables
namespace
{
    // keeps a snapshot from being deleted while it is read
    class HandleLease
    {
    public:
        HandleLease(DatasetStore &store, const std::string &name) : mStore(store), mName(name) { mStore.acquireHandle(mName); }
        ~HandleLease() { mStore.releaseHandle(mName); }

        HandleLease(const HandleLease &) = delete;
        HandleLease &operator=(const HandleLease &) = delete;

    private:
        DatasetStore &mStore;
        std::string mName;
    };

    std::string isoTime(int64_t millis)
    {
        const std::time_t seconds = static_cast<std::time_t>(millis / 1000);
        std::tm tm{};
        gmtime_r(&seconds, &tm);
        std::ostringstream out;
        out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << millis % 1000 << 'Z';
        return out.str();
    }
}

// Section 5: Constructors and Destructors
SnapshotManager::SnapshotManager(DatasetStore &store, SyncLog &log, Clock clock) :
    mStore(store),
    mLog(log),
    mClock(clock ? std::move(clock) : Clock(nowMillis))
{}

// Section 6: Static Methods
bool SnapshotManager::isSnapshotName(const std::string &name)
{
    return timestampOf(name).has_value();
}

std::optional<int64_t> SnapshotManager::timestampOf(const std::string &name)
{
    const std::string prefix = SNAPSHOT_PREFIX;
    if (!name.starts_with(prefix) || name.size() == prefix.size())
        return std::nullopt;

    int64_t value = 0;
    const char *first = name.data() + prefix.size();
    const char *last = name.data() + name.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last || value < 0)
        return std::nullopt;
    return value;
}

// Section 7: Public Methods
SyncError SnapshotManager::createSnapshot(Snapshot *created)
{
    std::lock_guard<std::mutex> guard(mMutex);
    SharedDatasetGuard datasetGuard(mStore.lock());

    const int64_t now = mClock();
    const std::string name = SNAPSHOT_PREFIX + std::to_string(now);

    int ret = mStore.duplicate(LIVE_DATASET_NAME, name);
    if (ret == SYNC_ERR_ALREADY_EXISTS) {
        mLog.warn("Snapshot " + name + " already exists");
        return SyncError::make(ret, "snapshot " + name + " already exists");
    }
    if (ret != SYNC_OK) {
        mLog.error("Creating snapshot " + name + " failed: " + syncErrorName(ret));
        return SyncError::make(ret, "cannot create snapshot " + name);
    }

    Snapshot snapshot{name, now, mStore.sizeOf(name)};
    std::ostringstream message;
    message << "Snapshot " << name << " created (" << HumanReadable(snapshot.sizeEstimate) << ")";
    mLog.success(message.str());
    if (created != nullptr)
        *created = snapshot;
    return SyncError::success();
}

std::vector<Snapshot> SnapshotManager::listSnapshots() const
{
    std::vector<Snapshot> snapshots;
    for (const auto &name : mStore.listDatasets())
    {
        const auto createdAt = timestampOf(name);
        if (!createdAt)
            continue;
        snapshots.push_back({name, *createdAt, mStore.sizeOf(name)});
    }
    std::sort(snapshots.begin(), snapshots.end(),
              [](const Snapshot &a, const Snapshot &b) { return a.createdAt > b.createdAt; });
    return snapshots;
}

SyncError SnapshotManager::restoreSnapshot(const std::string &name)
{
    if (!isSnapshotName(name))
        return SyncError::make(SYNC_ERR_INVALID_ARGUMENT, "'" + name + "' is not a snapshot");

    std::lock_guard<std::mutex> guard(mMutex);
    if (!mStore.exists(name))
        return SyncError::make(SYNC_ERR_NOT_FOUND, "snapshot " + name + " not found");

    ExclusiveDatasetGuard datasetGuard(mStore.lock());
    HandleLease lease(mStore, name);
    mLog.info("Restoring snapshot " + name);

    int ret = mStore.closeClients();
    if (ret != SYNC_OK)
        mLog.warn(std::string("A dataset client did not close cleanly: ") + syncErrorName(ret));

    ret = mStore.replace(name, LIVE_DATASET_NAME);
    const int reopened = mStore.reopenClients();
    if (ret != SYNC_OK) {
        mLog.error("Restoring snapshot " + name + " failed: " + syncErrorName(ret));
        return SyncError::make(ret, "cannot restore snapshot " + name);
    }
    if (reopened != SYNC_OK) {
        mLog.error(std::string("Reopening the workspace after restore failed: ") + syncErrorName(reopened));
        return SyncError::make(reopened, "workspace not reopened after restore");
    }

    if (mRestoreListener)
        mRestoreListener(name);
    mLog.success("Snapshot " + name + " restored");
    return SyncError::success();
}

SyncError SnapshotManager::exportSnapshot(const std::string &name, const std::filesystem::path &path)
{
    if (!isSnapshotName(name))
        return SyncError::make(SYNC_ERR_INVALID_ARGUMENT, "'" + name + "' is not a snapshot");

    std::lock_guard<std::mutex> guard(mMutex);
    if (!mStore.exists(name))
        return SyncError::make(SYNC_ERR_NOT_FOUND, "snapshot " + name + " not found");
    HandleLease lease(mStore, name);

    com::workspacesync::SnapshotExport document;
    document.mutable_meta()->set_name(name);
    document.mutable_meta()->set_exported_at(isoTime(mClock()));
    document.mutable_meta()->set_version(SNAPSHOT_EXPORT_VERSION);

    const std::filesystem::path root = mStore.datasetPath(name);
    std::error_code ec;
    for (auto it = std::filesystem::recursive_directory_iterator(root, ec);
         !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec))
    {
        if (!it->is_regular_file(ec))
            continue;
        std::ifstream file(it->path(), std::ios::binary);
        std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
        if (file.bad()) {
            mLog.error("Cannot read " + it->path().string());
            return SyncError::make(SYNC_ERR_IO, "cannot read " + it->path().string());
        }

        const std::string key = "/" + it->path().lexically_relative(root).generic_string();
        if (PathFilter::looksBinary(content))
            (*document.mutable_binary_data())[key] = std::move(content);
        else
            (*document.mutable_data())[key] = std::move(content);
    }
    if (ec) {
        mLog.error("Cannot walk snapshot " + name + ": " + ec.message());
        return SyncError::make(SYNC_ERR_IO, "cannot read snapshot " + name);
    }

    google::protobuf::util::JsonPrintOptions options;
    options.add_whitespace = true;
    std::string json;
    if (!google::protobuf::util::MessageToJsonString(document, &json, options).ok())
        return SyncError::make(SYNC_ERR_IO, "cannot serialize snapshot " + name);

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open())
        return SyncError::make(SYNC_ERR_IO, "cannot open " + path.string());
    out << json;
    out.close();
    if (out.fail())
        return SyncError::make(SYNC_ERR_IO, "cannot write " + path.string());

    mLog.info("Snapshot " + name + " exported to " + path.string() + " (" + std::to_string(document.data_size() + document.binary_data_size()) + " files)");
    return SyncError::success();
}

SyncError SnapshotManager::deleteSnapshot(const std::string &name)
{
    if (name == LIVE_DATASET_NAME || !isSnapshotName(name))
        return SyncError::make(SYNC_ERR_INVALID_ARGUMENT, "'" + name + "' is not a snapshot");

    std::lock_guard<std::mutex> guard(mMutex);
    int ret = mStore.remove(name);
    if (ret == SYNC_ERR_SNAPSHOT_BLOCKED) {
        mLog.warn("Snapshot " + name + " is still open, not deleted");
        return SyncError::make(ret, "snapshot " + name + " has open handles");
    }
    if (ret == SYNC_ERR_NOT_FOUND)
        return SyncError::make(ret, "snapshot " + name + " not found");
    if (ret != SYNC_OK) {
        mLog.error("Deleting snapshot " + name + " failed: " + syncErrorName(ret));
        return SyncError::make(ret, "cannot delete snapshot " + name);
    }

    mLog.info("Snapshot " + name + " deleted");
    return SyncError::success();
}
