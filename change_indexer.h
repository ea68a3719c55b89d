// Section 1: Compilation Guards
#ifndef _CHANGE_INDEXER_H_
#define _CHANGE_INDEXER_H_

// Section 2: Includes
#include <cstddef>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>

#include "manifest.pb.h"
#include "sync_config.h"
#include "vfs/dataset_store.h"

// Section 3: Defines and Macros
// (none)

// Section 4: Classes
class PathFilter;
class SyncLog;
class ThreadPool;
class VirtualFileSystem;

using Manifest = com::workspacesync::Manifest;
using ManifestEntry = com::workspacesync::ManifestEntry;

/**
 * Builds the manifest of the local workspace: one entry per file of every
 * non-system module, with the SHA-256 of its full content. Nothing is cached
 * between runs, every file is read and hashed each time.
 */
class ChangeIndexer : public DatasetClient {
public:
    /**
     * @param vfs Workspace to index
     * @param log Receives warnings for skipped files, console only if null
     * @param pool Hashes files in parallel when set, sequentially otherwise
     */
    explicit ChangeIndexer(VirtualFileSystem &vfs, SyncLog *log = nullptr, ThreadPool *pool = nullptr);

    /**
     * Indexes the workspace
     * @param filters Include/exclude patterns, size limit, binary exclusion
     * @param manifest Receives the entries, sorted by path
     * @param verbose Print every indexed file
     * @return 0 on success, negative if the module list cannot be read
     */
    int index(const SyncConfiguration::Filters &filters, Manifest &manifest, bool verbose = false);

    /**
     * Writes the last manifest as a binary protobuf, for diagnostics
     * @param path Destination file
     * @return 0 on success, negative on error
     */
    int dumpIndexToFile(const std::filesystem::path &path);

    /**
     * Prints the last manifest
     */
    void printIndex();

    /**
     * Number of entries in the last manifest
     */
    size_t count() const;

    std::optional<Manifest> lastManifest() const;

    int closeDataset() override;
    int reopenDataset() override { return 0; }

private:
    std::optional<ManifestEntry> indexFile(const std::string &module, const std::string &path,
                                           const PathFilter &filter, bool verbose);
    void warn(const std::string &message);

    VirtualFileSystem &mVfs;
    SyncLog *mLog;
    ThreadPool *mPool;

    mutable std::mutex mMutex;
    std::optional<Manifest> mLastManifest;
};

#endif // _CHANGE_INDEXER_H_
