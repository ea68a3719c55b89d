// *****************************************************************************
// Dataset Store
// *****************************************************************************

#ifndef _DATASET_STORE_H_
#define _DATASET_STORE_H_

// Section 1: Includes
// C++ Standard Library
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <vector>

// Project Includes
#include "vfs/dataset_lock.h"

// Section 2: Class Definitions
/**
 * Anything that keeps the live dataset open: the VFS, caches over it.
 * Restore closes every client before swapping the dataset and reopens them after.
 */
class DatasetClient
{
public:
    virtual ~DatasetClient() = default;
    virtual int closeDataset() = 0;
    virtual int reopenDataset() = 0;
};

/**
 * A storage root holding named datasets as sibling directories: the live
 * dataset and any number of snapshots.
 */
class DatasetStore
{
public:
    explicit DatasetStore(std::filesystem::path root);

    /**
     * Creates the storage root and the live dataset if missing
     * @return 0 on success, SYNC_ERR_IO otherwise
     */
    int open();

    [[nodiscard]] const std::filesystem::path &root() const { return mRoot; }
    [[nodiscard]] std::filesystem::path datasetPath(const std::string &name) const;
    [[nodiscard]] bool exists(const std::string &name) const;

    /**
     * Dataset names, hidden temporaries excluded
     */
    [[nodiscard]] std::vector<std::string> listDatasets() const;

    /**
     * Copies src into a new dataset dst. The copy goes to a hidden directory, is
     * flushed to disk and renamed into place, so dst never appears half written.
     * @return 0, SYNC_ERR_NOT_FOUND, SYNC_ERR_ALREADY_EXISTS or SYNC_ERR_IO
     */
    int duplicate(const std::string &src, const std::string &dst);

    /**
     * Replaces the content of dst by a copy of src
     * @return 0, SYNC_ERR_NOT_FOUND or SYNC_ERR_IO
     */
    int replace(const std::string &src, const std::string &dst);

    /**
     * @return 0, SYNC_ERR_NOT_FOUND, SYNC_ERR_SNAPSHOT_BLOCKED or SYNC_ERR_IO
     */
    int remove(const std::string &name);

    /**
     * Sum of regular file sizes in the dataset
     */
    [[nodiscard]] uint64_t sizeOf(const std::string &name) const;

    // open handle accounting
    void acquireHandle(const std::string &name);
    void releaseHandle(const std::string &name);
    [[nodiscard]] int openHandles(const std::string &name) const;

    void registerClient(DatasetClient *client);
    void unregisterClient(DatasetClient *client);

    /**
     * Closes every registered client, in registration order
     * @return first failing client's code, all clients are still visited
     */
    int closeClients();
    int reopenClients();

    DatasetLock &lock() { return mLock; }

private:
    int copyTree(const std::filesystem::path &from, const std::filesystem::path &to);
    int flush(const std::filesystem::path &path);
    std::filesystem::path hiddenPath(const std::string &prefix, const std::string &name) const;

    std::filesystem::path mRoot;
    DatasetLock mLock;

    mutable std::mutex mMutex;
    std::map<std::string, int> mHandles;
    std::vector<DatasetClient *> mClients;
};

#endif // _DATASET_STORE_H_
