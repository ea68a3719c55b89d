// *****************************************************************************
// Directory backed Virtual File System
// *****************************************************************************

#ifndef _DIRECTORY_VFS_H_
#define _DIRECTORY_VFS_H_

// Section 1: Includes
// C++ Standard Library
#include <atomic>
#include <filesystem>
#include <map>
#include <mutex>
#include <set>
#include <string>

// Project Includes
#include "vfs/dataset_store.h"
#include "vfs/virtual_file_system.h"

// Section 2: Class Definition
/**
 * Workspace stored as a directory tree: one top-level directory per module
 * inside the live dataset. Holds an open handle on the dataset until closed.
 */
class DirectoryVfs : public VirtualFileSystem, public DatasetClient
{
public:
    explicit DirectoryVfs(DatasetStore &store);
    ~DirectoryVfs() override;

    DirectoryVfs(const DirectoryVfs &) = delete;
    DirectoryVfs &operator=(const DirectoryVfs &) = delete;

    int read(const std::string &module, const std::string &relativePath, std::string &content) override;
    int write(const std::string &module, const std::string &relativePath, std::string_view content,
              bool fromSync = false) override;
    int remove(const std::string &module, const std::string &relativePath, bool fromSync = false) override;
    int stat(const std::string &module, const std::string &relativePath, VfsFileInfo &info) override;

    int mount(const std::string &module) override;
    int unmount(const std::string &module) override;

    std::vector<std::string> listModules(bool includeSystem = false) override;
    int listFiles(const std::string &module, std::vector<VfsFileInfo> &files) override;

    Subscription subscribe(ChangeHandler handler) override;

    std::optional<uint64_t> resolveNodeId(const std::string &path) override;
    std::optional<std::string> resolvePath(uint64_t nodeId) override;

    int closeDataset() override;
    int reopenDataset() override;

    /**
     * Drops the node id cache and the dataset handle, further calls fail
     */
    void dispose();

    [[nodiscard]] bool isOpen() const { return mOpen.load(); }
    [[nodiscard]] size_t cachedNodeIds() const;

private:
    int resolve(const std::string &module, const std::string &relativePath, std::filesystem::path &out) const;
    void notify(const VfsChange &change);
    void clearNodeCache();

    DatasetStore &mStore;
    std::atomic<bool> mOpen{false};
    bool mDisposed = false;

    mutable std::mutex mMutex;
    std::set<std::string> mUnmounted;
    std::map<std::string, uint64_t> mNodeIds;
    std::map<uint64_t, std::string> mNodePaths;
    uint64_t mNextNodeId = 1;

    std::shared_ptr<std::mutex> mHandlersMutex = std::make_shared<std::mutex>();
    std::shared_ptr<std::map<uint64_t, ChangeHandler>> mHandlers = std::make_shared<std::map<uint64_t, ChangeHandler>>();
    uint64_t mNextHandlerId = 1;
};

#endif // _DIRECTORY_VFS_H_
