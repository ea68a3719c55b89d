// Section 1: Main Header
#include "directory_vfs.h"

// Section 2: Includes
#include <algorithm>
#include <chrono>
#include <fstream>
#include <iostream>
#include <iterator>
#include <vector>

// Third-Party Includes
#include "termcolor/termcolor.hpp"

// Project Includes
#include "error_codes.h"
#include "sync_types.h"

// Section 3: Static Helpers
namespace
{
    int64_t toMillis(std::filesystem::file_time_type fileTime)
    {
        const auto systemTime = std::chrono::clock_cast<std::chrono::system_clock>(fileTime);
        return std::chrono::duration_cast<std::chrono::milliseconds>(systemTime.time_since_epoch()).count();
    }

    bool validModuleName(const std::string &module)
    {
        return !module.empty() && module != "." && module != ".." && module.find('/') == std::string::npos;
    }
}

// Section 4: Constructors and Destructors
DirectoryVfs::DirectoryVfs(DatasetStore &store) : mStore(store)
{
    mStore.registerClient(this);
    reopenDataset();
}

DirectoryVfs::~DirectoryVfs()
{
    dispose();
    mStore.unregisterClient(this);
}

// Section 5: Public Methods
int DirectoryVfs::read(const std::string &module, const std::string &relativePath, std::string &content)
{
    SharedDatasetGuard guard(mStore.lock());
    std::filesystem::path path;
    int ret = resolve(module, relativePath, path);
    if (ret != SYNC_OK)
        return ret;

    std::error_code err;
    if (!std::filesystem::is_regular_file(path, err))
        return SYNC_ERR_NOT_FOUND;

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open())
        return SYNC_ERR_IO;
    content.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    return file.bad() ? SYNC_ERR_IO : SYNC_OK;
}

int DirectoryVfs::write(const std::string &module, const std::string &relativePath, std::string_view content,
                        bool fromSync)
{
    {
        SharedDatasetGuard guard(mStore.lock());
        std::filesystem::path path;
        int ret = resolve(module, relativePath, path);
        if (ret != SYNC_OK)
            return ret;

        std::error_code err;
        std::filesystem::create_directories(path.parent_path(), err);
        if (err) {
            std::cout << termcolor::red << "Cannot create " << path.parent_path() << ": " << err.message() << "\r\n" << termcolor::reset;
            return SYNC_ERR_IO;
        }

        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        if (!file.is_open())
            return SYNC_ERR_IO;
        file.write(content.data(), static_cast<std::streamsize>(content.size()));
        file.close();
        if (file.fail())
            return SYNC_ERR_IO;
    }

    notify({module, relativePath, false, fromSync});
    return SYNC_OK;
}

int DirectoryVfs::remove(const std::string &module, const std::string &relativePath, bool fromSync)
{
    {
        SharedDatasetGuard guard(mStore.lock());
        std::filesystem::path path;
        int ret = resolve(module, relativePath, path);
        if (ret != SYNC_OK)
            return ret;

        std::error_code err;
        if (!std::filesystem::remove(path, err))
            return err ? SYNC_ERR_IO : SYNC_ERR_NOT_FOUND;

        std::lock_guard<std::mutex> lock(mMutex);
        auto it = mNodeIds.find(joinPath(module, relativePath));
        if (it != mNodeIds.end()) {
            mNodePaths.erase(it->second);
            mNodeIds.erase(it);
        }
    }

    notify({module, relativePath, true, fromSync});
    return SYNC_OK;
}

int DirectoryVfs::stat(const std::string &module, const std::string &relativePath, VfsFileInfo &info)
{
    SharedDatasetGuard guard(mStore.lock());
    std::filesystem::path path;
    int ret = resolve(module, relativePath, path);
    if (ret != SYNC_OK)
        return ret;

    std::error_code err;
    if (!std::filesystem::is_regular_file(path, err))
        return SYNC_ERR_NOT_FOUND;

    info.path = joinPath(module, relativePath);
    info.size = std::filesystem::file_size(path, err);
    if (err)
        return SYNC_ERR_IO;
    info.mtime = toMillis(std::filesystem::last_write_time(path, err));
    return err ? SYNC_ERR_IO : SYNC_OK;
}

int DirectoryVfs::mount(const std::string &module)
{
    if (!validModuleName(module))
        return SYNC_ERR_INVALID_ARGUMENT;
    if (!mOpen)
        return SYNC_ERR_INVALID_STATE;

    SharedDatasetGuard guard(mStore.lock());
    std::error_code err;
    std::filesystem::create_directories(mStore.datasetPath(LIVE_DATASET_NAME) / module, err);
    if (err)
        return SYNC_ERR_IO;

    std::lock_guard<std::mutex> lock(mMutex);
    mUnmounted.erase(module);
    return SYNC_OK;
}

int DirectoryVfs::unmount(const std::string &module)
{
    if (!validModuleName(module))
        return SYNC_ERR_INVALID_ARGUMENT;

    std::lock_guard<std::mutex> lock(mMutex);
    mUnmounted.insert(module);
    return SYNC_OK;
}

std::vector<std::string> DirectoryVfs::listModules(bool includeSystem)
{
    std::vector<std::string> modules;
    if (!mOpen)
        return modules;

    SharedDatasetGuard guard(mStore.lock());
    std::error_code err;
    for (const auto &entry : std::filesystem::directory_iterator(mStore.datasetPath(LIVE_DATASET_NAME), err)) {
        if (!entry.is_directory())
            continue;
        const std::string name = entry.path().filename().string();
        if (!includeSystem && isSystemModule(name))
            continue;

        std::lock_guard<std::mutex> lock(mMutex);
        if (!mUnmounted.contains(name))
            modules.push_back(name);
    }
    std::sort(modules.begin(), modules.end());
    return modules;
}

int DirectoryVfs::listFiles(const std::string &module, std::vector<VfsFileInfo> &files)
{
    if (!validModuleName(module))
        return SYNC_ERR_INVALID_ARGUMENT;
    if (!mOpen)
        return SYNC_ERR_INVALID_STATE;

    SharedDatasetGuard guard(mStore.lock());
    const auto root = mStore.datasetPath(LIVE_DATASET_NAME) / module;
    std::error_code err;
    if (!std::filesystem::is_directory(root, err))
        return SYNC_ERR_NOT_FOUND;

    auto iterator = std::filesystem::recursive_directory_iterator(root, err);
    if (err)
        return SYNC_ERR_IO;

    for (const auto &entry : iterator) {
        std::error_code entryErr;
        if (!entry.is_regular_file(entryErr))
            continue;

        VfsFileInfo info;
        info.path = joinPath(module, std::filesystem::relative(entry.path(), root, entryErr).generic_string());
        info.size = entry.file_size(entryErr);
        info.mtime = toMillis(entry.last_write_time(entryErr));
        if (entryErr) {
            std::cout << termcolor::yellow << "Skipping " << entry.path() << ": " << entryErr.message() << "\r\n" << termcolor::reset;
            continue;
        }
        files.push_back(std::move(info));
    }

    std::sort(files.begin(), files.end(), [](const VfsFileInfo &a, const VfsFileInfo &b) { return a.path < b.path; });
    return SYNC_OK;
}

Subscription DirectoryVfs::subscribe(ChangeHandler handler)
{
    uint64_t id = 0;
    {
        std::lock_guard<std::mutex> lock(*mHandlersMutex);
        id = mNextHandlerId++;
        mHandlers->emplace(id, std::move(handler));
    }

    std::weak_ptr<std::mutex> weakMutex = mHandlersMutex;
    std::weak_ptr<std::map<uint64_t, ChangeHandler>> weakHandlers = mHandlers;
    return {[weakMutex, weakHandlers](uint64_t handlerId) {
        auto mutex = weakMutex.lock();
        auto handlers = weakHandlers.lock();
        if (!mutex || !handlers)
            return;
        std::lock_guard<std::mutex> lock(*mutex);
        handlers->erase(handlerId);
    }, id};
}

std::optional<uint64_t> DirectoryVfs::resolveNodeId(const std::string &path)
{
    std::string module;
    std::string relativePath;
    if (!splitPath(path, module, relativePath))
        return std::nullopt;

    VfsFileInfo info;
    if (stat(module, relativePath, info) != SYNC_OK)
        return std::nullopt;

    std::lock_guard<std::mutex> lock(mMutex);
    const std::string key = joinPath(module, relativePath);
    auto it = mNodeIds.find(key);
    if (it != mNodeIds.end())
        return it->second;

    const uint64_t id = mNextNodeId++;
    mNodeIds.emplace(key, id);
    mNodePaths.emplace(id, key);
    return id;
}

std::optional<std::string> DirectoryVfs::resolvePath(uint64_t nodeId)
{
    std::lock_guard<std::mutex> lock(mMutex);
    auto it = mNodePaths.find(nodeId);
    if (it == mNodePaths.end())
        return std::nullopt;
    return it->second;
}

int DirectoryVfs::closeDataset()
{
    if (!mOpen.exchange(false))
        return SYNC_OK;

    clearNodeCache();
    mStore.releaseHandle(LIVE_DATASET_NAME);
    return SYNC_OK;
}

int DirectoryVfs::reopenDataset()
{
    {
        std::lock_guard<std::mutex> lock(mMutex);
        if (mDisposed)
            return SYNC_ERR_INVALID_STATE;
    }
    if (mOpen.exchange(true))
        return SYNC_OK;

    mStore.acquireHandle(LIVE_DATASET_NAME);
    return SYNC_OK;
}

void DirectoryVfs::dispose()
{
    closeDataset();
    {
        std::lock_guard<std::mutex> lock(mMutex);
        mDisposed = true;
    }
    std::lock_guard<std::mutex> lock(*mHandlersMutex);
    mHandlers->clear();
}

size_t DirectoryVfs::cachedNodeIds() const
{
    std::lock_guard<std::mutex> lock(mMutex);
    return mNodeIds.size();
}

// Section 6: Private Methods
int DirectoryVfs::resolve(const std::string &module, const std::string &relativePath, std::filesystem::path &out) const
{
    if (!mOpen)
        return SYNC_ERR_INVALID_STATE;

    std::string splitModule;
    std::string splitRelative;
    if (!validModuleName(module) || !splitPath(joinPath(module, relativePath), splitModule, splitRelative))
        return SYNC_ERR_INVALID_ARGUMENT;

    {
        std::lock_guard<std::mutex> lock(mMutex);
        if (mUnmounted.contains(module))
            return SYNC_ERR_NOT_FOUND;
    }

    out = mStore.datasetPath(LIVE_DATASET_NAME) / splitModule / splitRelative;
    return SYNC_OK;
}

void DirectoryVfs::notify(const VfsChange &change)
{
    std::vector<ChangeHandler> handlers;
    {
        std::lock_guard<std::mutex> lock(*mHandlersMutex);
        for (const auto &[id, handler] : *mHandlers)
            handlers.push_back(handler);
    }
    for (const auto &handler : handlers)
        handler(change);
}

void DirectoryVfs::clearNodeCache()
{
    std::lock_guard<std::mutex> lock(mMutex);
    mNodeIds.clear();
    mNodePaths.clear();
}
