// Section 1: Main Header
#include "dataset_store.h"

// Section 2: Includes
#include <algorithm>
#include <fcntl.h>
#include <iostream>
#include <system_error>
#include <unistd.h>

// Third-Party Includes
#include "termcolor/termcolor.hpp"

// Project Includes
#include "error_codes.h"
#include "sync_types.h"

// Section 3: Defines and Macros
constexpr const char *TEMP_PREFIX = ".tmp_";
constexpr const char *OLD_PREFIX = ".old_";

// Section 4: Constructors and Destructors
DatasetStore::DatasetStore(std::filesystem::path root) : mRoot(std::move(root)) {}

// Section 5: Public Methods
int DatasetStore::open()
{
    std::error_code err;
    std::filesystem::create_directories(datasetPath(LIVE_DATASET_NAME), err);
    if (err) {
        std::cout << termcolor::red << "Cannot create dataset at " << mRoot << ": " << err.message() << "\r\n" << termcolor::reset;
        return SYNC_ERR_IO;
    }

    // leftovers of an interrupted duplicate or replace
    for (const auto &entry : std::filesystem::directory_iterator(mRoot, err)) {
        const std::string name = entry.path().filename().string();
        if (name.starts_with(TEMP_PREFIX) || name.starts_with(OLD_PREFIX)) {
            std::error_code ignored;
            std::filesystem::remove_all(entry.path(), ignored);
        }
    }
    return SYNC_OK;
}

std::filesystem::path DatasetStore::datasetPath(const std::string &name) const
{
    return mRoot / name;
}

bool DatasetStore::exists(const std::string &name) const
{
    std::error_code err;
    return !name.empty() && name.front() != '.' && std::filesystem::is_directory(datasetPath(name), err);
}

std::vector<std::string> DatasetStore::listDatasets() const
{
    std::vector<std::string> names;
    std::error_code err;
    for (const auto &entry : std::filesystem::directory_iterator(mRoot, err)) {
        const std::string name = entry.path().filename().string();
        if (entry.is_directory() && !name.starts_with("."))
            names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

int DatasetStore::duplicate(const std::string &src, const std::string &dst)
{
    if (!exists(src))
        return SYNC_ERR_NOT_FOUND;
    if (exists(dst))
        return SYNC_ERR_ALREADY_EXISTS;

    const auto temp = hiddenPath(TEMP_PREFIX, dst);
    std::error_code err;
    std::filesystem::remove_all(temp, err);

    int ret = copyTree(datasetPath(src), temp);
    if (ret == SYNC_OK)
        ret = flush(temp);
    if (ret != SYNC_OK) {
        std::filesystem::remove_all(temp, err);
        return ret;
    }

    // rename(2) refuses a non-empty target, a concurrent duplicate cannot be clobbered
    std::filesystem::rename(temp, datasetPath(dst), err);
    if (err) {
        std::filesystem::remove_all(temp, err);
        return exists(dst) ? SYNC_ERR_ALREADY_EXISTS : SYNC_ERR_IO;
    }
    return flush(mRoot);
}

int DatasetStore::replace(const std::string &src, const std::string &dst)
{
    if (!exists(src))
        return SYNC_ERR_NOT_FOUND;

    const auto temp = hiddenPath(TEMP_PREFIX, dst);
    const auto old = hiddenPath(OLD_PREFIX, dst);
    std::error_code err;
    std::filesystem::remove_all(temp, err);
    std::filesystem::remove_all(old, err);

    int ret = copyTree(datasetPath(src), temp);
    if (ret == SYNC_OK)
        ret = flush(temp);
    if (ret != SYNC_OK) {
        std::filesystem::remove_all(temp, err);
        return ret;
    }

    const bool hadTarget = exists(dst);
    if (hadTarget) {
        std::filesystem::rename(datasetPath(dst), old, err);
        if (err) {
            std::filesystem::remove_all(temp, err);
            return SYNC_ERR_IO;
        }
    }

    std::filesystem::rename(temp, datasetPath(dst), err);
    if (err) {
        std::cout << termcolor::red << "Swapping dataset " << dst << " failed: " << err.message() << "\r\n" << termcolor::reset;
        if (hadTarget) {
            std::error_code rollback;
            std::filesystem::rename(old, datasetPath(dst), rollback);
        }
        return SYNC_ERR_IO;
    }

    std::filesystem::remove_all(old, err);
    return flush(mRoot);
}

int DatasetStore::remove(const std::string &name)
{
    if (!exists(name))
        return SYNC_ERR_NOT_FOUND;
    if (openHandles(name) > 0)
        return SYNC_ERR_SNAPSHOT_BLOCKED;

    std::error_code err;
    std::filesystem::remove_all(datasetPath(name), err);
    if (err) {
        std::cout << termcolor::red << "Removing dataset " << name << " failed: " << err.message() << "\r\n" << termcolor::reset;
        return SYNC_ERR_IO;
    }
    return SYNC_OK;
}

uint64_t DatasetStore::sizeOf(const std::string &name) const
{
    uint64_t total = 0;
    std::error_code err;
    for (const auto &entry : std::filesystem::recursive_directory_iterator(datasetPath(name), err)) {
        std::error_code sizeErr;
        if (entry.is_regular_file(sizeErr)) {
            const auto size = entry.file_size(sizeErr);
            if (!sizeErr)
                total += size;
        }
    }
    return total;
}

void DatasetStore::acquireHandle(const std::string &name)
{
    std::lock_guard<std::mutex> lock(mMutex);
    ++mHandles[name];
}

void DatasetStore::releaseHandle(const std::string &name)
{
    std::lock_guard<std::mutex> lock(mMutex);
    auto it = mHandles.find(name);
    if (it == mHandles.end())
        return;
    if (--it->second <= 0)
        mHandles.erase(it);
}

int DatasetStore::openHandles(const std::string &name) const
{
    std::lock_guard<std::mutex> lock(mMutex);
    auto it = mHandles.find(name);
    return it == mHandles.end() ? 0 : it->second;
}

void DatasetStore::registerClient(DatasetClient *client)
{
    std::lock_guard<std::mutex> lock(mMutex);
    if (std::find(mClients.begin(), mClients.end(), client) == mClients.end())
        mClients.push_back(client);
}

void DatasetStore::unregisterClient(DatasetClient *client)
{
    std::lock_guard<std::mutex> lock(mMutex);
    std::erase(mClients, client);
}

int DatasetStore::closeClients()
{
    std::vector<DatasetClient *> clients;
    {
        std::lock_guard<std::mutex> lock(mMutex);
        clients = mClients;
    }

    int ret = SYNC_OK;
    for (auto *client : clients) {
        const int status = client->closeDataset();
        if (status != SYNC_OK && ret == SYNC_OK)
            ret = status;
    }
    return ret;
}

int DatasetStore::reopenClients()
{
    std::vector<DatasetClient *> clients;
    {
        std::lock_guard<std::mutex> lock(mMutex);
        clients = mClients;
    }

    int ret = SYNC_OK;
    for (auto *client : clients) {
        const int status = client->reopenDataset();
        if (status != SYNC_OK && ret == SYNC_OK)
            ret = status;
    }
    return ret;
}

// Section 6: Private Methods
int DatasetStore::copyTree(const std::filesystem::path &from, const std::filesystem::path &to)
{
    std::error_code err;
    std::filesystem::copy(from, to,
                          std::filesystem::copy_options::recursive | std::filesystem::copy_options::copy_symlinks,
                          err);
    if (err) {
        std::cout << termcolor::red << "Copying " << from << " to " << to << " failed: " << err.message() << "\r\n" << termcolor::reset;
        return SYNC_ERR_IO;
    }
    return SYNC_OK;
}

int DatasetStore::flush(const std::filesystem::path &path)
{
    int fd = ::open(path.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0)
        return SYNC_ERR_IO;
    const int ret = ::syncfs(fd);
    ::close(fd);
    return ret == 0 ? SYNC_OK : SYNC_ERR_IO;
}

std::filesystem::path DatasetStore::hiddenPath(const std::string &prefix, const std::string &name) const
{
    return mRoot / (prefix + name);
}
