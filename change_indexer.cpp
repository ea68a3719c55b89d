// Section 1: Main Header
#include "change_indexer.h"

// Section 2: Includes
#include <algorithm>
#include <cstring>
#include <fstream>
#include <future>
#include <iostream>
#include <vector>

// Third-Party Includes
#include "termcolor/termcolor.hpp"

// Project Includes
#include "error_codes.h"
#include "hash/content_hash.h"
#include "human_readable.h"
#include "path_filter.h"
#include "util/sync_log.h"
#include "util/thread_pool.h"
#include "vfs/virtual_file_system.h"

// Section 3: Defines and Macros
// (none)

// Section 4: Static Variables
// (none)

// Section 5: Constructors and Destructors
ChangeIndexer::ChangeIndexer(VirtualFileSystem &vfs, SyncLog *log, ThreadPool *pool) :
    mVfs(vfs),
    mLog(log),
    mPool(pool)
{}

// Section 6: Public Methods
int ChangeIndexer::index(const SyncConfiguration::Filters &filters, Manifest &manifest, bool verbose)
{
    const PathFilter filter(filters);
    manifest.Clear();

    struct Candidate {
        std::string module;
        std::string path;
    };
    std::vector<Candidate> candidates;

    for (const auto &module : mVfs.listModules(false))
    {
        std::vector<VfsFileInfo> files;
        int ret = mVfs.listFiles(module, files);
        if (ret != SYNC_OK) {
            warn("Cannot list module " + module + ": " + syncErrorName(ret));
            continue;
        }

        for (auto &file : files)
        {
            if (!filter.accepts(file.path, file.size)) {
                if (verbose)
                    std::cout << termcolor::cyan << "Filtered out " << file.path << "\r\n" << termcolor::reset;
                continue;
            }
            candidates.push_back({module, std::move(file.path)});
        }
    }

    std::vector<std::optional<ManifestEntry>> results(candidates.size());
    if (mPool != nullptr && mPool->size() > 1)
    {
        std::vector<std::future<std::optional<ManifestEntry>>> futures;
        futures.reserve(candidates.size());
        for (const auto &candidate : candidates)
            futures.push_back(mPool->submit([this, &candidate, &filter, verbose]() {
                return indexFile(candidate.module, candidate.path, filter, verbose);
            }));

        for (size_t i = 0; i < futures.size(); ++i)
            results[i] = futures[i].valid() ? futures[i].get() : indexFile(candidates[i].module, candidates[i].path, filter, verbose);
    }
    else
    {
        for (size_t i = 0; i < candidates.size(); ++i)
            results[i] = indexFile(candidates[i].module, candidates[i].path, filter, verbose);
    }

    for (auto &result : results)
        if (result)
            *manifest.add_files() = std::move(*result);

    std::sort(manifest.mutable_files()->begin(), manifest.mutable_files()->end(),
              [](const ManifestEntry &a, const ManifestEntry &b) { return a.path() < b.path(); });
    manifest.set_generated_at(nowMillis());

    std::lock_guard<std::mutex> lock(mMutex);
    mLastManifest = manifest;
    return SYNC_OK;
}

int ChangeIndexer::dumpIndexToFile(const std::filesystem::path &path)
{
    const auto manifest = lastManifest();
    if (!manifest)
        return SYNC_ERR_INVALID_STATE;

    std::ofstream outFile(path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!outFile) {
        std::cout << termcolor::red << "Failed to open index file for writing: " << path << termcolor::reset << "\r\n";
        std::cerr << "Error: " << strerror(errno) << "\r\n";
        return SYNC_ERR_IO;
    }
    if (!manifest->SerializeToOstream(&outFile))
        return SYNC_ERR_IO;
    outFile.close();
    return SYNC_OK;
}

void ChangeIndexer::printIndex()
{
    const auto manifest = lastManifest();
    if (!manifest) {
        std::cout << termcolor::yellow << "No index yet" << "\r\n" << termcolor::reset;
        return;
    }

    for (const auto &entry : manifest->files())
        std::cout << termcolor::white << entry.path() << termcolor::cyan << "  " << entry.hash()
                  << termcolor::magenta << "  " << HumanReadable(entry.size()) << "\r\n" << termcolor::reset;
}

size_t ChangeIndexer::count() const
{
    std::lock_guard<std::mutex> lock(mMutex);
    return mLastManifest ? static_cast<size_t>(mLastManifest->files_size()) : 0;
}

std::optional<Manifest> ChangeIndexer::lastManifest() const
{
    std::lock_guard<std::mutex> lock(mMutex);
    return mLastManifest;
}

int ChangeIndexer::closeDataset()
{
    std::lock_guard<std::mutex> lock(mMutex);
    mLastManifest.reset();
    return SYNC_OK;
}

// Section 7: Private Methods
std::optional<ManifestEntry> ChangeIndexer::indexFile(const std::string &module, const std::string &path,
                                                      const PathFilter &filter, bool verbose)
{
    std::string splitModule;
    std::string relativePath;
    if (!VirtualFileSystem::splitPath(path, splitModule, relativePath))
        return std::nullopt;

    VfsFileInfo info;
    std::string content;
    int ret = mVfs.stat(module, relativePath, info);
    if (ret == SYNC_OK)
        ret = mVfs.read(module, relativePath, content);
    if (ret != SYNC_OK) {
        warn("Skipping unreadable file " + path + ": " + syncErrorName(ret));
        return std::nullopt;
    }

    if (!filter.acceptsContent(content)) {
        if (verbose)
            std::cout << termcolor::cyan << "Skipping binary file " << path << "\r\n" << termcolor::reset;
        return std::nullopt;
    }

    ManifestEntry entry;
    entry.set_path(path);
    entry.set_hash(ContentHash::hex(content));
    entry.set_mtime(info.mtime);
    entry.set_size(content.size());
    entry.set_is_deleted(false);

    if (verbose)
        std::cout << termcolor::white << "Indexed " << path << " " << termcolor::cyan << entry.hash() << "\r\n" << termcolor::reset;
    return entry;
}

void ChangeIndexer::warn(const std::string &message)
{
    if (mLog != nullptr)
        mLog->warn(message);
    else
        std::cout << termcolor::yellow << message << "\r\n" << termcolor::reset;
}
