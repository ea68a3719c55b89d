// Section 1: Main Header
#include "diff_planner.h"

// Section 2: Includes
#include <algorithm>
#include <map>

// Project Includes
#include "vfs/virtual_file_system.h"

// Section 3: Defines and Macros
// (none)

// Section 4: Static Variables
// (none)

// Section 5: Public Methods
bool SyncPlan::dropUpload(const std::string &path)
{
    return std::erase_if(uploads, [&](const ManifestEntry &entry) { return entry.path() == path; }) > 0;
}

bool SyncPlan::dropDownload(const std::string &path)
{
    return std::erase_if(downloads, [&](const ManifestEntry &entry) { return entry.path() == path; }) > 0;
}

SyncPlan DiffPlanner::plan(const Manifest &local, const Manifest &remote, SyncDirection direction)
{
    std::map<std::string, const ManifestEntry *> localByPath;
    std::map<std::string, const ManifestEntry *> remoteByPath;
    for (const auto &entry : local.files())
        localByPath[entry.path()] = &entry;
    for (const auto &entry : remote.files())
        remoteByPath[entry.path()] = &entry;

    SyncPlan plan;
    for (const auto &[path, entry] : localByPath)
    {
        if (entry->is_deleted())
            continue;
        auto it = remoteByPath.find(path);
        if (it == remoteByPath.end() || it->second->is_deleted() || it->second->hash() != entry->hash())
            plan.uploads.push_back(*entry);
    }

    for (const auto &[path, entry] : remoteByPath)
    {
        auto it = localByPath.find(path);
        const bool presentLocally = it != localByPath.end() && !it->second->is_deleted();
        if (entry->is_deleted()) {
            // a remote tombstone only matters if we still have the file
            if (presentLocally)
                plan.downloads.push_back(*entry);
            continue;
        }
        if (!presentLocally || it->second->hash() != entry->hash())
            plan.downloads.push_back(*entry);
    }

    collectDivergent(plan);
    applyDirection(plan, direction);
    return plan;
}

SyncPlan DiffPlanner::fromCheckResponse(const Manifest &local, const CheckResponse &response, SyncDirection direction)
{
    std::map<std::string, const ManifestEntry *> localByPath;
    for (const auto &entry : local.files())
        localByPath[entry.path()] = &entry;

    SyncPlan plan;
    for (const auto &path : response.files_to_upload())
    {
        auto it = localByPath.find(path);
        // the remote can only ask for what we announced
        if (it != localByPath.end())
            plan.uploads.push_back(*it->second);
    }
    for (const auto &entry : response.files_to_download())
        plan.downloads.push_back(entry);
    for (const auto &conflict : response.conflicts())
        plan.remoteConflicts.push_back(conflict);

    auto byPath = [](const ManifestEntry &a, const ManifestEntry &b) { return a.path() < b.path(); };
    std::sort(plan.uploads.begin(), plan.uploads.end(), byPath);
    std::sort(plan.downloads.begin(), plan.downloads.end(), byPath);

    collectDivergent(plan);
    applyDirection(plan, direction);
    return plan;
}

SyncPlan DiffPlanner::uploadAll(const Manifest &local)
{
    SyncPlan plan;
    for (const auto &entry : local.files())
        if (!entry.is_deleted())
            plan.uploads.push_back(entry);
    return plan;
}

size_t DiffPlanner::restrictTo(SyncPlan &plan, const PathFilter &filter)
{
    const auto rejected = [&filter](const ManifestEntry &entry) { return !syncable(entry, filter); };

    size_t dropped = std::erase_if(plan.uploads, rejected);
    dropped += std::erase_if(plan.downloads, rejected);
    std::erase_if(plan.divergent, [&](const Divergence &divergence) { return rejected(divergence.remote); });
    dropped += std::erase_if(plan.remoteConflicts, [&](const RemoteConflict &conflict) {
        ManifestEntry entry;
        entry.set_path(conflict.path());
        entry.set_size(conflict.remote().size());
        return rejected(entry);
    });
    return dropped;
}

bool DiffPlanner::syncable(const ManifestEntry &entry, const PathFilter &filter)
{
    std::string module;
    std::string relativePath;
    if (!VirtualFileSystem::splitPath(entry.path(), module, relativePath) || VirtualFileSystem::isSystemModule(module))
        return false;
    // tombstones carry no size
    return filter.accepts(entry.path(), entry.is_deleted() ? 0 : entry.size());
}

// Section 6: Private Methods
void DiffPlanner::applyDirection(SyncPlan &plan, SyncDirection direction)
{
    switch (direction) {
        case SyncDirection::PUSH:
            plan.downloads.clear();
            plan.divergent.clear();
            break;
        case SyncDirection::PULL:
            plan.uploads.clear();
            plan.divergent.clear();
            break;
        case SyncDirection::BIDIRECTIONAL:
            break;
    }
}

void DiffPlanner::collectDivergent(SyncPlan &plan)
{
    std::map<std::string, const ManifestEntry *> uploadsByPath;
    for (const auto &entry : plan.uploads)
        uploadsByPath[entry.path()] = &entry;

    for (const auto &remote : plan.downloads)
    {
        if (remote.is_deleted())
            continue;
        auto it = uploadsByPath.find(remote.path());
        if (it != uploadsByPath.end())
            plan.divergent.push_back({remote.path(), *it->second, remote});
    }
}
