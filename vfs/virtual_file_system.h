// *****************************************************************************
// Virtual File System Contract
// *****************************************************************************

#ifndef _VIRTUAL_FILE_SYSTEM_H_
#define _VIRTUAL_FILE_SYSTEM_H_

// Section 1: Includes
// C++ Standard Library
#include <array>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Project Includes
#include "util/event_bus.h"

// Section 2: Defines and Macros
constexpr std::array<const char *, 4> SYSTEM_MODULES = {"__config", "__vfs_meta__", "settings_ui", "agents"};

// Section 3: Types
struct VfsFileInfo {
    std::string path;       ///< /module/relative/path
    uint64_t size = 0;
    int64_t mtime = 0;      ///< epoch millis
};

struct VfsChange {
    std::string module;
    std::string relativePath;
    bool deleted = false;
    bool fromSync = false;  ///< written by the sync engine itself
};

// Section 4: Class Definition
/**
 * What the sync engine needs from the workspace file system. Paths inside a
 * module are relative and use '/' separators.
 */
class VirtualFileSystem
{
public:
    using ChangeHandler = std::function<void(const VfsChange &)>;

    virtual ~VirtualFileSystem() = default;

    /**
     * @return 0 on success, SYNC_ERR_NOT_FOUND or SYNC_ERR_IO
     */
    virtual int read(const std::string &module, const std::string &relativePath, std::string &content) = 0;

    /**
     * Writes a whole file, creating missing parent directories
     * @param fromSync Set by the engine so its own writes do not retrigger a sync
     */
    virtual int write(const std::string &module, const std::string &relativePath, std::string_view content,
                      bool fromSync = false) = 0;

    virtual int remove(const std::string &module, const std::string &relativePath, bool fromSync = false) = 0;

    virtual int stat(const std::string &module, const std::string &relativePath, VfsFileInfo &info) = 0;

    virtual int mount(const std::string &module) = 0;
    virtual int unmount(const std::string &module) = 0;

    /**
     * @param includeSystem Also return reserved modules such as __config
     */
    virtual std::vector<std::string> listModules(bool includeSystem = false) = 0;

    /**
     * Every regular file below the module root, directories are not listed
     */
    virtual int listFiles(const std::string &module, std::vector<VfsFileInfo> &files) = 0;

    virtual Subscription subscribe(ChangeHandler handler) = 0;

    virtual std::optional<uint64_t> resolveNodeId(const std::string &path) = 0;
    virtual std::optional<std::string> resolvePath(uint64_t nodeId) = 0;

    static bool isSystemModule(std::string_view module);

    /**
     * Splits "/module/a/b" into "module" and "a/b"
     * @return false if the path has no module or escapes it with ".."
     */
    static bool splitPath(const std::string &path, std::string &module, std::string &relativePath);

    static std::string joinPath(const std::string &module, const std::string &relativePath);
};

#endif // _VIRTUAL_FILE_SYSTEM_H_
