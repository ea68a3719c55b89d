// Section 1: Compilation Guards
#ifndef _TRANSFER_EXECUTOR_H_
#define _TRANSFER_EXECUTOR_H_

// Section 2: Includes
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "error_codes.h"
#include "sync_config.h"
#include "transfer_command.h"
#include "transport/transport.h"

// Section 3: Defines and Macros
// (none)

// Section 4: Classes
class SyncLog;
class VirtualFileSystem;

/**
 * Moves file content between the workspace and the remote peer. Each file is
 * retried on its own, a file that keeps failing is logged and skipped while
 * the others go through.
 */
class TransferExecutor {
public:
    using ProgressCallback = std::function<void(const SyncProgress &)>;
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    struct Report {
        size_t succeeded = 0;
        size_t failed = 0;
        uint64_t bytesTransferred = 0;
        std::vector<std::string> failedPaths;
        SyncError firstError;       ///< first file error, success if none failed
        bool aborted = false;       ///< stopped early on an authentication failure

        [[nodiscard]] bool ok() const { return failed == 0 && !aborted; }
    };

    TransferExecutor(VirtualFileSystem &vfs, SyncLog &log);

    void setProgressCallback(ProgressCallback callback) { mProgress = std::move(callback); }

    /**
     * Replaces the blocking sleep between retries
     */
    void setSleeper(Sleeper sleeper) { mSleep = std::move(sleeper); }

    /**
     * Runs every command. An authentication failure stops the remaining ones.
     */
    Report execute(const TransferCommands &commands, Transport &transport, const SyncConfiguration &config);

    /**
     * Fetches one remote file and writes it into the workspace, with retries
     */
    SyncError downloadFile(const ManifestEntry &entry, Transport &transport, const SyncConfiguration &config,
                           uint64_t &bytes);

    SyncError uploadFile(const ManifestEntry &entry, Transport &transport, const SyncConfiguration &config,
                         uint64_t &bytes);

    /**
     * Compresses and splits content the way the configuration asks
     * @param entry Manifest entry of the file
     * @param content Raw file bytes
     * @return the upload requests in sending order
     */
    static std::vector<UploadPart> buildParts(const ManifestEntry &entry, const std::string &content,
                                              const SyncConfiguration &config);

    /**
     * Delay before retry number attempt (1-based): retryDelayMs * 2^(attempt-1)
     */
    static std::chrono::milliseconds retryDelay(const SyncConfiguration &config, uint32_t attempt);

private:
    SyncError withRetries(const std::string &what, const std::string &path, const SyncConfiguration &config,
                          const std::function<SyncError()> &operation);
    SyncError uploadOnce(const ManifestEntry &entry, Transport &transport, const SyncConfiguration &config,
                         uint64_t &bytes);
    SyncError downloadOnce(const ManifestEntry &entry, Transport &transport, uint64_t &bytes);
    SyncError removeLocal(const ManifestEntry &entry);

    VirtualFileSystem &mVfs;
    SyncLog &mLog;
    ProgressCallback mProgress;
    Sleeper mSleep;
};

#endif // _TRANSFER_EXECUTOR_H_
