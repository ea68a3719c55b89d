// Section 1: Main Header
#include "transfer_executor.h"

// Section 2: Includes
#include <algorithm>
#include <sstream>
#include <thread>

// Project Includes
#include "compression.h"
#include "hash/content_hash.h"
#include "util/sync_log.h"
#include "vfs/virtual_file_system.h"

// Section 3: Defines and Macros
constexpr double MILLISECONDS_PER_SECOND = 1000.0;
constexpr uint32_t MAX_BACKOFF_SHIFT = 16;

// Section 4: Static Variables
// (none)

// Section 5: Constructors and Destructors
TransferExecutor::TransferExecutor(VirtualFileSystem &vfs, SyncLog &log) :
    mVfs(vfs),
    mLog(log),
    mSleep([](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); })
{}

// Section 6: Static Methods
std::vector<UploadPart> TransferExecutor::buildParts(const ManifestEntry &entry, const std::string &content,
                                                     const SyncConfiguration &config)
{
    std::string payload = content;
    std::string encoding;

    const auto &compression = config.compression();
    if (compression.enabled() && content.size() >= compression.min_size()) {
        std::string compressed;
        // only worth it if it actually shrinks
        if (Compression::gzip(content, compressed) == 0 && compressed.size() < content.size()) {
            payload = std::move(compressed);
            encoding = "gzip";
        }
    }

    UploadPart base;
    base.path = entry.path();
    base.hash = entry.hash();
    base.encoding = encoding;
    base.size = content.size();
    base.mtime = entry.mtime();

    const auto &chunking = config.chunking();
    const uint64_t chunkSize = chunking.chunk_size() > 0 ? chunking.chunk_size() : DEFAULT_CHUNK_SIZE;
    if (!chunking.enabled() || content.size() < chunking.threshold() || payload.size() <= chunkSize) {
        base.content = std::move(payload);
        return {base};
    }

    std::vector<UploadPart> parts;
    const auto count = static_cast<uint32_t>((payload.size() + chunkSize - 1) / chunkSize);
    parts.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        UploadPart part = base;
        part.content = payload.substr(static_cast<size_t>(i) * chunkSize, chunkSize);
        part.chunkIndex = i;
        part.chunkCount = count;
        parts.push_back(std::move(part));
    }
    return parts;
}

std::chrono::milliseconds TransferExecutor::retryDelay(const SyncConfiguration &config, uint32_t attempt)
{
    if (attempt == 0)
        return std::chrono::milliseconds(0);
    const uint32_t shift = std::min(attempt - 1, MAX_BACKOFF_SHIFT);
    return std::chrono::milliseconds(static_cast<int64_t>(config.retry().retry_delay_ms()) << shift);
}

// Section 7: Public Methods
TransferExecutor::Report TransferExecutor::execute(const TransferCommands &commands, Transport &transport,
                                                   const SyncConfiguration &config)
{
    Report report;
    const auto started = std::chrono::steady_clock::now();
    const size_t uploadTotal = commands.countOf(TransferCommand::KIND_UPLOAD);
    const size_t downloadTotal = commands.size() - uploadTotal;
    size_t uploadsDone = 0;
    size_t downloadsDone = 0;

    for (const auto &command : commands)
    {
        SyncProgress progress;
        progress.phase = command.isUpload() ? SyncPhase::UPLOADING : SyncPhase::DOWNLOADING;
        progress.current = command.isUpload() ? uploadsDone : downloadsDone;
        progress.total = command.isUpload() ? uploadTotal : downloadTotal;
        progress.currentFile = command.path();
        progress.bytesTransferred = report.bytesTransferred;
        const auto elapsedMs = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started).count();
        if (elapsedMs > 0)
            progress.speed = static_cast<double>(report.bytesTransferred) * MILLISECONDS_PER_SECOND / static_cast<double>(elapsedMs);
        if (mProgress)
            mProgress(progress);

        uint64_t bytes = 0;
        SyncError err;
        switch (command.kind()) {
            case TransferCommand::KIND_UPLOAD:
                err = uploadFile(command.entry(), transport, config, bytes);
                break;
            case TransferCommand::KIND_DOWNLOAD:
                err = downloadFile(command.entry(), transport, config, bytes);
                break;
            case TransferCommand::KIND_REMOVE:
                err = removeLocal(command.entry());
                break;
        }

        if (command.isUpload())
            ++uploadsDone;
        else
            ++downloadsDone;

        if (err.ok()) {
            ++report.succeeded;
            report.bytesTransferred += bytes;
            continue;
        }

        ++report.failed;
        report.failedPaths.push_back(command.path());
        if (report.firstError.ok())
            report.firstError = err;

        if (err.code == SYNC_ERR_AUTH) {
            report.aborted = true;
            break;
        }
    }

    if (mProgress && !commands.empty()) {
        SyncProgress progress;
        progress.phase = SyncPhase::APPLYING;
        progress.current = uploadsDone + downloadsDone;
        progress.total = commands.size();
        progress.bytesTransferred = report.bytesTransferred;
        mProgress(progress);
    }
    return report;
}

SyncError TransferExecutor::uploadFile(const ManifestEntry &entry, Transport &transport, const SyncConfiguration &config,
                                       uint64_t &bytes)
{
    return withRetries("upload", entry.path(), config, [&]() { return uploadOnce(entry, transport, config, bytes); });
}

SyncError TransferExecutor::downloadFile(const ManifestEntry &entry, Transport &transport, const SyncConfiguration &config,
                                         uint64_t &bytes)
{
    if (entry.is_deleted())
        return removeLocal(entry);
    return withRetries("download", entry.path(), config, [&]() { return downloadOnce(entry, transport, bytes); });
}

// Section 8: Private Methods
SyncError TransferExecutor::withRetries(const std::string &what, const std::string &path, const SyncConfiguration &config,
                                        const std::function<SyncError()> &operation)
{
    const uint32_t maxRetries = config.retry().max_retries();
    SyncError err;
    for (uint32_t attempt = 0; ; ++attempt)
    {
        err = operation();
        if (err.ok())
            return err;
        if (err.code == SYNC_ERR_AUTH || attempt >= maxRetries)
            break;

        const auto delay = retryDelay(config, attempt + 1);
        mLog.warn("Retrying " + what + " of " + path + " in " + std::to_string(delay.count()) + " ms: " + err.message);
        mSleep(delay);
    }

    mLog.error("Failed to " + what + " " + path + ": " + err.message);
    return err;
}

SyncError TransferExecutor::uploadOnce(const ManifestEntry &entry, Transport &transport, const SyncConfiguration &config,
                                       uint64_t &bytes)
{
    std::string module;
    std::string relativePath;
    if (!VirtualFileSystem::splitPath(entry.path(), module, relativePath))
        return SyncError::make(SYNC_ERR_INVALID_ARGUMENT, "invalid path " + entry.path());

    std::string content;
    int ret = mVfs.read(module, relativePath, content);
    if (ret != SYNC_OK)
        return SyncError::make(ret, std::string("cannot read local file: ") + syncErrorName(ret));

    ManifestEntry current = entry;
    // the file may have changed since it was indexed
    if (!entry.hash().empty()) {
        const std::string hash = ContentHash::hex(content);
        if (hash != entry.hash())
            current.set_hash(hash);
    }
    current.set_size(content.size());

    bytes = 0;
    for (const auto &part : buildParts(current, content, config))
    {
        SyncError err = transport.upload(part);
        if (!err.ok())
            return err;
        bytes += part.content.size();
    }
    return SyncError::success();
}

SyncError TransferExecutor::downloadOnce(const ManifestEntry &entry, Transport &transport, uint64_t &bytes)
{
    std::string module;
    std::string relativePath;
    if (!VirtualFileSystem::splitPath(entry.path(), module, relativePath))
        return SyncError::make(SYNC_ERR_INVALID_ARGUMENT, "invalid path " + entry.path());

    DownloadResult result;
    SyncError err = transport.download(entry.path(), result);
    if (!err.ok())
        return err;
    bytes = result.content.size();

    std::string content;
    if (result.encoding == "gzip") {
        if (Compression::gunzip(result.content, content) != 0)
            return SyncError::make(SYNC_ERR_PROTOCOL, "corrupt gzip body");
    } else {
        content = std::move(result.content);
    }

    if (!entry.hash().empty() && ContentHash::hex(content) != entry.hash())
        return SyncError::make(SYNC_ERR_PROTOCOL, "content hash mismatch");

    int ret = mVfs.write(module, relativePath, content, true);
    if (ret != SYNC_OK)
        return SyncError::make(ret, std::string("cannot write local file: ") + syncErrorName(ret));
    return SyncError::success();
}

SyncError TransferExecutor::removeLocal(const ManifestEntry &entry)
{
    std::string module;
    std::string relativePath;
    if (!VirtualFileSystem::splitPath(entry.path(), module, relativePath))
        return SyncError::make(SYNC_ERR_INVALID_ARGUMENT, "invalid path " + entry.path());

    int ret = mVfs.remove(module, relativePath, true);
    if (ret != SYNC_OK && ret != SYNC_ERR_NOT_FOUND) {
        mLog.error("Failed to remove " + entry.path() + ": " + syncErrorName(ret));
        return SyncError::make(ret, "cannot remove local file");
    }
    return SyncError::success();
}
