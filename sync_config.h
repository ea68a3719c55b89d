// Section 1: Compilation Guards
#ifndef _SYNC_CONFIG_H_
#define _SYNC_CONFIG_H_

// Section 2: Includes
#include <cstdint>
#include <mutex>
#include <string>

#include "error_codes.h"
#include "sync_config.pb.h"
#include "sync_types.h"

// Section 3: Defines and Macros
constexpr uint64_t ONE_KIB = 1ULL << 10;
constexpr uint64_t ONE_MIB = 1ULL << 20;

constexpr uint32_t DEFAULT_AUTO_SYNC_INTERVAL_MINUTES = 15;
constexpr uint64_t DEFAULT_CHUNK_SIZE = ONE_MIB;
constexpr uint64_t DEFAULT_CHUNK_THRESHOLD = 5 * ONE_MIB;
constexpr uint64_t DEFAULT_COMPRESSION_MIN_SIZE = ONE_KIB;
constexpr uint64_t DEFAULT_MAX_FILE_SIZE = 100 * ONE_MIB;
constexpr uint32_t DEFAULT_MAX_RETRIES = 3;
constexpr uint32_t DEFAULT_RETRY_DELAY_MS = 1000;
constexpr uint32_t DEFAULT_REALTIME_PORT = 8090;
constexpr uint32_t DEFAULT_HEARTBEAT_INTERVAL_MS = 30000;
constexpr uint32_t DEFAULT_RECONNECT_BASE_DELAY_MS = 1000;
constexpr uint32_t DEFAULT_MAX_RECONNECT_ATTEMPTS = 10;

using SyncConfiguration = com::workspacesync::SyncConfiguration;

class VirtualFileSystem;

// Section 4: Classes
/**
 * Owns the engine configuration. Loaded once from the reserved __config module,
 * changed only through save(), which writes it back immediately.
 */
class SyncConfigStore {
public:
    explicit SyncConfigStore(VirtualFileSystem &vfs);

    /**
     * Reads /__config/sync_config.json. A missing document leaves the defaults in place.
     * @return 0 on success, SYNC_ERR_CONFIGURATION if the document is unreadable or invalid
     */
    SyncError load();

    /**
     * Validates, fills unset fields from the defaults and persists
     * @param config New configuration, replaces the current one entirely
     */
    SyncError save(const SyncConfiguration &config);

    [[nodiscard]] SyncConfiguration get() const;

    /**
     * Every field set to its default value
     */
    static SyncConfiguration defaults();

    /**
     * client_<epoch ms>_<8 base36 chars>
     */
    static std::string generatePeerId();

    /**
     * Fills every unset field of config from defaults()
     */
    static SyncConfiguration withDefaults(const SyncConfiguration &config);

    static SyncError validate(const SyncConfiguration &config);

    static SyncError toJson(const SyncConfiguration &config, std::string &json);
    static SyncError fromJson(const std::string &json, SyncConfiguration &config);

    // typed views over the string-valued settings, invalid values map to the default
    static SyncStrategy strategy(const SyncConfiguration &config);
    static ConflictPolicy conflictPolicy(const SyncConfiguration &config);
    static TransportKind transport(const SyncConfiguration &config);

    static bool hasEndpoint(const SyncConfiguration &config) { return !config.endpoint().empty(); }

private:
    VirtualFileSystem &mVfs;
    mutable std::mutex mMutex;
    SyncConfiguration mConfig;
};

#endif // _SYNC_CONFIG_H_
