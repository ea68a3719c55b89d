// Section 1: Compilation Guards
#ifndef _SYNC_TYPES_H_
#define _SYNC_TYPES_H_

// Section 2: Includes
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Section 3: Defines and Macros
constexpr const char *LIVE_DATASET_NAME = "workspace";
constexpr const char *SNAPSHOT_PREFIX = "snapshot_";
constexpr const char *CONFIG_MODULE = "__config";
constexpr const char *SYNC_CONFIG_PATH = "/sync_config.json";

// Section 4: Types
enum class SyncState : std::uint8_t {
    IDLE = 0,
    CONNECTING,
    SYNCING,
    SUCCESS,
    ERROR,
    OFFLINE,
    PAUSED,
};

/**
 * What a triggered pass does. STANDARD follows the configured strategy.
 */
enum class SyncMode : std::uint8_t {
    STANDARD = 0,
    FORCE_PUSH,
    FORCE_PULL,
};

enum class SyncStrategy : std::uint8_t {
    MANUAL = 0,
    BIDIRECTIONAL,
    PUSH,
    PULL,
};

enum class SyncDirection : std::uint8_t {
    BIDIRECTIONAL = 0,
    PUSH,
    PULL,
};

enum class ConflictPolicy : std::uint8_t {
    SERVER_WINS = 0,
    CLIENT_WINS,
    NEWER_WINS,
    MANUAL,
};

enum class ConflictType : std::uint8_t {
    CONTENT = 0,
    DELETE,
    MOVE,
    METADATA,
};

enum class Resolution : std::uint8_t {
    LOCAL = 0,
    REMOTE,
};

enum class TransportKind : std::uint8_t {
    HTTP = 0,
    REALTIME,
    AUTO,
};

enum class SyncPhase : std::uint8_t {
    PREPARING = 0,
    UPLOADING,
    DOWNLOADING,
    APPLYING,
    FINALIZING,
};

enum class LogLevel : std::uint8_t {
    INFO = 0,
    SUCCESS,
    WARN,
    ERROR,
};

struct SyncProgress {
    SyncPhase phase = SyncPhase::PREPARING;
    uint64_t current = 0;
    uint64_t total = 0;
    std::optional<std::string> currentFile;
    std::optional<uint64_t> bytesTransferred;
    std::optional<double> speed;            ///< bytes per second
};

struct ConnectionInfo {
    std::string type;                       ///< "http" or "realtime"
    bool connected = false;
};

struct SyncStatus {
    SyncState state = SyncState::IDLE;
    std::optional<int64_t> lastSyncTime;    ///< epoch millis
    std::optional<SyncProgress> progress;   ///< only while SYNCING
    std::optional<std::string> errorMessage;
    std::optional<ConnectionInfo> connection;
};

struct ChangeInfo {
    int64_t timestamp = 0;
    uint64_t size = 0;
    std::string hash;
};

struct SyncConflict {
    std::string id;
    std::string path;
    ConflictType type = ConflictType::CONTENT;
    ChangeInfo localChange;
    ChangeInfo remoteChange;
    bool resolved = false;
    std::optional<Resolution> resolution;
    std::string remoteId;                   ///< id the remote peer knows the conflict by, if any
};

struct SyncLogEntry {
    int64_t timestamp = 0;
    LogLevel level = LogLevel::INFO;
    std::string message;
};

struct Snapshot {
    std::string name;
    int64_t createdAt = 0;
    uint64_t sizeEstimate = 0;
};

// Section 5: Helpers
const char *toString(SyncState state);
const char *toString(SyncMode mode);
const char *toString(SyncStrategy strategy);
const char *toString(ConflictPolicy policy);
const char *toString(ConflictType type);
const char *toString(Resolution resolution);
const char *toString(TransportKind transport);
const char *toString(SyncPhase phase);
const char *toString(LogLevel level);

std::optional<SyncMode> parseSyncMode(const std::string &value);
std::optional<SyncStrategy> parseSyncStrategy(const std::string &value);
std::optional<ConflictPolicy> parseConflictPolicy(const std::string &value);
std::optional<ConflictType> parseConflictType(const std::string &value);
std::optional<Resolution> parseResolution(const std::string &value);
std::optional<TransportKind> parseTransportKind(const std::string &value);
std::optional<SyncPhase> parseSyncPhase(const std::string &value);

/**
 * Direction a pass runs in, from the configured strategy and the requested mode
 */
SyncDirection directionFor(SyncStrategy strategy, SyncMode mode);

/**
 * Milliseconds since the Unix epoch, wall clock
 */
int64_t nowMillis();

#endif // _SYNC_TYPES_H_
