// Section 1: Main Header
#include "sync_types.h"

// Section 2: Includes
#include <chrono>
#include <string>

// Section 3: Defines and Macros
// (none)

// Section 4: Static Variables
// (none)

// Section 5: Public Methods
const char *toString(SyncState state)
{
    switch (state) {
        case SyncState::IDLE: return "idle";
        case SyncState::CONNECTING: return "connecting";
        case SyncState::SYNCING: return "syncing";
        case SyncState::SUCCESS: return "success";
        case SyncState::ERROR: return "error";
        case SyncState::OFFLINE: return "offline";
        case SyncState::PAUSED: return "paused";
    }
    return "unknown";
}

const char *toString(SyncMode mode)
{
    switch (mode) {
        case SyncMode::STANDARD: return "standard";
        case SyncMode::FORCE_PUSH: return "force_push";
        case SyncMode::FORCE_PULL: return "force_pull";
    }
    return "unknown";
}

const char *toString(SyncStrategy strategy)
{
    switch (strategy) {
        case SyncStrategy::MANUAL: return "manual";
        case SyncStrategy::BIDIRECTIONAL: return "bidirectional";
        case SyncStrategy::PUSH: return "push";
        case SyncStrategy::PULL: return "pull";
    }
    return "unknown";
}

const char *toString(ConflictPolicy policy)
{
    switch (policy) {
        case ConflictPolicy::SERVER_WINS: return "server-wins";
        case ConflictPolicy::CLIENT_WINS: return "client-wins";
        case ConflictPolicy::NEWER_WINS: return "newer-wins";
        case ConflictPolicy::MANUAL: return "manual";
    }
    return "unknown";
}

const char *toString(ConflictType type)
{
    switch (type) {
        case ConflictType::CONTENT: return "content";
        case ConflictType::DELETE: return "delete";
        case ConflictType::MOVE: return "move";
        case ConflictType::METADATA: return "metadata";
    }
    return "unknown";
}

const char *toString(Resolution resolution)
{
    return resolution == Resolution::LOCAL ? "local" : "remote";
}

const char *toString(TransportKind transport)
{
    switch (transport) {
        case TransportKind::HTTP: return "http";
        case TransportKind::REALTIME: return "realtime";
        case TransportKind::AUTO: return "auto";
    }
    return "unknown";
}

const char *toString(SyncPhase phase)
{
    switch (phase) {
        case SyncPhase::PREPARING: return "preparing";
        case SyncPhase::UPLOADING: return "uploading";
        case SyncPhase::DOWNLOADING: return "downloading";
        case SyncPhase::APPLYING: return "applying";
        case SyncPhase::FINALIZING: return "finalizing";
    }
    return "unknown";
}

const char *toString(LogLevel level)
{
    switch (level) {
        case LogLevel::INFO: return "info";
        case LogLevel::SUCCESS: return "success";
        case LogLevel::WARN: return "warn";
        case LogLevel::ERROR: return "error";
    }
    return "unknown";
}

std::optional<SyncMode> parseSyncMode(const std::string &value)
{
    if (value == "standard") return SyncMode::STANDARD;
    if (value == "force_push") return SyncMode::FORCE_PUSH;
    if (value == "force_pull") return SyncMode::FORCE_PULL;
    return std::nullopt;
}

std::optional<SyncStrategy> parseSyncStrategy(const std::string &value)
{
    if (value == "manual") return SyncStrategy::MANUAL;
    if (value == "bidirectional") return SyncStrategy::BIDIRECTIONAL;
    if (value == "push") return SyncStrategy::PUSH;
    if (value == "pull") return SyncStrategy::PULL;
    return std::nullopt;
}

std::optional<ConflictPolicy> parseConflictPolicy(const std::string &value)
{
    if (value == "server-wins") return ConflictPolicy::SERVER_WINS;
    if (value == "client-wins") return ConflictPolicy::CLIENT_WINS;
    if (value == "newer-wins") return ConflictPolicy::NEWER_WINS;
    if (value == "manual") return ConflictPolicy::MANUAL;
    return std::nullopt;
}

std::optional<ConflictType> parseConflictType(const std::string &value)
{
    if (value.empty() || value == "content") return ConflictType::CONTENT;
    if (value == "delete") return ConflictType::DELETE;
    if (value == "move") return ConflictType::MOVE;
    if (value == "metadata") return ConflictType::METADATA;
    return std::nullopt;
}

std::optional<Resolution> parseResolution(const std::string &value)
{
    if (value == "local") return Resolution::LOCAL;
    if (value == "remote") return Resolution::REMOTE;
    return std::nullopt;
}

std::optional<TransportKind> parseTransportKind(const std::string &value)
{
    if (value == "http") return TransportKind::HTTP;
    if (value == "realtime" || value == "websocket") return TransportKind::REALTIME;
    if (value == "auto") return TransportKind::AUTO;
    return std::nullopt;
}

std::optional<SyncPhase> parseSyncPhase(const std::string &value)
{
    if (value == "preparing") return SyncPhase::PREPARING;
    if (value == "uploading") return SyncPhase::UPLOADING;
    if (value == "downloading") return SyncPhase::DOWNLOADING;
    if (value == "applying") return SyncPhase::APPLYING;
    if (value == "finalizing") return SyncPhase::FINALIZING;
    return std::nullopt;
}

SyncDirection directionFor(SyncStrategy strategy, SyncMode mode)
{
    if (mode == SyncMode::FORCE_PUSH)
        return SyncDirection::PUSH;
    if (mode == SyncMode::FORCE_PULL)
        return SyncDirection::PULL;

    switch (strategy) {
        case SyncStrategy::PUSH: return SyncDirection::PUSH;
        case SyncStrategy::PULL: return SyncDirection::PULL;
        case SyncStrategy::MANUAL:
        case SyncStrategy::BIDIRECTIONAL:
        default:
            return SyncDirection::BIDIRECTIONAL;
    }
}

int64_t nowMillis()
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}
