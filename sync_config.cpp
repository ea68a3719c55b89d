// Section 1: Main Header
#include "sync_config.h"

// Section 2: Includes
#include <random>
#include <string>

#include <google/protobuf/util/json_util.h>

// Project Includes
#include "vfs/virtual_file_system.h"

// Section 3: Defines and Macros
// (none)

// Section 4: Static Variables
static const std::string CONFIG_RELATIVE_PATH = std::string(SYNC_CONFIG_PATH).substr(1);

// Section 5: Constructors and Destructors
SyncConfigStore::SyncConfigStore(VirtualFileSystem &vfs) : mVfs(vfs), mConfig(defaults())
{
    mConfig.set_peer_id(generatePeerId());
}

// Section 6: Static Methods
SyncConfiguration SyncConfigStore::defaults()
{
    SyncConfiguration config;
    config.set_endpoint("");
    config.set_username("");
    config.set_password("");
    config.set_token("");
    config.set_strategy(toString(SyncStrategy::MANUAL));
    config.set_conflict_resolution(toString(ConflictPolicy::SERVER_WINS));
    config.set_auto_sync(false);
    config.set_auto_sync_interval_minutes(DEFAULT_AUTO_SYNC_INTERVAL_MINUTES);
    config.set_transport(toString(TransportKind::AUTO));

    auto *chunking = config.mutable_chunking();
    chunking->set_enabled(true);
    chunking->set_chunk_size(DEFAULT_CHUNK_SIZE);
    chunking->set_threshold(DEFAULT_CHUNK_THRESHOLD);

    auto *compression = config.mutable_compression();
    compression->set_enabled(true);
    compression->set_algorithm("gzip");
    compression->set_min_size(DEFAULT_COMPRESSION_MIN_SIZE);

    auto *filters = config.mutable_filters();
    filters->set_max_file_size(DEFAULT_MAX_FILE_SIZE);
    filters->set_exclude_binary(false);

    auto *retry = config.mutable_retry();
    retry->set_max_retries(DEFAULT_MAX_RETRIES);
    retry->set_retry_delay_ms(DEFAULT_RETRY_DELAY_MS);

    auto *realtime = config.mutable_realtime();
    realtime->set_enabled(false);
    realtime->set_port(DEFAULT_REALTIME_PORT);
    realtime->set_heartbeat_interval_ms(DEFAULT_HEARTBEAT_INTERVAL_MS);
    realtime->set_reconnect_base_delay_ms(DEFAULT_RECONNECT_BASE_DELAY_MS);
    realtime->set_max_reconnect_attempts(DEFAULT_MAX_RECONNECT_ATTEMPTS);
    return config;
}

std::string SyncConfigStore::generatePeerId()
{
    static constexpr char DIGITS[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    std::random_device device;
    std::mt19937 rng(device());
    std::uniform_int_distribution<size_t> pick(0, sizeof(DIGITS) - 2);

    std::string suffix;
    for (int i = 0; i < 8; ++i)
        suffix += DIGITS[pick(rng)];
    return "client_" + std::to_string(nowMillis()) + "_" + suffix;
}

SyncConfiguration SyncConfigStore::withDefaults(const SyncConfiguration &config)
{
    SyncConfiguration merged = defaults();
    merged.MergeFrom(config);
    return merged;
}

SyncError SyncConfigStore::validate(const SyncConfiguration &config)
{
    const std::string &endpoint = config.endpoint();
    if (!endpoint.empty() && !endpoint.starts_with("http://") && !endpoint.starts_with("https://"))
        return SyncError::make(SYNC_ERR_CONFIGURATION, "endpoint must start with http:// or https://");
    if (config.has_strategy() && !parseSyncStrategy(config.strategy()))
        return SyncError::make(SYNC_ERR_CONFIGURATION, "unknown strategy '" + config.strategy() + "'");
    if (config.has_conflict_resolution() && !parseConflictPolicy(config.conflict_resolution()))
        return SyncError::make(SYNC_ERR_CONFIGURATION, "unknown conflictResolution '" + config.conflict_resolution() + "'");
    if (config.has_transport() && !parseTransportKind(config.transport()))
        return SyncError::make(SYNC_ERR_CONFIGURATION, "unknown transport '" + config.transport() + "'");
    if (config.has_auto_sync_interval_minutes() && config.auto_sync_interval_minutes() == 0)
        return SyncError::make(SYNC_ERR_CONFIGURATION, "autoSyncIntervalMinutes must be at least 1");
    if (config.chunking().has_chunk_size() && config.chunking().chunk_size() == 0)
        return SyncError::make(SYNC_ERR_CONFIGURATION, "chunking.chunkSize must be positive");
    if (config.compression().has_algorithm() && config.compression().algorithm() != "gzip")
        return SyncError::make(SYNC_ERR_CONFIGURATION, "unsupported compression algorithm '" + config.compression().algorithm() + "'");
    if (config.realtime().has_port() && config.realtime().port() > UINT16_MAX)
        return SyncError::make(SYNC_ERR_CONFIGURATION, "realtime.port out of range");
    return SyncError::success();
}

SyncError SyncConfigStore::toJson(const SyncConfiguration &config, std::string &json)
{
    google::protobuf::util::JsonPrintOptions options;
    options.add_whitespace = true;

    json.clear();
    auto status = google::protobuf::util::MessageToJsonString(config, &json, options);
    if (!status.ok())
        return SyncError::make(SYNC_ERR_CONFIGURATION, "cannot serialize configuration: " + status.ToString());
    return SyncError::success();
}

SyncError SyncConfigStore::fromJson(const std::string &json, SyncConfiguration &config)
{
    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = true;

    SyncConfiguration parsed;
    auto status = google::protobuf::util::JsonStringToMessage(json, &parsed, options);
    if (!status.ok())
        return SyncError::make(SYNC_ERR_CONFIGURATION, "malformed configuration: " + status.ToString());

    config = std::move(parsed);
    return SyncError::success();
}

SyncStrategy SyncConfigStore::strategy(const SyncConfiguration &config)
{
    return parseSyncStrategy(config.strategy()).value_or(SyncStrategy::MANUAL);
}

ConflictPolicy SyncConfigStore::conflictPolicy(const SyncConfiguration &config)
{
    return parseConflictPolicy(config.conflict_resolution()).value_or(ConflictPolicy::SERVER_WINS);
}

TransportKind SyncConfigStore::transport(const SyncConfiguration &config)
{
    return parseTransportKind(config.transport()).value_or(TransportKind::AUTO);
}

// Section 7: Public Methods
SyncError SyncConfigStore::load()
{
    std::string json;
    int ret = mVfs.read(CONFIG_MODULE, CONFIG_RELATIVE_PATH, json);
    if (ret == SYNC_ERR_NOT_FOUND)
        return SyncError::success();
    if (ret != SYNC_OK)
        return SyncError::make(SYNC_ERR_CONFIGURATION, std::string("cannot read ") + SYNC_CONFIG_PATH + ": " + syncErrorName(ret));

    SyncConfiguration stored;
    SyncError err = fromJson(json, stored);
    if (!err.ok())
        return err;
    err = validate(stored);
    if (!err.ok())
        return err;

    if (!stored.peer_id().empty()) {
        std::lock_guard<std::mutex> lock(mMutex);
        mConfig = withDefaults(stored);
        return SyncError::success();
    }

    // older documents carry no peer id, the generated one is written back
    stored.set_peer_id(get().peer_id());
    return save(stored);
}

SyncError SyncConfigStore::save(const SyncConfiguration &config)
{
    SyncError err = validate(config);
    if (!err.ok())
        return err;

    SyncConfiguration merged = withDefaults(config);
    if (merged.peer_id().empty())
        merged.set_peer_id(get().peer_id());
    std::string json;
    err = toJson(merged, json);
    if (!err.ok())
        return err;

    int ret = mVfs.mount(CONFIG_MODULE);
    if (ret == SYNC_OK)
        ret = mVfs.write(CONFIG_MODULE, CONFIG_RELATIVE_PATH, json, true);
    if (ret != SYNC_OK)
        return SyncError::make(ret, std::string("cannot write ") + SYNC_CONFIG_PATH + ": " + syncErrorName(ret));

    std::lock_guard<std::mutex> lock(mMutex);
    mConfig = merged;
    return SyncError::success();
}

SyncConfiguration SyncConfigStore::get() const
{
    std::lock_guard<std::mutex> lock(mMutex);
    return mConfig;
}
