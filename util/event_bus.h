// *****************************************************************************
// Event Bus
// *****************************************************************************

#ifndef _EVENT_BUS_H_
#define _EVENT_BUS_H_

// Section 1: Includes
// C++ Standard Library
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

// Project Includes
#include "sync_types.h"

// Section 2: Types
enum class SyncEventType : std::uint8_t {
    STATE_CHANGE = 0,
    PROGRESS,
    LOG,
    CONFLICT,
    CONNECTED,
    DISCONNECTED,
    ERROR,
    COMPLETED,
};

/**
 * One published event. Only the field matching the type is set.
 */
struct SyncEvent {
    SyncEventType type = SyncEventType::STATE_CHANGE;
    std::optional<SyncState> state;
    std::optional<SyncProgress> progress;
    std::optional<SyncLogEntry> log;
    std::optional<SyncConflict> conflict;
    int code = 0;                           ///< ERROR and COMPLETED
    std::string message;
};

const char *toString(SyncEventType type);
std::optional<SyncEventType> parseSyncEventType(const std::string &value);

// Section 3: Class Definitions
/**
 * Handle returned by EventBus::on(). Dropping it does not remove the handler,
 * unsubscribe() does. Safe to call after the bus is gone.
 */
class Subscription
{
public:
    Subscription() = default;
    Subscription(std::function<void(uint64_t)> remover, uint64_t id);

    void unsubscribe();
    [[nodiscard]] bool active() const { return static_cast<bool>(mRemover); }

private:
    std::function<void(uint64_t)> mRemover;
    uint64_t mId = 0;
};

class EventBus
{
public:
    using Handler = std::function<void(const SyncEvent &)>;

    EventBus();
    ~EventBus();

    EventBus(const EventBus &) = delete;
    EventBus &operator=(const EventBus &) = delete;

    Subscription on(SyncEventType type, Handler handler);

    /**
     * Delivers the event synchronously to every handler of its type.
     * Handlers run outside the registry lock and may unsubscribe themselves.
     */
    void emit(const SyncEvent &event) const;

    [[nodiscard]] size_t handlerCount(SyncEventType type) const;

private:
    struct Registry {
        std::mutex mutex;
        uint64_t nextId = 1;
        std::map<uint64_t, std::pair<SyncEventType, std::shared_ptr<Handler>>> handlers;
    };

    std::shared_ptr<Registry> mRegistry;
};

#endif // _EVENT_BUS_H_
