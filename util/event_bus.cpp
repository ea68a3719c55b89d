// Section 1: Main Header
#include "event_bus.h"

// Section 2: Includes
#include <vector>

// Section 3: Helpers
const char *toString(SyncEventType type)
{
    switch (type) {
        case SyncEventType::STATE_CHANGE: return "stateChange";
        case SyncEventType::PROGRESS: return "progress";
        case SyncEventType::LOG: return "log";
        case SyncEventType::CONFLICT: return "conflict";
        case SyncEventType::CONNECTED: return "connected";
        case SyncEventType::DISCONNECTED: return "disconnected";
        case SyncEventType::ERROR: return "error";
        case SyncEventType::COMPLETED: return "completed";
    }
    return "unknown";
}

std::optional<SyncEventType> parseSyncEventType(const std::string &value)
{
    for (uint8_t i = 0; i <= static_cast<uint8_t>(SyncEventType::COMPLETED); ++i) {
        const auto type = static_cast<SyncEventType>(i);
        if (value == toString(type))
            return type;
    }
    return std::nullopt;
}

// Section 4: Subscription
Subscription::Subscription(std::function<void(uint64_t)> remover, uint64_t id) :
    mRemover(std::move(remover)),
    mId(id)
{}

void Subscription::unsubscribe()
{
    if (!mRemover)
        return;
    auto remover = std::move(mRemover);
    mRemover = nullptr;
    remover(mId);
}

// Section 5: EventBus
EventBus::EventBus() : mRegistry(std::make_shared<Registry>()) {}

EventBus::~EventBus()
{
    std::lock_guard<std::mutex> lock(mRegistry->mutex);
    mRegistry->handlers.clear();
}

Subscription EventBus::on(SyncEventType type, Handler handler)
{
    uint64_t id = 0;
    {
        std::lock_guard<std::mutex> lock(mRegistry->mutex);
        id = mRegistry->nextId++;
        mRegistry->handlers.emplace(id, std::make_pair(type, std::make_shared<Handler>(std::move(handler))));
    }

    std::weak_ptr<Registry> weak = mRegistry;
    return {[weak](uint64_t handlerId) {
        if (auto registry = weak.lock()) {
            std::lock_guard<std::mutex> lock(registry->mutex);
            registry->handlers.erase(handlerId);
        }
    }, id};
}

void EventBus::emit(const SyncEvent &event) const
{
    std::vector<std::pair<uint64_t, std::shared_ptr<Handler>>> targets;
    {
        std::lock_guard<std::mutex> lock(mRegistry->mutex);
        for (const auto &[id, entry] : mRegistry->handlers)
            if (entry.first == event.type)
                targets.emplace_back(id, entry.second);
    }

    for (const auto &[id, handler] : targets) {
        {
            // skip handlers removed by an earlier handler of this same emit
            std::lock_guard<std::mutex> lock(mRegistry->mutex);
            if (!mRegistry->handlers.contains(id))
                continue;
        }
        (*handler)(event);
    }
}

size_t EventBus::handlerCount(SyncEventType type) const
{
    std::lock_guard<std::mutex> lock(mRegistry->mutex);
    size_t count = 0;
    for (const auto &[id, entry] : mRegistry->handlers)
        if (entry.first == type)
            ++count;
    return count;
}
