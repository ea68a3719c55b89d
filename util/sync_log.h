// *****************************************************************************
// Sync Log Buffer
// *****************************************************************************

#ifndef _SYNC_LOG_H_
#define _SYNC_LOG_H_

// Section 1: Includes
// C++ Standard Library
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

// Project Includes
#include "sync_types.h"

// Section 2: Defines and Macros
constexpr size_t SYNC_LOG_CAPACITY = 100;
constexpr size_t SYNC_LOG_DEFAULT_LIMIT = 50;

// Section 3: Class Definition
/**
 * Capped ring of engine log entries, newest first. Every entry is also echoed
 * to the console in the level's colour.
 */
class SyncLog
{
public:
    using Sink = std::function<void(const SyncLogEntry &)>;

    explicit SyncLog(size_t capacity = SYNC_LOG_CAPACITY, bool echo = true);

    void info(const std::string &message) { append(LogLevel::INFO, message); }
    void success(const std::string &message) { append(LogLevel::SUCCESS, message); }
    void warn(const std::string &message) { append(LogLevel::WARN, message); }
    void error(const std::string &message) { append(LogLevel::ERROR, message); }

    /**
     * Adds an entry, evicting the oldest one once the buffer is full
     * @param level Severity
     * @param message Text shown to the user
     */
    void append(LogLevel level, const std::string &message);

    /**
     * @param limit Maximum number of entries returned
     * @return at most limit entries, newest first
     */
    [[nodiscard]] std::vector<SyncLogEntry> entries(size_t limit = SYNC_LOG_DEFAULT_LIMIT) const;

    void clear();

    [[nodiscard]] size_t size() const;

    /**
     * Called after every append, outside the buffer lock
     */
    void setSink(Sink sink);

private:
    static void echoToConsole(const SyncLogEntry &entry);

    mutable std::mutex mMutex;
    std::deque<SyncLogEntry> mEntries;  ///< front is newest
    size_t mCapacity;
    bool mEcho;
    Sink mSink;
};

#endif // _SYNC_LOG_H_
