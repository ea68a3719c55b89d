// Section 1: Main Header
#include "sync_log.h"

// Section 2: Includes
#include <algorithm>
#include <iostream>

// Third-Party Includes
#include "termcolor/termcolor.hpp"

// Section 3: Constructors and Destructors
SyncLog::SyncLog(size_t capacity, bool echo) :
    mCapacity(capacity == 0 ? 1 : capacity),
    mEcho(echo)
{}

// Section 4: Public Methods
void SyncLog::append(LogLevel level, const std::string &message)
{
    SyncLogEntry entry{nowMillis(), level, message};
    Sink sink;
    {
        std::lock_guard<std::mutex> lock(mMutex);
        mEntries.push_front(entry);
        while (mEntries.size() > mCapacity)
            mEntries.pop_back();
        sink = mSink;
    }

    if (mEcho)
        echoToConsole(entry);
    if (sink)
        sink(entry);
}

std::vector<SyncLogEntry> SyncLog::entries(size_t limit) const
{
    std::lock_guard<std::mutex> lock(mMutex);
    const size_t count = std::min(limit, mEntries.size());
    return {mEntries.begin(), mEntries.begin() + static_cast<std::ptrdiff_t>(count)};
}

void SyncLog::clear()
{
    std::lock_guard<std::mutex> lock(mMutex);
    mEntries.clear();
}

size_t SyncLog::size() const
{
    std::lock_guard<std::mutex> lock(mMutex);
    return mEntries.size();
}

void SyncLog::setSink(Sink sink)
{
    std::lock_guard<std::mutex> lock(mMutex);
    mSink = std::move(sink);
}

// Section 5: Private Methods
void SyncLog::echoToConsole(const SyncLogEntry &entry)
{
    switch (entry.level) {
        case LogLevel::INFO:
            std::cout << termcolor::cyan << entry.message << "\r\n" << termcolor::reset;
            break;
        case LogLevel::SUCCESS:
            std::cout << termcolor::green << entry.message << "\r\n" << termcolor::reset;
            break;
        case LogLevel::WARN:
            std::cout << termcolor::yellow << entry.message << "\r\n" << termcolor::reset;
            break;
        case LogLevel::ERROR:
            std::cout << termcolor::red << entry.message << "\r\n" << termcolor::reset;
            break;
    }
}
