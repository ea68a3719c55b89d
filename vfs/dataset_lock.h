// *****************************************************************************
// Dataset Lock
// *****************************************************************************

#ifndef _DATASET_LOCK_H_
#define _DATASET_LOCK_H_

// Section 1: Includes
// C++ Standard Library
#include <atomic>
#include <shared_mutex>
#include <thread>

// Section 2: Class Definitions
/**
 * Reader/writer lock over the whole live dataset. Shared holders are sync
 * passes, conflict resolutions, snapshot creation and VFS calls; restore is the
 * only exclusive holder. Shared acquisition nests on the same thread, and a
 * thread holding the lock exclusively may take it shared too.
 */
class DatasetLock
{
public:
    void lockShared();
    void unlockShared();
    void lockExclusive();
    void unlockExclusive();

private:
    std::shared_mutex mMutex;
    std::atomic<std::thread::id> mExclusiveOwner{};
};

class SharedDatasetGuard
{
public:
    explicit SharedDatasetGuard(DatasetLock &lock) : mLock(lock) { mLock.lockShared(); }
    ~SharedDatasetGuard() { mLock.unlockShared(); }

    SharedDatasetGuard(const SharedDatasetGuard &) = delete;
    SharedDatasetGuard &operator=(const SharedDatasetGuard &) = delete;

private:
    DatasetLock &mLock;
};

class ExclusiveDatasetGuard
{
public:
    explicit ExclusiveDatasetGuard(DatasetLock &lock) : mLock(lock) { mLock.lockExclusive(); }
    ~ExclusiveDatasetGuard() { mLock.unlockExclusive(); }

    ExclusiveDatasetGuard(const ExclusiveDatasetGuard &) = delete;
    ExclusiveDatasetGuard &operator=(const ExclusiveDatasetGuard &) = delete;

private:
    DatasetLock &mLock;
};

#endif // _DATASET_LOCK_H_
