// Section 1: Main Header
#include "dataset_lock.h"

// Section 2: Includes
#include <map>

// Section 3: Static Variables
namespace
{
    // shared depth per lock for the calling thread
    thread_local std::map<const DatasetLock *, int> tSharedDepth;
}

// Section 4: Public Methods
void DatasetLock::lockShared()
{
    if (mExclusiveOwner.load() == std::this_thread::get_id())
        return;

    int &depth = tSharedDepth[this];
    if (depth++ == 0)
        mMutex.lock_shared();
}

void DatasetLock::unlockShared()
{
    if (mExclusiveOwner.load() == std::this_thread::get_id())
        return;

    auto it = tSharedDepth.find(this);
    if (it == tSharedDepth.end())
        return;
    if (--it->second == 0) {
        tSharedDepth.erase(it);
        mMutex.unlock_shared();
    }
}

void DatasetLock::lockExclusive()
{
    mMutex.lock();
    mExclusiveOwner.store(std::this_thread::get_id());
}

void DatasetLock::unlockExclusive()
{
    mExclusiveOwner.store(std::thread::id{});
    mMutex.unlock();
}
