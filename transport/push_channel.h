// *****************************************************************************
// Push Channel
// *****************************************************************************

#ifndef _PUSH_CHANNEL_H_
#define _PUSH_CHANNEL_H_

// Section 1: Includes
// C++ Standard Library
#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

// Project Includes
#include "transport/channel_frame.h"
#include "util/scheduler.h"

// Section 2: Class Definitions
/**
 * Persistent connection to the remote peer's realtime port. A reader thread
 * dispatches incoming frames, the scheduler drives heartbeats and reconnects.
 * After maxAttempts failed reconnects the channel stays down until reconnect().
 */
class PushChannel
{
public:
    struct Options {
        std::string host;
        uint16_t port = 0;
        uint32_t heartbeatMs = 30000;
        uint32_t baseDelayMs = 1000;
        uint32_t maxAttempts = 10;
        int connectTimeoutMs = 5000;
    };

    using MessageHandler = std::function<void(const ChannelMessage &)>;
    using StateHandler = std::function<void(bool connected)>;

    PushChannel(Options options, Scheduler &scheduler, MessageHandler onMessage, StateHandler onState);
    virtual ~PushChannel();

    PushChannel(const PushChannel &) = delete;
    PushChannel &operator=(const PushChannel &) = delete;

    /**
     * Connects now. On failure the reconnect schedule takes over. Does nothing after close().
     * @return 0 if connected, negative otherwise
     */
    int connect();

    /**
     * Resets the attempt counter and connects again, also after giving up or close()
     */
    int reconnect();

    /**
     * Drops the connection and cancels heartbeat and pending reconnects
     */
    void close();

    [[nodiscard]] bool isConnected() const { return mConnected.load(); }
    [[nodiscard]] uint32_t attempts() const { return mAttempts.load(); }
    [[nodiscard]] bool gaveUp() const { return mGaveUp.load(); }

    /**
     * @return 0 on success, negative if not connected or the write failed
     */
    int send(const ChannelMessage &message);

    /**
     * Delay before reconnect attempt n (1-based): base * 2^(n-1)
     */
    static uint64_t backoffDelay(uint32_t baseMs, uint32_t attempt);

protected:
    /**
     * Opens the transport socket
     * @param fd Receives a connected stream socket
     * @return 0 on success, negative on failure
     */
    virtual int openSocket(int &fd);

private:
    int attemptConnect();
    void scheduleReconnect();
    void readLoop(int fd);
    void handleDrop(int fd);
    void heartbeat();

    const Options mOptions;
    Scheduler &mScheduler;
    MessageHandler mOnMessage;
    StateHandler mOnState;

    TaskGuard mGuard;
    std::mutex mConnectMutex;           ///< one connect or close at a time
    std::mutex mMutex;                  ///< mFd, mReader and the task ids
    int mFd = -1;
    std::thread mReader;
    Scheduler::TaskId mHeartbeatTask = Scheduler::INVALID_TASK;
    Scheduler::TaskId mReconnectTask = Scheduler::INVALID_TASK;

    std::atomic<bool> mQuit{false};
    std::atomic<bool> mConnected{false};
    std::atomic<bool> mGaveUp{false};
    std::atomic<uint32_t> mAttempts{0};
};

#endif // _PUSH_CHANNEL_H_
