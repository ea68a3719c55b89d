// *****************************************************************************
// Push Channel
// *****************************************************************************

// Section 1: Main Header
#include "push_channel.h"

// Section 2: Includes
// C++ Standard Library
#include <algorithm>
#include <iostream>

// System Includes
#include <sys/socket.h>
#include <unistd.h>

// Third-Party Includes
#include "termcolor/termcolor.hpp"

// Project Includes
#include "sync_types.h"
#include "transport/socket_helpers.h"

// Section 3: Defines and Macros
constexpr uint32_t MAX_BACKOFF_SHIFT = 16;

// Section 4: Constructors/Destructors
PushChannel::PushChannel(Options options, Scheduler &scheduler, MessageHandler onMessage, StateHandler onState) :
    mOptions(std::move(options)),
    mScheduler(scheduler),
    mOnMessage(std::move(onMessage)),
    mOnState(std::move(onState))
{
}

PushChannel::~PushChannel()
{
    mGuard.revoke();
    close();
}

// Section 5: Public Methods
int PushChannel::connect()
{
    const int ret = attemptConnect();
    if (ret != 0)
        scheduleReconnect();
    return ret;
}

int PushChannel::reconnect()
{
    {
        std::lock_guard<std::mutex> lock(mMutex);
        if (mReconnectTask != Scheduler::INVALID_TASK)
            mScheduler.cancel(mReconnectTask);
        mReconnectTask = Scheduler::INVALID_TASK;
    }
    mQuit = false;
    mAttempts = 0;
    mGaveUp = false;
    return connect();
}

void PushChannel::close()
{
    mQuit = true;

    std::lock_guard<std::mutex> connectLock(mConnectMutex);
    std::thread reader;
    int fd = -1;
    {
        std::lock_guard<std::mutex> lock(mMutex);
        if (mHeartbeatTask != Scheduler::INVALID_TASK)
            mScheduler.cancel(mHeartbeatTask);
        if (mReconnectTask != Scheduler::INVALID_TASK)
            mScheduler.cancel(mReconnectTask);
        mHeartbeatTask = Scheduler::INVALID_TASK;
        mReconnectTask = Scheduler::INVALID_TASK;

        fd = mFd;
        mFd = -1;
        reader = std::move(mReader);
    }

    if (fd >= 0)
        shutdown(fd, SHUT_RDWR);
    if (reader.joinable())
        reader.join();
    if (fd >= 0)
        ::close(fd);

    if (mConnected.exchange(false) && mOnState)
        mOnState(false);
}

int PushChannel::send(const ChannelMessage &message)
{
    int fd = -1;
    {
        std::lock_guard<std::mutex> lock(mMutex);
        fd = mFd;
    }
    if (fd < 0 || !mConnected)
        return -1;

    const ChannelFrame frame(message);
    if (frame.transmit(fd) != 0) {
        // the reader notices the dead socket and runs the drop handling
        shutdown(fd, SHUT_RDWR);
        return -1;
    }
    return 0;
}

uint64_t PushChannel::backoffDelay(uint32_t baseMs, uint32_t attempt)
{
    const uint32_t shift = std::min(attempt > 0 ? attempt - 1 : 0, MAX_BACKOFF_SHIFT);
    return static_cast<uint64_t>(baseMs) << shift;
}

// Section 6: Protected Methods
int PushChannel::openSocket(int &fd)
{
    return SocketHelpers::connect_timeout(mOptions.host, mOptions.port, mOptions.connectTimeoutMs, fd);
}

// Section 7: Private Methods
int PushChannel::attemptConnect()
{
    std::lock_guard<std::mutex> connectLock(mConnectMutex);
    if (mQuit)
        return -1;
    if (mConnected)
        return 0;

    std::thread previous;
    {
        std::lock_guard<std::mutex> lock(mMutex);
        previous = std::move(mReader);
    }
    if (previous.joinable())
        previous.join();

    int fd = -1;
    if (openSocket(fd) != 0 || fd < 0) {
        std::cout << termcolor::yellow << "Push channel: cannot reach " << mOptions.host << ":" << mOptions.port
                  << "\r\n" << termcolor::reset;
        return -1;
    }

    {
        std::lock_guard<std::mutex> lock(mMutex);
        mFd = fd;
        mConnected = true;
        mAttempts = 0;
        mGaveUp = false;
        mReader = std::thread(&PushChannel::readLoop, this, fd);
        if (mHeartbeatTask == Scheduler::INVALID_TASK && mOptions.heartbeatMs > 0)
            mHeartbeatTask = mScheduler.scheduleAtFixedRate(std::chrono::milliseconds(mOptions.heartbeatMs),
                                                            mGuard.wrap([this] { heartbeat(); }));
    }

    std::cout << termcolor::green << "Push channel connected to " << mOptions.host << ":" << mOptions.port
              << "\r\n" << termcolor::reset;
    if (mOnState)
        mOnState(true);
    return 0;
}

void PushChannel::scheduleReconnect()
{
    if (mQuit)
        return;

    const uint32_t attempt = mAttempts + 1;
    if (attempt > mOptions.maxAttempts) {
        mGaveUp = true;
        std::cout << termcolor::red << "Push channel: giving up after " << mOptions.maxAttempts << " attempts"
                  << "\r\n" << termcolor::reset;
        return;
    }

    const auto delay = std::chrono::milliseconds(backoffDelay(mOptions.baseDelayMs, attempt));
    std::lock_guard<std::mutex> lock(mMutex);
    mReconnectTask = mScheduler.scheduleOnce(delay, mGuard.wrap([this] {
        {
            std::lock_guard<std::mutex> taskLock(mMutex);
            mReconnectTask = Scheduler::INVALID_TASK;
        }
        ++mAttempts;
        if (attemptConnect() != 0)
            scheduleReconnect();
    }));
}

void PushChannel::readLoop(int fd)
{
    while (!mQuit) {
        ChannelFrame frame;
        if (ChannelFrame::receive(mQuit, fd, frame) != 0)
            break;

        switch (frame.command()) {
            case ChannelFrame::CMD_ID_PING: {
                ChannelMessage pong;
                pong.set_type("pong");
                pong.set_timestamp(nowMillis());
                if (ChannelFrame(pong).transmit(fd) != 0)
                    shutdown(fd, SHUT_RDWR);
                break;
            }
            case ChannelFrame::CMD_ID_PONG:
                break;
            default:
                if (mOnMessage)
                    mOnMessage(frame.message());
                break;
        }
    }
    handleDrop(fd);
}

void PushChannel::handleDrop(int fd)
{
    {
        std::lock_guard<std::mutex> lock(mMutex);
        if (mFd != fd)
            return;     // close() owns the socket
        mFd = -1;
        if (mHeartbeatTask != Scheduler::INVALID_TASK)
            mScheduler.cancel(mHeartbeatTask);
        mHeartbeatTask = Scheduler::INVALID_TASK;
    }
    ::close(fd);
    mConnected = false;

    std::cout << termcolor::yellow << "Push channel disconnected" << "\r\n" << termcolor::reset;
    if (mOnState)
        mOnState(false);
    scheduleReconnect();
}

void PushChannel::heartbeat()
{
    if (!mConnected)
        return;
    ChannelMessage ping;
    ping.set_type("ping");
    ping.set_timestamp(nowMillis());
    if (send(ping) != 0)
        std::cout << termcolor::yellow << "Push channel: heartbeat failed" << "\r\n" << termcolor::reset;
}
