/******************************************************************************
 * Channel Frame Header
 ******************************************************************************/

/* Section 1: Compilation Guards */
#ifndef _CHANNEL_FRAME_H_
#define _CHANNEL_FRAME_H_

/* Section 2: Includes */
// C++ Standard Library
#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

// Project Includes
#include "channel.pb.h"

/* Section 3: Defines and Macros */
#define INDEX_AFTER(prevIdx,prevIdxSiz)    ((prevIdx)+(prevIdxSiz))

using ChannelMessage = com::workspacesync::ChannelMessage;

/* Section 4: Classes */
/**
 * One push channel frame: total size, command id, then the ChannelMessage
 * protobuf. The size is little-endian and counts the whole frame.
 */
class ChannelFrame {
public:
    /* Public Types */
    typedef enum : uint8_t {
        CMD_ID_SYNC_CHANGES = 0,
        CMD_ID_SYNC_CONFLICT,
        CMD_ID_SYNC_PROGRESS,
        CMD_ID_PING,
        CMD_ID_PONG,
        CMD_ID_COUNT,
    } cmd_id_t;

    enum decode_status : int8_t {
        DECODE_OK = 0,
        DECODE_NEED_MORE = 1,
        DECODE_BAD_SIZE = -1,
        DECODE_BAD_COMMAND = -2,
        DECODE_BAD_PAYLOAD = -3,
    };

    /* Public Static Constants */
    static constexpr size_t kSizeIndex = 0;
    static constexpr size_t kSizeSize = sizeof(uint64_t);
    static constexpr size_t kCmdIndex = INDEX_AFTER(kSizeIndex, kSizeSize);
    static constexpr size_t kCmdSize = sizeof(uint8_t);
    static constexpr size_t kPayloadIndex = INDEX_AFTER(kCmdIndex, kCmdSize);
    static constexpr uint64_t kMaxFrameSize = 16ULL << 20;

    /* Constructors/Destructors */
    ChannelFrame() = default;

    /**
     * Builds a frame for a message, the command id follows message.type()
     */
    explicit ChannelFrame(ChannelMessage message);

    /* Public Static Methods */
    static std::optional<cmd_id_t> commandFromType(const std::string &type);
    static const char *typeFromCommand(cmd_id_t command);

    /**
     * Decodes the first frame in data
     * @param consumed Bytes used by the frame when DECODE_OK
     */
    static decode_status decode(std::string_view data, ChannelFrame &frame, size_t &consumed);

    /**
     * Reads one frame from the socket
     * @return 0 on success, negative if the connection dropped, quit was raised or the frame is malformed
     */
    static int receive(const std::atomic<bool> &quit, int socket, ChannelFrame &frame);

    /* Public Methods */
    [[nodiscard]] std::string encode() const;

    /**
     * Sends the frame, one writer at a time
     * @return 0 on success, negative on error
     */
    int transmit(int socket) const;

    const char *commandName() const;
    [[nodiscard]] cmd_id_t command() const { return mCommand; }
    [[nodiscard]] const ChannelMessage &message() const { return mMessage; }

    void dump(std::ostream &os) const;

private:
    static std::mutex sSendMutex;

    cmd_id_t mCommand = CMD_ID_PING;
    ChannelMessage mMessage;
};

#endif // _CHANNEL_FRAME_H_
