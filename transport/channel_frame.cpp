// *****************************************************************************
// Channel Frame Implementation
// *****************************************************************************

// Section 1: Main Header
#include "channel_frame.h"

// Section 2: Includes
// C++ Standard Library
#include <iostream>

// Third-Party Includes
#include "termcolor/termcolor.hpp"

// Project Includes
#include "human_readable.h"
#include "transport/socket_helpers.h"

// Section 3: Defines and Macros
constexpr int BITS_PER_BYTE = 8;

// Section 4: Static Variables
std::mutex ChannelFrame::sSendMutex;

// Section 5: Static Helpers
namespace
{
    void writeSize(std::string &out, uint64_t value)
    {
        for (size_t i = 0; i < ChannelFrame::kSizeSize; ++i)
            out += static_cast<char>((value >> (i * BITS_PER_BYTE)) & 0xFF);
    }

    uint64_t readSize(std::string_view data)
    {
        uint64_t value = 0;
        for (size_t i = 0; i < ChannelFrame::kSizeSize; ++i)
            value |= static_cast<uint64_t>(static_cast<uint8_t>(data[i])) << (i * BITS_PER_BYTE);
        return value;
    }
}

// Section 6: Constructors/Destructors
ChannelFrame::ChannelFrame(ChannelMessage message) :
    mCommand(commandFromType(message.type()).value_or(CMD_ID_PING)),
    mMessage(std::move(message))
{
    mMessage.set_type(typeFromCommand(mCommand));
}

// Section 7: Static Methods
std::optional<ChannelFrame::cmd_id_t> ChannelFrame::commandFromType(const std::string &type)
{
    if (type == "sync:changes") return CMD_ID_SYNC_CHANGES;
    if (type == "sync:conflict") return CMD_ID_SYNC_CONFLICT;
    if (type == "sync:progress") return CMD_ID_SYNC_PROGRESS;
    if (type == "ping") return CMD_ID_PING;
    if (type == "pong") return CMD_ID_PONG;
    return std::nullopt;
}

const char *ChannelFrame::typeFromCommand(cmd_id_t command)
{
    switch (command) {
        case CMD_ID_SYNC_CHANGES: return "sync:changes";
        case CMD_ID_SYNC_CONFLICT: return "sync:conflict";
        case CMD_ID_SYNC_PROGRESS: return "sync:progress";
        case CMD_ID_PING: return "ping";
        case CMD_ID_PONG: return "pong";
        default: return "unknown";
    }
}

ChannelFrame::decode_status ChannelFrame::decode(std::string_view data, ChannelFrame &frame, size_t &consumed)
{
    consumed = 0;
    if (data.size() < kPayloadIndex)
        return DECODE_NEED_MORE;

    const uint64_t size = readSize(data);
    if (size < kPayloadIndex || size > kMaxFrameSize)
        return DECODE_BAD_SIZE;
    if (data.size() < size)
        return DECODE_NEED_MORE;

    const auto command = static_cast<uint8_t>(data[kCmdIndex]);
    if (command >= CMD_ID_COUNT)
        return DECODE_BAD_COMMAND;

    ChannelMessage message;
    const auto payload = data.substr(kPayloadIndex, size - kPayloadIndex);
    if (!message.ParseFromArray(payload.data(), static_cast<int>(payload.size())))
        return DECODE_BAD_PAYLOAD;

    frame.mCommand = static_cast<cmd_id_t>(command);
    frame.mMessage = std::move(message);
    frame.mMessage.set_type(typeFromCommand(frame.mCommand));
    consumed = size;
    return DECODE_OK;
}

int ChannelFrame::receive(const std::atomic<bool> &quit, int socket, ChannelFrame &frame)
{
    std::string header(kPayloadIndex, '\0');
    if (SocketHelpers::recv_bytes(quit, socket, header.data(), header.size()) != 0)
        return -1;

    const uint64_t size = readSize(header);
    if (size < kPayloadIndex || size > kMaxFrameSize) {
        std::cout << termcolor::red << "Received frame with invalid size " << size << "\r\n" << termcolor::reset;
        return -1;
    }

    std::string data = header;
    data.resize(size);
    if (size > kPayloadIndex &&
        SocketHelpers::recv_bytes(quit, socket, data.data() + kPayloadIndex, size - kPayloadIndex) != 0)
        return -1;

    size_t consumed = 0;
    const decode_status status = decode(data, frame, consumed);
    if (status != DECODE_OK) {
        std::cout << termcolor::red << "Received malformed frame (" << static_cast<int>(status) << ")" << "\r\n" << termcolor::reset;
        return -1;
    }
    return 0;
}

// Section 8: Public Methods
std::string ChannelFrame::encode() const
{
    std::string payload;
    mMessage.SerializeToString(&payload);

    std::string out;
    out.reserve(kPayloadIndex + payload.size());
    writeSize(out, kPayloadIndex + payload.size());
    out += static_cast<char>(mCommand);
    out += payload;
    return out;
}

int ChannelFrame::transmit(int socket) const
{
    const std::string data = encode();
    std::lock_guard<std::mutex> lock(sSendMutex);
    return SocketHelpers::send_all(socket, data);
}

const char *ChannelFrame::commandName() const
{
    return typeFromCommand(mCommand);
}

void ChannelFrame::dump(std::ostream &os) const
{
    os << termcolor::cyan << "Frame " << commandName() << " (" << HumanReadable(kPayloadIndex + mMessage.ByteSizeLong()) << ")";
    if (mMessage.changes_size() > 0)
        os << ", " << mMessage.changes_size() << " changes";
    if (mMessage.has_conflict())
        os << ", conflict on " << mMessage.conflict().path();
    if (!mMessage.phase().empty())
        os << ", " << mMessage.phase() << " " << mMessage.current() << "/" << mMessage.total();
    os << "\r\n" << termcolor::reset;
}
