#ifndef _SOCKET_HELPERS_H_
#define _SOCKET_HELPERS_H_

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace SocketHelpers
{
    enum status_code : std::uint8_t
    {
        BYTES_RECEIVED = 0,
        RECV_FAILED,
        RECV_TIMEOUT,
        CONN_CLOSED,
        SELECT_ERROR,
    };

    /**
     * Resolves host and connects with a deadline
     * @param fd Receives the connected socket
     * @return 0 on success, negative on resolution/connect failure or timeout
     */
    int connect_timeout(const std::string &host, uint16_t port, int timeout_ms, int &fd);

    /**
     * Receives exactly size bytes, polling quit between short waits
     * @return 0 on success, negative if the connection closed or failed, or quit was raised
     */
    int recv_bytes(const std::atomic<bool> &quit, int socket, void *buffer, size_t size);

    status_code recv_timeout(int sockfd, void* buffer, size_t &length, int timeout_ms);

    /**
     * Sends the whole buffer
     * @return 0 on success, negative on error
     */
    int send_all(int socket, std::string_view data);

    /**
     * SO_RCVTIMEO and SO_SNDTIMEO
     */
    int set_timeouts(int socket, int timeout_ms);
};


#endif  //_SOCKET_HELPERS_H_
