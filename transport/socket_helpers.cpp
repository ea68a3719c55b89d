#include "socket_helpers.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <unistd.h>

constexpr int MILLISECONDS_IN_SECOND = 1000;
constexpr int RECV_TIMEOUT_MS = 10;

int SocketHelpers::connect_timeout(const std::string &host, uint16_t port, int timeout_ms, int &fd)
{
    fd = -1;
    struct addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo *result = nullptr;
    const std::string service = std::to_string(port);
    if (getaddrinfo(host.c_str(), service.c_str(), &hints, &result) != 0 || result == nullptr)
        return -1;

    int ret = -1;
    for (struct addrinfo *addr = result; addr != nullptr && ret != 0; addr = addr->ai_next)
    {
        int sock = socket(addr->ai_family, addr->ai_socktype | SOCK_CLOEXEC, addr->ai_protocol);
        if (sock < 0)
            continue;

        const int flags = fcntl(sock, F_GETFL, 0);
        fcntl(sock, F_SETFL, flags | O_NONBLOCK);

        int status = connect(sock, addr->ai_addr, addr->ai_addrlen);
        if (status < 0 && errno == EINPROGRESS)
        {
            struct pollfd pfd{sock, POLLOUT, 0};
            status = poll(&pfd, 1, timeout_ms) == 1 ? 0 : -1;
            if (status == 0)
            {
                int soError = 0;
                socklen_t len = sizeof(soError);
                getsockopt(sock, SOL_SOCKET, SO_ERROR, &soError, &len);
                status = soError == 0 ? 0 : -1;
            }
        }

        if (status == 0)
        {
            fcntl(sock, F_SETFL, flags);
            fd = sock;
            ret = 0;
        }
        else
        {
            close(sock);
        }
    }

    freeaddrinfo(result);
    return ret;
}

int SocketHelpers::recv_bytes(const std::atomic<bool> &quit, int socket, void *buffer, size_t size)
{
    auto *wptr = static_cast<uint8_t *>(buffer);
    size_t received = 0;
    while (received < size)
    {
        if (quit)
            return -1;

        size_t length = size - received;
        status_code status = recv_timeout(socket, wptr + received, length, RECV_TIMEOUT_MS);
        received += length;

        if (status == RECV_FAILED || status == SELECT_ERROR || status == CONN_CLOSED)
            return -1;
    }
    return 0;
}

SocketHelpers::status_code SocketHelpers::recv_timeout(int sockfd, void* buffer, size_t &length, int timeout_ms)
{
    fd_set readfds;
    struct timeval timeval;

    FD_ZERO(&readfds);
    FD_SET(sockfd, &readfds);
    timeval.tv_sec = timeout_ms / MILLISECONDS_IN_SECOND;
    timeval.tv_usec = (timeout_ms % MILLISECONDS_IN_SECOND) * MILLISECONDS_IN_SECOND;

    int ret = select(sockfd + 1, &readfds, nullptr, nullptr, &timeval);

    if (ret > 0 && FD_ISSET(sockfd, &readfds))
    {
        ssize_t bytes_received = recv(sockfd, buffer, length, 0);
        length = 0;
        if (bytes_received > 0)
        {
            length = bytes_received;
            return BYTES_RECEIVED;
        }
        if (bytes_received == 0)
            return CONN_CLOSED;
        return RECV_FAILED;
    }
    length = 0;
    if (ret == 0 || (ret < 0 && errno == EINTR))
        return RECV_TIMEOUT;
    return SELECT_ERROR;
}

int SocketHelpers::send_all(int socket, std::string_view data)
{
    size_t sent = 0;
    while (sent < data.size())
    {
        ssize_t num = send(socket, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (num < 0)
        {
            if (errno == EINTR)
                continue;
            return -1;
        }
        sent += static_cast<size_t>(num);
    }
    return 0;
}

int SocketHelpers::set_timeouts(int socket, int timeout_ms)
{
    struct timeval timeval;
    timeval.tv_sec = timeout_ms / MILLISECONDS_IN_SECOND;
    timeval.tv_usec = (timeout_ms % MILLISECONDS_IN_SECOND) * MILLISECONDS_IN_SECOND;
    if (setsockopt(socket, SOL_SOCKET, SO_RCVTIMEO, &timeval, sizeof(timeval)) != 0)
        return -1;
    if (setsockopt(socket, SOL_SOCKET, SO_SNDTIMEO, &timeval, sizeof(timeval)) != 0)
        return -1;
    return 0;
}
