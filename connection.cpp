#include "connection.hpp"
#include <cstring>
#include <memory>
#include <unistd.h>
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include "errors.hpp"
#include "network_utils.hpp"

namespace
{

int remaining_ms(std::chrono::steady_clock::time_point deadline)
{
    auto left = std::chrono::duration_cast<std::chrono::microseconds>(
        deadline - std::chrono::steady_clock::now());
    if (left.count() <= 0)
        return 0;
    return static_cast<int>((left.count() + 999) / 1000);
}

// Returns 0 once connected, otherwise the errno describing the failure.
int connect_before(int fd, const sockaddr *addr, socklen_t addr_len,
                   std::chrono::steady_clock::time_point deadline)
{
    if (connect(fd, addr, addr_len) == 0)
        return 0;
    if (errno != EINPROGRESS)
        return errno;

    for (;;)
    {
        int wait_ms = remaining_ms(deadline);
        if (wait_ms == 0)
            return ETIMEDOUT;

        pollfd pfd{fd, POLLOUT, 0};
        int ret = poll(&pfd, 1, wait_ms);
        if (ret == 0)
            return ETIMEDOUT;
        if (ret < 0)
        {
            if (errno == EINTR)
                continue;
            return errno;
        }
        break;
    }

    int so_error = 0;
    socklen_t len = sizeof(so_error);
    if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0)
        return errno;
    return so_error;
}

int dial(const std::string &host, uint16_t port, int timeout_ms)
{
    std::string target = format_host_port(host, port);

    addrinfo hints;
    memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo *result = nullptr;
    std::string service = std::to_string(port);
    int rc = getaddrinfo(host.c_str(), service.c_str(), &hints, &result);
    if (rc != 0)
    {
        throw TunnelError(ErrorCode::IOError, "dial " + target + ": " + gai_strerror(rc));
    }
    std::unique_ptr<addrinfo, decltype(&freeaddrinfo)> addresses(result, freeaddrinfo);

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    int last_error = EADDRNOTAVAIL;

    for (addrinfo *ai = addresses.get(); ai != nullptr; ai = ai->ai_next)
    {
        int fd = socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
        if (fd < 0)
        {
            last_error = errno;
            continue;
        }

        int flags = fcntl(fd, F_GETFL, 0);
        if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0)
        {
            last_error = errno;
            ::close(fd);
            continue;
        }

        last_error = connect_before(fd, ai->ai_addr, ai->ai_addrlen, deadline);
        if (last_error != 0)
        {
            ::close(fd);
            if (last_error == ETIMEDOUT)
                break;
            continue;
        }

        if (fcntl(fd, F_SETFL, flags) < 0)
        {
            last_error = errno;
            ::close(fd);
            continue;
        }

        int flag = 1;
        setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag));
        setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &flag, sizeof(flag));
        return fd;
    }

    if (last_error == ETIMEDOUT)
    {
        throw TunnelError(ErrorCode::TimedOut, "dial " + target + ": connection timed out");
    }
    throw TunnelError(ErrorCode::IOError, "dial " + target + ": " + strerror(last_error));
}

} // namespace

Connection::Connection(const std::string &host, uint16_t port, int timeout_ms)
    : sockfd(dial(host, port, timeout_ms))
{
}

Connection::Connection(int fd) : sockfd(fd)
{
}

Connection::~Connection()
{
    if (sockfd >= 0)
    {
        ::close(sockfd);
    }
}

void Connection::set_read_deadline(int timeout_ms)
{
    has_read_deadline = true;
    read_deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
}

void Connection::set_write_deadline(int timeout_ms)
{
    has_write_deadline = true;
    write_deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
}

void Connection::clear_read_deadline()
{
    has_read_deadline = false;
}

void Connection::clear_deadlines()
{
    has_read_deadline = false;
    has_write_deadline = false;
}

void Connection::wait_ready(short events, std::chrono::steady_clock::time_point deadline, const char *what)
{
    for (;;)
    {
        int wait_ms = remaining_ms(deadline);
        if (wait_ms == 0)
            break;

        pollfd pfd{sockfd, events, 0};
        int ret = poll(&pfd, 1, wait_ms);
        if (ret > 0)
            return;
        if (ret == 0)
            break;
        if (errno != EINTR)
            throw TunnelError(ErrorCode::IOError, errno_message("poll"));
    }
    throw TunnelError(ErrorCode::TimedOut, std::string(what) + " timed out");
}

ssize_t Connection::recv_data(uint8_t *buffer, size_t max_len)
{
    for (;;)
    {
        if (has_read_deadline)
            wait_ready(POLLIN, read_deadline, "read");

        ssize_t len = recv(sockfd, buffer, max_len, 0);
        if (len >= 0)
            return len;
        if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK)
            continue;
        throw TunnelError(ErrorCode::IOError, errno_message("recv"));
    }
}

void Connection::send_all(const uint8_t *data, size_t len)
{
    size_t sent = 0;
    while (sent < len)
    {
        int flags = MSG_NOSIGNAL;
        if (has_write_deadline)
        {
            wait_ready(POLLOUT, write_deadline, "write");
            flags |= MSG_DONTWAIT;
        }

        ssize_t n = send(sockfd, data + sent, len - sent, flags);
        if (n < 0)
        {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK)
                continue;
            throw TunnelError(ErrorCode::IOError, errno_message("send"));
        }
        sent += static_cast<size_t>(n);
    }
}

bool Connection::close()
{
    if (closed.exchange(true))
        return true;
    if (::shutdown(sockfd, SHUT_RDWR) < 0 && errno != ENOTCONN)
        return false;
    return true;
}
