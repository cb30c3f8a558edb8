#ifndef NETWORK_UTILS_HPP
#define NETWORK_UTILS_HPP

#include <string>
#include <cstring>
#include <cerrno>
#include <arpa/inet.h>
#include <sys/socket.h>

// Detect if an address string is IPv6
inline bool is_ipv6(const std::string &addr)
{
    struct in6_addr result;
    return inet_pton(AF_INET6, addr.c_str(), &result) == 1;
}

// "host:port", with IPv6 literals bracketed
inline std::string format_host_port(const std::string &host, int port)
{
    if (is_ipv6(host))
        return "[" + host + "]:" + std::to_string(port);
    return host + ":" + std::to_string(port);
}

inline std::string errno_message(const char *what, int err = errno)
{
    return std::string(what) + ": " + strerror(err);
}

#endif
