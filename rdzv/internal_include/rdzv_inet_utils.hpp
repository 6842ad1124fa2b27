#pragma once

#include <rdzv_inet.h>
#include <cstring>
#include <functional>
#include <string>
#include <sstream>

#ifdef WIN32
#include <winsock2.h>
#include <ws2tcpip.h>
#undef min
#else
#include <arpa/inet.h>
#endif

[[nodiscard]] inline std::string rdzv_inet_to_str(const rdzv_inet_address_t &addr) {
    if (addr.protocol == inetIPv4) {
        std::ostringstream oss;
        oss << static_cast<int>(addr.ipv4.data[0]) << "."
                << static_cast<int>(addr.ipv4.data[1]) << "."
                << static_cast<int>(addr.ipv4.data[2]) << "."
                << static_cast<int>(addr.ipv4.data[3]);
        return oss.str();
    }
    if (addr.protocol == inetIPv6) {
        char ip_str[INET6_ADDRSTRLEN];
        inet_ntop(AF_INET6, &addr.ipv6, ip_str, sizeof(ip_str));
        return ip_str;
    }
    return "Unknown Protocol";
}

[[nodiscard]] inline std::string rdzv_sockaddr_to_str(const rdzv_socket_address_t &addr) {
    if (addr.inet.protocol == inetIPv6) {
        return "[" + rdzv_inet_to_str(addr.inet) + "]:" + std::to_string(addr.port);
    }
    return rdzv_inet_to_str(addr.inet) + ":" + std::to_string(addr.port);
}

/// Hashable, comparable form of @code rdzv_inet_address_t@endcode used as a map key.
struct internal_inet_address_t {
    rdzv_inet_protocol_t protocol;

    rdzv_ipv4_address_t ipv4;
    rdzv_ipv6_address_t ipv6;

    bool operator==(const internal_inet_address_t &rhs) const {
        if (protocol != rhs.protocol) {
            return false;
        }
        if (protocol == inetIPv4) {
            return memcmp(ipv4.data, rhs.ipv4.data, 4) == 0;
        }
        if (protocol == inetIPv6) {
            return memcmp(ipv6.data, rhs.ipv6.data, 16) == 0;
        }
        return false;
    }
};

template<>
struct std::hash<internal_inet_address_t> {
    std::size_t operator()(const internal_inet_address_t &inet_addr) const noexcept {
        std::size_t hash_value = 0;
        hash_value = hash_value * 31 + inet_addr.protocol;
        if (inet_addr.protocol == inetIPv4) {
            for (const auto &byte: inet_addr.ipv4.data) {
                hash_value = hash_value * 31 + byte;
            }
        } else {
            for (const auto &byte: inet_addr.ipv6.data) {
                hash_value = hash_value * 31 + byte;
            }
        }
        return hash_value;
    }
};

struct internal_inet_socket_address_t {
    internal_inet_address_t inet_address;
    uint16_t port;

    bool operator==(const internal_inet_socket_address_t &rhs) const {
        return inet_address == rhs.inet_address && port == rhs.port;
    }
};

template<>
struct std::hash<internal_inet_socket_address_t> {
    std::size_t operator()(const internal_inet_socket_address_t &inet_addr) const noexcept {
        std::size_t hash_value = 0;
        hash_value = hash_value * 31 + std::hash<internal_inet_address_t>{}(inet_addr.inet_address);
        hash_value = hash_value * 31 + inet_addr.port;
        return hash_value;
    }
};

inline internal_inet_address_t rdzv_inet_to_internal(const rdzv_inet_address_t &inet_addr) {
    internal_inet_address_t internal_addr{};
    internal_addr.protocol = inet_addr.protocol;
    if (inet_addr.protocol == inetIPv4) {
        internal_addr.ipv4 = inet_addr.ipv4;
    } else {
        internal_addr.ipv6 = inet_addr.ipv6;
    }
    return internal_addr;
}

inline internal_inet_socket_address_t rdzv_socket_to_internal(const rdzv_socket_address_t &socket_addr) {
    internal_inet_socket_address_t internal_socket{};
    internal_socket.inet_address = rdzv_inet_to_internal(socket_addr.inet);
    internal_socket.port = socket_addr.port;
    return internal_socket;
}

inline rdzv_inet_address_t internal_to_rdzv_inet(const internal_inet_address_t &internal_addr) {
    rdzv_inet_address_t inet_addr{};
    inet_addr.protocol = internal_addr.protocol;
    if (internal_addr.protocol == inetIPv4) {
        inet_addr.ipv4 = internal_addr.ipv4;
    } else {
        inet_addr.ipv6 = internal_addr.ipv6;
    }
    return inet_addr;
}

inline rdzv_socket_address_t internal_to_rdzv_sockaddr(const internal_inet_socket_address_t &internal_socket) {
    rdzv_socket_address_t socket_addr{};
    socket_addr.inet = internal_to_rdzv_inet(internal_socket.inet_address);
    socket_addr.port = internal_socket.port;
    return socket_addr;
}
