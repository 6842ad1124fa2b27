#include "sockaddr_utils.hpp"

#include <cstring>
#ifdef WIN32
#include <winsock2.h>
#include <ws2tcpip.h>
#else
#include <arpa/inet.h>
#include <netinet/in.h>
#endif

int convert_to_sockaddr(const rdzv_socket_address_t &rdzv_addr, sockaddr_storage *sock_addr_out,
                        socklen_t *sock_addr_len_out) {
    *sock_addr_out = {};
    if (rdzv_addr.inet.protocol == inetIPv4) {
        auto *addr_in = reinterpret_cast<sockaddr_in *>(sock_addr_out);
        addr_in->sin_family = AF_INET;
        addr_in->sin_port = htons(rdzv_addr.port);

        // octets are already in network order
        std::memcpy(&addr_in->sin_addr.s_addr, rdzv_addr.inet.ipv4.data, sizeof(rdzv_addr.inet.ipv4.data));
        *sock_addr_len_out = sizeof(sockaddr_in);
        return 0;
    }
    if (rdzv_addr.inet.protocol == inetIPv6) {
        auto *addr_in6 = reinterpret_cast<sockaddr_in6 *>(sock_addr_out);
        addr_in6->sin6_family = AF_INET6;
        addr_in6->sin6_port = htons(rdzv_addr.port);
        std::memcpy(addr_in6->sin6_addr.s6_addr, rdzv_addr.inet.ipv6.data, sizeof(rdzv_addr.inet.ipv6.data));
        *sock_addr_len_out = sizeof(sockaddr_in6);
        return 0;
    }
    return -1; // Unsupported protocol
}

int convert_from_sockaddr(const sockaddr *sock_addr, rdzv_socket_address_t *rdzv_addr) {
    *rdzv_addr = {};
    if (sock_addr->sa_family == AF_INET) {
        const auto *addr_in = reinterpret_cast<const sockaddr_in *>(sock_addr);
        rdzv_addr->inet.protocol = inetIPv4;
        rdzv_addr->port = ntohs(addr_in->sin_port);
        std::memcpy(rdzv_addr->inet.ipv4.data, &addr_in->sin_addr.s_addr, sizeof(rdzv_addr->inet.ipv4.data));
    } else if (sock_addr->sa_family == AF_INET6) {
        const auto *addr_in6 = reinterpret_cast<const sockaddr_in6 *>(sock_addr);
        rdzv_addr->inet.protocol = inetIPv6;
        rdzv_addr->port = ntohs(addr_in6->sin6_port);
        std::memcpy(rdzv_addr->inet.ipv6.data, addr_in6->sin6_addr.s6_addr, sizeof(rdzv_addr->inet.ipv6.data));
    } else [[unlikely]] {
        return -1; // Unsupported protocol
    }
    return 0;
}
