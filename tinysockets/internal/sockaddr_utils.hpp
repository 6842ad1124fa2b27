#pragma once

#include <rdzv_inet.h>

#ifdef WIN32
#include <winsock2.h>
#include <ws2tcpip.h>
#else
#include <netinet/in.h>
#include <sys/socket.h>
#endif

/// Converts an rdzv socket address into a native sockaddr of the matching family.
/// @param sock_addr_out storage receiving either a sockaddr_in or a sockaddr_in6
/// @param sock_addr_len_out populated with the size of the written sockaddr
/// @return 0 on success, -1 if the protocol is unsupported
int convert_to_sockaddr(const rdzv_socket_address_t &rdzv_addr, sockaddr_storage *sock_addr_out,
                        socklen_t *sock_addr_len_out);

/// @return 0 on success, -1 if the address family is unsupported
int convert_from_sockaddr(const sockaddr *sock_addr, rdzv_socket_address_t *rdzv_addr);
