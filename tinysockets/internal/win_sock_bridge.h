#ifndef SOCKET_BRIDGE_H
#define SOCKET_BRIDGE_H

#ifdef WIN32
#define WIN32_LEAN_AND_MEAN
#include <winsock2.h>
#include <ws2tcpip.h>
#undef min
#undef max
#else
#include <unistd.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#endif

#include <cstddef>

#ifdef WIN32

#define MSG_NOSIGNAL 0
#define SHUT_RDWR SD_BOTH

typedef long long int ssize_t;

inline int setsockoptvp(const int socket_fd, const int level, const int optname, const void *optval,
                        const socklen_t optlen) {
    return setsockopt(socket_fd, level, optname, static_cast<const char *>(optval), optlen);
}

inline ssize_t recvvp(const int socket_fd, void *buffer, const size_t length, const int flags) {
    return recv(socket_fd, static_cast<char *>(buffer), static_cast<int>(length), flags);
}

inline ssize_t sendvp(const int socket_fd, const void *buffer, const size_t length, const int flags) {
    return send(socket_fd, static_cast<const char *>(buffer), static_cast<int>(length), flags);
}
#else

inline void closesocket(const int socket_fd) {
    close(socket_fd);
}

inline int setsockoptvp(const int socket_fd, const int level, const int optname, const void *optval,
                        const socklen_t optlen) {
    return setsockopt(socket_fd, level, optname, optval, optlen);
}

inline ssize_t recvvp(const int socket_fd, void *buffer, const size_t length, const int flags) {
    return recv(socket_fd, buffer, length, flags);
}

inline ssize_t sendvp(const int socket_fd, const void *buffer, const size_t length, const int flags) {
    return send(socket_fd, buffer, length, flags);
}

#endif
#endif //SOCKET_BRIDGE_H
