#include "tinysockets.hpp"

#include <rdzv_inet_utils.hpp>
#include <rdzv_log.hpp>
#include <sockaddr_utils.hpp>

#include "win_sock_bridge.h"
#include <cerrno>
#include <cstring> // for std::strerror

static bool configure_socket_fd(const int socket_fd) {
    constexpr int opt = 1;

    // enable TCP_NODELAY
    if (setsockoptvp(socket_fd, IPPROTO_TCP, TCP_NODELAY, &opt, sizeof(opt)) < 0) [[unlikely]] {
        LOG(ERR) << "Failed to set TCP_NODELAY option on client socket";
        return false;
    }
    return true;
}

tinysockets::BlockingIOSocket::BlockingIOSocket(const rdzv_socket_address_t &address) : socket_fd(-1),
    connect_sockaddr(address) {
}

tinysockets::BlockingIOSocket::~BlockingIOSocket() {
    if (socket_fd >= 0) {
        if (!closeConnection(true)) [[unlikely]] {
            LOG(ERR) << "[BlockingIOSocket] Failed to close connection from destructor";
        }
    }
}

bool tinysockets::BlockingIOSocket::establishConnection() {
    if (socket_fd >= 0) {
        return false;
    }

    sockaddr_storage server_address{};
    socklen_t server_address_len{};
    if (convert_to_sockaddr(connect_sockaddr, &server_address, &server_address_len) != 0) [[unlikely]] {
        LOG(ERR) << "Unsupported protocol";
        return false;
    }

    const int fd = socket(server_address.ss_family, SOCK_STREAM, 0);
    if (fd < 0) [[unlikely]] {
        const std::string error_message = std::strerror(errno);
        LOG(ERR) << "Failed to create socket: " << error_message;
        return false;
    }

    if (!configure_socket_fd(fd)) [[unlikely]] {
        closesocket(fd);
        return false;
    }

    if (connect(fd, reinterpret_cast<const sockaddr *>(&server_address), server_address_len) < 0) {
        const std::string error_message = std::strerror(errno);
        LOG(ERR) << "Failed to connect to " << rdzv_sockaddr_to_str(connect_sockaddr) << "; connect() failed with "
                << error_message;
        closesocket(fd);
        return false;
    }
    socket_fd = fd;
    return true;
}

bool tinysockets::BlockingIOSocket::closeConnection(const bool allow_data_discard) {
    const int fd = socket_fd.exchange(-1);
    if (fd < 0) {
        return false;
    }

    linger l{};
    l.l_onoff = 1;
    if (!allow_data_discard) {
        // linger on close to ensure all data is sent and at least acked by the peer's kernel
        l.l_linger = 5;
    } else {
        // set SO_LINGER to 0 to force a hard close
        l.l_linger = 0;
    }
    setsockoptvp(fd, SOL_SOCKET, SO_LINGER, &l, sizeof(l));

    // shut down both directions first so that a concurrent recv() unblocks and returns an error
    shutdown(fd, SHUT_RDWR);
    closesocket(fd);
    return true;
}

bool tinysockets::BlockingIOSocket::isOpen() {
    if (socket_fd < 0) [[unlikely]] {
        return false;
    }
    std::lock_guard guard{recv_mutex};
    const int fd = socket_fd;
    if (fd < 0) {
        return false;
    }
#ifndef WIN32
    // Using MSG_PEEK with a small read: if it returns 0, the connection is closed.
    char buf;
    const ssize_t n = recv(fd, &buf, 1, MSG_PEEK | MSG_DONTWAIT);
    if (n == 0) {
        return false;
    }
    if (n < 0) {
        // No data available, but socket may still be connected
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }
    return true;
#else
    u_long mode = 1;
    if (ioctlsocket(fd, FIONBIO, &mode) != NO_ERROR) {
        return false;
    }
    bool is_open = false;
    char buf;
    if (const int n = recv(fd, &buf, 1, MSG_PEEK); n == 0) {
        is_open = false;
    } else if (n == SOCKET_ERROR) {
        is_open = WSAGetLastError() == WSAEWOULDBLOCK;
    } else {
        is_open = true;
    }
    mode = 0;
    if (ioctlsocket(fd, FIONBIO, &mode) != NO_ERROR) {
        return false;
    }
    return is_open;
#endif
}

const rdzv_socket_address_t &tinysockets::BlockingIOSocket::getConnectSockAddr() const {
    return connect_sockaddr;
}

bool tinysockets::BlockingIOSocket::sendLtvPacket(const rdzv::packetId_t packet_id,
                                                  const PacketWriteBuffer &buffer) const {
    const int fd = socket_fd;
    if (fd < 0) {
        return false;
    }
    PacketWriteBuffer tlv_buffer{};
    tlv_buffer.reserve(buffer.size() + sizeof(packet_id) + sizeof(uint64_t));
    tlv_buffer.write<uint64_t>(buffer.size() + sizeof(rdzv::packetId_t));
    tlv_buffer.write(packet_id);
    tlv_buffer.writeContents(buffer.data(), buffer.size());

    size_t bytes_sent = 0;
    while (bytes_sent < tlv_buffer.size()) {
        const ssize_t bytes_sent_now = sendvp(fd, tlv_buffer.data() + bytes_sent,
                                              tlv_buffer.size() - bytes_sent, MSG_NOSIGNAL);
        if (bytes_sent_now < 0) {
            if (errno == EINTR) {
                continue;
            }
            const std::string error_message = std::strerror(errno);
            LOG(WARN) << "[BlockingIOSocket] Failed to send packet with error: " << error_message;
            return false;
        }
        bytes_sent += static_cast<size_t>(bytes_sent_now);
    }
    return true;
}

std::optional<size_t> tinysockets::BlockingIOSocket::receivePacketLength() const {
    std::byte length_bytes[sizeof(uint64_t)]{};
    std::span<std::byte> length_span{length_bytes};
    if (receiveRawData(length_span, length_span.size_bytes()) != static_cast<ssize_t>(sizeof(uint64_t))) {
        return std::nullopt;
    }
    PacketReadBuffer buffer{reinterpret_cast<const uint8_t *>(length_bytes), sizeof(length_bytes)};
    return static_cast<size_t>(buffer.read<uint64_t>());
}

ssize_t tinysockets::BlockingIOSocket::receiveRawData(std::span<std::byte> &dst, const size_t n_bytes) const {
    // check if dst has enough space for n_bytes
    if (dst.size_bytes() < n_bytes) {
        LOG(BUG) << "Insufficient buffer size provided to receiveRawData!";
        return -1;
    }
    const int fd = socket_fd;
    if (fd < 0) {
        return -1;
    }
    size_t n_received = 0;
    while (n_received < n_bytes) {
        const ssize_t i = recvvp(fd, dst.data() + n_received, n_bytes - n_received, 0);
        if (i == 0) {
            // EOF
            LOG(DEBUG) << "[BlockingIOSocket] Connection to " << rdzv_sockaddr_to_str(connect_sockaddr)
                    << " closed by peer";
            return -1;
        }
        if (i < 0) {
            if (errno == EINTR) {
                continue;
            }
            const std::string error_message = std::strerror(errno);
            LOG(WARN) << "[BlockingIOSocket] Failed to receive packet data with error: " << error_message;
            return -1;
        }
        n_received += static_cast<size_t>(i);
    }
    return static_cast<ssize_t>(n_received);
}
