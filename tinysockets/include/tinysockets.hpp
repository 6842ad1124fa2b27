#pragma once

#include <rdzv_inet.h>
#include <rdzv_packet.hpp>
#include <rdzv_log.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <thread>

#ifdef WIN32
typedef long long int ssize_t;
#else
#include <sys/types.h>
#endif

struct uv_server_stream_t;
struct uv_stream_s;
struct uv_buf_t;
struct uv_handle_s;

namespace tinysockets {
    /// Upper bound for the length of a single packet accepted from the wire
    constexpr size_t MAX_PACKET_LENGTH = 64 * 1024 * 1024;

    struct ServerSocketState;

    using ServerSocketReadCallback = std::function<void(const rdzv_socket_address_t &,
                                                        const std::span<std::uint8_t> &)>;
    using ServerSocketJoinCallback = std::function<void(const rdzv_socket_address_t &)>;
    using ServerSocketCloseCallback = std::function<void(const rdzv_socket_address_t &)>;

    /// A task posted to the server thread from another thread
    using ServerSocketTask = std::function<void()>;

    /// Event-loop driven server socket. All callbacks are invoked on the server thread.
    /// Other threads may hand work to the server thread via @code postTask@endcode.
    class ServerSocket final {
        rdzv_socket_address_t listen_address;

        ServerSocketState *server_socket_state;
        std::thread server_thread;

        bool bound = false;
        std::atomic_bool running = false;
        std::atomic_bool interrupted = false;

    public:
        /// binds to the specified socket address
        explicit ServerSocket(const rdzv_socket_address_t &listen_address);

        ServerSocket(const ServerSocket &other) = delete;

        ServerSocket(ServerSocket &&other) = delete;

        ServerSocket &operator=(const ServerSocket &other) = delete;

        ServerSocket &operator=(ServerSocket &&other) = delete;

        /// Returns false if already bound, if listen_address is invalid or if binding fails
        [[nodiscard]] bool listen();

        /// Returns false if not bound or already running
        [[nodiscard]] bool runAsync();

        /// Returns false if not running
        [[nodiscard]] bool interrupt();

        /// Wait for the server thread to exit
        void join();

        /// Add a callback to be called when a complete packet is received from a client
        void addReadCallback(const ServerSocketReadCallback &callback) const;

        /// Add a callback to be called when a client connection is closed
        void addCloseCallback(const ServerSocketCloseCallback &callback) const;

        /// Add a callback to be called when a client joins
        void addJoinCallback(const ServerSocketJoinCallback &callback) const;

        /// Schedules the task to run on the server thread.
        /// Safe to call from any thread.
        /// Returns false if the server is not running or has been interrupted; the task is then discarded.
        [[nodiscard]] bool postTask(ServerSocketTask task) const;

        /// Closes the client connection associated with the given socket address
        /// Returns false if the client connection does not exist or if the server is not running
        [[nodiscard]] bool closeClientConnection(const rdzv_socket_address_t &client_address) const;

        /// Closes all client connections
        [[nodiscard]] bool closeAllClientConnections() const;

        /// Returns the thread ID of the server thread
        [[nodiscard]] std::thread::id getServerThreadId() const;

        /// Returns the port the server is listening on; returns 0 if not listening
        [[nodiscard]] uint16_t getListenPort() const;

        ~ServerSocket();

        // Packet decoding / encoding functions

        /// Decodes a packet of type T from a buffer handed to a read callback.
        /// Returns std::nullopt if the packet id does not match or deserialization fails
        template<typename T> requires std::is_base_of_v<rdzv::Packet, T>
        [[nodiscard]] std::optional<T> receivePacket(PacketReadBuffer &buffer) {
            const rdzv::packetId_t id = T::packet_id;
            return receiveLtvPacket<T>(id, buffer);
        }

        template<typename T> requires std::is_base_of_v<rdzv::Packet, T>
        [[nodiscard]] std::optional<T> receiveLtvPacket(const rdzv::packetId_t packet_id, PacketReadBuffer &buffer) {
            try {
                if (const auto actual_packet_id = buffer.read<rdzv::packetId_t>(); actual_packet_id != packet_id) {
                    LOG(ERR) << "Expected packet ID " << packet_id << " but received " << actual_packet_id;
                    return std::nullopt;
                }
                T packet{};
                if (!packet.deserialize(buffer)) {
                    LOG(ERR) << "Failed to deserialize packet with ID " << packet_id;
                    return std::nullopt;
                }
                return packet;
            } catch (const std::out_of_range &e) {
                LOG(ERR) << "Truncated packet with ID " << packet_id << ": " << e.what();
                return std::nullopt;
            }
        }

        /// Sends a packet to the client associated with the given socket address.
        /// Must be called from the server thread.
        /// Returns false if the server is not running or the client connection does not exist
        template<typename T> requires std::is_base_of_v<rdzv::Packet, T>
        [[nodiscard]] bool sendPacket(const rdzv_socket_address_t &client_address, const T &packet) {
            const rdzv::packetId_t id = T::packet_id;
            PacketWriteBuffer buffer{};
            packet.serialize(buffer);
            return sendLtvPacket(client_address, id, buffer);
        }

        [[nodiscard]] bool sendLtvPacket(const rdzv_socket_address_t &client_address,
                                         const rdzv::packetId_t packet_id,
                                         const PacketWriteBuffer &buffer) {
            PacketWriteBuffer complete_packet{};
            complete_packet.reserve(buffer.size() + sizeof(rdzv::packetId_t) + sizeof(uint64_t));
            complete_packet.write<uint64_t>(buffer.size() + sizeof(rdzv::packetId_t));
            complete_packet.write(packet_id);
            complete_packet.writeContents(buffer.data(), buffer.size());
            return sendRawPacket(client_address, complete_packet);
        }

        [[nodiscard]] bool sendRawPacket(const rdzv_socket_address_t &client_address,
                                         const PacketWriteBuffer &buffer);

    private:
        void onAsyncSignal() const;

        void onTaskSignal() const;

        void onNewConnection(uv_server_stream_t *server, int status);

        void onClientRead(uv_stream_s *stream, ssize_t n_read, const uv_buf_t *buf) const;

        void onClientClose(uv_handle_s *handle) const;

        [[nodiscard]] std::optional<rdzv_socket_address_t> getUvStreamAddressCached(uv_stream_s *stream) const;

        void performLoopShutdown() const;
    };

    /// Blocking client socket speaking the length-type-value packet framing.
    /// Sending and receiving are each serialized by their own mutex.
    class BlockingIOSocket final {
        std::atomic_int socket_fd;
        rdzv_socket_address_t connect_sockaddr;

        std::mutex send_mutex;
        std::mutex recv_mutex;

    public:
        explicit BlockingIOSocket(const rdzv_socket_address_t &address);

        BlockingIOSocket(const BlockingIOSocket &other) = delete;

        BlockingIOSocket(BlockingIOSocket &&other) = delete;

        BlockingIOSocket &operator=(const BlockingIOSocket &other) = delete;

        BlockingIOSocket &operator=(BlockingIOSocket &&other) = delete;

        ~BlockingIOSocket();

        /// Returns false if already connected or if the connection cannot be established
        [[nodiscard]] bool establishConnection();

        /// Closes the socket. Unblocks a concurrent receive on the same socket.
        /// @param allow_data_discard if true, will perform an instant shutdown without lingering
        [[nodiscard]] bool closeConnection(bool allow_data_discard = false);

        [[nodiscard]] bool isOpen();

        [[nodiscard]] const rdzv_socket_address_t &getConnectSockAddr() const;

        template<typename T> requires std::is_base_of_v<rdzv::Packet, T>
        [[nodiscard]] bool sendPacket(const T &packet) {
            std::lock_guard guard{send_mutex};
            const rdzv::packetId_t id = T::packet_id;
            PacketWriteBuffer buffer{};
            packet.serialize(buffer);
            return sendLtvPacket(id, buffer);
        }

        /// Receives a packet of the specified type.
        /// Blocks until the packet arrived; returns std::nullopt if the connection fails or the packet is malformed
        template<typename T> requires std::is_base_of_v<rdzv::Packet, T>
        [[nodiscard]] std::optional<T> receivePacket() {
            std::lock_guard guard{recv_mutex};
            const rdzv::packetId_t id = T::packet_id;
            return receiveLtvPacket<T>(id);
        }

        /// Sends a packet to the connected socket
        [[nodiscard]] bool sendLtvPacket(rdzv::packetId_t packet_id, const PacketWriteBuffer &buffer) const;

        /// Receives exactly n_bytes from the socket and writes them into dst
        [[nodiscard]] ssize_t receiveRawData(std::span<std::byte> &dst, size_t n_bytes) const;

    private:
        [[nodiscard]] std::optional<size_t> receivePacketLength() const;

        template<typename T> requires std::is_base_of_v<rdzv::Packet, T>
        [[nodiscard]] std::optional<T> receiveLtvPacket(const rdzv::packetId_t packet_id) {
            const std::optional<size_t> length_opt = receivePacketLength();
            if (!length_opt) {
                return std::nullopt;
            }
            const size_t length = *length_opt;
            if (length > MAX_PACKET_LENGTH || length < sizeof(rdzv::packetId_t)) {
                LOG(ERR) << "[BlockingIOSocket] Received invalid packet length " << length << "; closing connection";
                if (!closeConnection()) [[unlikely]] {
                    LOG(ERR) << "[BlockingIOSocket] Failed to close connection after invalid packet length";
                }
                return std::nullopt;
            }
            const std::unique_ptr<std::byte[]> data_ptr{new std::byte[length]};
            std::span data{data_ptr.get(), length};
            if (receiveRawData(data, data.size_bytes()) != static_cast<ssize_t>(data.size_bytes())) {
                LOG(ERR) << "[BlockingIOSocket] Failed to receive packet data for packet ID " << packet_id
                        << " with length " << data.size();
                return std::nullopt;
            }
            PacketReadBuffer buffer{reinterpret_cast<const uint8_t *>(data.data()), data.size()};
            try {
                if (const auto actual_packet_id = buffer.read<rdzv::packetId_t>(); actual_packet_id != packet_id) {
                    LOG(ERR) << "[BlockingIOSocket] Expected packet ID " << packet_id << " but received "
                            << actual_packet_id;
                    return std::nullopt;
                }
                T packet{};
                if (!packet.deserialize(buffer)) {
                    LOG(ERR) << "[BlockingIOSocket] Failed to deserialize packet with ID " << packet_id;
                    return std::nullopt;
                }
                return packet;
            } catch (const std::out_of_range &e) {
                LOG(ERR) << "[BlockingIOSocket] Truncated packet with ID " << packet_id << ": " << e.what();
                return std::nullopt;
            }
        }
    };
};
