#include <rdzv_inet_utils.hpp>

#include <uv.h>
#include "tinysockets.hpp"

#include <cstdlib>
#include <cstring>
#include <deque>
#include <unordered_map>
#include <vector>

#include "sockaddr_utils.hpp"

static bool uv_err_check(const int status, const char *operation) {
    if (status < 0) [[unlikely]] {
        LOG(ERR) << "[ServerSocket] " << operation << " failed: " << uv_strerror(status);
        return false;
    }
    return true;
}

#define UV_ERR_CHECK(status, operation) uv_err_check(status, operation)

namespace tinysockets {
    struct RecvBuffer {
        /// The expected length of the packet; empty while waiting for the length field
        std::optional<uint64_t> expected_length{};

        /// Bytes of the length field received so far
        std::vector<uint8_t> length_bytes{};

        /// The current buffer
        std::vector<uint8_t> buffer{};
    };

    struct ServerSocketState {
        std::unique_ptr<uv_loop_s> loop;
        std::unique_ptr<uv_tcp_s> tcp_server;

        /// Signals the loop to shut down
        std::unique_ptr<uv_async_s> async_handle;

        /// Signals the loop that tasks have been posted
        std::unique_ptr<uv_async_s> task_handle;

        /// Maps the client socket addresses to the respective uv stream
        std::unordered_map<internal_inet_socket_address_t, uv_stream_s *> sockaddr_to_uvstream{};
        /// Maps the uv stream to the respective client socket addresses
        std::unordered_map<uv_handle_t *, internal_inet_socket_address_t> uvstream_to_sockaddr{};

        /// List of callbacks invoked on client read
        std::vector<ServerSocketReadCallback> read_callbacks{};

        /// List of callbacks invoked on client close
        std::vector<ServerSocketCloseCallback> close_callbacks{};

        /// List of callbacks invoked on client join
        std::vector<ServerSocketJoinCallback> join_callbacks{};

        /// Maps client socket addresses to the respective packet buffers.
        /// Every packet starts with a 64-bit length field; received data is
        /// concatenated until the expected length is reached.
        std::unordered_map<internal_inet_socket_address_t, RecvBuffer> current_recv_buffers{};

        /// Guards pending_tasks and accepting_tasks
        std::mutex task_mutex{};

        /// Tasks posted from other threads waiting to be run on the server thread
        std::deque<ServerSocketTask> pending_tasks{};

        /// False once the task handle is closed; uv_async_send must not be called afterward
        bool accepting_tasks = false;
    };
}

tinysockets::ServerSocket::ServerSocket(const rdzv_socket_address_t &listen_address)
    : listen_address(listen_address),
      server_socket_state(new ServerSocketState{}) {
}

bool tinysockets::ServerSocket::listen() {
    if (bound) {
        return false;
    }
    if (listen_address.port == 0) {
        return false;
    }

    sockaddr_storage sock_addr{};
    socklen_t sock_addr_len{};
    if (convert_to_sockaddr(listen_address, &sock_addr, &sock_addr_len) != 0) {
        return false;
    }

    server_socket_state->loop = std::make_unique<uv_loop_t>();
    if (!UV_ERR_CHECK(uv_loop_init(server_socket_state->loop.get()), "uv_loop_init")) {
        server_socket_state->loop = nullptr;
        return false;
    }

    server_socket_state->tcp_server = std::make_unique<uv_tcp_t>();
    server_socket_state->tcp_server->data = this;
    if (!UV_ERR_CHECK(uv_tcp_init(server_socket_state->loop.get(), server_socket_state->tcp_server.get()),
                      "uv_tcp_init")) {
        server_socket_state->tcp_server = nullptr;
        performLoopShutdown();
        return false;
    }

    // on windows, bind already fails; on linux, listen is where it fails
    if (uv_tcp_bind(server_socket_state->tcp_server.get(), reinterpret_cast<const sockaddr *>(&sock_addr), 0) != 0 ||
        uv_listen(reinterpret_cast<uv_stream_t *>(server_socket_state->tcp_server.get()), 128,
                  [](uv_stream_t *server, const int status) {
                      auto *this_ptr = static_cast<ServerSocket *>(server->data);
                      this_ptr->onNewConnection(reinterpret_cast<uv_server_stream_t *>(server), status);
                  }) != 0) {
        LOG(ERR) << "[ServerSocket] Failed to bind to " << rdzv_sockaddr_to_str(listen_address);
        performLoopShutdown();
        return false;
    }

    server_socket_state->async_handle = std::make_unique<uv_async_t>();
    server_socket_state->async_handle->data = this;
    if (!UV_ERR_CHECK(uv_async_init(server_socket_state->loop.get(), server_socket_state->async_handle.get(),
                          [](uv_async_t *handle) {
                          const auto *this_ptr = static_cast<ServerSocket *>(handle->data);
                          this_ptr->onAsyncSignal();
                          }), "uv_async_init")) {
        server_socket_state->async_handle = nullptr;
        performLoopShutdown();
        return false;
    }

    server_socket_state->task_handle = std::make_unique<uv_async_t>();
    server_socket_state->task_handle->data = this;
    if (!UV_ERR_CHECK(uv_async_init(server_socket_state->loop.get(), server_socket_state->task_handle.get(),
                          [](uv_async_t *handle) {
                          const auto *this_ptr = static_cast<ServerSocket *>(handle->data);
                          this_ptr->onTaskSignal();
                          }), "uv_async_init")) {
        server_socket_state->task_handle = nullptr;
        performLoopShutdown();
        return false;
    }
    {
        std::lock_guard guard{server_socket_state->task_mutex};
        server_socket_state->accepting_tasks = true;
    }

    bound = true;
    return true;
}

bool tinysockets::ServerSocket::runAsync() {
    if (!bound || running) {
        return false;
    }
    running = true;
    server_thread = std::thread([this] {
        if (!UV_ERR_CHECK(uv_run(server_socket_state->loop.get(), UV_RUN_DEFAULT), "uv_run")) {
            LOG(ERR) << "[ServerSocket] Event loop terminated abnormally";
        }
        performLoopShutdown();
    });
    return true;
}

bool tinysockets::ServerSocket::interrupt() {
    if (!running) {
        return false;
    }
    if (interrupted.exchange(true)) {
        return true;
    }
    uv_async_send(server_socket_state->async_handle.get());
    return true;
}

void tinysockets::ServerSocket::join() {
    if (server_thread.joinable()) {
        server_thread.join();
    }
}

void tinysockets::ServerSocket::addReadCallback(const ServerSocketReadCallback &callback) const {
    server_socket_state->read_callbacks.push_back(callback);
}

void tinysockets::ServerSocket::addCloseCallback(const ServerSocketCloseCallback &callback) const {
    server_socket_state->close_callbacks.push_back(callback);
}

void tinysockets::ServerSocket::addJoinCallback(const ServerSocketJoinCallback &callback) const {
    server_socket_state->join_callbacks.push_back(callback);
}

bool tinysockets::ServerSocket::postTask(ServerSocketTask task) const {
    if (!running || interrupted) {
        return false;
    }
    std::lock_guard guard{server_socket_state->task_mutex};
    if (!server_socket_state->accepting_tasks) {
        return false;
    }
    server_socket_state->pending_tasks.push_back(std::move(task));
    uv_async_send(server_socket_state->task_handle.get());
    return true;
}

bool tinysockets::ServerSocket::closeClientConnection(const rdzv_socket_address_t &client_address) const {
    if (!running) {
        return false;
    }
    const auto inet_internal = rdzv_socket_to_internal(client_address);
    if (const auto it = server_socket_state->sockaddr_to_uvstream.find(inet_internal);
        it != server_socket_state->sockaddr_to_uvstream.end()) {
        if (!uv_is_closing(reinterpret_cast<uv_handle_t *>(it->second))) {
            uv_close(reinterpret_cast<uv_handle_t *>(it->second), [](uv_handle_t *handle) {
                const auto *this_ptr = static_cast<ServerSocket *>(handle->data);
                this_ptr->onClientClose(handle);
            });
        }
        return true;
    }
    return false;
}

struct write_req_t {
    uv_write_t req;
    uv_buf_t buf;
};

bool tinysockets::ServerSocket::sendRawPacket(const rdzv_socket_address_t &client_address,
                                              const PacketWriteBuffer &buffer) {
    if (!running) {
        return false;
    }
    if (interrupted) {
        return false;
    }

    const auto inet_internal = rdzv_socket_to_internal(client_address);
    const auto it = server_socket_state->sockaddr_to_uvstream.find(inet_internal);
    if (it == server_socket_state->sockaddr_to_uvstream.end()) {
        return false;
    }
    if (uv_is_closing(reinterpret_cast<uv_handle_t *>(it->second))) {
        return false;
    }

    auto *wr = new write_req_t;
    wr->buf = uv_buf_init(static_cast<char *>(std::malloc(buffer.size())), static_cast<unsigned int>(buffer.size()));
    std::memcpy(wr->buf.base, buffer.data(), buffer.size());
    wr->req.data = this;

    // free memory and delete write_req_t on write completion
    const int write_status = uv_write(&wr->req, it->second, &wr->buf, 1, [](uv_write_t *req, int) {
        const auto *write_req = reinterpret_cast<write_req_t *>(req);
        std::free(write_req->buf.base);
        delete write_req;
    });

    if (write_status != 0) {
        LOG(WARN) << "[ServerSocket] Failed to write to client " << rdzv_sockaddr_to_str(client_address) << ": "
                << uv_strerror(write_status);
        std::free(wr->buf.base);
        delete wr;
        return false;
    }

    return true;
}

bool tinysockets::ServerSocket::closeAllClientConnections() const {
    if (!running) {
        return false;
    }
    for (const auto &[_, stream]: server_socket_state->sockaddr_to_uvstream) {
        if (!uv_is_closing(reinterpret_cast<uv_handle_t *>(stream))) {
            uv_close(reinterpret_cast<uv_handle_t *>(stream), [](uv_handle_t *handle) {
                const auto *this_ptr = static_cast<ServerSocket *>(handle->data);
                this_ptr->onClientClose(handle);
            });
        }
    }
    return true;
}

std::thread::id tinysockets::ServerSocket::getServerThreadId() const {
    if (!running) {
        return std::thread::id{};
    }
    return server_thread.get_id();
}

uint16_t tinysockets::ServerSocket::getListenPort() const {
    if (!bound) {
        return 0;
    }
    return listen_address.port;
}

void tinysockets::ServerSocket::onAsyncSignal() const {
    uv_stop(server_socket_state->async_handle->loop);
    if (!closeAllClientConnections()) [[unlikely]] {
        LOG(ERR) << "Failed to close all client connections";
    }
}

void tinysockets::ServerSocket::onTaskSignal() const {
    std::deque<ServerSocketTask> tasks{};
    {
        std::lock_guard guard{server_socket_state->task_mutex};
        tasks.swap(server_socket_state->pending_tasks);
    }
    for (const auto &task: tasks) {
        task();
    }
}

static void createBuffer(uv_handle_t *, const size_t suggested_size, uv_buf_t *buf) {
    buf->base = new char[suggested_size];
    buf->len = suggested_size;
}

std::optional<rdzv_socket_address_t> tinysockets::ServerSocket::getUvStreamAddressCached(uv_stream_t *stream) const {
    const auto inet_internal = server_socket_state->uvstream_to_sockaddr.find(reinterpret_cast<uv_handle_t *>(stream));
    if (inet_internal == server_socket_state->uvstream_to_sockaddr.end()) {
        return std::nullopt;
    }
    return internal_to_rdzv_sockaddr(inet_internal->second);
}

void tinysockets::ServerSocket::performLoopShutdown() const {
    if (server_socket_state->loop == nullptr) {
        return;
    }
    {
        std::lock_guard guard{server_socket_state->task_mutex};
        server_socket_state->accepting_tasks = false;
        server_socket_state->pending_tasks.clear();
    }
    if (server_socket_state->tcp_server != nullptr) {
        uv_close(reinterpret_cast<uv_handle_t *>(server_socket_state->tcp_server.get()), nullptr);
    }
    if (server_socket_state->async_handle != nullptr) {
        uv_close(reinterpret_cast<uv_handle_t *>(server_socket_state->async_handle.get()), nullptr);
    }
    if (server_socket_state->task_handle != nullptr) {
        uv_close(reinterpret_cast<uv_handle_t *>(server_socket_state->task_handle.get()), nullptr);
    }
    uv_run(server_socket_state->loop.get(), UV_RUN_NOWAIT);
    while (uv_loop_close(server_socket_state->loop.get()) == UV_EBUSY) {
        if (!closeAllClientConnections()) [[unlikely]] {
            LOG(ERR) << "Failed to close all clients connections";
        }
        uv_run(server_socket_state->loop.get(), UV_RUN_NOWAIT);
    }
    server_socket_state->loop = nullptr;
}

static std::optional<rdzv_socket_address_t> getUvStreamAddress(uv_stream_t *stream) {
    sockaddr_storage addr{};
    int addr_len = sizeof(addr);
    if (uv_tcp_getpeername(reinterpret_cast<uv_tcp_t *>(stream), reinterpret_cast<sockaddr *>(&addr), &addr_len) != 0)
        [[unlikely]] {
        return std::nullopt;
    }
    rdzv_socket_address_t client_addr{};
    if (convert_from_sockaddr(reinterpret_cast<const sockaddr *>(&addr), &client_addr) != 0) [[unlikely]] {
        return std::nullopt;
    }
    return client_addr;
}

void tinysockets::ServerSocket::onNewConnection(uv_server_stream_t *server, const int status) {
    if (status < 0) {
        return;
    }
    if (interrupted) {
        // don't accept more connections when the server has been interrupted
        return;
    }
    auto *client = new uv_tcp_t{};
    if (!UV_ERR_CHECK(uv_tcp_init(server_socket_state->loop.get(), client), "uv_tcp_init")) {
        delete client;
        return;
    }
    client->data = this;
    if (uv_accept(reinterpret_cast<uv_stream_t *>(server), reinterpret_cast<uv_stream_t *>(client)) != 0) {
        uv_close(reinterpret_cast<uv_handle_t *>(client), [](uv_handle_t *handle) {
            delete reinterpret_cast<uv_tcp_t *>(handle);
        });
        return;
    }

    const auto client_addr = getUvStreamAddress(reinterpret_cast<uv_stream_t *>(client));
    if (!client_addr) [[unlikely]] {
        LOG(ERR) << "Failed to get client address";
        uv_close(reinterpret_cast<uv_handle_t *>(client), [](uv_handle_t *handle) {
            delete reinterpret_cast<uv_tcp_t *>(handle);
        });
        return;
    }
    LOG(DEBUG) << "New connection accepted from " << rdzv_sockaddr_to_str(*client_addr);

    const auto inet_internal = rdzv_socket_to_internal(*client_addr);
    server_socket_state->sockaddr_to_uvstream[inet_internal] = reinterpret_cast<uv_stream_t *>(client);
    server_socket_state->uvstream_to_sockaddr[reinterpret_cast<uv_handle_t *>(client)] = inet_internal;

    const int read_status = uv_read_start(reinterpret_cast<uv_stream_t *>(client), createBuffer,
                  [](uv_stream_t *stream, const ssize_t n_read, const uv_buf_t *buf) {
                      // Handle EOF or errors
                      if (n_read < 0) {
                          delete[] buf->base;
                          if (!uv_is_closing(reinterpret_cast<uv_handle_t *>(stream))) {
                              uv_close(reinterpret_cast<uv_handle_t *>(stream), [](uv_handle_t *handle) {
                                  const auto *this_ptr = static_cast<ServerSocket *>(handle->data);
                                  this_ptr->onClientClose(handle);
                              });
                          }
                          return;
                      }
                      const auto *this_ptr = static_cast<ServerSocket *>(stream->data);
                      this_ptr->onClientRead(stream, n_read, buf);
                  });
    if (read_status != 0) [[unlikely]] {
        LOG(ERR) << "[ServerSocket] Failed to start reading from client " << rdzv_sockaddr_to_str(*client_addr)
                << ": " << uv_strerror(read_status);
        if (!closeClientConnection(*client_addr)) [[unlikely]] {
            LOG(ERR) << "Failed to close client connection";
        }
        return;
    }

    // invoke join callbacks
    for (const auto &callback: server_socket_state->join_callbacks) {
        callback(*client_addr);
    }
}

void tinysockets::ServerSocket::onClientRead(uv_stream_t *stream, const ssize_t n_read, const uv_buf_t *buf) const {
    const std::unique_ptr<char[]> buf_owner{buf->base};
    const auto client_addr = getUvStreamAddressCached(stream);
    if (!client_addr) [[unlikely]] {
        LOG(ERR) << "Failed to get client address";
        return;
    }

    const std::span data(reinterpret_cast<const uint8_t *>(buf->base), static_cast<size_t>(n_read));
    PacketReadBuffer buffer = PacketReadBuffer::wrap(data);

    auto &current_recv_buffer = server_socket_state->current_recv_buffers[rdzv_socket_to_internal(*client_addr)];

    while (buffer.remaining() > 0) {
        if (!current_recv_buffer.expected_length) {
            // the length field may be split across reads
            const size_t n_length_bytes = std::min(buffer.remaining(),
                                                   sizeof(uint64_t) - current_recv_buffer.length_bytes.size());
            const size_t offset = current_recv_buffer.length_bytes.size();
            current_recv_buffer.length_bytes.resize(offset + n_length_bytes);
            buffer.readContents(current_recv_buffer.length_bytes.data() + offset, n_length_bytes);
            if (current_recv_buffer.length_bytes.size() < sizeof(uint64_t)) {
                break;
            }
            PacketReadBuffer length_buffer = PacketReadBuffer::wrap(current_recv_buffer.length_bytes);
            const auto length = length_buffer.read<uint64_t>();
            current_recv_buffer.length_bytes.clear();
            if (length > MAX_PACKET_LENGTH) {
                LOG(ERR) << "[ServerSocket] Client " << rdzv_sockaddr_to_str(*client_addr)
                        << " announced excessive packet length " << length << "; closing connection";
                if (!closeClientConnection(*client_addr)) [[unlikely]] {
                    LOG(ERR) << "Failed to close client connection";
                }
                return;
            }
            current_recv_buffer.expected_length = length;
        }

        const size_t n_to_insert = std::min(buffer.remaining(),
                                            static_cast<size_t>(*current_recv_buffer.expected_length -
                                                                current_recv_buffer.buffer.size()));
        const size_t offset = current_recv_buffer.buffer.size();
        current_recv_buffer.buffer.resize(offset + n_to_insert);
        buffer.readContents(current_recv_buffer.buffer.data() + offset, n_to_insert);

        if (current_recv_buffer.buffer.size() == *current_recv_buffer.expected_length) {
            // if the buffer is full, invoke read callbacks
            for (const auto &callback: server_socket_state->read_callbacks) {
                callback(*client_addr, current_recv_buffer.buffer);
            }
            current_recv_buffer.expected_length = std::nullopt;
            current_recv_buffer.buffer.clear();
        }
    }
}

void tinysockets::ServerSocket::onClientClose(uv_handle_t *handle) const {
    auto *client = reinterpret_cast<uv_tcp_t *>(handle);
    const auto client_addr = getUvStreamAddressCached(reinterpret_cast<uv_stream_t *>(client));

    if (!client_addr) [[unlikely]] {
        LOG(ERR) << "Failed to get client address";
        delete client;
        return;
    }

    // Remove from connections map
    const auto inet_internal = rdzv_socket_to_internal(*client_addr);
    server_socket_state->sockaddr_to_uvstream.erase(inet_internal);
    server_socket_state->uvstream_to_sockaddr.erase(handle);
    server_socket_state->current_recv_buffers.erase(inet_internal);

    for (const auto &callback: server_socket_state->close_callbacks) {
        callback(*client_addr);
    }
    delete client;
}

tinysockets::ServerSocket::~ServerSocket() {
    if (!running && server_socket_state->loop != nullptr) {
        performLoopShutdown();
    }
    if (running && !interrupted) {
        if (!interrupt()) [[unlikely]] {
            LOG(ERR) << "Failed to interrupt ServerSocket from destructor";
        }
    }
    join();
    delete server_socket_state;
}
