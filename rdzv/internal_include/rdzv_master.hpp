#pragma once

#include <rdzv_inet.h>
#include <sync_config.hpp>

namespace rdzv {
    class RendezvousMasterHandler;

    class RendezvousMaster {
        rdzv_socket_address_t listen_address;
        SyncServiceConfig config;
        RendezvousMasterHandler *master;

    public:
        RendezvousMaster(const rdzv_socket_address_t &listen_address, const SyncServiceConfig &config);

        RendezvousMaster(const RendezvousMaster &other) = delete;

        RendezvousMaster(RendezvousMaster &&other) = delete;

        RendezvousMaster &operator=(const RendezvousMaster &other) = delete;

        RendezvousMaster &operator=(RendezvousMaster &&other) = delete;

        /// returns false if the handler is already running or has been interrupted
        [[nodiscard]] bool launch();

        /// returns false if the handler has already been interrupted or was never launched
        [[nodiscard]] bool interrupt() const;

        /// returns false if the handler is not running
        /// blocks until the handler has terminated
        [[nodiscard]] bool join() const;

        /// returns the port the master is listening on; 0 if not launched
        [[nodiscard]] uint16_t getListenPort() const;

        ~RendezvousMaster();
    };
}
