#include "rdzv_master.hpp"

#include "rdzv_master_handler.hpp"

rdzv::RendezvousMaster::RendezvousMaster(const rdzv_socket_address_t &listen_address,
                                         const SyncServiceConfig &config) : listen_address(listen_address),
                                                                            config(config),
                                                                            master(nullptr) {
}

bool rdzv::RendezvousMaster::launch() {
    if (master != nullptr) {
        return false;
    }
    master = new RendezvousMasterHandler(listen_address, config);
    return master->run();
}

bool rdzv::RendezvousMaster::interrupt() const {
    if (master == nullptr) {
        return false;
    }
    return master->interrupt();
}

bool rdzv::RendezvousMaster::join() const {
    if (master == nullptr) {
        return false;
    }
    return master->join();
}

uint16_t rdzv::RendezvousMaster::getListenPort() const {
    if (master == nullptr) {
        return 0;
    }
    return master->getListenPort();
}

rdzv::RendezvousMaster::~RendezvousMaster() {
    delete master;
}
