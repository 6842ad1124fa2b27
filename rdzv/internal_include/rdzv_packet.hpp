#pragma once

#include "rdzv_packet_buffer.hpp"

namespace rdzv {
    typedef uint16_t packetId_t;

    class Packet {
    public:
        Packet() = default;

        virtual ~Packet() = default;

        virtual void serialize(PacketWriteBuffer &buffer) const = 0;

        [[nodiscard]] virtual bool deserialize(PacketReadBuffer &buffer) = 0;
    };

    class EmptyPacket : public Packet {
    public:
        void serialize(PacketWriteBuffer &buffer) const override;

        bool deserialize(PacketReadBuffer &buffer) override;
    };
}
