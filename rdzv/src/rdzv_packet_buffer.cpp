#include "rdzv_packet_buffer.hpp"

#include <cstdint>
#include <cstring>
#include <string>

PacketReadBuffer::PacketReadBuffer(const uint8_t *data, const size_t length): data_(data), length_(length),
                                                                              read_index_(0) {
}

std::vector<uint8_t> PacketReadBuffer::readBytes() {
    const auto length = read<uint64_t>();
    if (length > length_ - read_index_) {
        throw std::out_of_range("Read exceeds buffer length");
    }
    std::vector<uint8_t> result(data_ + read_index_, data_ + read_index_ + length);
    read_index_ += length;
    return result;
}

void PacketReadBuffer::reset() {
    read_index_ = 0;
}

size_t PacketReadBuffer::remaining() const {
    return length_ - read_index_;
}

PacketReadBuffer PacketReadBuffer::wrap(const uint8_t *data, const size_t length) {
    return {data, length};
}

PacketReadBuffer PacketReadBuffer::wrap(const std::span<const uint8_t> &data) {
    return {data.data(), data.size()};
}

// PacketWriteBuffer

PacketWriteBuffer::PacketWriteBuffer(const size_t initial_capacity) {
    if (initial_capacity > 0) {
        data_.reserve(initial_capacity);
    }
}

void PacketWriteBuffer::writeContents(const uint8_t *data, const size_t length) {
    if (data == nullptr || length == 0) {
        return;
    }
    if (length > SIZE_MAX - data_.size()) {
        throw std::overflow_error("Size overflow in writeContents");
    }
    const size_t old_size = data_.size();
    data_.resize(data_.size() + length);
    std::memcpy(data_.data() + old_size, data, length);
}

void PacketWriteBuffer::writeBytes(const std::vector<uint8_t> &bytes) {
    ensureCapacity(sizeof(uint64_t) + bytes.size());
    write<uint64_t>(bytes.size());
    writeContents(bytes.data(), bytes.size());
}

void PacketWriteBuffer::reset() {
    data_.clear();
}

void PacketWriteBuffer::reserve(const size_t new_capacity) {
    data_.reserve(new_capacity);
}

size_t PacketWriteBuffer::size() const {
    return data_.size();
}

const uint8_t *PacketWriteBuffer::data() const {
    return data_.data();
}

void PacketWriteBuffer::ensureCapacity(const size_t additional_size) {
    if (const size_t required_capacity = data_.size() + additional_size; required_capacity > data_.capacity()) {
        if (required_capacity > SIZE_MAX / 2) {
            throw std::overflow_error("Capacity overflow in ensureCapacity");
        }
        data_.reserve(required_capacity * 2);
    }
}
