#pragma once

#include <cstdint>
#include <stdexcept>
#include <vector>
#include <span>
#include <bit>
#include <algorithm>


template<typename T>
concept BufferPOD = std::is_arithmetic_v<T>;

/**
 * @class PacketReadBuffer
 * @brief A utility class for reading data from a byte buffer in big-endian format.
 *
 * PacketReadBuffer wraps a raw buffer (uint8_t*) with a specified length, providing methods to read various data types.
 * The buffer does not own the wrapped memory.
 */
class PacketReadBuffer final {
public:
    PacketReadBuffer(const uint8_t *data, size_t length);

    /**
     * @brief Reads a value of type T from the buffer in big-endian format.
     *
     * T must be an arithmetic type (e.g., int, double, uint32_t).
     * @tparam T The type to read from the buffer.
     * @return The value of type T read from the buffer.
     * @throws std::out_of_range if reading exceeds the buffer length.
     */
    template<typename T> requires BufferPOD<T>
    T read() {
        if (read_index_ + sizeof(T) > length_) {
            throw std::out_of_range("Read exceeds buffer length");
        }

        T value;
        if constexpr (std::is_integral_v<T>) {
            value = readIntegral<T>();
        } else if constexpr (std::is_same_v<T, float>) {
            value = std::bit_cast<T>(readIntegral<uint32_t>());
        } else if constexpr (std::is_same_v<T, double>) {
            value = std::bit_cast<T>(readIntegral<uint64_t>());
        } else {
            static_assert(std::is_same_v<T, float> || std::is_same_v<T, double>, "Unsupported type");
        }

        read_index_ += sizeof(T);
        return value;
    }

private:
    template<typename T> requires std::is_integral_v<T>
    T readIntegral() {
        using U = std::make_unsigned_t<T>;
        U value = 0;
        for (size_t i = 0; i < sizeof(T); ++i) {
            value = static_cast<U>((static_cast<uint64_t>(value) << 8) | data_[read_index_ + i]);
        }
        return static_cast<T>(value);
    }

public:
    void readContents(uint8_t *dst, const size_t length) {
        if (read_index_ + length > length_) {
            throw std::out_of_range("Read exceeds buffer length");
        }
        std::copy_n(data_ + read_index_, length, dst);
        read_index_ += length;
    }

    /**
     * @brief Reads a length-prefixed byte blob from the buffer.
     * @throws std::out_of_range if the declared length exceeds the remaining bytes.
     */
    std::vector<uint8_t> readBytes();

    /**
     * @brief Resets the read position to the beginning of the buffer.
     */
    void reset();

    /**
     * @return The number of bytes remaining in the buffer.
     */
    [[nodiscard]] size_t remaining() const;

    /**
     * @brief Static factory method to wrap an existing byte array in a PacketReadBuffer.
     *
     * @param data Pointer to the raw byte buffer.
     * @param length The length of the buffer.
     * @return A PacketReadBuffer instance wrapping the provided data.
     */
    [[nodiscard]] static PacketReadBuffer wrap(const uint8_t *data, size_t length);

    /**
      * @brief Static factory method to wrap an existing byte span in a PacketReadBuffer.
      */
    [[nodiscard]] static PacketReadBuffer wrap(const std::span<const uint8_t> &data);

private:
    const uint8_t *data_;
    size_t length_;
    size_t read_index_;
};

/**
 * @class PacketWriteBuffer
 * @brief A utility class for dynamically writing data to a byte buffer in big-endian format.
 *
 * PacketWriteBuffer manages a dynamically growing buffer. The buffer automatically grows as needed
 * and can be preallocated with the `reserve` function.
 */
class PacketWriteBuffer {
public:
    explicit PacketWriteBuffer(size_t initial_capacity = 0);

    /**
     * @brief Writes a value of type T to the buffer in big-endian format.
     *
     * T must be an arithmetic type (e.g., int, double, uint32_t).
     */
    template<typename T> requires BufferPOD<T>
    void write(T value) {
        if constexpr (std::is_same_v<T, float>) {
            writeIntegral<uint32_t>(std::bit_cast<uint32_t>(value));
        } else if constexpr (std::is_same_v<T, double>) {
            writeIntegral<uint64_t>(std::bit_cast<uint64_t>(value));
        } else {
            writeIntegral<T>(value);
        }
    }

private:
    template<typename T> requires std::is_integral_v<T>
    void writeIntegral(T value) {
        ensureCapacity(sizeof(T));

        const auto bits = static_cast<std::make_unsigned_t<T>>(value);
        for (size_t i = 0; i < sizeof(T); ++i) {
            data_.push_back(static_cast<uint8_t>(static_cast<uint64_t>(bits) >> (8 * (sizeof(T) - 1 - i))));
        }
    }

public:
    /**
     * @brief Copies raw data to the buffer.
     */
    void writeContents(const uint8_t *data, size_t length);

    /**
     * @brief Writes a byte blob prefixed with its 64-bit length.
     */
    void writeBytes(const std::vector<uint8_t> &bytes);

    /**
     * @brief Clears the buffer, allowing it to be reused.
     */
    void reset();

    /**
     * @brief Reserves a minimum capacity for the buffer to avoid frequent reallocations.
     */
    void reserve(size_t new_capacity);

    /**
     * @return The number of bytes written to the buffer.
     */
    [[nodiscard]] size_t size() const;

    /**
     * @return A pointer to the raw data in the buffer.
     */
    [[nodiscard]] const uint8_t *data() const;

private:
    void ensureCapacity(size_t additional_size);

    std::vector<uint8_t> data_{}; ///< Underlying dynamic buffer.
};
