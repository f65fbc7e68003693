/**
 * dsPack Unpacker - Binary Cursor
 *
 * Positioned reader of fixed-width integers over a byte span. The byte
 * order is an argument of every read; the cursor keeps no endianness
 * state of its own.
 */

#pragma once

#include "types.hpp"
#include "result.hpp"
#include <span>
#include <string>
#include <cstdint>

namespace dspack {

inline uint32_t load_u32(const uint8_t* p, ByteOrder order) {
    if (order == ByteOrder::Big) {
        return (static_cast<uint32_t>(p[0]) << 24) |
               (static_cast<uint32_t>(p[1]) << 16) |
               (static_cast<uint32_t>(p[2]) << 8) |
               static_cast<uint32_t>(p[3]);
    }
    return static_cast<uint32_t>(p[0]) |
           (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}

inline void store_u32(uint8_t* p, uint32_t value, ByteOrder order) {
    if (order == ByteOrder::Big) {
        p[0] = static_cast<uint8_t>(value >> 24);
        p[1] = static_cast<uint8_t>(value >> 16);
        p[2] = static_cast<uint8_t>(value >> 8);
        p[3] = static_cast<uint8_t>(value);
    } else {
        p[0] = static_cast<uint8_t>(value);
        p[1] = static_cast<uint8_t>(value >> 8);
        p[2] = static_cast<uint8_t>(value >> 16);
        p[3] = static_cast<uint8_t>(value >> 24);
    }
}

class BinaryCursor {
public:
    explicit BinaryCursor(std::span<const uint8_t> data, size_t position = 0)
        : data_(data), pos_(position) {}

    size_t position() const { return pos_; }
    size_t size() const { return data_.size(); }
    size_t remaining() const { return pos_ < data_.size() ? data_.size() - pos_ : 0; }

    Result<void> seek(size_t position) {
        if (position > data_.size()) {
            return Error::out_of_bounds("Seek to " + std::to_string(position) +
                                        " past end of " + std::to_string(data_.size()) + " bytes");
        }
        pos_ = position;
        return Result<void>::success();
    }

    Result<void> skip(size_t count) {
        return seek(pos_ + count);
    }

    Result<uint32_t> read_u32(ByteOrder order) {
        if (remaining() < 4) {
            return Error::out_of_bounds("Read of 4 bytes at " + std::to_string(pos_) +
                                        " past end of " + std::to_string(data_.size()) + " bytes");
        }
        uint32_t value = load_u32(data_.data() + pos_, order);
        pos_ += 4;
        return value;
    }

    Result<int32_t> read_i32(ByteOrder order) {
        DSPACK_TRY_ASSIGN(raw, read_u32(order));
        return static_cast<int32_t>(raw);
    }

    Result<std::span<const uint8_t>> read_bytes(size_t count) {
        if (remaining() < count) {
            return Error::out_of_bounds("Read of " + std::to_string(count) + " bytes at " +
                                        std::to_string(pos_) + " past end of " +
                                        std::to_string(data_.size()) + " bytes");
        }
        auto bytes = data_.subspan(pos_, count);
        pos_ += count;
        return bytes;
    }

private:
    std::span<const uint8_t> data_;
    size_t pos_ = 0;
};

} // namespace dspack
