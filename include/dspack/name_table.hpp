/**
 * dsPack Unpacker - Name Table
 *
 * Blob of NUL-terminated names referenced by byte offset from the file
 * and folder records.
 */

#pragma once

#include "result.hpp"
#include <vector>
#include <string>
#include <cstdint>

namespace dspack {

class NameTable {
public:
    NameTable() = default;
    explicit NameTable(std::vector<uint8_t> data) : data_(std::move(data)) {}

    /**
     * Name starting at `offset`, without its terminator.
     * Fails if the offset is at/after the end or no NUL follows it.
     */
    Result<std::string> resolve(uint32_t offset) const;

    size_t size() const { return data_.size(); }
    bool empty() const { return data_.empty(); }

private:
    std::vector<uint8_t> data_;
};

} // namespace dspack
