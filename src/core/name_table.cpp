/**
 * dsPack Unpacker - Name Table Implementation
 */

#include "dspack/name_table.hpp"

#include <algorithm>

namespace dspack {

Result<std::string> NameTable::resolve(uint32_t offset) const {
    if (offset >= data_.size()) {
        return Error::out_of_bounds("Name offset " + std::to_string(offset) +
                                    " outside name table of " + std::to_string(data_.size()) + " bytes");
    }

    auto first = data_.begin() + offset;
    auto terminator = std::find(first, data_.end(), uint8_t{0});
    if (terminator == data_.end()) {
        return Error::integrity("Name at offset " + std::to_string(offset) +
                                " is not terminated inside the name table");
    }

    return std::string(first, terminator);
}

} // namespace dspack
