/**
 * dsPack Unpacker - MiniPack decompression
 */

#include "dspack/minipack.hpp"
#include "dspack/logging.hpp"

#include <string>

namespace dspack {

Result<std::vector<uint8_t>> minipack_decompress(std::span<const uint8_t> compressed,
                                                 uint32_t decompressed_size) {
    std::vector<uint8_t> output(decompressed_size);

    size_t in_pos = 0;
    size_t out_pos = 0;
    const size_t in_size = compressed.size();

    while (in_pos < in_size && out_pos < output.size()) {
        uint8_t control = compressed[in_pos++];

        for (int bit = 0; bit < 8; ++bit) {
            if (in_pos >= in_size || out_pos >= output.size()) {
                break;
            }

            if (control & (1u << bit)) {
                output[out_pos++] = compressed[in_pos++];
                continue;
            }

            if (in_pos + 1 >= in_size) {
                return Error::decompression("Back-reference truncated at input offset " +
                                            std::to_string(in_pos) + " of " + std::to_string(in_size));
            }

            uint8_t b0 = compressed[in_pos];
            uint8_t b1 = compressed[in_pos + 1];
            in_pos += 2;

            size_t distance = (static_cast<size_t>(b1 & 0xF0) << 4) | b0;
            size_t length = static_cast<size_t>(b1 & 0x0F) + MINIPACK_MIN_MATCH;

            // Distance 0 copies the current, still zero byte
            if (distance > out_pos) {
                return Error::decompression("Back-reference distance " + std::to_string(distance) +
                                            " invalid at output offset " + std::to_string(out_pos));
            }
            if (length > output.size() - out_pos) {
                return Error::decompression("Back-reference of " + std::to_string(length) +
                                            " bytes overruns output at offset " +
                                            std::to_string(out_pos) + " of " +
                                            std::to_string(output.size()));
            }

            // Byte at a time: source and destination may overlap
            for (size_t i = 0; i < length; ++i) {
                output[out_pos] = output[out_pos - distance];
                ++out_pos;
            }
        }
    }

    if (out_pos < output.size()) {
        LOG_DEBUG("MiniPack", "Stream ended after " << out_pos << " of " << output.size()
                  << " bytes");
    }

    return output;
}

} // namespace dspack
