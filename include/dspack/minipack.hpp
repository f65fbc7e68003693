/**
 * dsPack Unpacker - MiniPack decompression
 *
 * MiniPack is the archive's LZ77-style payload compression. The stream is
 * a run of segments, each a control byte followed by up to 8 tokens; the
 * control bits are read LSB first:
 *   1 -> literal: one byte copied to the output
 *   0 -> back-reference: b0 b1, distance = ((b1 & 0xF0) << 4) | b0,
 *        length = (b1 & 0x0F) + 3, copied byte by byte so that a distance
 *        shorter than the length repeats the pattern
 *
 * The bit split was derived from observed data, not documentation.
 */

#pragma once

#include "result.hpp"
#include <span>
#include <vector>
#include <cstdint>

namespace dspack {

constexpr uint32_t MINIPACK_MIN_MATCH = 3;
constexpr uint32_t MINIPACK_MAX_MATCH = 18;
constexpr uint32_t MINIPACK_MAX_DISTANCE = 0xFFF;

/**
 * Decompress a MiniPack stream into exactly `decompressed_size` bytes.
 *
 * Fails with Error::Code::Decompression if a token is cut off by the end of
 * the input, or a back-reference would read before the start of the output
 * or write past its end. Output the stream does not reach stays zero.
 */
Result<std::vector<uint8_t>> minipack_decompress(std::span<const uint8_t> compressed,
                                                 uint32_t decompressed_size);

} // namespace dspack
