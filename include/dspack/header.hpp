/**
 * dsPack Unpacker - Header Parser
 */

#pragma once

#include "types.hpp"
#include "result.hpp"
#include <span>

namespace dspack {

/**
 * Byte order announced by the two magic words in the first 8 bytes.
 * Only "mgf " 08 01 5A 5A (little) and its byte-reversed form (big) are
 * accepted.
 */
Result<ByteOrder> detect_byte_order(std::span<const uint8_t> magic);

/**
 * Parse and validate the 44-byte header.
 * @param bytes     At least HEADER_SIZE bytes from the start of the archive
 * @param file_size Size of the whole archive, for offset checks
 */
Result<ArchiveHeader> parse_header(std::span<const uint8_t> bytes, uint64_t file_size);

} // namespace dspack
