/**
 * dsPack Unpacker - Header Parser Implementation
 *
 * Layout (all u32 in the archive's byte order):
 *   0  magic1 "mgf " / " fgm"
 *   4  magic2 08 01 5A 5A / 5A 5A 01 08
 *   8  reserved
 *   12 num_files, file_dir_length, file_dir_offset
 *   24 num_folders, folder_dir_length, folder_dir_offset
 *   36 names_dir_length, names_dir_offset
 */

#include "dspack/header.hpp"
#include "dspack/binary_cursor.hpp"
#include "dspack/logging.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace dspack {

namespace {

std::string hex_bytes(std::span<const uint8_t> bytes) {
    std::ostringstream ss;
    ss << std::hex << std::setfill('0');
    for (uint8_t b : bytes) {
        ss << std::setw(2) << static_cast<int>(b);
    }
    return ss.str();
}

Result<uint32_t> read_count(BinaryCursor& cursor, ByteOrder order, const char* field) {
    DSPACK_TRY_ASSIGN(count, cursor.read_u32(order));
    if (count > MAX_ENTRY_COUNT) {
        return Error::integrity(std::string("Invalid count ") + field + ": " + std::to_string(count) +
                                " (limit " + std::to_string(MAX_ENTRY_COUNT) + ")");
    }
    return count;
}

Result<uint32_t> read_offset(BinaryCursor& cursor, ByteOrder order, uint64_t file_size,
                             const char* field) {
    DSPACK_TRY_ASSIGN(offset, cursor.read_u32(order));
    if (offset >= file_size) {
        return Error::out_of_bounds(std::string("Invalid offset ") + field + ": " +
                                    std::to_string(offset) + " (file size: " +
                                    std::to_string(file_size) + ")");
    }
    return offset;
}

// Region [offset, offset + length) must lie inside the file
Result<void> check_region(uint64_t offset, uint64_t length, uint64_t file_size, const char* what) {
    if (offset + length > file_size) {
        return Error::out_of_bounds(std::string(what) + " [" + std::to_string(offset) + ", " +
                                    std::to_string(offset + length) + ") extends past end of file (" +
                                    std::to_string(file_size) + " bytes)");
    }
    return Result<void>::success();
}

} // namespace

Result<ByteOrder> detect_byte_order(std::span<const uint8_t> magic) {
    if (magic.size() < MAGIC_LITTLE.size()) {
        return Error::invalid_format("File too small for dsPack magic (" +
                                     std::to_string(magic.size()) + " bytes)");
    }

    auto words = magic.first(MAGIC_LITTLE.size());
    if (std::equal(words.begin(), words.end(), MAGIC_LITTLE.begin())) {
        return ByteOrder::Little;
    }
    if (std::equal(words.begin(), words.end(), MAGIC_BIG.begin())) {
        return ByteOrder::Big;
    }

    return Error::invalid_format("Invalid magic numbers: " + hex_bytes(words.first(4)) + " " +
                                 hex_bytes(words.subspan(4, 4)));
}

Result<ArchiveHeader> parse_header(std::span<const uint8_t> bytes, uint64_t file_size) {
    DSPACK_TRY_ASSIGN(order, detect_byte_order(bytes));

    if (bytes.size() < HEADER_SIZE) {
        return Error::invalid_format("File too small for dsPack header (" +
                                     std::to_string(bytes.size()) + " of " +
                                     std::to_string(HEADER_SIZE) + " bytes)");
    }

    BinaryCursor cursor(bytes, MAGIC_LITTLE.size());
    DSPACK_TRY(cursor.skip(4));  // reserved

    ArchiveHeader header;
    header.byte_order = order;

    DSPACK_TRY_ASSIGN(num_files, read_count(cursor, order, "num_files"));
    DSPACK_TRY_ASSIGN(file_dir_length, cursor.read_u32(order));
    DSPACK_TRY_ASSIGN(file_dir_offset, read_offset(cursor, order, file_size, "file_dir_offset"));
    DSPACK_TRY_ASSIGN(num_folders, read_count(cursor, order, "num_folders"));
    DSPACK_TRY_ASSIGN(folder_dir_length, cursor.read_u32(order));
    DSPACK_TRY_ASSIGN(folder_dir_offset, read_offset(cursor, order, file_size, "folder_dir_offset"));
    DSPACK_TRY_ASSIGN(names_dir_length, cursor.read_u32(order));
    DSPACK_TRY_ASSIGN(names_dir_offset, read_offset(cursor, order, file_size, "names_dir_offset"));

    header.num_files = num_files;
    header.file_dir_length = file_dir_length;
    header.file_dir_offset = file_dir_offset;
    header.num_folders = num_folders;
    header.folder_dir_length = folder_dir_length;
    header.folder_dir_offset = folder_dir_offset;
    header.names_dir_length = names_dir_length;
    header.names_dir_offset = names_dir_offset;

    DSPACK_TRY(check_region(header.file_dir_offset,
                            uint64_t{header.num_files} * FILE_RECORD_SIZE, file_size,
                            "File directory"));
    DSPACK_TRY(check_region(header.folder_dir_offset,
                            uint64_t{header.num_folders} * FOLDER_RECORD_SIZE, file_size,
                            "Folder directory"));
    DSPACK_TRY(check_region(header.names_dir_offset, header.names_dir_length, file_size,
                            "Name table"));

    // Directory lengths are descriptive; a mismatch is worth noting but not fatal
    if (header.file_dir_length != header.num_files * FILE_RECORD_SIZE) {
        LOG_WARNING("Header", "file_dir_length " << header.file_dir_length << " != "
                    << header.num_files << " records * " << FILE_RECORD_SIZE);
    }
    if (header.folder_dir_length != header.num_folders * FOLDER_RECORD_SIZE) {
        LOG_WARNING("Header", "folder_dir_length " << header.folder_dir_length << " != "
                    << header.num_folders << " records * " << FOLDER_RECORD_SIZE);
    }

    LOG_DEBUG("Header", byte_order_string(order) << ", " << header.num_files << " files @"
              << header.file_dir_offset << ", " << header.num_folders << " folders @"
              << header.folder_dir_offset << ", names " << header.names_dir_length << "@"
              << header.names_dir_offset);

    return header;
}

} // namespace dspack
