/**
 * dsPack Unpacker - Common types and definitions
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>
#include <array>

namespace dspack {

/**
 * Byte order of every integer in one archive, fixed by its magic.
 */
enum class ByteOrder {
    Little,
    Big
};

constexpr const char* byte_order_string(ByteOrder order) {
    return order == ByteOrder::Big ? "Big-endian" : "Little-endian";
}

// Index fields use -1 for "no parent" / "none"
constexpr int32_t NO_INDEX = -1;

// Header: 2 magic words, reserved word, 8 descriptors
constexpr size_t HEADER_SIZE = 44;
constexpr size_t FILE_RECORD_SIZE = 24;
constexpr size_t FOLDER_RECORD_SIZE = 24;

// Counts above this are treated as a corrupt header
constexpr uint32_t MAX_ENTRY_COUNT = 100000;

constexpr std::array<uint8_t, 8> MAGIC_LITTLE = {'m', 'g', 'f', ' ', 0x08, 0x01, 0x5A, 0x5A};
constexpr std::array<uint8_t, 8> MAGIC_BIG = {' ', 'f', 'g', 'm', 0x5A, 0x5A, 0x01, 0x08};

/**
 * Decoded archive header.
 */
struct ArchiveHeader {
    ByteOrder byte_order = ByteOrder::Little;
    uint32_t num_files = 0;
    uint32_t file_dir_length = 0;
    uint32_t file_dir_offset = 0;
    uint32_t num_folders = 0;
    uint32_t folder_dir_length = 0;
    uint32_t folder_dir_offset = 0;
    uint32_t names_dir_length = 0;
    uint32_t names_dir_offset = 0;
};

/**
 * How a file record's payload is stored.
 */
enum class PayloadKind {
    Empty,      // compressed_size == 0, nothing to write
    Stored,     // compressed_size == decompressed_size
    MiniPack,   // compressed_size < decompressed_size
    Anomalous   // compressed_size > decompressed_size
};

constexpr const char* payload_kind_string(PayloadKind kind) {
    switch (kind) {
        case PayloadKind::Empty:     return "empty";
        case PayloadKind::Stored:    return "stored";
        case PayloadKind::MiniPack:  return "minipack";
        case PayloadKind::Anomalous: return "anomalous";
        default:                     return "unknown";
    }
}

/**
 * Entry of the file directory (24 bytes on disk).
 */
struct FileEntry {
    std::string name;
    int32_t parent_folder = NO_INDEX;
    uint32_t decompressed_size = 0;
    uint32_t compressed_size = 0;
    uint32_t unknown = 0;           // Meaning not established, kept as read
    uint32_t data_offset = 0;

    bool is_root() const { return parent_folder == NO_INDEX; }

    PayloadKind kind() const {
        if (compressed_size == 0) return PayloadKind::Empty;
        if (compressed_size == decompressed_size) return PayloadKind::Stored;
        if (compressed_size < decompressed_size) return PayloadKind::MiniPack;
        return PayloadKind::Anomalous;
    }
};

/**
 * Entry of the folder directory (24 bytes on disk).
 * Subfolder fields are informational; the tree comes from parent_folder.
 */
struct FolderEntry {
    std::string name;
    int32_t parent_folder = NO_INDEX;
    int32_t last_subfolder = NO_INDEX;
    int32_t first_subfolder = NO_INDEX;
    int32_t first_file = NO_INDEX;
    int32_t last_file = NO_INDEX;

    bool is_root() const { return parent_folder == NO_INDEX; }

    // Files declared by the first/last range (reporting only)
    uint32_t declared_file_count() const {
        if (first_file < 0 || last_file < first_file) return 0;
        return static_cast<uint32_t>(last_file - first_file + 1);
    }
};

} // namespace dspack
