/**
 * dsPack Unpacker - Directory Builder
 *
 * Decodes the fixed 24-byte file and folder records and validates their
 * cross-references. Any bad record fails the whole directory: records
 * carry no framing that would allow skipping one.
 */

#pragma once

#include "types.hpp"
#include "result.hpp"
#include "name_table.hpp"
#include <span>
#include <vector>

namespace dspack {

struct DirectoryLimits {
    uint32_t num_files = 0;
    uint32_t num_folders = 0;
    uint64_t file_size = 0;     // Archive size, for payload range checks
};

/**
 * Decode `limits.num_files` file records from `records`.
 */
Result<std::vector<FileEntry>> read_file_entries(std::span<const uint8_t> records,
                                                 ByteOrder order,
                                                 const NameTable& names,
                                                 const DirectoryLimits& limits);

/**
 * Decode `limits.num_folders` folder records from `records`.
 */
Result<std::vector<FolderEntry>> read_folder_entries(std::span<const uint8_t> records,
                                                     ByteOrder order,
                                                     const NameTable& names,
                                                     const DirectoryLimits& limits);

} // namespace dspack
