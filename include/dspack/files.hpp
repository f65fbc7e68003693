/**
 * dsPack Unpacker - File utilities
 */

#pragma once

#include "result.hpp"
#include <string>
#include <vector>
#include <filesystem>
#include <span>
#include <cstdint>

namespace dspack {

/**
 * Write data to file, replacing it. The parent directory must exist.
 */
Result<void> write_file(const std::filesystem::path& path, std::span<const uint8_t> data);

/**
 * Create directories recursively. Existing directories are not an error.
 */
Result<void> create_directories(const std::filesystem::path& path);

/**
 * True for regular files with a .dspack extension (any case).
 */
bool is_dspack_file(const std::filesystem::path& path);

/**
 * Archives directly inside `directory`, sorted by name.
 */
Result<std::vector<std::filesystem::path>> find_dspack_files(const std::filesystem::path& directory);

/**
 * Format file size for display.
 */
std::string format_file_size(uint64_t bytes);

} // namespace dspack
