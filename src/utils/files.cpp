/**
 * dsPack Unpacker - File Utilities Implementation
 */

#include "dspack/files.hpp"
#include "dspack/path_utils.hpp"

#include <fstream>
#include <algorithm>
#include <cstdio>

namespace dspack {

Result<void> write_file(const std::filesystem::path& path, std::span<const uint8_t> data) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return Error::io_error("Failed to open file for writing", path.string());
    }
    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    file.flush();
    if (!file) {
        return Error::io_error("Short write of " + std::to_string(data.size()) + " bytes", path.string());
    }
    return Result<void>::success();
}

Result<void> create_directories(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    if (ec) {
        return Error::io_error("Failed to create directory: " + ec.message(), path.string());
    }
    if (!std::filesystem::is_directory(path, ec)) {
        return Error::io_error("Path exists and is not a directory", path.string());
    }
    return Result<void>::success();
}

bool is_dspack_file(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec) && get_extension_lower(path) == ".dspack";
}

Result<std::vector<std::filesystem::path>> find_dspack_files(const std::filesystem::path& directory) {
    std::vector<std::filesystem::path> result;
    std::error_code ec;
    std::filesystem::directory_iterator it(directory, ec);
    for (; !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
        if (is_dspack_file(it->path())) {
            result.push_back(it->path());
        }
    }
    if (ec) {
        return Error::io_error("Failed to scan directory: " + ec.message(), directory.string());
    }
    std::sort(result.begin(), result.end());
    return result;
}

std::string format_file_size(uint64_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB"};
    int unit = 0;
    double size = static_cast<double>(bytes);

    while (size >= 1024.0 && unit < 3) {
        size /= 1024.0;
        unit++;
    }

    char buf[64];
    if (unit == 0) {
        snprintf(buf, sizeof(buf), "%llu B", static_cast<unsigned long long>(bytes));
    } else {
        snprintf(buf, sizeof(buf), "%.2f %s", size, units[unit]);
    }
    return buf;
}

} // namespace dspack
