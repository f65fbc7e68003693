/**
 * dsPack Unpacker - Path Utilities
 *
 * Helpers for turning archive names into output paths.
 */

#pragma once

#include <string>
#include <string_view>
#include <optional>
#include <algorithm>
#include <cctype>
#include <filesystem>

namespace dspack {

/**
 * Get lowercase file extension including the dot.
 */
inline std::string get_extension_lower(const std::filesystem::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

/**
 * Insert `marker` in front of the extension of the last path component:
 * "Data/file2.ext" -> "Data/file2[Compressed].ext". Names without an
 * extension get the marker appended.
 */
inline std::string insert_marker(const std::string& path, std::string_view marker) {
    size_t name_start = path.find_last_of('/');
    name_start = (name_start == std::string::npos) ? 0 : name_start + 1;

    // A leading dot ("/.hidden") starts the name, it does not start an extension
    size_t dot = path.find_last_of('.');
    if (dot == std::string::npos || dot <= name_start) {
        return path + std::string(marker);
    }
    return path.substr(0, dot) + std::string(marker) + path.substr(dot);
}

/**
 * Normalize an archive path into a safe relative output path:
 * backslashes become slashes, empty and "." components are dropped.
 * Returns nullopt for a path that would leave the output root ("..",
 * drive letters) or is empty after normalization.
 */
inline std::optional<std::string> sanitize_relative_path(std::string_view path) {
    std::string result;
    size_t pos = 0;
    while (pos <= path.size()) {
        size_t end = path.find_first_of("/\\", pos);
        if (end == std::string_view::npos) end = path.size();
        std::string_view part = path.substr(pos, end - pos);
        pos = end + 1;

        if (part.empty() || part == ".") continue;
        if (part == ".." || part.find(':') != std::string_view::npos) {
            return std::nullopt;
        }
        if (!result.empty()) result += '/';
        result.append(part);
    }
    if (result.empty()) {
        return std::nullopt;
    }
    return result;
}

} // namespace dspack
