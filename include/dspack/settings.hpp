/**
 * dsPack Unpacker - Settings
 *
 * JSON settings file. Keys that are missing keep their defaults.
 */

#pragma once

#include "result.hpp"
#include "logging.hpp"
#include <filesystem>
#include <string>

namespace dspack {

struct UnpackerSettings {
    // Logging
    LogLevel log_level = LogLevel::Info;
    std::filesystem::path log_file;             // Empty: no log file
    bool console_output = true;

    // Extraction
    std::filesystem::path output_dir;           // Default for --extract without --output
    std::string compressed_marker = "[Compressed]";
    bool write_report = false;

    // Analysis
    size_t sample_file_count = 5;
    size_t tree_depth = 5;
};

Result<UnpackerSettings> load_settings(const std::filesystem::path& path);
Result<void> save_settings(const UnpackerSettings& settings, const std::filesystem::path& path);

/**
 * Point the global logger at the configured level, console and file.
 */
void apply_logging_settings(const UnpackerSettings& settings);

} // namespace dspack
