/**
 * dsPack Unpacker - Batch Processing
 *
 * Runs analysis (and optionally extraction) over one archive or every
 * .dspack archive in a directory. A failing archive is reported and the
 * run moves on to the next one.
 */

#pragma once

#include "settings.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace dspack {

struct BatchOptions {
    std::filesystem::path output_root;  // Empty: analyze only
    bool show_tree = false;
    bool list_files = false;
};

struct BatchResult {
    size_t archives = 0;        // Archives found
    size_t opened = 0;          // Parsed successfully
    size_t failed = 0;          // Could not be opened/parsed
    size_t partial = 0;         // Extracted with fallbacks or failed files
    std::vector<std::string> errors;

    bool success() const { return failed == 0 && partial == 0; }
};

/**
 * Archives named by `input`: the file itself, or every .dspack in the directory.
 */
Result<std::vector<std::filesystem::path>> collect_archives(const std::filesystem::path& input);

BatchResult run_batch(const std::filesystem::path& input, const BatchOptions& options,
                      const UnpackerSettings& settings);

} // namespace dspack
