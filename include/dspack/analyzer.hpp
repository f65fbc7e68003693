/**
 * dsPack Unpacker - Archive Analysis
 *
 * Read-only summary of an open archive: counts, folder listing, sample
 * entries and extension statistics.
 */

#pragma once

#include "types.hpp"
#include "archive.hpp"
#include <string>
#include <vector>
#include <utility>

namespace dspack {

struct FolderSummary {
    std::string path;
    uint32_t file_count = 0;    // From the folder's first/last file range
};

struct FileSample {
    std::string name;
    uint32_t decompressed_size = 0;
    uint32_t compressed_size = 0;
    double compression_percent = 0.0;   // 0 when not compressed
};

struct ArchiveSummary {
    std::string label;
    ByteOrder byte_order = ByteOrder::Little;
    size_t file_count = 0;
    size_t folder_count = 0;
    uint64_t total_compressed = 0;
    uint64_t total_decompressed = 0;
    size_t empty_count = 0;
    size_t stored_count = 0;
    size_t minipack_count = 0;
    size_t anomalous_count = 0;
    std::vector<FolderSummary> folders;
    std::vector<FileSample> samples;
    std::vector<std::string> file_paths;                        // Every file, archive-relative
    std::vector<std::pair<std::string, size_t>> extensions;     // Most frequent first
};

ArchiveSummary analyze(const Archive& archive, size_t sample_count = 5);

/**
 * Human-readable report lines (the "[Archive Analysis: ...]" block).
 */
std::vector<std::string> format_summary(const ArchiveSummary& summary);

/**
 * Folder/file hierarchy: "+ name/" for folders, "- name" for files,
 * two spaces per level, files before folders, nothing deeper than `max_depth`.
 */
std::vector<std::string> format_tree(const ArchiveSummary& summary, size_t max_depth = 5);

} // namespace dspack
