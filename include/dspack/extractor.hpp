/**
 * dsPack Unpacker - Extraction Pipeline
 *
 * Materializes an open archive onto an OutputSink: every folder, then
 * every file in directory order. A file that cannot be decoded is still
 * written (raw, with a marker in its name); one file's failure never
 * stops the others.
 */

#pragma once

#include "types.hpp"
#include "archive.hpp"
#include "output_sink.hpp"
#include <string>
#include <vector>
#include <cstdint>

namespace dspack {

constexpr const char* DEFAULT_COMPRESSED_MARKER = "[Compressed]";

struct ExtractOptions {
    // Inserted before the extension of payloads written undecoded
    std::string compressed_marker = DEFAULT_COMPRESSED_MARKER;
};

enum class ExtractOutcome {
    Skipped,        // Empty entry, nothing written
    Written,        // Stored entry written verbatim
    Decompressed,   // MiniPack entry decoded and written
    Fallback,       // Raw bytes written under the marker name
    Failed          // Nothing written (bad path, short read, write error)
};

constexpr const char* extract_outcome_string(ExtractOutcome outcome) {
    switch (outcome) {
        case ExtractOutcome::Skipped:      return "skipped";
        case ExtractOutcome::Written:      return "written";
        case ExtractOutcome::Decompressed: return "decompressed";
        case ExtractOutcome::Fallback:     return "fallback";
        case ExtractOutcome::Failed:       return "failed";
        default:                           return "unknown";
    }
}

struct ExtractedFile {
    size_t index = 0;
    std::string archive_path;   // Folder path + name as stored
    std::string output_path;    // Relative path handed to the sink (empty if none)
    PayloadKind kind = PayloadKind::Empty;
    ExtractOutcome outcome = ExtractOutcome::Skipped;
    uint32_t compressed_size = 0;
    uint32_t decompressed_size = 0;
    uint32_t unknown = 0;
    uint64_t written_size = 0;
    uint32_t crc32 = 0;         // Of the bytes written
    std::string message;        // Failure / fallback reason
};

struct ExtractionResult {
    std::string archive_label;
    bool success = true;
    size_t folders_created = 0;
    size_t written = 0;         // Written + Decompressed
    size_t skipped = 0;
    size_t fallback = 0;
    size_t failed = 0;
    size_t minipack_invocations = 0;
    std::vector<std::string> folder_errors;
    std::vector<ExtractedFile> files;
};

/**
 * Extract every folder and file of `archive` into `sink`.
 */
ExtractionResult extract_all(const Archive& archive, OutputSink& sink,
                             const ExtractOptions& options = {});

} // namespace dspack
