/**
 * dsPack Unpacker - Extraction Pipeline Implementation
 *
 * Per file:
 *   empty      -> skipped
 *   stored     -> raw bytes
 *   minipack   -> decoded bytes, or raw bytes + marker if decoding fails
 *   anomalous  -> raw bytes + marker (compressed larger than decompressed)
 */

#include "dspack/extractor.hpp"
#include "dspack/minipack.hpp"
#include "dspack/path_utils.hpp"
#include "dspack/logging.hpp"

#include <zlib.h>

namespace dspack {

namespace {

uint32_t checksum(std::span<const uint8_t> data) {
    uLong crc = ::crc32(0L, Z_NULL, 0);
    crc = ::crc32(crc, data.data(), static_cast<uInt>(data.size()));
    return static_cast<uint32_t>(crc);
}

bool write_output(OutputSink& sink, ExtractedFile& record, const std::string& path,
                  std::span<const uint8_t> data) {
    auto written = sink.write_file(path, data);
    if (!written) {
        record.outcome = ExtractOutcome::Failed;
        record.message = written.error().full_message();
        LOG_ERROR("Extractor", "  - Failed to write " << path << ": " << record.message);
        return false;
    }
    record.output_path = path;
    record.written_size = data.size();
    record.crc32 = checksum(data);
    return true;
}

void write_fallback(OutputSink& sink, ExtractedFile& record, const std::string& path,
                    std::span<const uint8_t> raw, const ExtractOptions& options) {
    std::string marked = insert_marker(path, options.compressed_marker);
    if (write_output(sink, record, marked, raw)) {
        record.outcome = ExtractOutcome::Fallback;
        LOG_WARNING("Extractor", "  > Extracted as-is: " << marked);
    }
}

void extract_one(const Archive& archive, const FileEntry& entry, ExtractedFile& record,
                 OutputSink& sink, const ExtractOptions& options, size_t& minipack_calls) {
    if (record.kind == PayloadKind::Empty) {
        record.outcome = ExtractOutcome::Skipped;
        LOG_INFO("Extractor", "  - Empty entry, nothing to extract");
        return;
    }

    auto path = sanitize_relative_path(record.archive_path);
    if (!path) {
        record.outcome = ExtractOutcome::Failed;
        record.message = Error::io_error("Path escapes the output root", record.archive_path).full_message();
        LOG_ERROR("Extractor", "  - " << record.message);
        return;
    }

    auto payload = archive.read_payload(entry);
    if (!payload) {
        record.outcome = ExtractOutcome::Failed;
        record.message = payload.error().full_message();
        LOG_ERROR("Extractor", "  - Failed to read payload: " << record.message);
        return;
    }
    const std::vector<uint8_t>& raw = payload.value();

    switch (record.kind) {
        case PayloadKind::Stored:
            LOG_INFO("Extractor", "  > File is not compressed");
            if (write_output(sink, record, *path, raw)) {
                record.outcome = ExtractOutcome::Written;
            }
            return;

        case PayloadKind::MiniPack: {
            ++minipack_calls;
            auto decoded = minipack_decompress(raw, entry.decompressed_size);
            if (!decoded) {
                record.message = decoded.error().message;
                LOG_WARNING("Extractor", "(!!) Unknown compression format: " << record.message);
                write_fallback(sink, record, *path, raw, options);
                return;
            }
            LOG_INFO("Extractor", "  > Successfully decompressed (" << entry.compressed_size
                     << " -> " << decoded->size() << " bytes)");
            if (write_output(sink, record, *path, decoded.value())) {
                record.outcome = ExtractOutcome::Decompressed;
            }
            return;
        }

        case PayloadKind::Anomalous:
            record.message = "Compressed size " + std::to_string(entry.compressed_size) +
                             " exceeds decompressed size " + std::to_string(entry.decompressed_size);
            LOG_WARNING("Extractor", "(!!) Invalid compression: " << record.message);
            write_fallback(sink, record, *path, raw, options);
            return;

        case PayloadKind::Empty:
            return;
    }
}

} // namespace

ExtractionResult extract_all(const Archive& archive, OutputSink& sink, const ExtractOptions& options) {
    ExtractionResult result;
    result.archive_label = archive.label();

    LOG_INFO("Extractor", "Extracting " << archive.label() << " to " << sink.describe());

    for (size_t i = 0; i < archive.folder_paths().size(); ++i) {
        const std::string& folder = archive.folder_paths()[i];
        auto path = sanitize_relative_path(folder);
        if (!path) {
            result.folder_errors.push_back("Folder " + std::to_string(i) + " path escapes the output root: " + folder);
            LOG_ERROR("Extractor", result.folder_errors.back());
            continue;
        }
        auto created = sink.create_directory(*path);
        if (!created) {
            result.folder_errors.push_back(created.error().full_message());
            LOG_ERROR("Extractor", "Failed to create folder " << *path << ": "
                      << created.error().full_message());
            continue;
        }
        ++result.folders_created;
    }

    const auto& files = archive.files();
    result.files.reserve(files.size());

    for (size_t i = 0; i < files.size(); ++i) {
        const FileEntry& entry = files[i];

        ExtractedFile record;
        record.index = i;
        record.archive_path = archive.file_path(entry);
        record.kind = entry.kind();
        record.compressed_size = entry.compressed_size;
        record.decompressed_size = entry.decompressed_size;
        record.unknown = entry.unknown;

        LOG_INFO("Extractor", "[" << (i + 1) << "/" << files.size() << "] " << entry.name);
        extract_one(archive, entry, record, sink, options, result.minipack_invocations);

        switch (record.outcome) {
            case ExtractOutcome::Skipped:      ++result.skipped; break;
            case ExtractOutcome::Written:
            case ExtractOutcome::Decompressed: ++result.written; break;
            case ExtractOutcome::Fallback:     ++result.fallback; break;
            case ExtractOutcome::Failed:       ++result.failed; break;
        }
        result.files.push_back(std::move(record));
    }

    result.success = result.fallback == 0 && result.failed == 0 && result.folder_errors.empty();

    LOG_INFO("Extractor", "Done: " << result.written << " written, " << result.fallback
             << " extracted as-is, " << result.failed << " failed, " << result.skipped << " empty");
    return result;
}

} // namespace dspack
