/**
 * dsPack Unpacker - Batch Processing Implementation
 */

#include "dspack/batch.hpp"
#include "dspack/analyzer.hpp"
#include "dspack/archive.hpp"
#include "dspack/extractor.hpp"
#include "dspack/files.hpp"
#include "dspack/report.hpp"
#include "dspack/logging.hpp"

namespace dspack {

namespace {

void log_lines(const std::vector<std::string>& lines) {
    for (const auto& line : lines) {
        LOG_INFO("Analyze", line);
    }
}

} // namespace

Result<std::vector<std::filesystem::path>> collect_archives(const std::filesystem::path& input) {
    std::error_code ec;
    if (std::filesystem::is_directory(input, ec)) {
        return find_dspack_files(input);
    }
    if (std::filesystem::is_regular_file(input, ec)) {
        return std::vector<std::filesystem::path>{input};
    }
    return Error::io_error("No such file or directory", input.string());
}

BatchResult run_batch(const std::filesystem::path& input, const BatchOptions& options,
                      const UnpackerSettings& settings) {
    BatchResult result;

    auto archives = collect_archives(input);
    if (!archives) {
        result.errors.push_back(archives.error().full_message());
        LOG_ERROR("Batch", "(!) Error scanning " << input.string() << ": "
                  << archives.error().full_message());
        ++result.failed;
        return result;
    }
    if (archives->empty()) {
        LOG_WARNING("Batch", "(!) No .dsPack files found in " << input.string());
        return result;
    }

    result.archives = archives->size();
    LOG_INFO("Batch", "Found " << result.archives << " .dsPack files");

    ExtractOptions extract_options;
    extract_options.compressed_marker = settings.compressed_marker;

    for (const auto& path : archives.value()) {
        LOG_INFO("Batch", std::string(50, '='));
        LOG_INFO("Batch", "Processing " << path.string());

        // Scoped per archive: the file handle closes before the next one opens
        auto archive = Archive::open(path);
        if (!archive) {
            result.errors.push_back(path.filename().string() + ": " +
                                    error_code_string(archive.error().code) + ": " +
                                    archive.error().message);
            LOG_ERROR("Batch", "(!) Error: " << archive.error().full_message());
            ++result.failed;
            continue;
        }
        ++result.opened;

        auto summary = analyze(archive.value(), settings.sample_file_count);
        log_lines(format_summary(summary));
        if (options.show_tree) {
            log_lines(format_tree(summary, settings.tree_depth));
        }
        if (options.list_files) {
            for (const auto& file_path : summary.file_paths) {
                LOG_INFO("List", file_path);
            }
        }

        if (options.output_root.empty()) {
            continue;
        }

        auto target = options.output_root / path.stem();
        LOG_INFO("Batch", "Extracting files to " << target.string());

        DirectorySink sink(target);
        auto root = sink.create_directory(".");
        if (!root) {
            result.errors.push_back(root.error().full_message());
            LOG_ERROR("Batch", "(!) Cannot create output folder: " << root.error().full_message());
            ++result.partial;
            continue;
        }

        auto extraction = extract_all(archive.value(), sink, extract_options);
        if (!extraction.success) {
            ++result.partial;
            result.errors.push_back(path.filename().string() + ": " +
                                    std::to_string(extraction.fallback) + " extracted as-is, " +
                                    std::to_string(extraction.failed) + " failed");
        }

        if (settings.write_report) {
            auto report_path = options.output_root / (path.stem().string() + "_report.json");
            auto written = write_extraction_report(extraction, report_path);
            if (!written) {
                LOG_ERROR("Batch", "(!) Cannot write report: " << written.error().full_message());
            }
        }
    }

    LOG_INFO("Batch", "Processed " << result.archives << " archives: " << result.opened << " opened, "
             << result.failed << " failed, " << result.partial << " partially extracted");
    return result;
}

} // namespace dspack
