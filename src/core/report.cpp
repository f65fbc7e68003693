/**
 * dsPack Unpacker - Extraction Report Implementation
 */

#include "dspack/report.hpp"
#include "dspack/files.hpp"
#include "dspack/logging.hpp"

#include <nlohmann/json.hpp>
#include <iomanip>
#include <sstream>

namespace dspack {

namespace {

std::string hex32(uint32_t value) {
    std::ostringstream ss;
    ss << std::hex << std::setw(8) << std::setfill('0') << value;
    return ss.str();
}

} // namespace

std::string extraction_report_json(const ExtractionResult& result) {
    nlohmann::json j;
    j["archive"] = result.archive_label;
    j["success"] = result.success;
    j["folders_created"] = result.folders_created;
    j["written"] = result.written;
    j["skipped"] = result.skipped;
    j["fallback"] = result.fallback;
    j["failed"] = result.failed;
    j["folder_errors"] = result.folder_errors;

    nlohmann::json files = nlohmann::json::array();
    for (const auto& file : result.files) {
        nlohmann::json item;
        item["index"] = file.index;
        item["path"] = file.archive_path;
        item["output"] = file.output_path;
        item["kind"] = payload_kind_string(file.kind);
        item["outcome"] = extract_outcome_string(file.outcome);
        item["compressed_size"] = file.compressed_size;
        item["decompressed_size"] = file.decompressed_size;
        item["written_size"] = file.written_size;
        item["unknown"] = file.unknown;
        if (!file.output_path.empty()) {
            item["crc32"] = hex32(file.crc32);
        }
        if (!file.message.empty()) {
            item["message"] = file.message;
        }
        files.push_back(std::move(item));
    }
    j["files"] = std::move(files);

    // Archive names are not guaranteed UTF-8; invalid bytes become U+FFFD
    return j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

Result<void> write_extraction_report(const ExtractionResult& result, const std::filesystem::path& path) {
    std::string text = extraction_report_json(result);
    auto bytes = std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(text.data()), text.size());
    DSPACK_TRY(write_file(path, bytes));
    LOG_INFO("Report", "Wrote extraction report: " << path.string());
    return Result<void>::success();
}

} // namespace dspack
