/**
 * dsPack Unpacker - Extraction Report
 *
 * JSON record of one extraction run: what was written where, how each
 * payload was stored, and a CRC-32 of the bytes that reached the disk.
 */

#pragma once

#include "extractor.hpp"
#include "result.hpp"
#include <filesystem>
#include <string>

namespace dspack {

std::string extraction_report_json(const ExtractionResult& result);

Result<void> write_extraction_report(const ExtractionResult& result, const std::filesystem::path& path);

} // namespace dspack
