/**
 * dsPack Unpacker - Settings Implementation
 */

#include "dspack/settings.hpp"

#include <nlohmann/json.hpp>
#include <fstream>

namespace dspack {

Result<UnpackerSettings> load_settings(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Error::io_error("Cannot open settings file", path.string());
    }

    UnpackerSettings settings;
    try {
        nlohmann::json j = nlohmann::json::parse(file);

        if (j.contains("log_level")) {
            auto name = j["log_level"].get<std::string>();
            auto level = parse_log_level(name);
            if (!level) {
                return Error::parse_error("Unknown log_level '" + name + "'", path.string());
            }
            settings.log_level = *level;
        }
        if (j.contains("log_file")) settings.log_file = j["log_file"].get<std::string>();
        if (j.contains("console_output")) settings.console_output = j["console_output"].get<bool>();
        if (j.contains("output_dir")) settings.output_dir = j["output_dir"].get<std::string>();
        if (j.contains("compressed_marker")) settings.compressed_marker = j["compressed_marker"].get<std::string>();
        if (j.contains("write_report")) settings.write_report = j["write_report"].get<bool>();
        if (j.contains("sample_file_count")) settings.sample_file_count = j["sample_file_count"].get<size_t>();
        if (j.contains("tree_depth")) settings.tree_depth = j["tree_depth"].get<size_t>();
    } catch (const nlohmann::json::exception& e) {
        return Error::parse_error(std::string("Invalid settings: ") + e.what(), path.string());
    }

    if (settings.compressed_marker.empty()) {
        return Error::parse_error("compressed_marker must not be empty", path.string());
    }

    return settings;
}

Result<void> save_settings(const UnpackerSettings& settings, const std::filesystem::path& path) {
    nlohmann::json j;
    j["log_level"] = log_level_string(settings.log_level);
    j["log_file"] = settings.log_file.string();
    j["console_output"] = settings.console_output;
    j["output_dir"] = settings.output_dir.string();
    j["compressed_marker"] = settings.compressed_marker;
    j["write_report"] = settings.write_report;
    j["sample_file_count"] = settings.sample_file_count;
    j["tree_depth"] = settings.tree_depth;

    std::string text;
    try {
        text = j.dump(2);
    } catch (const nlohmann::json::exception& e) {
        return Error::parse_error(std::string("Cannot serialize settings: ") + e.what(), path.string());
    }

    std::ofstream file(path);
    if (!file.is_open()) {
        return Error::io_error("Cannot write settings file", path.string());
    }
    file << text << '\n';
    if (!file) {
        return Error::io_error("Failed to write settings", path.string());
    }
    return Result<void>::success();
}

void apply_logging_settings(const UnpackerSettings& settings) {
    auto& logger = Logger::instance();
    logger.set_level(settings.log_level);
    logger.set_console_output(settings.console_output);
    if (settings.log_file.empty()) {
        logger.close_file();
    } else if (!logger.set_file(settings.log_file)) {
        LOG_WARNING("Settings", "Cannot open log file: " << settings.log_file.string());
    }
}

} // namespace dspack
