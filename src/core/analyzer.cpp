/**
 * dsPack Unpacker - Archive Analysis Implementation
 */

#include "dspack/analyzer.hpp"
#include "dspack/files.hpp"
#include "dspack/path_utils.hpp"

#include <algorithm>
#include <iomanip>
#include <map>
#include <sstream>

namespace dspack {

namespace {

struct TreeNode {
    bool is_file = false;
    std::map<std::string, TreeNode> children;
};

void add_path(TreeNode& root, const std::string& path, bool is_file) {
    TreeNode* current = &root;
    size_t pos = 0;
    while (pos < path.size()) {
        size_t end = path.find('/', pos);
        if (end == std::string::npos) end = path.size();
        if (end > pos) {
            bool last = end == path.size();
            TreeNode& child = current->children[path.substr(pos, end - pos)];
            if (last && is_file) child.is_file = true;
            current = &child;
        }
        pos = end + 1;
    }
}

void render(const TreeNode& node, const std::string& name, size_t depth, size_t max_depth,
            std::vector<std::string>& lines) {
    if (depth > max_depth) {
        return;
    }

    std::string prefix(depth * 2, ' ');
    if (node.is_file) {
        lines.push_back(prefix + "- " + name);
    } else {
        lines.push_back(prefix + "+ " + name + "/");
    }

    // Files before folders, each group by name
    for (bool files_pass : {true, false}) {
        for (const auto& [child_name, child] : node.children) {
            if (child.is_file == files_pass) {
                render(child, child_name, depth + 1, max_depth, lines);
            }
        }
    }
}

} // namespace

ArchiveSummary analyze(const Archive& archive, size_t sample_count) {
    ArchiveSummary summary;
    summary.label = archive.label();
    summary.byte_order = archive.byte_order();
    summary.file_count = archive.files().size();
    summary.folder_count = archive.folders().size();

    for (size_t i = 0; i < archive.folders().size(); ++i) {
        FolderSummary folder;
        folder.path = archive.folder_paths()[i];
        folder.file_count = archive.folders()[i].declared_file_count();
        summary.folders.push_back(std::move(folder));
    }

    std::map<std::string, size_t> extension_counts;
    for (const FileEntry& entry : archive.files()) {
        summary.total_compressed += entry.compressed_size;
        summary.total_decompressed += entry.decompressed_size;

        switch (entry.kind()) {
            case PayloadKind::Empty:     ++summary.empty_count; break;
            case PayloadKind::Stored:    ++summary.stored_count; break;
            case PayloadKind::MiniPack:  ++summary.minipack_count; break;
            case PayloadKind::Anomalous: ++summary.anomalous_count; break;
        }

        std::string ext = get_extension_lower(std::filesystem::path(entry.name));
        if (ext.size() > 1) {
            ++extension_counts[ext.substr(1)];
        }

        summary.file_paths.push_back(archive.file_path(entry));

        if (summary.samples.size() < sample_count) {
            FileSample sample;
            sample.name = entry.name;
            sample.decompressed_size = entry.decompressed_size;
            sample.compressed_size = entry.compressed_size;
            if (entry.decompressed_size > 0) {
                double ratio = static_cast<double>(entry.compressed_size) / entry.decompressed_size;
                sample.compression_percent = std::max(0.0, (1.0 - ratio) * 100.0);
            }
            summary.samples.push_back(std::move(sample));
        }
    }

    summary.extensions.assign(extension_counts.begin(), extension_counts.end());
    std::stable_sort(summary.extensions.begin(), summary.extensions.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });

    return summary;
}

std::vector<std::string> format_summary(const ArchiveSummary& summary) {
    std::vector<std::string> lines;
    std::ostringstream ss;

    lines.push_back("[Archive Analysis: " + std::filesystem::path(summary.label).filename().string() + "]");
    lines.push_back(std::string(50, '='));
    lines.push_back(std::string("Format: ") + byte_order_string(summary.byte_order));
    lines.push_back("Files: " + std::to_string(summary.file_count));
    lines.push_back("Folders: " + std::to_string(summary.folder_count));
    lines.push_back("Payload: " + format_file_size(summary.total_compressed) + " stored, " +
                    format_file_size(summary.total_decompressed) + " unpacked (" +
                    std::to_string(summary.stored_count) + " raw, " +
                    std::to_string(summary.minipack_count) + " MiniPack, " +
                    std::to_string(summary.anomalous_count) + " anomalous, " +
                    std::to_string(summary.empty_count) + " empty)");

    lines.push_back("");
    lines.push_back("[Folder Structure]");
    for (const auto& folder : summary.folders) {
        lines.push_back("  " + folder.path + "/ (" + std::to_string(folder.file_count) + " files)");
    }

    lines.push_back("");
    lines.push_back("[Sample Files]");
    for (const auto& sample : summary.samples) {
        lines.push_back("  * " + sample.name);
        lines.push_back("    Size: " + std::to_string(sample.decompressed_size) + " bytes");
        if (sample.compression_percent > 0.0) {
            ss.str("");
            ss << std::fixed << std::setprecision(1) << sample.compression_percent;
            lines.push_back("    Compression: " + ss.str() + "%");
        }
    }

    if (!summary.extensions.empty()) {
        lines.push_back("");
        lines.push_back("[File Extension Statistics]");
        for (const auto& [ext, count] : summary.extensions) {
            lines.push_back("  " + ext + ": " + std::to_string(count) + " files");
        }
    }

    return lines;
}

std::vector<std::string> format_tree(const ArchiveSummary& summary, size_t max_depth) {
    TreeNode root;
    for (const auto& folder : summary.folders) {
        add_path(root, folder.path, false);
    }
    for (const auto& file : summary.file_paths) {
        add_path(root, file, true);
    }

    std::vector<std::string> lines;
    lines.push_back("+ /");
    for (bool files_pass : {true, false}) {
        for (const auto& [name, child] : root.children) {
            if (child.is_file == files_pass) {
                render(child, name, 1, max_depth, lines);
            }
        }
    }
    return lines;
}

} // namespace dspack
