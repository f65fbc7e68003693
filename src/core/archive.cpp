/**
 * dsPack Unpacker - Archive Implementation
 *
 * Open order: header -> name table -> file records -> folder records ->
 * folder paths. Every step must succeed; the byte source is released
 * with the half-built archive on any failure.
 */

#include "dspack/archive.hpp"
#include "dspack/header.hpp"
#include "dspack/directory.hpp"
#include "dspack/path_resolver.hpp"
#include "dspack/logging.hpp"

#include <algorithm>

namespace dspack {

Archive::~Archive() = default;
Archive::Archive(Archive&&) noexcept = default;
Archive& Archive::operator=(Archive&&) noexcept = default;

Result<Archive> Archive::open(const std::filesystem::path& path) {
    LOG_DEBUG("Archive", "Opening: " << path.string());

    auto source = FileByteSource::open(path);
    if (!source) {
        LOG_ERROR("Archive", "Failed to open " << path.string() << ": " << source.error().message);
        return source.error();
    }
    return open(std::unique_ptr<ByteSource>(std::move(source.value())));
}

Result<Archive> Archive::open(std::unique_ptr<ByteSource> source) {
    if (!source) {
        return Error(Error::Code::InvalidArgument, "No byte source");
    }

    Archive archive;
    archive.label_ = source->label();
    archive.source_ = std::move(source);

    auto parsed = archive.parse();
    if (!parsed) {
        Error error = parsed.error();
        if (error.context.empty()) {
            error.context = archive.label_;
        }
        LOG_ERROR("Archive", error_code_string(error.code) << ": " << error.full_message());
        return error;
    }

    LOG_INFO("Archive", "Opened: " << archive.label_ << " (" << byte_order_string(archive.byte_order())
             << ", " << archive.files_.size() << " files, " << archive.folders_.size() << " folders)");
    return std::move(archive);
}

Result<void> Archive::parse() {
    const uint64_t size = source_->size();

    // A short file still gets its magic checked first, so the error says "not a dsPack"
    DSPACK_TRY_ASSIGN(head, source_->read(0, static_cast<size_t>(std::min<uint64_t>(size, HEADER_SIZE))));
    DSPACK_TRY_ASSIGN(header, parse_header(head, size));
    header_ = header;

    DSPACK_TRY_ASSIGN(name_bytes, source_->read(header_.names_dir_offset, header_.names_dir_length));
    names_ = NameTable(std::move(name_bytes));

    DirectoryLimits limits;
    limits.num_files = header_.num_files;
    limits.num_folders = header_.num_folders;
    limits.file_size = size;

    DSPACK_TRY_ASSIGN(file_records,
                      source_->read(header_.file_dir_offset, header_.num_files * FILE_RECORD_SIZE));
    DSPACK_TRY_ASSIGN(files, read_file_entries(file_records, header_.byte_order, names_, limits));
    files_ = std::move(files);

    DSPACK_TRY_ASSIGN(folder_records,
                      source_->read(header_.folder_dir_offset, header_.num_folders * FOLDER_RECORD_SIZE));
    DSPACK_TRY_ASSIGN(folders, read_folder_entries(folder_records, header_.byte_order, names_, limits));
    folders_ = std::move(folders);

    PathResolver resolver(folders_);
    DSPACK_TRY_ASSIGN(paths, resolver.resolve_all());
    folder_paths_ = std::move(paths);

    return Result<void>::success();
}

const std::string& Archive::folder_path(int32_t folder_index) const {
    static const std::string root;
    if (folder_index < 0 || static_cast<size_t>(folder_index) >= folder_paths_.size()) {
        return root;
    }
    return folder_paths_[folder_index];
}

std::string Archive::file_path(const FileEntry& entry) const {
    const std::string& parent = folder_path(entry.parent_folder);
    if (parent.empty()) {
        return entry.name;
    }
    return parent + "/" + entry.name;
}

Result<std::vector<uint8_t>> Archive::read_payload(const FileEntry& entry) const {
    if (!source_) {
        return Error::io_error("Archive is closed", label_);
    }
    return source_->read(entry.data_offset, entry.compressed_size);
}

void Archive::close() {
    if (source_) {
        LOG_DEBUG("Archive", "Closing: " << label_);
    }
    source_.reset();
    files_.clear();
    folders_.clear();
    folder_paths_.clear();
    names_ = NameTable();
}

} // namespace dspack
