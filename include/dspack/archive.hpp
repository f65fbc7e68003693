/**
 * dsPack Unpacker - Archive
 *
 * An open dsPack archive: the byte source, the decoded header, both
 * directories and the resolved folder paths. Directories are read in
 * full at open; payloads are read from the source on demand.
 */

#pragma once

#include "types.hpp"
#include "result.hpp"
#include "byte_source.hpp"
#include "name_table.hpp"
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace dspack {

class Archive {
public:
    ~Archive();

    // Delete copy, enable move
    Archive(const Archive&) = delete;
    Archive& operator=(const Archive&) = delete;
    Archive(Archive&&) noexcept;
    Archive& operator=(Archive&&) noexcept;

    /**
     * Open and fully validate an archive on disk.
     * Fails on an unknown magic, a bad offset, a bad cross-reference or a
     * folder cycle; nothing of a failed archive is kept.
     */
    static Result<Archive> open(const std::filesystem::path& path);

    /**
     * Open from an arbitrary byte source. The archive takes ownership.
     */
    static Result<Archive> open(std::unique_ptr<ByteSource> source);

    const ArchiveHeader& header() const { return header_; }
    ByteOrder byte_order() const { return header_.byte_order; }
    const std::string& label() const { return label_; }
    uint64_t file_size() const { return source_ ? source_->size() : 0; }

    const std::vector<FileEntry>& files() const { return files_; }
    const std::vector<FolderEntry>& folders() const { return folders_; }

    /**
     * Resolved path of a folder ("Data/Textures"), empty for NO_INDEX.
     */
    const std::string& folder_path(int32_t folder_index) const;
    const std::vector<std::string>& folder_paths() const { return folder_paths_; }

    /**
     * Path of a file relative to the archive root ("Data/Textures/a.dds").
     */
    std::string file_path(const FileEntry& entry) const;

    /**
     * Raw bytes of an entry's payload (compressed_size bytes at data_offset).
     */
    Result<std::vector<uint8_t>> read_payload(const FileEntry& entry) const;

    bool is_open() const { return source_ != nullptr; }
    void close();

private:
    Archive() = default;

    Result<void> parse();

    std::unique_ptr<ByteSource> source_;
    std::string label_;
    ArchiveHeader header_;
    NameTable names_;
    std::vector<FileEntry> files_;
    std::vector<FolderEntry> folders_;
    std::vector<std::string> folder_paths_;
};

} // namespace dspack
