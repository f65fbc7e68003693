/**
 * dsPack Unpacker - Test archive builder
 *
 * Lays out a synthetic archive as:
 *   header | payloads | name table | file records | folder records | 4 pad bytes
 * The padding keeps every directory offset inside the file even when a
 * directory is empty.
 */

#pragma once

#include <dspack/binary_cursor.hpp>
#include <dspack/types.hpp>

#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace dspack::test {

struct FolderSpec {
    std::string name;
    int32_t parent = NO_INDEX;
    int32_t first_file = NO_INDEX;
    int32_t last_file = NO_INDEX;
    int32_t first_subfolder = NO_INDEX;
    int32_t last_subfolder = NO_INDEX;
};

struct FileSpec {
    std::string name;
    int32_t parent = NO_INDEX;
    std::vector<uint8_t> payload;       // Bytes stored in the archive
    uint32_t decompressed_size = 0;
    uint32_t unknown = 0;
};

class ArchiveBuilder {
public:
    explicit ArchiveBuilder(ByteOrder order = ByteOrder::Little) : order_(order) {}

    int32_t add_folder(const std::string& name, int32_t parent = NO_INDEX,
                       int32_t first_file = NO_INDEX, int32_t last_file = NO_INDEX) {
        FolderSpec folder;
        folder.name = name;
        folder.parent = parent;
        folder.first_file = first_file;
        folder.last_file = last_file;
        folders_.push_back(folder);
        return static_cast<int32_t>(folders_.size() - 1);
    }

    // Stored entry: decompressed size equals payload size
    int32_t add_stored_file(const std::string& name, int32_t parent, const std::vector<uint8_t>& data) {
        return add_file(name, parent, data, static_cast<uint32_t>(data.size()));
    }

    int32_t add_file(const std::string& name, int32_t parent, const std::vector<uint8_t>& payload,
                     uint32_t decompressed_size, uint32_t unknown = 0) {
        FileSpec file;
        file.name = name;
        file.parent = parent;
        file.payload = payload;
        file.decompressed_size = decompressed_size;
        file.unknown = unknown;
        files_.push_back(file);
        return static_cast<int32_t>(files_.size() - 1);
    }

    std::vector<FolderSpec>& folders() { return folders_; }
    std::vector<FileSpec>& files() { return files_; }
    const std::vector<FolderSpec>& folders() const { return folders_; }
    const std::vector<FileSpec>& files() const { return files_; }

    std::vector<uint8_t> build() {
        std::vector<uint8_t> out(HEADER_SIZE, 0);
        const auto& magic = (order_ == ByteOrder::Big) ? MAGIC_BIG : MAGIC_LITTLE;
        std::memcpy(out.data(), magic.data(), magic.size());

        std::vector<uint32_t> data_offsets;
        for (const auto& file : files_) {
            data_offsets.push_back(static_cast<uint32_t>(out.size()));
            out.insert(out.end(), file.payload.begin(), file.payload.end());
        }

        names_offset_ = static_cast<uint32_t>(out.size());
        std::vector<uint32_t> file_name_offsets;
        std::vector<uint32_t> folder_name_offsets;
        for (const auto& file : files_) {
            file_name_offsets.push_back(static_cast<uint32_t>(out.size()) - names_offset_);
            out.insert(out.end(), file.name.begin(), file.name.end());
            out.push_back(0);
        }
        for (const auto& folder : folders_) {
            folder_name_offsets.push_back(static_cast<uint32_t>(out.size()) - names_offset_);
            out.insert(out.end(), folder.name.begin(), folder.name.end());
            out.push_back(0);
        }
        names_length_ = static_cast<uint32_t>(out.size()) - names_offset_;

        file_dir_offset_ = static_cast<uint32_t>(out.size());
        for (size_t i = 0; i < files_.size(); ++i) {
            const auto& file = files_[i];
            append_u32(out, file_name_offsets[i]);
            append_u32(out, static_cast<uint32_t>(file.parent));
            append_u32(out, file.decompressed_size);
            append_u32(out, static_cast<uint32_t>(file.payload.size()));
            append_u32(out, file.unknown);
            append_u32(out, data_offsets[i]);
        }

        folder_dir_offset_ = static_cast<uint32_t>(out.size());
        for (size_t i = 0; i < folders_.size(); ++i) {
            const auto& folder = folders_[i];
            append_u32(out, folder_name_offsets[i]);
            append_u32(out, static_cast<uint32_t>(folder.parent));
            append_u32(out, static_cast<uint32_t>(folder.last_subfolder));
            append_u32(out, static_cast<uint32_t>(folder.first_subfolder));
            append_u32(out, static_cast<uint32_t>(folder.first_file));
            append_u32(out, static_cast<uint32_t>(folder.last_file));
        }

        out.insert(out.end(), 4, 0);

        put_u32(out, 12, static_cast<uint32_t>(files_.size()));
        put_u32(out, 16, static_cast<uint32_t>(files_.size() * FILE_RECORD_SIZE));
        put_u32(out, 20, file_dir_offset_);
        put_u32(out, 24, static_cast<uint32_t>(folders_.size()));
        put_u32(out, 28, static_cast<uint32_t>(folders_.size() * FOLDER_RECORD_SIZE));
        put_u32(out, 32, folder_dir_offset_);
        put_u32(out, 36, names_length_);
        put_u32(out, 40, names_offset_);

        return out;
    }

    // Valid after build()
    uint32_t file_dir_offset() const { return file_dir_offset_; }
    uint32_t folder_dir_offset() const { return folder_dir_offset_; }
    uint32_t names_offset() const { return names_offset_; }
    uint32_t names_length() const { return names_length_; }

    // Overwrite field `field` (0-5) of a record in an already built archive
    void patch_file_field(std::vector<uint8_t>& bytes, size_t index, size_t field, uint32_t value) const {
        put_u32(bytes, file_dir_offset_ + index * FILE_RECORD_SIZE + field * 4, value);
    }

    void patch_folder_field(std::vector<uint8_t>& bytes, size_t index, size_t field, uint32_t value) const {
        put_u32(bytes, folder_dir_offset_ + index * FOLDER_RECORD_SIZE + field * 4, value);
    }

    void put_u32(std::vector<uint8_t>& bytes, size_t offset, uint32_t value) const {
        store_u32(bytes.data() + offset, value, order_);
    }

private:
    void append_u32(std::vector<uint8_t>& out, uint32_t value) const {
        uint8_t buf[4];
        store_u32(buf, value, order_);
        out.insert(out.end(), buf, buf + 4);
    }

    ByteOrder order_;
    std::vector<FolderSpec> folders_;
    std::vector<FileSpec> files_;
    uint32_t file_dir_offset_ = 0;
    uint32_t folder_dir_offset_ = 0;
    uint32_t names_offset_ = 0;
    uint32_t names_length_ = 0;
};

inline void write_bytes(const std::filesystem::path& path, const std::vector<uint8_t>& bytes) {
    std::ofstream file(path, std::ios::binary);
    file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
}

inline std::vector<uint8_t> read_bytes(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    return std::vector<uint8_t>((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

inline std::vector<uint8_t> bytes_of(const std::string& text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

// MiniPack stream for "ABABABABAB": literal A, literal B, back-reference (distance 2, length 8)
inline std::vector<uint8_t> minipack_abab() {
    return {0x03, 'A', 'B', 0x02, 0x05};
}

} // namespace dspack::test
