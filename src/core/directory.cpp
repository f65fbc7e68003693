/**
 * dsPack Unpacker - Directory Builder Implementation
 *
 * File record:   name_offset u32, parent_folder i32, decompressed_size u32,
 *                compressed_size u32, unknown u32, data_offset u32
 * Folder record: name_offset u32, parent_folder i32, last_subfolder i32,
 *                first_subfolder i32, first_file i32, last_file i32
 */

#include "dspack/directory.hpp"
#include "dspack/binary_cursor.hpp"
#include "dspack/logging.hpp"

namespace dspack {

namespace {

bool valid_folder_ref(int32_t index, uint32_t num_folders) {
    return index == NO_INDEX || (index >= 0 && static_cast<uint32_t>(index) < num_folders);
}

// first_file / last_file may point one past the last file
bool valid_file_ref(int32_t index, uint32_t num_files) {
    return index == NO_INDEX || (index >= 0 && static_cast<uint32_t>(index) <= num_files);
}

Result<std::string> entry_name(const NameTable& names, uint32_t offset,
                               const char* kind, uint32_t index) {
    auto name = names.resolve(offset);
    if (!name) {
        return Error::integrity(std::string("Invalid ") + kind + " name at offset " +
                                std::to_string(offset) + " for " + kind + " " +
                                std::to_string(index) + ": " + name.error().message);
    }
    if (name->empty()) {
        return Error::integrity(std::string("Empty ") + kind + " name at offset " +
                                std::to_string(offset) + " for " + kind + " " +
                                std::to_string(index));
    }
    return std::move(name.value());
}

} // namespace

Result<std::vector<FileEntry>> read_file_entries(std::span<const uint8_t> records,
                                                 ByteOrder order,
                                                 const NameTable& names,
                                                 const DirectoryLimits& limits) {
    BinaryCursor cursor(records);
    std::vector<FileEntry> files;
    files.reserve(limits.num_files);

    for (uint32_t i = 0; i < limits.num_files; ++i) {
        DSPACK_TRY_ASSIGN(name_offset, cursor.read_u32(order));
        DSPACK_TRY_ASSIGN(parent_folder, cursor.read_i32(order));
        DSPACK_TRY_ASSIGN(decompressed_size, cursor.read_u32(order));
        DSPACK_TRY_ASSIGN(compressed_size, cursor.read_u32(order));
        DSPACK_TRY_ASSIGN(unknown, cursor.read_u32(order));
        DSPACK_TRY_ASSIGN(data_offset, cursor.read_u32(order));

        if (!valid_folder_ref(parent_folder, limits.num_folders)) {
            return Error::integrity("Invalid parent folder " + std::to_string(parent_folder) +
                                    " for file " + std::to_string(i));
        }

        if (compressed_size > limits.file_size) {
            return Error::out_of_bounds("Invalid compressed length " + std::to_string(compressed_size) +
                                        " for file " + std::to_string(i) + " (file size: " +
                                        std::to_string(limits.file_size) + ")");
        }
        if (compressed_size > 0 && data_offset >= limits.file_size) {
            return Error::out_of_bounds("Invalid data offset " + std::to_string(data_offset) +
                                        " for file " + std::to_string(i) + " (file size: " +
                                        std::to_string(limits.file_size) + ")");
        }

        DSPACK_TRY_ASSIGN(name, entry_name(names, name_offset, "file", i));

        FileEntry entry;
        entry.name = std::move(name);
        entry.parent_folder = parent_folder;
        entry.decompressed_size = decompressed_size;
        entry.compressed_size = compressed_size;
        entry.unknown = unknown;
        entry.data_offset = data_offset;
        files.push_back(std::move(entry));
    }

    LOG_DEBUG("Directory", "Read " << files.size() << " file records");
    return files;
}

Result<std::vector<FolderEntry>> read_folder_entries(std::span<const uint8_t> records,
                                                     ByteOrder order,
                                                     const NameTable& names,
                                                     const DirectoryLimits& limits) {
    BinaryCursor cursor(records);
    std::vector<FolderEntry> folders;
    folders.reserve(limits.num_folders);

    for (uint32_t i = 0; i < limits.num_folders; ++i) {
        DSPACK_TRY_ASSIGN(name_offset, cursor.read_u32(order));
        DSPACK_TRY_ASSIGN(parent_folder, cursor.read_i32(order));
        DSPACK_TRY_ASSIGN(last_subfolder, cursor.read_i32(order));
        DSPACK_TRY_ASSIGN(first_subfolder, cursor.read_i32(order));
        DSPACK_TRY_ASSIGN(first_file, cursor.read_i32(order));
        DSPACK_TRY_ASSIGN(last_file, cursor.read_i32(order));

        if (!valid_folder_ref(parent_folder, limits.num_folders)) {
            return Error::integrity("Invalid parent folder " + std::to_string(parent_folder) +
                                    " for folder " + std::to_string(i));
        }
        if (!valid_file_ref(first_file, limits.num_files)) {
            return Error::integrity("Invalid first file " + std::to_string(first_file) +
                                    " for folder " + std::to_string(i));
        }
        if (!valid_file_ref(last_file, limits.num_files)) {
            return Error::integrity("Invalid last file " + std::to_string(last_file) +
                                    " for folder " + std::to_string(i));
        }

        DSPACK_TRY_ASSIGN(name, entry_name(names, name_offset, "folder", i));

        FolderEntry entry;
        entry.name = std::move(name);
        entry.parent_folder = parent_folder;
        entry.last_subfolder = last_subfolder;
        entry.first_subfolder = first_subfolder;
        entry.first_file = first_file;
        entry.last_file = last_file;
        folders.push_back(std::move(entry));
    }

    LOG_DEBUG("Directory", "Read " << folders.size() << " folder records");
    return folders;
}

} // namespace dspack
