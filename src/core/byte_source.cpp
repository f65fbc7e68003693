/**
 * dsPack Unpacker - Byte Source Implementation
 */

#include "dspack/byte_source.hpp"
#include "dspack/logging.hpp"

#include <algorithm>

namespace dspack {

Result<std::unique_ptr<FileByteSource>> FileByteSource::open(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return Error::io_error("Not a regular file", path.string());
    }

    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return Error::io_error("Failed to get file size: " + ec.message(), path.string());
    }

    auto source = std::make_unique<FileByteSource>(PrivateTag{});
    source->file_.open(path, std::ios::binary);
    if (!source->file_) {
        return Error::io_error("Failed to open file for reading", path.string());
    }
    source->path_ = path;
    source->size_ = static_cast<uint64_t>(size);

    LOG_DEBUG("ByteSource", "Opened " << path.string() << " (" << size << " bytes)");
    return std::move(source);
}

FileByteSource::~FileByteSource() {
    if (file_.is_open()) {
        file_.close();
        LOG_DEBUG("ByteSource", "Closed " << path_.string());
    }
}

Result<std::vector<uint8_t>> FileByteSource::read(uint64_t offset, size_t length) {
    if (offset > size_ || length > size_ - offset) {
        return Error::out_of_bounds("Range " + std::to_string(offset) + "+" + std::to_string(length) +
                                    " outside file of " + std::to_string(size_) + " bytes",
                                    path_.string());
    }

    std::vector<uint8_t> data(length);
    if (length == 0) {
        return data;
    }

    // A failed earlier read leaves the stream in a fail state
    file_.clear();
    file_.seekg(static_cast<std::streamoff>(offset));
    if (!file_.good()) {
        return Error::io_error("Failed to seek to offset " + std::to_string(offset), path_.string());
    }

    file_.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(length));
    if (file_.gcount() != static_cast<std::streamsize>(length)) {
        return Error::io_error("Short read: wanted " + std::to_string(length) + " bytes at " +
                               std::to_string(offset) + ", got " + std::to_string(file_.gcount()),
                               path_.string());
    }

    return data;
}

Result<std::vector<uint8_t>> MemoryByteSource::read(uint64_t offset, size_t length) {
    ++read_count_;
    if (offset > data_.size() || length > data_.size() - offset) {
        return Error::out_of_bounds("Range " + std::to_string(offset) + "+" + std::to_string(length) +
                                    " outside buffer of " + std::to_string(data_.size()) + " bytes",
                                    label_);
    }
    auto first = data_.begin() + static_cast<std::ptrdiff_t>(offset);
    return std::vector<uint8_t>(first, first + static_cast<std::ptrdiff_t>(length));
}

} // namespace dspack
