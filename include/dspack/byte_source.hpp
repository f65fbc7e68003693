/**
 * dsPack Unpacker - Byte Sources
 *
 * Random-access byte providers the archive reads from. The archive owns
 * its source; the file handle is released when the source is destroyed.
 */

#pragma once

#include "result.hpp"
#include <filesystem>
#include <fstream>
#include <memory>
#include <vector>
#include <string>
#include <cstdint>

namespace dspack {

class ByteSource {
public:
    virtual ~ByteSource() = default;

    virtual uint64_t size() const = 0;

    /**
     * Read exactly `length` bytes at `offset`.
     * Fails with OutOfBounds if the range leaves the source, IoError on a short read.
     */
    virtual Result<std::vector<uint8_t>> read(uint64_t offset, size_t length) = 0;

    // Label used in diagnostics (usually the file path)
    virtual std::string label() const = 0;
};

/**
 * Reads from a file on disk through a scoped std::ifstream.
 */
class FileByteSource : public ByteSource {
    // Only open() can name the tag
    struct PrivateTag { explicit PrivateTag() = default; };

public:
    static Result<std::unique_ptr<FileByteSource>> open(const std::filesystem::path& path);

    explicit FileByteSource(PrivateTag) {}

    ~FileByteSource() override;

    FileByteSource(const FileByteSource&) = delete;
    FileByteSource& operator=(const FileByteSource&) = delete;

    uint64_t size() const override { return size_; }
    Result<std::vector<uint8_t>> read(uint64_t offset, size_t length) override;
    std::string label() const override { return path_.string(); }

    bool is_open() const { return file_.is_open(); }

private:
    std::filesystem::path path_;
    std::ifstream file_;
    uint64_t size_ = 0;
};

/**
 * Serves bytes from an owned buffer.
 */
class MemoryByteSource : public ByteSource {
public:
    explicit MemoryByteSource(std::vector<uint8_t> data, std::string label = "<memory>")
        : data_(std::move(data)), label_(std::move(label)) {}

    uint64_t size() const override { return data_.size(); }
    Result<std::vector<uint8_t>> read(uint64_t offset, size_t length) override;
    std::string label() const override { return label_; }

    // Number of read() calls served, for tests that check on-demand access
    size_t read_count() const { return read_count_; }

private:
    std::vector<uint8_t> data_;
    std::string label_;
    size_t read_count_ = 0;
};

} // namespace dspack
