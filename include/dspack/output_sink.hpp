/**
 * dsPack Unpacker - Output Sinks
 *
 * Where extracted folders and payloads go. Paths handed to a sink are
 * relative, slash-separated and already sanitized.
 */

#pragma once

#include "result.hpp"
#include <filesystem>
#include <span>
#include <string>
#include <cstdint>

namespace dspack {

class OutputSink {
public:
    virtual ~OutputSink() = default;

    // Create a folder; an existing folder is not an error
    virtual Result<void> create_directory(const std::string& relative_path) = 0;

    // Create or replace a file; parent folders are created as needed
    virtual Result<void> write_file(const std::string& relative_path, std::span<const uint8_t> data) = 0;

    virtual std::string describe() const = 0;
};

/**
 * Writes under a root directory on the local filesystem.
 */
class DirectorySink : public OutputSink {
public:
    explicit DirectorySink(std::filesystem::path root) : root_(std::move(root)) {}

    Result<void> create_directory(const std::string& relative_path) override;
    Result<void> write_file(const std::string& relative_path, std::span<const uint8_t> data) override;
    std::string describe() const override { return root_.string(); }

    const std::filesystem::path& root() const { return root_; }
    std::filesystem::path resolve(const std::string& relative_path) const;

private:
    std::filesystem::path root_;
};

} // namespace dspack
