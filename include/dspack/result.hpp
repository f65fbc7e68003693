/**
 * dsPack Unpacker - Result Type
 *
 * Result<T> holds either a value or an Error. Every fallible operation in
 * the library returns one; nothing throws across the public API.
 */

#pragma once

#include <variant>
#include <string>
#include <optional>
#include <stdexcept>
#include <utility>

namespace dspack {

/**
 * Error information with code and message
 */
struct Error {
    enum class Code {
        None = 0,
        InvalidFormat,      // Unrecognized magic, truncated header
        OutOfBounds,        // Offset or length outside the archive
        Integrity,          // Cross-reference out of range, unresolvable name
        CorruptArchive,     // Parent chain cycle
        Decompression,      // MiniPack token overran a buffer
        IoError,
        ParseError,         // Settings / JSON
        InvalidArgument,
        Unknown
    };

    Code code = Code::None;
    std::string message;
    std::string context;  // Archive path, entry name, ...

    Error() = default;
    Error(Code c, std::string msg) : code(c), message(std::move(msg)) {}
    Error(Code c, std::string msg, std::string ctx)
        : code(c), message(std::move(msg)), context(std::move(ctx)) {}

    bool ok() const { return code == Code::None; }

    std::string full_message() const {
        if (context.empty()) {
            return message;
        }
        return message + " [" + context + "]";
    }

    // Common error constructors
    static Error invalid_format(const std::string& msg, const std::string& ctx = "") {
        return Error(Code::InvalidFormat, msg, ctx);
    }

    static Error out_of_bounds(const std::string& msg, const std::string& ctx = "") {
        return Error(Code::OutOfBounds, msg, ctx);
    }

    static Error integrity(const std::string& msg, const std::string& ctx = "") {
        return Error(Code::Integrity, msg, ctx);
    }

    static Error corrupt_archive(const std::string& msg, const std::string& ctx = "") {
        return Error(Code::CorruptArchive, msg, ctx);
    }

    static Error decompression(const std::string& msg) {
        return Error(Code::Decompression, msg);
    }

    static Error io_error(const std::string& msg, const std::string& path = "") {
        return Error(Code::IoError, msg, path);
    }

    static Error parse_error(const std::string& msg, const std::string& ctx = "") {
        return Error(Code::ParseError, msg, ctx);
    }
};

constexpr const char* error_code_string(Error::Code code) {
    switch (code) {
        case Error::Code::None:            return "None";
        case Error::Code::InvalidFormat:   return "FormatError";
        case Error::Code::OutOfBounds:     return "BoundsError";
        case Error::Code::Integrity:       return "IntegrityError";
        case Error::Code::CorruptArchive:  return "CorruptArchiveError";
        case Error::Code::Decompression:   return "DecompressionFailure";
        case Error::Code::IoError:         return "IOError";
        case Error::Code::ParseError:      return "ParseError";
        case Error::Code::InvalidArgument: return "InvalidArgument";
        default:                           return "Unknown";
    }
}

/**
 * Result type that holds either a value T or an Error
 *
 * Usage:
 *   Result<Archive> archive = Archive::open("Data.dsPack");
 *   if (archive) {
 *       for (const auto& file : archive->files()) { ... }
 *   } else {
 *       LOG_ERROR("Tag", archive.error().full_message());
 *   }
 */
template<typename T>
class Result {
public:
    // Success construction
    Result(T value) : data_(std::move(value)) {}

    // Error construction
    Result(Error error) : data_(std::move(error)) {}

    // Check if result is successful
    bool ok() const { return std::holds_alternative<T>(data_); }
    bool has_value() const { return ok(); }
    explicit operator bool() const { return ok(); }

    // Access value (throws if error)
    T& value() {
        if (!ok()) {
            throw std::runtime_error("Result contains error: " + error().message);
        }
        return std::get<T>(data_);
    }

    const T& value() const {
        if (!ok()) {
            throw std::runtime_error("Result contains error: " + error().message);
        }
        return std::get<T>(data_);
    }

    // Access value with default
    T value_or(T default_value) const {
        if (ok()) {
            return std::get<T>(data_);
        }
        return default_value;
    }

    // Access error
    const Error& error() const {
        if (ok()) {
            static Error no_error;
            return no_error;
        }
        return std::get<Error>(data_);
    }

    // Pointer-like access
    T* operator->() { return &value(); }
    const T* operator->() const { return &value(); }
    T& operator*() { return value(); }
    const T& operator*() const { return value(); }

private:
    std::variant<T, Error> data_;
};

/**
 * Specialization for void results (just success/failure)
 */
template<>
class Result<void> {
public:
    Result() : error_(std::nullopt) {}
    Result(Error error) : error_(std::move(error)) {}

    bool ok() const { return !error_.has_value(); }
    explicit operator bool() const { return ok(); }

    const Error& error() const {
        static Error no_error;
        return error_ ? *error_ : no_error;
    }

    static Result success() { return Result(); }
    static Result failure(Error err) { return Result(std::move(err)); }

private:
    std::optional<Error> error_;
};

// Helper macros for early return on error
#define DSPACK_TRY(expr) \
    do { \
        auto _result = (expr); \
        if (!_result.ok()) { \
            return _result.error(); \
        } \
    } while(0)

#define DSPACK_TRY_ASSIGN(var, expr) \
    auto _result_##var = (expr); \
    if (!_result_##var.ok()) { \
        return _result_##var.error(); \
    } \
    auto var = std::move(_result_##var.value())

} // namespace dspack
