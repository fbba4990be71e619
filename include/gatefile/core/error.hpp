#pragma once

#include <variant>
#include <string>
#include <string_view>
#include <system_error>

namespace gatefile {

// ============================================================================
// I/O Errors (frame transport and byte streams)
// ============================================================================

enum class IoError {
    Success = 0,
    EndOfStream,
    ClosedPipe,
    Cancelled,
    Timeout,
    ShortWrite,
    InvalidArgument,
    PermissionDenied,
    Unknown
};

// ============================================================================
// File Errors (range, conditional and multipart protocol layer)
// ============================================================================

enum class FileError {
    InvalidRange = 1,
    NoOverlap,
    SizeLimitExceeded,
    NotMultipart,
    MissingBoundary,
    MalformedMultipart,
    MessageTooLarge,
    MissingFile,
    InvalidPath,
    NotSeekable
};

} // namespace gatefile

// Enable std::error_code integration - MUST be before make_error_code declarations
template<>
struct std::is_error_code_enum<gatefile::IoError> : std::true_type {};

template<>
struct std::is_error_code_enum<gatefile::FileError> : std::true_type {};

namespace gatefile {

const std::error_category& io_error_category() noexcept;
std::error_code make_error_code(IoError e) noexcept;

const std::error_category& file_error_category() noexcept;
std::error_code make_error_code(FileError e) noexcept;

// ============================================================================
// Unified Error Type
// ============================================================================

class Error {
public:
    using Variant = std::variant<IoError, FileError, std::error_code>;

private:
    Variant inner_;
    std::string message_;

public:
    Error() : inner_(IoError::Success) {}

    Error(IoError e, std::string message = "")
        : inner_(e), message_(std::move(message)) {}

    Error(FileError e, std::string message = "")
        : inner_(e), message_(std::move(message)) {}

    Error(std::error_code ec, std::string message = "")
        : inner_(ec), message_(std::move(message)) {}

    // Factory methods
    static Error io(IoError e, std::string msg = "") {
        return Error(e, std::move(msg));
    }

    static Error file(FileError e, std::string msg = "") {
        return Error(e, std::move(msg));
    }

    static Error system(std::error_code ec, std::string msg = "") {
        return Error(ec, std::move(msg));
    }

    // From the current errno value
    static Error last_system_error(std::string msg = "");

    static Error end_of_stream() {
        return Error(IoError::EndOfStream, "end of stream");
    }

    static Error cancelled() {
        return Error(IoError::Cancelled, "Operation cancelled");
    }

    // Type checks
    bool is_io() const noexcept {
        return std::holds_alternative<IoError>(inner_);
    }

    bool is_file() const noexcept {
        return std::holds_alternative<FileError>(inner_);
    }

    bool is_system() const noexcept {
        return std::holds_alternative<std::error_code>(inner_);
    }

    bool is_end_of_stream() const noexcept {
        return is_io() && std::get<IoError>(inner_) == IoError::EndOfStream;
    }

    bool is(FileError e) const noexcept {
        return is_file() && std::get<FileError>(inner_) == e;
    }

    bool is(IoError e) const noexcept {
        return is_io() && std::get<IoError>(inner_) == e;
    }

    // Accessors
    IoError io_error() const noexcept {
        return is_io() ? std::get<IoError>(inner_) : IoError::Unknown;
    }

    FileError file_error() const noexcept {
        return is_file() ? std::get<FileError>(inner_) : FileError::InvalidPath;
    }

    std::error_code system_error() const noexcept {
        return is_system() ? std::get<std::error_code>(inner_) : std::error_code{};
    }

    std::error_code code() const noexcept;

    // Status a caller would answer with for this error (500 for transport errors)
    int http_status() const noexcept;

    std::string_view message() const noexcept {
        return message_;
    }

    std::string to_string() const;

    bool operator==(const Error& other) const noexcept {
        return inner_ == other.inner_;
    }

    bool operator!=(const Error& other) const noexcept {
        return !(*this == other);
    }

    // true if error, false if success
    explicit operator bool() const noexcept {
        if (is_io()) return std::get<IoError>(inner_) != IoError::Success;
        if (is_file()) return true;
        if (is_system()) return static_cast<bool>(std::get<std::error_code>(inner_));
        return false;
    }
};

} // namespace gatefile
