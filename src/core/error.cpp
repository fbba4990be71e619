#include "gatefile/core/error.hpp"

#include <cerrno>
#include <sstream>

namespace gatefile {

// ============================================================================
// Error Categories
// ============================================================================

namespace {

class IoErrorCategory : public std::error_category {
public:
    const char* name() const noexcept override {
        return "gatefile.io";
    }

    std::string message(int ev) const override {
        switch (static_cast<IoError>(ev)) {
            case IoError::Success: return "Success";
            case IoError::EndOfStream: return "End of stream";
            case IoError::ClosedPipe: return "Read/write on closed pipe";
            case IoError::Cancelled: return "Operation cancelled";
            case IoError::Timeout: return "Operation timed out";
            case IoError::ShortWrite: return "Short write";
            case IoError::InvalidArgument: return "Invalid argument";
            case IoError::PermissionDenied: return "Permission denied";
            case IoError::Unknown: return "Unknown error";
            default: return "Unknown I/O error";
        }
    }
};

class FileErrorCategory : public std::error_category {
public:
    const char* name() const noexcept override {
        return "gatefile.file";
    }

    std::string message(int ev) const override {
        switch (static_cast<FileError>(ev)) {
            case FileError::InvalidRange: return "Invalid range";
            case FileError::NoOverlap: return "Range does not overlap content";
            case FileError::SizeLimitExceeded: return "Size limit exceeded";
            case FileError::NotMultipart: return "Request Content-Type isn't multipart/form-data";
            case FileError::MissingBoundary: return "No multipart boundary param in Content-Type";
            case FileError::MalformedMultipart: return "Malformed multipart body";
            case FileError::MessageTooLarge: return "Multipart message too large";
            case FileError::MissingFile: return "No such file";
            case FileError::InvalidPath: return "Invalid path";
            case FileError::NotSeekable: return "Content is not seekable";
            default: return "Unknown file error";
        }
    }
};

const IoErrorCategory io_category_instance{};
const FileErrorCategory file_category_instance{};

} // anonymous namespace

const std::error_category& io_error_category() noexcept {
    return io_category_instance;
}

const std::error_category& file_error_category() noexcept {
    return file_category_instance;
}

std::error_code make_error_code(IoError e) noexcept {
    return {static_cast<int>(e), io_error_category()};
}

std::error_code make_error_code(FileError e) noexcept {
    return {static_cast<int>(e), file_error_category()};
}

// ============================================================================
// Error Implementation
// ============================================================================

Error Error::last_system_error(std::string msg) {
    return Error(std::error_code(errno, std::generic_category()), std::move(msg));
}

std::error_code Error::code() const noexcept {
    if (is_io()) {
        return make_error_code(std::get<IoError>(inner_));
    }
    if (is_file()) {
        return make_error_code(std::get<FileError>(inner_));
    }
    if (is_system()) {
        return std::get<std::error_code>(inner_);
    }
    return {};
}

int Error::http_status() const noexcept {
    if (is_file()) {
        switch (std::get<FileError>(inner_)) {
            case FileError::InvalidRange:
            case FileError::NoOverlap:
                return 416;
            case FileError::SizeLimitExceeded:
            case FileError::MessageTooLarge:
                return 413;
            case FileError::NotMultipart:
            case FileError::MissingBoundary:
            case FileError::MalformedMultipart:
            case FileError::MissingFile:
                return 400;
            case FileError::InvalidPath:
                return 404;
            case FileError::NotSeekable:
                return 500;
        }
    }
    if (is_io()) {
        switch (std::get<IoError>(inner_)) {
            case IoError::Timeout: return 408;
            case IoError::Cancelled: return 499; // Client Closed Request
            default: return 500;
        }
    }
    return 500;
}

std::string Error::to_string() const {
    std::ostringstream oss;

    if (is_io()) {
        oss << "IoError::" << io_error_category().message(static_cast<int>(std::get<IoError>(inner_)));
    } else if (is_file()) {
        oss << "FileError::" << file_error_category().message(static_cast<int>(std::get<FileError>(inner_)));
    } else if (is_system()) {
        auto ec = std::get<std::error_code>(inner_);
        oss << "SystemError::" << ec.category().name() << ":" << ec.value() << " " << ec.message();
    }

    if (!message_.empty()) {
        oss << " - " << message_;
    }

    return oss.str();
}

} // namespace gatefile
