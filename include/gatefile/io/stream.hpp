#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "gatefile/core/error.hpp"
#include "gatefile/util/expected.hpp"

namespace gatefile {

// ============================================================================
// Byte Stream Interfaces
// ============================================================================

// Sequential reader. read() returns at least one byte, or an error;
// IoError::EndOfStream marks the end of the data.
class ByteReader {
public:
    virtual ~ByteReader() = default;
    virtual expected<size_t, Error> read(char* dst, size_t len) = 0;
};

// Sequential writer. write() consumes the whole input or fails.
class ByteWriter {
public:
    virtual ~ByteWriter() = default;
    virtual expected<size_t, Error> write(std::string_view data) = 0;
};

// Readable content with absolute positioning, served by ContentServer
class ContentSource : public ByteReader {
public:
    // Moves the read position to offset bytes from the start
    virtual expected<int64_t, Error> seek(int64_t offset) = 0;
};

// ============================================================================
// In-memory Content
// ============================================================================

class MemorySource : public ContentSource {
    std::string data_;
    size_t pos_ = 0;

public:
    MemorySource() = default;
    explicit MemorySource(std::string data) : data_(std::move(data)) {}

    expected<size_t, Error> read(char* dst, size_t len) override;
    expected<int64_t, Error> seek(int64_t offset) override;

    int64_t size() const noexcept { return static_cast<int64_t>(data_.size()); }
    const std::string& data() const noexcept { return data_; }
};

// ============================================================================
// File Content (POSIX descriptor)
// ============================================================================

class FileSource : public ContentSource {
    int fd_ = -1;
    std::string path_;
    int64_t size_ = 0;
    std::chrono::system_clock::time_point mod_time_{};
    bool directory_ = false;

    FileSource(int fd, std::string path) : fd_(fd), path_(std::move(path)) {}

public:
    ~FileSource() override;

    FileSource(const FileSource&) = delete;
    FileSource& operator=(const FileSource&) = delete;

    static expected<std::unique_ptr<FileSource>, Error> open(const std::string& path);

    expected<size_t, Error> read(char* dst, size_t len) override;
    expected<int64_t, Error> seek(int64_t offset) override;

    const std::string& path() const noexcept { return path_; }
    int64_t size() const noexcept { return size_; }
    std::chrono::system_clock::time_point mod_time() const noexcept { return mod_time_; }
    bool is_directory() const noexcept { return directory_; }

    // Last path element, without directories
    std::string name() const;
};

// ============================================================================
// Transfer Helpers
// ============================================================================

namespace io {

// Copies exactly n bytes. A reader ending early fails with EndOfStream.
expected<int64_t, Error> copy_n(ByteWriter& dst, ByteReader& src, int64_t n);

// Reads until len bytes or end of stream; returns the count read
expected<size_t, Error> read_full(ByteReader& src, char* dst, size_t len);

// Drains src into a string
expected<std::string, Error> read_all(ByteReader& src);

} // namespace io

} // namespace gatefile
