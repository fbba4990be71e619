#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "gatefile/io/stream.hpp"
#include "gatefile/transport/metadata.hpp"

namespace gatefile {

// Part header fields in insertion order
using PartHeaders = std::vector<std::pair<std::string, std::string>>;

namespace multipart {

// 30 bytes of OpenSSL randomness, hex encoded (60 characters)
expected<std::string, Error> random_boundary();

} // namespace multipart

// ============================================================================
// CountingWriter - sink that only measures
// ============================================================================

class CountingWriter : public ByteWriter {
    int64_t count_ = 0;

public:
    expected<size_t, Error> write(std::string_view data) override {
        count_ += static_cast<int64_t>(data.size());
        return data.size();
    }

    int64_t count() const noexcept { return count_; }
};

// ============================================================================
// MultipartWriter - MIME multipart envelope over a ByteWriter
// ============================================================================

class MultipartWriter : public ByteWriter {
    ByteWriter& out_;
    std::string boundary_;
    bool has_part_ = false;
    bool closed_ = false;

public:
    MultipartWriter(ByteWriter& out, std::string boundary)
        : out_(out), boundary_(std::move(boundary)) {}

    const std::string& boundary() const noexcept { return boundary_; }

    // Starts a new part: delimiter line, then headers sorted by name
    expected<void, Error> create_part(const PartHeaders& headers);

    // Body bytes of the current part
    expected<size_t, Error> write(std::string_view data) override;

    // Writes the closing delimiter
    expected<void, Error> close();

    // "multipart/form-data; boundary=..."
    std::string form_data_content_type() const;
};

// ============================================================================
// MultipartReader - streaming MIME multipart decoder
// ============================================================================

class MultipartReader;

// One body part. Valid until the next call to MultipartReader::next_part().
class Part : public ByteReader {
    MultipartReader& reader_;
    Metadata headers_;
    std::string disposition_;
    std::string form_name_;
    std::string file_name_;
    bool done_ = false;

    friend class MultipartReader;

public:
    Part(MultipartReader& reader, Metadata headers);

    const Metadata& headers() const noexcept { return headers_; }

    // "name" parameter of a form-data Content-Disposition, else ""
    const std::string& form_name() const noexcept { return form_name_; }

    // Base name of the "filename" parameter, "" when absent
    const std::string& file_name() const noexcept { return file_name_; }

    std::string_view content_type() const { return headers_.get("content-type"); }

    // Part body; EndOfStream at the part's end
    expected<size_t, Error> read(char* dst, size_t len) override;
};

class MultipartReader {
    ByteReader& source_;
    std::string dash_boundary_;   // "--" boundary
    std::string delimiter_;       // "\r\n--" boundary
    std::string buf_;
    size_t head_ = 0;
    bool source_eof_ = false;
    bool started_ = false;
    bool finished_ = false;
    std::unique_ptr<Part> current_;

    friend class Part;

    // Appends source bytes to buf_; 0 once the source is exhausted
    expected<size_t, Error> fill();
    void compact();
    expected<std::string, Error> read_line();
    expected<Metadata, Error> read_headers();
    expected<size_t, Error> read_part(char* dst, size_t len);

public:
    MultipartReader(ByteReader& source, std::string_view boundary);

    MultipartReader(const MultipartReader&) = delete;
    MultipartReader& operator=(const MultipartReader&) = delete;

    // Next part, or EndOfStream after the closing delimiter. Unread bytes
    // of the previous part are skipped.
    expected<Part*, Error> next_part();
};

} // namespace gatefile
