#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "gatefile/core/options.hpp"
#include "gatefile/http/multipart.hpp"
#include "gatefile/io/stream.hpp"
#include "gatefile/transport/frame.hpp"

namespace gatefile {

// ============================================================================
// FileHeader - one uploaded file of a form
// ============================================================================

class FileHeader {
    std::string filename_;
    Metadata headers_;
    int64_t size_ = 0;
    std::string content_;     // in-memory bytes
    std::string temp_path_;   // spilled content, when non-empty

    friend class FormData;

public:
    FileHeader(std::string filename, Metadata headers)
        : filename_(std::move(filename)), headers_(std::move(headers)) {}

    const std::string& filename() const noexcept { return filename_; }
    const Metadata& headers() const noexcept { return headers_; }
    std::string_view content_type() const { return headers_.get("content-type"); }
    int64_t size() const noexcept { return size_; }

    bool in_memory() const noexcept { return temp_path_.empty(); }
    const std::string& temp_path() const noexcept { return temp_path_; }

    // Seekable view of the uploaded bytes
    expected<std::unique_ptr<ContentSource>, Error> open() const;

    void set_memory_content(std::string content);
    void set_temp_file(std::string path, int64_t size);
};

// ============================================================================
// FormData - decoded multipart form
// ============================================================================
//
// Owns the temporary files of spilled parts until remove_all() or
// destruction. Lookups of absent keys yield empty results.

class FormData {
    std::map<std::string, std::vector<std::string>, std::less<>> values_;
    std::map<std::string, std::vector<FileHeader>, std::less<>> files_;

public:
    FormData() = default;
    ~FormData();

    FormData(FormData&& other) noexcept;
    FormData& operator=(FormData&& other) noexcept;

    FormData(const FormData&) = delete;
    FormData& operator=(const FormData&) = delete;

    void add_value(std::string name, std::string value);
    void add_file(std::string name, FileHeader file);

    const std::vector<FileHeader>& files(std::string_view key) const;
    const FileHeader* first_file(std::string_view key) const;

    // First file of key, MissingFile when there is none
    expected<const FileHeader*, Error> require_file(std::string_view key) const;

    const std::vector<std::string>& values(std::string_view key) const;
    std::optional<std::string_view> first_value(std::string_view key) const;

    std::vector<std::string> value_keys() const;
    std::vector<std::string> file_keys() const;

    // Deletes spilled temporary files. Safe to call more than once.
    expected<void, Error> remove_all();
};

// ============================================================================
// Multipart Form Bridge
// ============================================================================

namespace form {

// Boundary of the inbound content-type, which must be multipart/form-data
// or multipart/mixed
expected<std::string, Error> parse_boundary(const Metadata& incoming);

// Reads the whole form from the stream. size_limit > 0 caps the upload
// size. Text values share options.form_value_limit; file parts stay in
// memory within options.form_memory_limit and spill to
// options.resolved_temp_dir() beyond it.
expected<FormData, Error> parse(FrameReceiver& receiver, int64_t size_limit,
                                const Options& options = {});

using PartHandler = std::function<expected<void, Error>(Part&)>;

// Streams each part to handler as it arrives, without buffering. Stops at
// the closing delimiter, or at the first read or handler error.
expected<void, Error> process_each_part(FrameReceiver& receiver, int64_t size_limit,
                                        const PartHandler& handler);

} // namespace form

} // namespace gatefile
