#include "gatefile/server/form.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>

#include <fcntl.h>
#include <unistd.h>

#include "gatefile/core/logging.hpp"
#include "gatefile/http/headers.hpp"
#include "gatefile/http/mime.hpp"
#include "gatefile/transport/chunk_stream.hpp"

namespace gatefile {

// ============================================================================
// FileHeader
// ============================================================================

expected<std::unique_ptr<ContentSource>, Error> FileHeader::open() const {
    if (temp_path_.empty()) {
        return std::unique_ptr<ContentSource>(std::make_unique<MemorySource>(content_));
    }
    auto file = FileSource::open(temp_path_);
    if (!file) {
        return unexpected(file.error());
    }
    return std::unique_ptr<ContentSource>(std::move(*file));
}

void FileHeader::set_memory_content(std::string content) {
    size_ = static_cast<int64_t>(content.size());
    content_ = std::move(content);
    temp_path_.clear();
}

void FileHeader::set_temp_file(std::string path, int64_t size) {
    content_.clear();
    temp_path_ = std::move(path);
    size_ = size;
}

// ============================================================================
// FormData
// ============================================================================

FormData::~FormData() {
    if (auto removed = remove_all(); !removed) {
        default_logger().log(default_logger()
            .entry(LogLevel::Warn, "removing form temporary files failed")
            .field("error", removed.error().to_string()));
    }
}

FormData::FormData(FormData&& other) noexcept
    : values_(std::move(other.values_))
    , files_(std::move(other.files_)) {
    other.values_.clear();
    other.files_.clear();
}

FormData& FormData::operator=(FormData&& other) noexcept {
    if (this != &other) {
        if (auto removed = remove_all(); !removed) {
            default_logger().log(default_logger()
                .entry(LogLevel::Warn, "removing form temporary files failed")
                .field("error", removed.error().to_string()));
        }
        values_ = std::move(other.values_);
        files_ = std::move(other.files_);
        other.values_.clear();
        other.files_.clear();
    }
    return *this;
}

void FormData::add_value(std::string name, std::string value) {
    values_[std::move(name)].push_back(std::move(value));
}

void FormData::add_file(std::string name, FileHeader file) {
    files_[std::move(name)].push_back(std::move(file));
}

const std::vector<FileHeader>& FormData::files(std::string_view key) const {
    static const std::vector<FileHeader> none;
    auto it = files_.find(key);
    return it == files_.end() ? none : it->second;
}

const FileHeader* FormData::first_file(std::string_view key) const {
    const auto& list = files(key);
    return list.empty() ? nullptr : &list.front();
}

expected<const FileHeader*, Error> FormData::require_file(std::string_view key) const {
    const FileHeader* file = first_file(key);
    if (!file) {
        return unexpected(Error::file(FileError::MissingFile, "http: no such file"));
    }
    return file;
}

const std::vector<std::string>& FormData::values(std::string_view key) const {
    static const std::vector<std::string> none;
    auto it = values_.find(key);
    return it == values_.end() ? none : it->second;
}

std::optional<std::string_view> FormData::first_value(std::string_view key) const {
    const auto& list = values(key);
    if (list.empty()) {
        return std::nullopt;
    }
    return std::string_view(list.front());
}

std::vector<std::string> FormData::value_keys() const {
    std::vector<std::string> keys;
    for (const auto& [key, _] : values_) {
        keys.push_back(key);
    }
    return keys;
}

std::vector<std::string> FormData::file_keys() const {
    std::vector<std::string> keys;
    for (const auto& [key, _] : files_) {
        keys.push_back(key);
    }
    return keys;
}

expected<void, Error> FormData::remove_all() {
    std::optional<Error> first_error;
    for (auto& [_, list] : files_) {
        for (auto& file : list) {
            if (file.temp_path_.empty()) {
                continue;
            }
            std::error_code ec;
            std::filesystem::remove(file.temp_path_, ec);
            if (ec && !first_error) {
                first_error = Error::system(ec, "remove " + file.temp_path_);
            }
            file.temp_path_.clear();
        }
    }
    if (first_error) {
        return unexpected(*first_error);
    }
    return {};
}

// ============================================================================
// Form Parsing
// ============================================================================

namespace form {

namespace {

constexpr size_t kCopyChunk = 32 * 1024;

// Appends to a descriptor created by mkstemp
class TempFileWriter : public ByteWriter {
    int fd_ = -1;
    std::string path_;

public:
    ~TempFileWriter() override {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }

    expected<void, Error> create(const std::filesystem::path& dir) {
        std::string pattern = (dir / "gatefile-upload-XXXXXX").string();
        fd_ = ::mkstemp(pattern.data());
        if (fd_ < 0) {
            return unexpected(Error::last_system_error("create temporary file in " + dir.string()));
        }
        path_ = pattern;
        return {};
    }

    expected<size_t, Error> write(std::string_view data) override {
        size_t done = 0;
        while (done < data.size()) {
            ssize_t n = ::write(fd_, data.data() + done, data.size() - done);
            if (n < 0) {
                if (errno == EINTR) continue;
                return unexpected(Error::last_system_error("write " + path_));
            }
            done += static_cast<size_t>(n);
        }
        return done;
    }

    const std::string& path() const noexcept { return path_; }
};

// Reads up to `limit` bytes of the part, plus one to detect overflow
expected<std::string, Error> read_limited(Part& part, int64_t limit) {
    std::string out;
    char chunk[kCopyChunk];
    for (;;) {
        auto n = part.read(chunk, sizeof(chunk));
        if (!n) {
            if (n.error().is_end_of_stream()) {
                return std::move(out);
            }
            return unexpected(n.error());
        }
        out.append(chunk, *n);
        if (static_cast<int64_t>(out.size()) > limit) {
            return std::move(out);
        }
    }
}

// Writes `head` and the rest of the part to a new temporary file
expected<FileHeader, Error> spill(Part& part, FileHeader file, std::string head,
                                  const std::filesystem::path& dir) {
    TempFileWriter out;
    if (auto created = out.create(dir); !created) {
        return unexpected(created.error());
    }

    int64_t size = 0;
    auto fail = [&](const Error& error) -> expected<FileHeader, Error> {
        std::error_code ec;
        std::filesystem::remove(out.path(), ec);
        return unexpected(error);
    };

    if (auto written = out.write(head); !written) {
        return fail(written.error());
    }
    size += static_cast<int64_t>(head.size());

    char chunk[kCopyChunk];
    for (;;) {
        auto n = part.read(chunk, sizeof(chunk));
        if (!n) {
            if (n.error().is_end_of_stream()) break;
            return fail(n.error());
        }
        if (auto written = out.write(std::string_view(chunk, *n)); !written) {
            return fail(written.error());
        }
        size += static_cast<int64_t>(*n);
    }

    file.set_temp_file(out.path(), size);

    default_logger().log(default_logger()
        .entry(LogLevel::Debug, "form file part spilled to disk")
        .field("filename", file.filename())
        .field("size", size)
        .field("path", out.path()));
    return std::move(file);
}

} // anonymous namespace

expected<std::string, Error> parse_boundary(const Metadata& incoming) {
    auto content_type = incoming.pick(header::content_type);
    if (content_type.empty()) {
        return unexpected(Error::file(FileError::NotMultipart,
            "request Content-Type isn't multipart/form-data"));
    }

    auto media = mime::parse_media_type(content_type);
    if (!media || !(media->type == "multipart/form-data" || media->type == "multipart/mixed")) {
        return unexpected(Error::file(FileError::NotMultipart,
            "request Content-Type isn't multipart/form-data"));
    }

    auto it = media->params.find("boundary");
    if (it == media->params.end()) {
        return unexpected(Error::file(FileError::MissingBoundary,
            "no multipart boundary param in Content-Type"));
    }
    return it->second;
}

expected<FormData, Error> parse(FrameReceiver& receiver, int64_t size_limit, const Options& options) {
    auto boundary = parse_boundary(receiver.incoming());
    if (!boundary) {
        return unexpected(boundary.error());
    }

    ChunkStreamReader body(receiver, size_limit);
    MultipartReader reader(body, *boundary);

    FormData form;
    int64_t memory_left = options.form_memory_limit;
    int64_t values_left = options.form_value_limit;
    const auto temp_dir = options.resolved_temp_dir();

    for (;;) {
        auto next = reader.next_part();
        if (!next) {
            if (next.error().is_end_of_stream()) {
                break;
            }
            return unexpected(next.error());
        }
        Part& part = **next;

        const std::string& name = part.form_name();
        if (name.empty()) {
            continue;
        }

        if (part.file_name().empty()) {
            auto value = read_limited(part, values_left);
            if (!value) {
                return unexpected(value.error());
            }
            if (static_cast<int64_t>(value->size()) > values_left) {
                return unexpected(Error::file(FileError::MessageTooLarge,
                    "multipart: message too large"));
            }
            values_left -= static_cast<int64_t>(value->size());
            form.add_value(name, std::move(*value));
            continue;
        }

        FileHeader file(part.file_name(), part.headers());
        auto head = read_limited(part, memory_left);
        if (!head) {
            return unexpected(head.error());
        }

        if (static_cast<int64_t>(head->size()) > memory_left) {
            auto spilled = spill(part, std::move(file), std::move(*head), temp_dir);
            if (!spilled) {
                return unexpected(spilled.error());
            }
            form.add_file(name, std::move(*spilled));
        } else {
            memory_left -= static_cast<int64_t>(head->size());
            file.set_memory_content(std::move(*head));
            form.add_file(name, std::move(file));
        }
    }

    return std::move(form);
}

expected<void, Error> process_each_part(FrameReceiver& receiver, int64_t size_limit,
                                        const PartHandler& handler) {
    auto boundary = parse_boundary(receiver.incoming());
    if (!boundary) {
        return unexpected(boundary.error());
    }

    ChunkStreamReader body(receiver, size_limit);
    MultipartReader reader(body, *boundary);

    for (;;) {
        auto next = reader.next_part();
        if (!next) {
            if (next.error().is_end_of_stream()) {
                return {};
            }
            return unexpected(next.error());
        }
        if (auto handled = handler(**next); !handled) {
            return handled;
        }
    }
}

} // namespace form

} // namespace gatefile
