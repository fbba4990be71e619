#include "gatefile/http/multipart.hpp"

#include <algorithm>
#include <cstring>

#include <openssl/err.h>
#include <openssl/rand.h>

#include "gatefile/http/mime.hpp"

namespace gatefile {

namespace multipart {

expected<std::string, Error> random_boundary() {
    unsigned char bytes[30];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
        char reason[256];
        ERR_error_string_n(ERR_get_error(), reason, sizeof(reason));
        return unexpected(Error::io(IoError::Unknown,
            std::string("boundary generation failed: ") + reason));
    }

    static const char hex[] = "0123456789abcdef";
    std::string boundary;
    boundary.reserve(sizeof(bytes) * 2);
    for (unsigned char b : bytes) {
        boundary += hex[b >> 4];
        boundary += hex[b & 0x0F];
    }
    return boundary;
}

} // namespace multipart

// ============================================================================
// MultipartWriter
// ============================================================================

expected<void, Error> MultipartWriter::create_part(const PartHeaders& headers) {
    if (closed_) {
        return unexpected(Error::io(IoError::ClosedPipe, "multipart: writer is closed"));
    }

    std::string out;
    if (has_part_) {
        out += "\r\n--" + boundary_ + "\r\n";
    } else {
        out += "--" + boundary_ + "\r\n";
    }

    PartHeaders sorted = headers;
    std::stable_sort(sorted.begin(), sorted.end(),
        [](const auto& a, const auto& b) { return a.first < b.first; });
    for (const auto& [name, value] : sorted) {
        out += name + ": " + value + "\r\n";
    }
    out += "\r\n";

    auto written = out_.write(out);
    if (!written) {
        return unexpected(written.error());
    }
    has_part_ = true;
    return {};
}

expected<size_t, Error> MultipartWriter::write(std::string_view data) {
    if (closed_) {
        return unexpected(Error::io(IoError::ClosedPipe, "multipart: writer is closed"));
    }
    return out_.write(data);
}

expected<void, Error> MultipartWriter::close() {
    if (closed_) {
        return {};
    }
    std::string out = has_part_ ? "\r\n--" : "--";
    out += boundary_ + "--\r\n";

    auto written = out_.write(out);
    if (!written) {
        return unexpected(written.error());
    }
    closed_ = true;
    return {};
}

std::string MultipartWriter::form_data_content_type() const {
    return "multipart/form-data; boundary=" + boundary_;
}

// ============================================================================
// Part
// ============================================================================

namespace {

constexpr size_t kReadChunk = 4096;
constexpr size_t kMaxHeaderBytes = 64 * 1024;

Error malformed(std::string message) {
    return Error::file(FileError::MalformedMultipart, "multipart: " + std::move(message));
}

std::string base_name(std::string_view path) {
    while (!path.empty() && (path.back() == '/' || path.back() == '\\')) {
        path.remove_suffix(1);
    }
    auto slash = path.find_last_of("/\\");
    if (slash != std::string_view::npos) {
        path.remove_prefix(slash + 1);
    }
    return std::string(path);
}

bool is_blank(char c) {
    return c == ' ' || c == '\t';
}

} // anonymous namespace

Part::Part(MultipartReader& reader, Metadata headers)
    : reader_(reader), headers_(std::move(headers)) {
    auto disposition = headers_.get("content-disposition");
    if (disposition.empty()) {
        return;
    }
    auto parsed = mime::parse_media_type(disposition);
    if (!parsed) {
        return;
    }
    disposition_ = parsed->type;
    if (disposition_ == "form-data") {
        form_name_ = parsed->param("name");
    }
    auto filename = parsed->param("filename");
    if (!filename.empty()) {
        file_name_ = base_name(filename);
    }
}

expected<size_t, Error> Part::read(char* dst, size_t len) {
    if (done_) {
        return unexpected(Error::end_of_stream());
    }
    auto n = reader_.read_part(dst, len);
    if (!n && n.error().is_end_of_stream()) {
        done_ = true;
    }
    return n;
}

// ============================================================================
// MultipartReader
// ============================================================================

MultipartReader::MultipartReader(ByteReader& source, std::string_view boundary)
    : source_(source)
    , dash_boundary_("--" + std::string(boundary))
    , delimiter_("\r\n--" + std::string(boundary)) {}

expected<size_t, Error> MultipartReader::fill() {
    if (source_eof_) {
        return size_t{0};
    }
    compact();

    char chunk[kReadChunk];
    auto n = source_.read(chunk, sizeof(chunk));
    if (!n) {
        if (n.error().is_end_of_stream()) {
            source_eof_ = true;
            return size_t{0};
        }
        return unexpected(n.error());
    }
    buf_.append(chunk, *n);
    return *n;
}

void MultipartReader::compact() {
    if (head_ > 0 && head_ >= buf_.size() / 2) {
        buf_.erase(0, head_);
        head_ = 0;
    }
}

expected<std::string, Error> MultipartReader::read_line() {
    for (;;) {
        auto nl = buf_.find('\n', head_);
        if (nl != std::string::npos) {
            size_t end = nl;
            if (end > head_ && buf_[end - 1] == '\r') {
                --end;
            }
            std::string line = buf_.substr(head_, end - head_);
            head_ = nl + 1;
            return line;
        }
        if (buf_.size() - head_ > kMaxHeaderBytes) {
            return unexpected(Error::file(FileError::MessageTooLarge, "multipart: header line too long"));
        }
        auto n = fill();
        if (!n) {
            return unexpected(n.error());
        }
        if (*n == 0) {
            if (head_ < buf_.size()) {
                // Unterminated last line, such as a closing delimiter at EOF
                std::string line = buf_.substr(head_);
                head_ = buf_.size();
                return line;
            }
            return unexpected(malformed("unexpected end of body"));
        }
    }
}

expected<Metadata, Error> MultipartReader::read_headers() {
    Metadata headers;
    size_t total = 0;
    for (;;) {
        auto line = read_line();
        if (!line) {
            return unexpected(line.error());
        }
        if (line->empty()) {
            return headers;
        }
        total += line->size();
        if (total > kMaxHeaderBytes) {
            return unexpected(Error::file(FileError::MessageTooLarge, "multipart: part headers too large"));
        }

        auto colon = line->find(':');
        if (colon == std::string::npos || colon == 0) {
            return unexpected(malformed("malformed part header: " + *line));
        }
        std::string_view value(*line);
        value.remove_prefix(colon + 1);
        while (!value.empty() && is_blank(value.front())) value.remove_prefix(1);
        while (!value.empty() && is_blank(value.back())) value.remove_suffix(1);

        headers.add(std::string_view(*line).substr(0, colon), value);
    }
}

expected<Part*, Error> MultipartReader::next_part() {
    if (finished_) {
        return unexpected(Error::end_of_stream());
    }

    // Skip what the caller left unread of the previous part
    if (current_) {
        char sink[kReadChunk];
        for (;;) {
            auto n = current_->read(sink, sizeof(sink));
            if (!n) {
                if (n.error().is_end_of_stream()) break;
                return unexpected(n.error());
            }
        }
        current_.reset();
    }

    if (!started_) {
        // Preamble: everything up to the first delimiter line
        for (;;) {
            auto line = read_line();
            if (!line) {
                return unexpected(line.error());
            }
            std::string_view l(*line);
            while (!l.empty() && is_blank(l.back())) l.remove_suffix(1);
            if (l == dash_boundary_) {
                break;
            }
            if (l.size() == dash_boundary_.size() + 2 &&
                l.substr(0, dash_boundary_.size()) == dash_boundary_ && l.substr(dash_boundary_.size()) == "--") {
                finished_ = true;
                return unexpected(Error::end_of_stream());
            }
        }
        started_ = true;
    } else {
        // read_part stopped in front of "\r\n--boundary"
        head_ += delimiter_.size();
        auto rest = read_line();
        if (!rest) {
            return unexpected(rest.error());
        }
        std::string_view r(*rest);
        if (r.substr(0, 2) == "--") {
            finished_ = true;
            return unexpected(Error::end_of_stream());
        }
        while (!r.empty() && is_blank(r.back())) r.remove_suffix(1);
        if (!r.empty()) {
            return unexpected(malformed("unexpected data after boundary"));
        }
    }

    auto headers = read_headers();
    if (!headers) {
        return unexpected(headers.error());
    }
    current_ = std::make_unique<Part>(*this, std::move(*headers));
    return current_.get();
}

expected<size_t, Error> MultipartReader::read_part(char* dst, size_t len) {
    if (len == 0) {
        return size_t{0};
    }

    for (;;) {
        size_t search_from = head_;
        for (;;) {
            auto idx = buf_.find(delimiter_, search_from);
            if (idx == std::string::npos) {
                break;
            }

            // A delimiter must be followed by "--", or blanks and a line end
            size_t after = idx + delimiter_.size();
            size_t p = after;
            bool need_more = false;
            bool is_boundary = false;
            if (p + 1 < buf_.size() && buf_[p] == '-' && buf_[p + 1] == '-') {
                is_boundary = true;
            } else {
                while (p < buf_.size() && is_blank(buf_[p])) ++p;
                if (p >= buf_.size() || (buf_[p] == '\r' && p + 1 >= buf_.size()) ||
                    (p + 1 == buf_.size() && buf_[p] == '-')) {
                    need_more = !source_eof_;
                } else if (buf_[p] == '\n' || (buf_[p] == '\r' && buf_[p + 1] == '\n')) {
                    is_boundary = true;
                }
            }

            if (is_boundary) {
                size_t available = idx - head_;
                if (available == 0) {
                    return unexpected(Error::end_of_stream());
                }
                size_t n = std::min(len, available);
                std::memcpy(dst, buf_.data() + head_, n);
                head_ += n;
                return n;
            }
            if (need_more) {
                // Hand out the bytes before the candidate, then decide
                if (idx > head_) {
                    size_t n = std::min(len, idx - head_);
                    std::memcpy(dst, buf_.data() + head_, n);
                    head_ += n;
                    return n;
                }
                search_from = std::string::npos;
                break;
            }
            search_from = idx + 1;
        }

        if (search_from != std::string::npos) {
            // No delimiter: everything but a possible delimiter prefix is body
            size_t keep = std::min(buf_.size() - head_, delimiter_.size() - 1);
            size_t safe = buf_.size() - head_ - keep;
            if (source_eof_) {
                return unexpected(malformed("unexpected end of body"));
            }
            if (safe > 0) {
                size_t n = std::min(len, safe);
                std::memcpy(dst, buf_.data() + head_, n);
                head_ += n;
                return n;
            }
        } else if (source_eof_) {
            return unexpected(malformed("unexpected end of body"));
        }

        auto n = fill();
        if (!n) {
            return unexpected(n.error());
        }
    }
}

} // namespace gatefile
