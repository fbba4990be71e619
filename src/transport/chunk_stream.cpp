#include "gatefile/transport/chunk_stream.hpp"

#include <algorithm>
#include <cstring>

#include "gatefile/core/logging.hpp"

namespace gatefile {

// ============================================================================
// ChunkStreamReader
// ============================================================================

expected<size_t, Error> ChunkStreamReader::read(char* dst, size_t len) {
    if (len == 0) {
        return size_t{0};
    }

    while (offset_ >= leftover_.size()) {
        auto frame = receiver_.recv();
        if (!frame) {
            return unexpected(frame.error());
        }
        leftover_ = std::move(frame->data);
        offset_ = 0;
    }

    size_t n = std::min(len, leftover_.size() - offset_);

    if (size_limit_ > 0 && total_ + static_cast<int64_t>(n) > size_limit_) {
        default_logger().log(default_logger()
            .entry(LogLevel::Warn, "upload size limit exceeded")
            .field("limit", size_limit_)
            .field("received", total_ + static_cast<int64_t>(n)));
        return unexpected(Error::file(FileError::SizeLimitExceeded, "size limit exceeded"));
    }

    std::memcpy(dst, leftover_.data() + offset_, n);
    offset_ += n;
    total_ += static_cast<int64_t>(n);
    return n;
}

// ============================================================================
// ChunkStreamWriter
// ============================================================================

expected<size_t, Error> ChunkStreamWriter::write(std::string_view data) {
    size_t sent = 0;
    while (sent < data.size()) {
        size_t n = std::min(chunk_size_, data.size() - sent);

        Frame frame;
        frame.content_type = content_type_;
        frame.data.assign(data.data() + sent, n);

        auto result = sender_.send(frame);
        if (!result) {
            return unexpected(result.error());
        }
        sent += n;
    }
    return sent;
}

} // namespace gatefile
