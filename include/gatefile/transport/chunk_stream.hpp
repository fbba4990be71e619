#pragma once

#include <cstdint>
#include <string>

#include "gatefile/io/stream.hpp"
#include "gatefile/transport/frame.hpp"

namespace gatefile {

// ============================================================================
// ChunkStreamReader - frames in, bytes out
// ============================================================================

class ChunkStreamReader : public ByteReader {
    FrameReceiver& receiver_;
    std::string leftover_;
    size_t offset_ = 0;
    int64_t size_limit_ = 0;
    int64_t total_ = 0;

public:
    // size_limit > 0 caps the cumulative bytes read
    explicit ChunkStreamReader(FrameReceiver& receiver, int64_t size_limit = 0)
        : receiver_(receiver), size_limit_(size_limit) {}

    // Pulls a frame only when the leftover is exhausted. Fails with
    // SizeLimitExceeded, before copying, once the limit would be crossed.
    expected<size_t, Error> read(char* dst, size_t len) override;

    int64_t total() const noexcept { return total_; }
    int64_t size_limit() const noexcept { return size_limit_; }
};

// ============================================================================
// ChunkStreamWriter - bytes in, frames out
// ============================================================================

class ChunkStreamWriter : public ByteWriter {
    FrameSender& sender_;
    std::string content_type_;
    size_t chunk_size_;

public:
    static constexpr size_t default_chunk_size = 10 * 1024;

    explicit ChunkStreamWriter(FrameSender& sender, std::string content_type = {},
                               size_t chunk_size = default_chunk_size)
        : sender_(sender)
        , content_type_(std::move(content_type))
        , chunk_size_(chunk_size == 0 ? default_chunk_size : chunk_size) {}

    // Sends data as frames of at most chunk_size bytes, in order. Frames
    // already sent when a send fails are not rolled back.
    expected<size_t, Error> write(std::string_view data) override;

    const std::string& content_type() const noexcept { return content_type_; }
    void set_content_type(std::string content_type) { content_type_ = std::move(content_type); }
    size_t chunk_size() const noexcept { return chunk_size_; }
};

} // namespace gatefile
