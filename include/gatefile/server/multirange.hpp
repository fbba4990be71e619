#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "gatefile/http/range.hpp"
#include "gatefile/io/pipe.hpp"
#include "gatefile/io/stream.hpp"

namespace gatefile {

// ============================================================================
// MultiRangeEncoder - multipart/byteranges body produced on the fly
// ============================================================================
//
// The encoded size is known up front so the response headers can be
// committed before the body exists. start() launches one producer thread
// which writes the envelope into an unbuffered pipe; the caller drains the
// returned reader. Destroying the encoder closes the read side and joins
// the producer.

class MultiRangeEncoder {
    std::vector<ByteRange> ranges_;
    std::string part_content_type_;
    int64_t size_;
    std::string boundary_;
    int64_t encoded_size_ = 0;

    std::optional<io::PipeReader> reader_;
    std::thread producer_;

public:
    MultiRangeEncoder(std::vector<ByteRange> ranges, std::string content_type,
                      int64_t size, std::string boundary);
    ~MultiRangeEncoder();

    MultiRangeEncoder(const MultiRangeEncoder&) = delete;
    MultiRangeEncoder& operator=(const MultiRangeEncoder&) = delete;

    // Encoder with a fresh random boundary
    static expected<std::unique_ptr<MultiRangeEncoder>, Error> create(
        std::vector<ByteRange> ranges, std::string content_type, int64_t size);

    // Exact body size, computed by a dry pass against a CountingWriter
    static int64_t measure(const std::vector<ByteRange>& ranges,
                           std::string_view content_type,
                           int64_t size,
                           const std::string& boundary);

    const std::string& boundary() const noexcept { return boundary_; }
    int64_t encoded_size() const noexcept { return encoded_size_; }

    // "multipart/byteranges; boundary=..."
    std::string content_type() const;

    // Launches the producer over `source`, which must outlive the encoder.
    // Seek or copy failures reach the returned reader as read errors.
    ByteReader& start(ContentSource& source);
};

} // namespace gatefile
