#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "gatefile/core/error.hpp"
#include "gatefile/util/expected.hpp"

namespace gatefile {

// ============================================================================
// Byte Range
// ============================================================================

// Resolved byte range: the half-open interval [start, start + length)
struct ByteRange {
    int64_t start = 0;
    int64_t length = 0;

    int64_t end() const noexcept { return start + length - 1; }

    // Content-Range value: "bytes start-end/size"
    std::string content_range(int64_t size) const;

    bool operator==(const ByteRange& other) const noexcept {
        return start == other.start && length == other.length;
    }
};

// ============================================================================
// Range Parsing (RFC 7233)
// ============================================================================

namespace range {

// Resolves a Range header value against a representation of `size` bytes.
// Examples for size 1000:
//   ""                  -> no ranges
//   "bytes=0-499"       -> {0, 500}
//   "bytes=-100"        -> {900, 100}
//   "bytes=900-"        -> {900, 100}
//   "bytes=0-0,-1"      -> {0, 1}, {999, 1}
//   "bytes=2000-3000"   -> FileError::NoOverlap
//   "items=0-1"         -> FileError::InvalidRange
expected<std::vector<ByteRange>, Error> parse(std::string_view header, int64_t size);

// Sum of the range lengths
int64_t total_length(const std::vector<ByteRange>& ranges) noexcept;

// Content-Range value of an unsatisfiable range: "bytes */size"
std::string unsatisfied_content_range(int64_t size);

} // namespace range

} // namespace gatefile
