#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace gatefile {

// ============================================================================
// Header Names
// ============================================================================
//
// Lower-case, as carried in frame stream metadata.

namespace header {

// Outbound response vocabulary
inline constexpr std::string_view code = "code";
inline constexpr std::string_view accept_ranges = "accept-ranges";
inline constexpr std::string_view content_type = "content-type";
inline constexpr std::string_view content_range = "content-range";
inline constexpr std::string_view content_length = "content-length";
inline constexpr std::string_view content_encoding = "content-encoding";
inline constexpr std::string_view content_disposition = "content-disposition";
inline constexpr std::string_view last_modified = "last-modified";
inline constexpr std::string_view etag = "etag";
inline constexpr std::string_view cache_control = "cache-control";
inline constexpr std::string_view x_content_type_options = "x-content-type-options";
inline constexpr std::string_view transfer_encoding = "transfer-encoding";

// Inbound request headers
inline constexpr std::string_view range = "range";
inline constexpr std::string_view if_range = "if-range";
inline constexpr std::string_view if_match = "if-match";
inline constexpr std::string_view if_none_match = "if-none-match";
inline constexpr std::string_view if_unmodified_since = "if-unmodified-since";
inline constexpr std::string_view if_modified_since = "if-modified-since";

inline constexpr std::string_view response_vocabulary[] = {
    code, accept_ranges, content_type, content_range, content_length,
    content_encoding, content_disposition, last_modified, etag,
    cache_control, x_content_type_options, transfer_encoding,
};

} // namespace header

// ============================================================================
// Response Headers
// ============================================================================
//
// Ordered name/value set committed once per response. Names are compared
// case-insensitively and stored lower-cased.

class ResponseHeaders {
public:
    using Header = std::pair<std::string, std::string>;
    using Headers = std::vector<Header>;

private:
    Headers headers_;

public:
    ResponseHeaders() = default;

    // Updates an existing entry in place or appends a new one
    ResponseHeaders& set(std::string_view name, std::string value);

    void erase(std::string_view name);

    bool has(std::string_view name) const;

    // Value of name, "" when absent
    std::string_view get(std::string_view name) const;

    // Status code stored under "code", 0 when unset
    int status() const;
    ResponseHeaders& set_status(int status);

    const Headers& entries() const noexcept { return headers_; }
    size_t size() const noexcept { return headers_.size(); }
    bool empty() const noexcept { return headers_.empty(); }

    auto begin() const { return headers_.begin(); }
    auto end() const { return headers_.end(); }

    void clear() { headers_.clear(); }
};

} // namespace gatefile
