#pragma once

#include <map>
#include <string>
#include <string_view>

#include "gatefile/core/error.hpp"
#include "gatefile/util/expected.hpp"

namespace gatefile::mime {

// ============================================================================
// Extension Table
// ============================================================================

// MIME type for a file extension ("png" or ".png", case-insensitive).
// Registered types win over the built-in table; "" when unknown.
std::string type_by_extension(std::string_view extension);

// MIME type for the extension of a file name, "" when unknown
std::string type_by_name(std::string_view name);

void register_type(std::string_view extension, std::string mime_type);

// ============================================================================
// Content Sniffing
// ============================================================================

// Bytes considered by detect_content_type
inline constexpr size_t sniff_length = 512;

// Content type from the leading bytes of data. Always returns a valid
// type: "application/octet-stream" when nothing more specific matches.
std::string detect_content_type(std::string_view data);

// ============================================================================
// Media Type Parsing
// ============================================================================

struct MediaType {
    std::string type;                          // lower-cased, "multipart/form-data"
    std::map<std::string, std::string> params; // lower-cased keys

    std::string param(std::string_view key) const;
};

// Parses "type/subtype; key=value; key=\"quoted value\"" and disposition
// values such as "form-data; name=file"
expected<MediaType, Error> parse_media_type(std::string_view value);

} // namespace gatefile::mime
