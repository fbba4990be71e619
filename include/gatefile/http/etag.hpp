#pragma once

#include <string_view>
#include <utility>

namespace gatefile::etag {

struct Scanned {
    std::string_view tag;     // "" when no valid entity tag was found
    std::string_view remain;  // text following the tag
};

// Reads one entity tag ("xyz" or W/"xyz") from the start of s, after
// trimming surrounding whitespace
Scanned scan(std::string_view s);

// Strong comparison: identical, and neither is weak
bool strong_match(std::string_view a, std::string_view b);

// Weak comparison: identical once any W/ prefix is removed
bool weak_match(std::string_view a, std::string_view b);

} // namespace gatefile::etag
