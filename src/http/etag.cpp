#include "gatefile/http/etag.hpp"

namespace gatefile::etag {

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) {
        s.remove_prefix(1);
    }
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) {
        s.remove_suffix(1);
    }
    return s;
}

std::string_view strip_weak(std::string_view s) {
    if (s.substr(0, 2) == "W/") {
        s.remove_prefix(2);
    }
    return s;
}

} // anonymous namespace

Scanned scan(std::string_view s) {
    s = trim(s);
    size_t start = s.substr(0, 2) == "W/" ? 2 : 0;
    if (s.size() - start < 2 || s[start] != '"') {
        return {};
    }

    // RFC 7232 2.3: etagc = %x21 / %x23-7E / obs-text
    for (size_t i = start + 1; i < s.size(); ++i) {
        auto c = static_cast<unsigned char>(s[i]);
        if (c == 0x21 || (c >= 0x23 && c <= 0x7E) || c >= 0x80) {
            continue;
        }
        if (c == '"') {
            return {s.substr(0, i + 1), s.substr(i + 1)};
        }
        return {};
    }
    return {};
}

bool strong_match(std::string_view a, std::string_view b) {
    return a == b && !a.empty() && a.front() == '"';
}

bool weak_match(std::string_view a, std::string_view b) {
    return strip_weak(a) == strip_weak(b);
}

} // namespace gatefile::etag
