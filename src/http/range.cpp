#include "gatefile/http/range.hpp"

#include "gatefile/util/from_string.hpp"

namespace gatefile {

namespace {

// Strips spaces and tabs, as header field values are trimmed
std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) {
        s.remove_prefix(1);
    }
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) {
        s.remove_suffix(1);
    }
    return s;
}

Error invalid_range() {
    return Error::file(FileError::InvalidRange, "invalid range");
}

} // anonymous namespace

std::string ByteRange::content_range(int64_t size) const {
    return "bytes " + std::to_string(start) + "-" + std::to_string(end()) +
           "/" + std::to_string(size);
}

namespace range {

expected<std::vector<ByteRange>, Error> parse(std::string_view header, int64_t size) {
    std::vector<ByteRange> ranges;
    if (header.empty()) {
        return ranges;
    }

    constexpr std::string_view prefix = "bytes=";
    if (header.substr(0, prefix.size()) != prefix) {
        return unexpected(invalid_range());
    }

    bool no_overlap = false;
    std::string_view rest = header.substr(prefix.size());

    for (;;) {
        auto comma = rest.find(',');
        std::string_view spec = trim(rest.substr(0, comma));

        if (!spec.empty()) {
            auto dash = spec.find('-');
            if (dash == std::string_view::npos) {
                return unexpected(invalid_range());
            }
            std::string_view first = trim(spec.substr(0, dash));
            std::string_view last = trim(spec.substr(dash + 1));

            ByteRange r;
            bool keep = true;

            if (first.empty()) {
                // Suffix form: last `n` bytes
                if (last.empty() || last.front() == '-') {
                    return unexpected(invalid_range());
                }
                auto suffix = from_string<int64_t>(last);
                if (!suffix || *suffix < 0) {
                    return unexpected(invalid_range());
                }
                int64_t n = *suffix > size ? size : *suffix;
                r.start = size - n;
                r.length = size - r.start;
            } else {
                auto start = from_string<int64_t>(first);
                if (!start || *start < 0) {
                    return unexpected(invalid_range());
                }
                if (*start >= size) {
                    no_overlap = true;
                    keep = false;
                } else {
                    r.start = *start;
                    if (last.empty()) {
                        r.length = size - r.start;
                    } else {
                        auto end = from_string<int64_t>(last);
                        if (!end || r.start > *end) {
                            return unexpected(invalid_range());
                        }
                        int64_t e = *end >= size ? size - 1 : *end;
                        r.length = e - r.start + 1;
                    }
                }
            }

            if (keep) {
                ranges.push_back(r);
            }
        }

        if (comma == std::string_view::npos) {
            break;
        }
        rest.remove_prefix(comma + 1);
    }

    if (no_overlap && ranges.empty()) {
        return unexpected(Error::file(FileError::NoOverlap, "invalid range: failed to overlap"));
    }
    return ranges;
}

int64_t total_length(const std::vector<ByteRange>& ranges) noexcept {
    int64_t total = 0;
    for (const auto& r : ranges) {
        total += r.length;
    }
    return total;
}

std::string unsatisfied_content_range(int64_t size) {
    return "bytes */" + std::to_string(size);
}

} // namespace range

} // namespace gatefile
