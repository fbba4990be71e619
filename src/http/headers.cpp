#include "gatefile/http/headers.hpp"

#include <algorithm>
#include <cctype>

#include "gatefile/util/from_string.hpp"

namespace gatefile {

namespace {

std::string lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

} // anonymous namespace

ResponseHeaders& ResponseHeaders::set(std::string_view name, std::string value) {
    auto key = lower(name);
    for (auto& [k, v] : headers_) {
        if (k == key) {
            v = std::move(value);
            return *this;
        }
    }
    headers_.emplace_back(std::move(key), std::move(value));
    return *this;
}

void ResponseHeaders::erase(std::string_view name) {
    auto key = lower(name);
    headers_.erase(
        std::remove_if(headers_.begin(), headers_.end(),
            [&](const Header& h) { return h.first == key; }),
        headers_.end());
}

bool ResponseHeaders::has(std::string_view name) const {
    auto key = lower(name);
    return std::any_of(headers_.begin(), headers_.end(),
        [&](const Header& h) { return h.first == key; });
}

std::string_view ResponseHeaders::get(std::string_view name) const {
    auto key = lower(name);
    for (const auto& [k, v] : headers_) {
        if (k == key) {
            return v;
        }
    }
    return {};
}

int ResponseHeaders::status() const {
    auto parsed = from_string<int>(get(header::code));
    return parsed ? *parsed : 0;
}

ResponseHeaders& ResponseHeaders::set_status(int status) {
    return set(header::code, std::to_string(status));
}

} // namespace gatefile
