#include "gatefile/transport/metadata.hpp"

#include <cctype>

namespace gatefile {

std::string Metadata::normalize(std::string_view key) {
    std::string out;
    out.reserve(key.size());
    for (char c : key) {
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

Metadata::Metadata(std::initializer_list<std::pair<std::string_view, std::string_view>> init) {
    for (const auto& [key, value] : init) {
        add(key, value);
    }
}

Metadata& Metadata::add(std::string_view key, std::string_view value) {
    entries_[normalize(key)].emplace_back(value);
    return *this;
}

Metadata& Metadata::set(std::string_view key, std::string_view value) {
    auto& slot = entries_[normalize(key)];
    slot.clear();
    slot.emplace_back(value);
    return *this;
}

void Metadata::erase(std::string_view key) {
    auto it = entries_.find(normalize(key));
    if (it != entries_.end()) {
        entries_.erase(it);
    }
}

bool Metadata::has(std::string_view key) const {
    return entries_.find(normalize(key)) != entries_.end();
}

std::string_view Metadata::get(std::string_view key) const {
    auto it = entries_.find(normalize(key));
    if (it == entries_.end() || it->second.empty()) {
        return {};
    }
    return it->second.front();
}

std::string_view Metadata::pick(std::string_view key) const {
    auto value = get(key);
    if (!value.empty()) {
        return value;
    }
    std::string forwarded(forwarded_prefix);
    forwarded += key;
    return get(forwarded);
}

const std::vector<std::string>& Metadata::values(std::string_view key) const {
    static const std::vector<std::string> none;
    auto it = entries_.find(normalize(key));
    if (it == entries_.end()) {
        return none;
    }
    return it->second;
}

} // namespace gatefile
