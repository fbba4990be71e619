#pragma once

#include <initializer_list>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace gatefile {

// ============================================================================
// Metadata - inbound header multimap of a frame stream
// ============================================================================
//
// Keys are case-insensitive and stored lower-cased. A key may carry several
// values, kept in arrival order.

class Metadata {
public:
    static constexpr std::string_view forwarded_prefix = "grpcgateway-";

private:
    std::map<std::string, std::vector<std::string>, std::less<>> entries_;

public:
    Metadata() = default;
    Metadata(std::initializer_list<std::pair<std::string_view, std::string_view>> init);

    // Appends a value for key
    Metadata& add(std::string_view key, std::string_view value);

    // Replaces all values of key
    Metadata& set(std::string_view key, std::string_view value);

    void erase(std::string_view key);

    bool has(std::string_view key) const;

    // First value of key, "" when absent
    std::string_view get(std::string_view key) const;

    // First value of key, falling back to the key as forwarded by an HTTP
    // gateway under forwarded_prefix ("grpcgateway-range" for "range")
    std::string_view pick(std::string_view key) const;

    // All values of key, empty when absent
    const std::vector<std::string>& values(std::string_view key) const;

    size_t size() const noexcept { return entries_.size(); }
    bool empty() const noexcept { return entries_.empty(); }

    auto begin() const { return entries_.begin(); }
    auto end() const { return entries_.end(); }

    static std::string normalize(std::string_view key);
};

} // namespace gatefile
