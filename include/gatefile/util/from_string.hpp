#pragma once

#include <charconv>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

#include "gatefile/util/expected.hpp"
#include "gatefile/core/error.hpp"

namespace gatefile {

// ============================================================================
// FromString trait - strict conversion of a whole string to T
// ============================================================================

template<typename T, typename = void>
struct FromString;

// Integral types: decimal digits with an optional leading '-' for signed
// types. No whitespace, no '+', and the whole input must be consumed.
template<typename T>
struct FromString<T, std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>>> {
    static expected<T, Error> parse(std::string_view s) {
        if (s.empty()) {
            return unexpected(Error::io(IoError::InvalidArgument, "empty number"));
        }

        T value{};
        auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);

        if (ec == std::errc{} && ptr == s.data() + s.size()) {
            return value;
        }

        if (ec == std::errc::result_out_of_range) {
            return unexpected(Error::io(IoError::InvalidArgument,
                "number out of range: " + std::string(s)));
        }

        return unexpected(Error::io(IoError::InvalidArgument,
            "invalid integer: " + std::string(s)));
    }
};

template<>
struct FromString<bool> {
    static expected<bool, Error> parse(std::string_view s) {
        if (s == "true" || s == "1" || s == "yes" || s == "on") {
            return true;
        }
        if (s == "false" || s == "0" || s == "no" || s == "off") {
            return false;
        }
        return unexpected(Error::io(IoError::InvalidArgument,
            "invalid boolean: " + std::string(s)));
    }
};

template<>
struct FromString<std::string> {
    static expected<std::string, Error> parse(std::string_view s) {
        return std::string(s);
    }
};

// Empty input is an empty optional rather than an error
template<typename T>
struct FromString<std::optional<T>> {
    static expected<std::optional<T>, Error> parse(std::string_view s) {
        if (s.empty()) {
            return std::optional<T>{std::nullopt};
        }
        auto result = FromString<T>::parse(s);
        if (result) {
            return std::optional<T>{std::move(*result)};
        }
        return unexpected(result.error());
    }
};

template<typename T>
expected<T, Error> from_string(std::string_view s) {
    return FromString<T>::parse(s);
}

} // namespace gatefile
