#pragma once

#include <charconv>
#include <chrono>
#include <concepts>
#include <string>
#include <string_view>
#include <type_traits>

#include "mediaseek/util/expected.hpp"
#include "mediaseek/core/error.hpp"

namespace mediaseek {

// ============================================================================
// FromString trait - Convert a configuration or header token to type T
// ============================================================================

template<typename T, typename = void>
struct FromString;

template<typename T>
struct FromString<T, std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>>> {
    static expected<T, Error> parse(std::string_view s) {
        if (s.empty()) {
            return unexpected(Error(StreamError::InvalidConfig, "Empty value"));
        }

        T value{};
        auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);

        if (ec == std::errc{} && ptr == s.data() + s.size()) {
            return value;
        }

        if (ec == std::errc::result_out_of_range) {
            return unexpected(Error(StreamError::InvalidConfig,
                "Value out of range: " + std::string(s)));
        }

        return unexpected(Error(StreamError::InvalidConfig,
            "Invalid integer: " + std::string(s)));
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
        return unexpected(Error(StreamError::InvalidConfig,
            "Invalid boolean: " + std::string(s)));
    }
};

template<>
struct FromString<std::string> {
    static expected<std::string, Error> parse(std::string_view s) {
        return std::string(s);
    }
};

// Whole seconds, e.g. "30"
template<>
struct FromString<std::chrono::seconds> {
    static expected<std::chrono::seconds, Error> parse(std::string_view s) {
        auto count = FromString<long long>::parse(s);
        if (!count) {
            return unexpected(count.error());
        }
        if (*count < 0) {
            return unexpected(Error(StreamError::InvalidConfig,
                "Negative duration: " + std::string(s)));
        }
        return std::chrono::seconds(*count);
    }
};

template<typename T>
expected<T, Error> from_string(std::string_view s) {
    return FromString<T>::parse(s);
}

template<typename T>
concept Parseable = requires(std::string_view s) {
    { FromString<T>::parse(s) } -> std::same_as<expected<T, Error>>;
};

} // namespace mediaseek
