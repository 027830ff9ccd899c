#ifndef TASKLIST_UTIL_STRING_H
#define TASKLIST_UTIL_STRING_H

#include <string>
#include <string_view>
#include <type_traits>
#include <charconv>
#include <tasklist/exceptions.h>

namespace tasklist::util {

/**
 * @brief Decodes a URL-encoded string (e.g., %20 to space).
 * Handles both '+' and '%xx' encodings.
 */
std::string url_decode(std::string_view str);

std::string to_lower(std::string_view str);

std::string trim(std::string_view str);

/**
 * @brief Length of a UTF-8 string measured in UTF-16 code units.
 * Code points above U+FFFF count as 2, everything else as 1.
 */
std::size_t utf16_length(std::string_view str);

/**
 * @brief Converts various types to string for database parameters.
 */
template<typename T>
std::string to_string_param(const T& val) {
    if constexpr (std::is_same_v<T, std::string>) return val;
    else if constexpr (std::is_constructible_v<std::string, T>) return std::string(val);
    else if constexpr (std::is_same_v<T, bool>) return val ? "true" : "false";
    else return std::to_string(val);
}

/**
 * @brief Converts a string_view to a numeric or boolean type with std::from_chars.
 * @throws ConfigError if parsing fails or trailing characters remain.
 */
template<typename T>
T convert_string(std::string_view s) {
    using PureT = std::remove_cvref_t<T>;

    if constexpr (std::is_same_v<PureT, std::string>) {
        return std::string(s);
    } else if constexpr (std::is_same_v<PureT, bool>) {
        if (s == "true" || s == "1" || s == "yes") return true;
        if (s == "false" || s == "0" || s == "no") return false;
        throw ConfigError("Invalid boolean format: " + std::string(s));
    } else if constexpr (std::is_integral_v<PureT>) {
        PureT val{};
        auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), val);
        if (ec != std::errc() || ptr != s.data() + s.size()) {
            throw ConfigError("Invalid integer format: " + std::string(s));
        }
        return val;
    } else {
        static_assert(sizeof(PureT) == 0, "Unsupported type for convert_string");
    }
}

} // namespace tasklist::util

#endif // TASKLIST_UTIL_STRING_H
