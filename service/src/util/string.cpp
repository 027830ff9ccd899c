#include <tasklist/util/string.h>
#include <string>
#include <string_view>
#include <cctype>
#include <algorithm>
#include <charconv>

namespace tasklist::util {

std::string url_decode(std::string_view str) {
    std::string out;
    out.reserve(str.size());
    while (!str.empty()) {
        if (str.front() == '%' && str.size() >= 3) {
            unsigned byte = 0;
            const char* first = str.data() + 1;
            auto [end, ec] = std::from_chars(first, first + 2, byte, 16);
            if (ec == std::errc() && end == first + 2) {
                out += static_cast<char>(byte);
                str.remove_prefix(3);
                continue;
            }
        }
        out += str.front() == '+' ? ' ' : str.front();
        str.remove_prefix(1);
    }
    return out;
}

std::string to_lower(std::string_view str) {
    std::string result(str);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string trim(std::string_view str) {
    constexpr std::string_view kSpace = " \t\r\n\f\v";
    const auto first = str.find_first_not_of(kSpace);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = str.find_last_not_of(kSpace);
    return std::string(str.substr(first, last - first + 1));
}

std::size_t utf16_length(std::string_view str) {
    std::size_t count = 0;
    for (unsigned char c : str) {
        if ((c & 0xC0) == 0x80) {
            continue;  // continuation byte
        }
        // 11110xxx starts a code point above U+FFFF, a surrogate pair in UTF-16
        count += (c >= 0xF0) ? 2 : 1;
    }
    return count;
}

} // namespace tasklist::util
