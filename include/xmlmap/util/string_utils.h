#ifndef XMLMAP_UTIL_STRING_UTILS_H
#define XMLMAP_UTIL_STRING_UTILS_H

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace xmlmap {
    template<typename T>
    std::string to_string(const T &value);

    // Rendered as True / False
    template<>
    std::string to_string(const bool &value);

    template<>
    std::string to_string(const int64_t &value);

    // Shortest representation that parses back to the same double.
    template<>
    std::string to_string(const double &value);

    [[nodiscard]] std::string_view trim(std::string_view text) noexcept;

    [[nodiscard]] std::string to_lower(std::string_view text);

    [[nodiscard]] std::vector<std::string_view> split(std::string_view text, char delimiter);
} // namespace xmlmap

#endif  // XMLMAP_UTIL_STRING_UTILS_H
