#include <xmlmap/util/string_utils.h>

#include <fmt/format.h>

#include <algorithm>
#include <cctype>

namespace xmlmap {
    template<>
    std::string to_string(const bool &value) { return value ? "True" : "False"; }

    template<>
    std::string to_string(const int64_t &value) { return fmt::format("{}", value); }

    template<>
    std::string to_string(const double &value) { return fmt::format("{}", value); }

    std::string_view trim(std::string_view text) noexcept {
        constexpr std::string_view whitespace{" \t\n\r\f\v"};
        auto first = text.find_first_not_of(whitespace);
        if (first == std::string_view::npos) { return {}; }
        auto last = text.find_last_not_of(whitespace);
        return text.substr(first, last - first + 1);
    }

    std::string to_lower(std::string_view text) {
        std::string result{text};
        std::transform(result.begin(), result.end(), result.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return result;
    }

    std::vector<std::string_view> split(std::string_view text, char delimiter) {
        std::vector<std::string_view> parts;
        size_t start = 0;
        while (true) {
            auto pos = text.find(delimiter, start);
            if (pos == std::string_view::npos) {
                parts.push_back(text.substr(start));
                break;
            }
            parts.push_back(text.substr(start, pos - start));
            start = pos + 1;
        }
        return parts;
    }
} // namespace xmlmap
