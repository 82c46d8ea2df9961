#include "utils/StringUtils.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cstddef>
#include <iterator>

namespace IV::Utils {

namespace {

bool equal_icase(char lhs, char rhs) {
    return std::tolower(static_cast<unsigned char>(lhs)) == std::tolower(static_cast<unsigned char>(rhs));
}

} // namespace

auto toLower(std::string_view value) -> std::string {
    std::string lowered;
    lowered.reserve(value.size());
    std::transform(value.begin(), value.end(), std::back_inserter(lowered), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return lowered;
}

auto trim(std::string_view value) -> std::string_view {
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front())) != 0) {
        value.remove_prefix(1);
    }
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back())) != 0) {
        value.remove_suffix(1);
    }
    return value;
}

auto findIcase(std::string_view haystack, std::string_view needle, std::size_t from) -> std::size_t {
    if (from > haystack.size()) {
        return std::string_view::npos;
    }
    auto it = std::search(haystack.begin() + static_cast<std::ptrdiff_t>(from),
                          haystack.end(),
                          needle.begin(),
                          needle.end(),
                          equal_icase);
    if (it == haystack.end() && !needle.empty()) {
        return std::string_view::npos;
    }
    return static_cast<std::size_t>(it - haystack.begin());
}

auto rfindIcase(std::string_view haystack, std::string_view needle) -> std::size_t {
    auto it = std::find_end(haystack.begin(), haystack.end(), needle.begin(), needle.end(), equal_icase);
    if (it == haystack.end() && !needle.empty()) {
        return std::string_view::npos;
    }
    return static_cast<std::size_t>(it - haystack.begin());
}

auto containsIcase(std::string_view haystack, std::string_view needle) -> bool {
    return findIcase(haystack, needle) != std::string_view::npos;
}

auto startsWithIcase(std::string_view text, std::string_view prefix) -> bool {
    return text.size() >= prefix.size()
           && std::equal(prefix.begin(), prefix.end(), text.begin(), equal_icase);
}

auto split(std::string_view text, char delimiter) -> std::vector<std::string_view> {
    std::vector<std::string_view> fields;
    std::size_t                   offset = 0;
    while (true) {
        auto next = text.find(delimiter, offset);
        if (next == std::string_view::npos) {
            fields.push_back(text.substr(offset));
            break;
        }
        fields.push_back(text.substr(offset, next - offset));
        offset = next + 1;
    }
    return fields;
}

auto escapeXml(std::string_view text) -> std::string {
    std::string escaped;
    escaped.reserve(text.size());
    for (char ch : text) {
        switch (ch) {
        case '&':
            escaped.append("&amp;");
            break;
        case '<':
            escaped.append("&lt;");
            break;
        case '>':
            escaped.append("&gt;");
            break;
        case '"':
            escaped.append("&quot;");
            break;
        case '\'':
            escaped.append("&#039;");
            break;
        default:
            escaped.push_back(ch);
            break;
        }
    }
    return escaped;
}

auto formatNumber(double value) -> std::string {
    std::array<char, 64> buffer{};
    auto result = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value);
    if (result.ec != std::errc{}) {
        return "0";
    }
    return std::string(buffer.data(), result.ptr);
}

} // namespace IV::Utils
