#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace IV::Utils {

[[nodiscard]] auto toLower(std::string_view value) -> std::string;
[[nodiscard]] auto trim(std::string_view value) -> std::string_view;

[[nodiscard]] auto findIcase(std::string_view haystack, std::string_view needle, std::size_t from = 0)
    -> std::size_t;
[[nodiscard]] auto rfindIcase(std::string_view haystack, std::string_view needle) -> std::size_t;
[[nodiscard]] auto containsIcase(std::string_view haystack, std::string_view needle) -> bool;
[[nodiscard]] auto startsWithIcase(std::string_view text, std::string_view prefix) -> bool;

// Splits on every occurrence of `delimiter`; empty fields are kept.
[[nodiscard]] auto split(std::string_view text, char delimiter) -> std::vector<std::string_view>;

// Escapes &, <, >, " and ' for use in XML text or double-quoted attributes.
[[nodiscard]] auto escapeXml(std::string_view text) -> std::string;

// Shortest decimal form that round-trips; integral values print without a fraction.
[[nodiscard]] auto formatNumber(double value) -> std::string;

} // namespace IV::Utils
