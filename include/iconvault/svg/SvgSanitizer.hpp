#pragma once

#include <iconvault/core/Error.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace IV::Svg {

/*
 * Whitelist sanitizer for untrusted SVG markup.
 *
 * Stages: reject DOCTYPE/ENTITY declarations on the raw bytes, cut the
 * <svg ... </svg> span, parse, remove <script> subtrees, remove every element
 * carrying an on* attribute together with its subtree, remove elements that
 * are not whitelisted, filter attributes, serialize.
 *
 * The result contains no <script and sanitizing it again yields the same
 * string.
 */
[[nodiscard]] auto SanitizeSvg(std::string_view raw) -> Expected<std::string>;

// Text from the first "<svg" to the end of the last "</svg>" (case-insensitive).
// Returns `raw` unchanged when no such span exists.
[[nodiscard]] auto ExtractSvgSpan(std::string_view raw) -> std::string_view;

[[nodiscard]] auto IsAllowedSvgElement(std::string_view name) -> bool;
[[nodiscard]] auto IsAllowedSvgAttribute(std::string_view name) -> bool;
[[nodiscard]] auto IsEventHandlerAttribute(std::string_view name) -> bool;
[[nodiscard]] auto IsJavascriptUrl(std::string_view value) -> bool;

// XML 1.0 Name restricted to ASCII letters, digits and "_:.-".
[[nodiscard]] auto IsValidXmlName(std::string_view name) -> bool;

/*
 * Returns nullopt when the whole declaration must be dropped, otherwise the
 * value with url(javascript:...) openings removed. An empty result means drop.
 */
[[nodiscard]] auto SanitizeStyle(std::string_view style) -> std::optional<std::string>;

/*
 * Attribute policy shared with sprite synthesis. Returns the value to keep,
 * possibly rewritten, or nullopt when the attribute is dropped.
 */
[[nodiscard]] auto SanitizeAttribute(std::string_view name, std::string_view value)
    -> std::optional<std::string>;

} // namespace IV::Svg
