#pragma once

#include <iconvault/catalog/Icon.hpp>

#include <string>
#include <vector>

namespace IV::Svg {

inline constexpr std::string_view kSvgNamespace = "http://www.w3.org/2000/svg";

struct Symbol {
    std::string id;
    std::string view_box;
    // Serialized <path> elements, already escaped.
    std::string inner;
};

struct SpriteDocument {
    std::vector<Symbol> symbols;
};

/*
 * One <symbol id="icon-{name}" viewBox="0 0 {width} {grid}"> per entry, in
 * map order. Per-path attributes go through SanitizeAttribute; "d" is never
 * overridden.
 */
[[nodiscard]] auto BuildSprite(PathSpecMap const& specs) -> SpriteDocument;

[[nodiscard]] auto RenderSprite(SpriteDocument const& document) -> std::string;

} // namespace IV::Svg
