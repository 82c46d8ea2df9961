#include <iconvault/svg/SpriteSynthesizer.hpp>
#include <iconvault/svg/SvgSanitizer.hpp>

#include "log/TaggedLogger.hpp"
#include "utils/StringUtils.hpp"

#include <optional>
#include <string_view>

namespace IV::Svg {

namespace {

// The synthesized root declares only the SVG namespace, so namespace
// declarations and prefixed names cannot appear on a path.
auto needs_namespace(std::string_view name) -> bool {
    return Utils::toLower(name) == "xmlns" || name.find(':') != std::string_view::npos;
}

auto render_path(std::string const& data, PathAttributes const* attributes) -> std::string {
    std::string out = "<path d=\"" + Utils::escapeXml(data) + "\"";
    if (attributes != nullptr) {
        for (auto const& [name, value] : *attributes) {
            if (Utils::toLower(name) == "d") {
                continue;
            }
            auto kept = needs_namespace(name) ? std::nullopt : SanitizeAttribute(name, value);
            if (!kept) {
                iv_log("dropping path attribute " + name, "Synthesizer");
                continue;
            }
            out += ' ';
            out += name;
            out += "=\"";
            out += Utils::escapeXml(*kept);
            out += '"';
        }
    }
    out += "></path>";
    return out;
}

} // namespace

auto BuildSprite(PathSpecMap const& specs) -> SpriteDocument {
    SpriteDocument document;
    document.symbols.reserve(specs.size());
    for (auto const& [name, spec] : specs) {
        Symbol symbol;
        symbol.id       = std::string{kSpriteIdPrefix} + name;
        symbol.view_box = "0 0 " + Utils::formatNumber(spec.width) + " " + Utils::formatNumber(spec.grid);
        for (std::size_t index = 0; index < spec.paths.size(); ++index) {
            auto const* attributes = index < spec.attrs.size() ? &spec.attrs[index] : nullptr;
            symbol.inner += render_path(spec.paths[index], attributes);
        }
        document.symbols.push_back(std::move(symbol));
    }
    return document;
}

auto RenderSprite(SpriteDocument const& document) -> std::string {
    std::string out = "<svg xmlns=\"" + std::string{kSvgNamespace} + "\" style=\"display:none;\">";
    for (auto const& symbol : document.symbols) {
        out += "<symbol id=\"" + Utils::escapeXml(symbol.id) + "\" viewBox=\"" + Utils::escapeXml(symbol.view_box)
               + "\">";
        out += symbol.inner;
        out += "</symbol>";
    }
    out += "</svg>";
    return out;
}

} // namespace IV::Svg
