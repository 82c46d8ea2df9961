#include <iconvault/parse/SpriteParser.hpp>

#include "log/TaggedLogger.hpp"
#include "svg/XmlLoad.hpp"

#include <pugixml.hpp>

namespace IV::Parse {

namespace {

auto collect_symbols(pugi::xml_node root, IconCatalog& catalog) -> void {
    std::vector<pugi::xml_node> pending;
    // Reverse push keeps document order with a LIFO stack.
    auto push_children = [&](pugi::xml_node node) {
        std::vector<pugi::xml_node> children;
        for (auto child : node.children()) {
            if (child.type() == pugi::node_element) {
                children.push_back(child);
            }
        }
        pending.insert(pending.end(), children.rbegin(), children.rend());
    };
    push_children(root);
    while (!pending.empty()) {
        auto node = pending.back();
        pending.pop_back();
        if (Svg::Detail::LocalName(node.name()) == "symbol") {
            std::string_view id = node.attribute("id").value();
            if (!id.empty()) {
                Icon icon{};
                icon.name      = std::string{stripIconPrefix(id)};
                icon.css_class = std::string{kSpriteIdPrefix} + icon.name;
                icon.symbol_id = std::string{id};
                icon.view_box  = std::string{node.attribute("viewBox").value()};
                catalog.push_back(std::move(icon));
            }
        }
        push_children(node);
    }
}

} // namespace

auto ParseSvgSprite(std::string_view bytes) -> Expected<IconCatalog> {
    pugi::xml_document doc;
    auto const         parsed = Svg::Detail::LoadUntrustedXml(bytes, doc);
    if (!parsed) {
        return std::unexpected(Error{Error::Code::MalformedXml,
                                     "Sprite is not well-formed XML: " + Svg::Detail::DescribeParseFailure(parsed)});
    }
    IconCatalog catalog;
    collect_symbols(doc, catalog);
    iv_log("sprite: " + std::to_string(catalog.size()) + " symbols", "Parser");
    return catalog;
}

auto MergeSpriteCatalog(IconCatalog const& existing, IconCatalog parsed) -> IconCatalog {
    if (existing.empty()) {
        return parsed;
    }
    return existing;
}

} // namespace IV::Parse
