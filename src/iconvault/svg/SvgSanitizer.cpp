#include <iconvault/svg/SvgSanitizer.hpp>

#include "log/TaggedLogger.hpp"
#include "svg/XmlLoad.hpp"
#include "utils/StringUtils.hpp"

#include <pugixml.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <functional>
#include <span>
#include <vector>

namespace IV::Svg {

namespace {

// Lowercase; names are compared after lowering.
constexpr std::array<std::string_view, 20> kAllowedElements{
    "svg",      "symbol",   "defs",  "g",    "path",     "circle",   "rect",
    "ellipse",  "line",     "polyline", "polygon", "title", "desc", "use",
    "clippath", "mask",     "lineargradient", "radialgradient", "stop", "pattern",
};

constexpr std::array<std::string_view, 47> kAllowedAttributes{
    "xmlns",
    "xmlns:xlink",
    "viewbox",
    "width",
    "height",
    "id",
    "class",
    "fill",
    "fill-rule",
    "stroke",
    "stroke-width",
    "stroke-linecap",
    "stroke-linejoin",
    "stroke-miterlimit",
    "stroke-dasharray",
    "stroke-dashoffset",
    "opacity",
    "fill-opacity",
    "stroke-opacity",
    "d",
    "x",
    "y",
    "x1",
    "x2",
    "y1",
    "y2",
    "cx",
    "cy",
    "r",
    "rx",
    "ry",
    "points",
    "transform",
    "style",
    "gradientunits",
    "gradienttransform",
    "spreadmethod",
    "offset",
    "stop-color",
    "stop-opacity",
    "clip-path",
    "mask",
    "href",
    "xlink:href",
    "aria-hidden",
    "role",
    "focusable",
};

// A keyword, optional whitespace, then a terminator. Empty terminator means
// the keyword alone matches.
struct StylePattern {
    std::string_view keyword;
    std::string_view terminator;
};

constexpr std::array<StylePattern, 6> kDangerousStyle{{
    {"expression", "("},
    {"javascript", ":"},
    {"vbscript", ":"},
    {"@import", ""},
    {"behavior", ":"},
    {"-moz-binding", ""},
}};

auto skip_spaces(std::string_view text, std::size_t pos) -> std::size_t {
    while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
        ++pos;
    }
    return pos;
}

auto matches_pattern(std::string_view style, StylePattern const& pattern) -> bool {
    std::size_t from = 0;
    while (true) {
        auto const hit = Utils::findIcase(style, pattern.keyword, from);
        if (hit == std::string_view::npos) {
            return false;
        }
        if (pattern.terminator.empty()) {
            return true;
        }
        auto const next = skip_spaces(style, hit + pattern.keyword.size());
        if (style.substr(next).starts_with(pattern.terminator)) {
            return true;
        }
        from = hit + 1;
    }
}

// Length of a url( ['"] javascript: opening at `pos`, or 0.
auto javascript_url_length(std::string_view style, std::size_t pos) -> std::size_t {
    if (!Utils::startsWithIcase(style.substr(pos), "url")) {
        return 0;
    }
    auto cursor = skip_spaces(style, pos + 3);
    if (cursor >= style.size() || style[cursor] != '(') {
        return 0;
    }
    cursor = skip_spaces(style, cursor + 1);
    if (cursor < style.size() && (style[cursor] == '\'' || style[cursor] == '"')) {
        ++cursor;
    }
    cursor = skip_spaces(style, cursor);
    if (!Utils::startsWithIcase(style.substr(cursor), "javascript:")) {
        return 0;
    }
    return cursor + std::string_view{"javascript:"}.size() - pos;
}

auto is_whitelisted(std::span<std::string_view const> list, std::string_view name) -> bool {
    auto const lowered = Utils::toLower(name);
    return std::find(list.begin(), list.end(), std::string_view{lowered}) != list.end();
}

// Mirrors attribute whitespace normalization on load, so reparsing the output
// reproduces the same value.
auto normalize_attribute_whitespace(std::string value) -> std::string {
    std::replace_if(value.begin(), value.end(), [](char ch) { return ch == '\t' || ch == '\n' || ch == '\r'; }, ' ');
    return value;
}

using NodePredicate = std::function<bool(pugi::xml_node const&)>;

/*
 * Collects the outermost elements matching `predicate`; matched elements are
 * not descended into, so the collected subtrees are disjoint.
 */
auto collect_elements(pugi::xml_node root, NodePredicate const& predicate) -> std::vector<pugi::xml_node> {
    std::vector<pugi::xml_node> doomed;
    std::vector<pugi::xml_node> pending{root};
    while (!pending.empty()) {
        auto node = pending.back();
        pending.pop_back();
        for (auto child : node.children()) {
            if (child.type() != pugi::node_element) {
                continue;
            }
            if (predicate(child)) {
                doomed.push_back(child);
            } else {
                pending.push_back(child);
            }
        }
    }
    return doomed;
}

auto remove_elements(pugi::xml_node root, NodePredicate const& predicate) -> std::size_t {
    std::size_t removed = 0;
    for (auto& node : collect_elements(root, predicate)) {
        if (node.parent().remove_child(node)) {
            ++removed;
        }
    }
    return removed;
}

auto all_elements(pugi::xml_node root) -> std::vector<pugi::xml_node> {
    std::vector<pugi::xml_node> elements;
    std::vector<pugi::xml_node> pending{root};
    while (!pending.empty()) {
        auto node = pending.back();
        pending.pop_back();
        for (auto child : node.children()) {
            if (child.type() == pugi::node_element) {
                elements.push_back(child);
                pending.push_back(child);
            }
        }
    }
    return elements;
}

// Turns CDATA sections into ordinary text and normalizes carriage returns.
auto flatten_text(pugi::xml_document& doc) -> void {
    std::vector<pugi::xml_node> cdata;
    std::vector<pugi::xml_node> pending{doc};
    while (!pending.empty()) {
        auto node = pending.back();
        pending.pop_back();
        for (auto child : node.children()) {
            if (child.type() == pugi::node_cdata) {
                cdata.push_back(child);
            } else if (child.type() == pugi::node_element) {
                pending.push_back(child);
            } else if (child.type() == pugi::node_pcdata) {
                std::string value{child.value()};
                if (value.find('\r') != std::string::npos) {
                    std::replace(value.begin(), value.end(), '\r', '\n');
                    child.set_value(value.c_str());
                }
            }
        }
    }
    for (auto& node : cdata) {
        std::string value{node.value()};
        std::replace(value.begin(), value.end(), '\r', '\n');
        auto parent = node.parent();
        auto text   = parent.insert_child_before(pugi::node_pcdata, node);
        text.set_value(value.c_str());
        parent.remove_child(node);
    }
}

auto is_xml_whitespace(std::string_view text) -> bool {
    return text.find_first_not_of(" \t\n\r") == std::string_view::npos;
}

// Merges adjacent text siblings and drops runs that are whitespace only,
// which is what loading the serialized output does to them.
auto coalesce_text(pugi::xml_document& doc) -> void {
    std::vector<pugi::xml_node> pending{doc};
    while (!pending.empty()) {
        auto node = pending.back();
        pending.pop_back();
        std::vector<pugi::xml_node> blank;
        pugi::xml_node              run;
        for (auto child = node.first_child(); child;) {
            auto next = child.next_sibling();
            if (child.type() == pugi::node_pcdata) {
                if (run) {
                    std::string merged{run.value()};
                    merged += child.value();
                    run.set_value(merged.c_str());
                    node.remove_child(child);
                } else {
                    run = child;
                }
            } else {
                if (run && is_xml_whitespace(run.value())) {
                    blank.push_back(run);
                }
                run = pugi::xml_node{};
                if (child.type() == pugi::node_element) {
                    pending.push_back(child);
                }
            }
            child = next;
        }
        if (run && is_xml_whitespace(run.value())) {
            blank.push_back(run);
        }
        for (auto& text : blank) {
            node.remove_child(text);
        }
    }
}

auto has_event_handler(pugi::xml_node const& node) -> bool {
    for (auto attribute : node.attributes()) {
        if (IsEventHandlerAttribute(attribute.name())) {
            return true;
        }
    }
    return false;
}

auto strip_attributes(pugi::xml_node root) -> std::size_t {
    std::size_t dropped = 0;
    for (auto element : all_elements(root)) {
        std::vector<pugi::xml_attribute> doomed;
        for (auto attribute : element.attributes()) {
            auto kept = SanitizeAttribute(attribute.name(), attribute.value());
            if (!kept) {
                doomed.push_back(attribute);
                continue;
            }
            auto normalized = normalize_attribute_whitespace(std::move(*kept));
            if (normalized != attribute.value()) {
                attribute.set_value(normalized.c_str());
            }
        }
        for (auto& attribute : doomed) {
            element.remove_attribute(attribute);
        }
        dropped += doomed.size();
    }
    return dropped;
}

} // namespace

auto ExtractSvgSpan(std::string_view raw) -> std::string_view {
    constexpr std::string_view closing = "</svg>";
    auto const                 first   = Utils::findIcase(raw, "<svg");
    if (first == std::string_view::npos) {
        return raw;
    }
    auto const last = Utils::rfindIcase(raw, closing);
    if (last == std::string_view::npos || last < first) {
        return raw;
    }
    return raw.substr(first, last + closing.size() - first);
}

auto IsAllowedSvgElement(std::string_view name) -> bool {
    return is_whitelisted(kAllowedElements, name);
}

auto IsAllowedSvgAttribute(std::string_view name) -> bool {
    return is_whitelisted(kAllowedAttributes, name) || Utils::startsWithIcase(name, "data-");
}

auto IsEventHandlerAttribute(std::string_view name) -> bool {
    return Utils::startsWithIcase(name, "on");
}

auto IsJavascriptUrl(std::string_view value) -> bool {
    // URL parsers ignore embedded tabs and newlines in the scheme.
    std::string compact;
    compact.reserve(value.size());
    for (char ch : value) {
        if (static_cast<unsigned char>(ch) > 0x20) {
            compact.push_back(ch);
        }
    }
    return Utils::startsWithIcase(compact, "javascript:");
}

auto IsValidXmlName(std::string_view name) -> bool {
    if (name.empty()) {
        return false;
    }
    auto const first = static_cast<unsigned char>(name.front());
    if (std::isalpha(first) == 0 && first != '_' && first != ':') {
        return false;
    }
    return std::all_of(name.begin(), name.end(), [](unsigned char ch) {
        return std::isalnum(ch) != 0 || ch == '_' || ch == ':' || ch == '.' || ch == '-';
    });
}

auto SanitizeStyle(std::string_view style) -> std::optional<std::string> {
    for (auto const& pattern : kDangerousStyle) {
        if (matches_pattern(style, pattern)) {
            return std::nullopt;
        }
    }
    std::string cleaned;
    cleaned.reserve(style.size());
    std::size_t pos = 0;
    while (pos < style.size()) {
        if (auto length = javascript_url_length(style, pos); length > 0) {
            pos += length;
            continue;
        }
        cleaned.push_back(style[pos]);
        ++pos;
    }
    return cleaned;
}

auto SanitizeAttribute(std::string_view name, std::string_view value) -> std::optional<std::string> {
    if (!IsValidXmlName(name) || IsEventHandlerAttribute(name)) {
        return std::nullopt;
    }
    auto const lowered = Utils::toLower(name);
    if ((lowered == "href" || lowered == "xlink:href") && IsJavascriptUrl(value)) {
        return std::nullopt;
    }
    if (!IsAllowedSvgAttribute(name)) {
        return std::nullopt;
    }
    if (lowered == "style") {
        auto style = SanitizeStyle(value);
        if (!style || style->empty()) {
            return std::nullopt;
        }
        return style;
    }
    return std::string{value};
}

auto SanitizeSvg(std::string_view raw) -> Expected<std::string> {
    if (raw.empty()) {
        return std::unexpected(Error{Error::Code::EmptySvg, "SVG content is empty"});
    }
    if (Utils::containsIcase(raw, "<!DOCTYPE")) {
        iv_log("rejected document type declaration", "Sanitizer", "Security");
        return std::unexpected(Error{Error::Code::DoctypeNotAllowed, "DOCTYPE declarations are not allowed"});
    }
    if (Utils::containsIcase(raw, "<!ENTITY")) {
        iv_log("rejected entity declaration", "Sanitizer", "Security");
        return std::unexpected(Error{Error::Code::EntityNotAllowed, "ENTITY declarations are not allowed"});
    }

    auto const span = ExtractSvgSpan(raw);

    pugi::xml_document doc;
    auto const         parsed = Detail::LoadUntrustedXml(span, doc);
    if (!parsed) {
        return std::unexpected(Error{Error::Code::InvalidSvg, "Invalid SVG: " + Detail::DescribeParseFailure(parsed)});
    }
    if (auto const roots = Detail::RootElementCount(doc); roots != 1) {
        return std::unexpected(Error{Error::Code::InvalidSvg,
                                     "Invalid SVG: expected one root element, found " + std::to_string(roots)});
    }

    flatten_text(doc);

    auto const scripts = remove_elements(doc, [](pugi::xml_node const& node) {
        return Utils::toLower(Detail::LocalName(node.name())) == "script";
    });
    auto const handlers   = remove_elements(doc, has_event_handler);
    auto const disallowed = remove_elements(doc, [](pugi::xml_node const& node) {
        return !IsAllowedSvgElement(node.name());
    });
    auto const attributes = strip_attributes(doc);
    coalesce_text(doc);
    iv_log("removed " + std::to_string(scripts) + " script, " + std::to_string(handlers) + " handler, "
               + std::to_string(disallowed) + " disallowed elements and " + std::to_string(attributes)
               + " attributes",
           "Sanitizer");

    if (!doc.document_element()) {
        return std::unexpected(Error{Error::Code::SanitizationFailed, "No SVG element survived sanitization"});
    }
    auto output = Detail::SerializeRaw(doc);
    if (output.empty()) {
        return std::unexpected(Error{Error::Code::SanitizationFailed, "Failed to serialize sanitized SVG"});
    }
    return output;
}

} // namespace IV::Svg
