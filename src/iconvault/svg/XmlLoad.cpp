#include "svg/XmlLoad.hpp"

#include <utility>

namespace IV::Svg::Detail {

auto LoadUntrustedXml(std::string_view text, pugi::xml_document& doc) -> pugi::xml_parse_result {
    unsigned int flags = pugi::parse_default;
    flags &= ~pugi::parse_doctype;
    return doc.load_buffer(text.data(), text.size(), flags, pugi::encoding_utf8);
}

auto RootElementCount(pugi::xml_document const& doc) -> std::size_t {
    std::size_t count = 0;
    for (auto child : doc.children()) {
        if (child.type() == pugi::node_element) {
            ++count;
        }
    }
    return count;
}

auto SerializeRaw(pugi::xml_document const& doc) -> std::string {
    StringWriter writer;
    doc.save(writer, "", pugi::format_raw | pugi::format_no_declaration, pugi::encoding_utf8);
    return std::move(writer.out);
}

auto LocalName(std::string_view qualified) -> std::string_view {
    auto const colon = qualified.rfind(':');
    if (colon == std::string_view::npos) {
        return qualified;
    }
    return qualified.substr(colon + 1);
}

auto DescribeParseFailure(pugi::xml_parse_result const& result) -> std::string {
    return std::string{result.description()} + " at offset " + std::to_string(result.offset);
}

} // namespace IV::Svg::Detail
