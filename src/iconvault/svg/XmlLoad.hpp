#pragma once

#include <pugixml.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace IV::Svg::Detail {

struct StringWriter : pugi::xml_writer {
    std::string out;
    void write(const void* data, size_t size) override {
        out.append(static_cast<const char*>(data), size);
    }
};

/*
 * Loads untrusted XML. Document type declarations are never parsed, so no
 * internal or external entities exist; only the five predefined entities and
 * numeric character references decode. pugixml performs no I/O of its own.
 */
[[nodiscard]] auto LoadUntrustedXml(std::string_view text, pugi::xml_document& doc) -> pugi::xml_parse_result;

[[nodiscard]] auto RootElementCount(pugi::xml_document const& doc) -> std::size_t;

// Raw form, no declaration, UTF-8. Empty when nothing was written.
[[nodiscard]] auto SerializeRaw(pugi::xml_document const& doc) -> std::string;

// Local part of a possibly prefixed name ("svg:script" -> "script").
[[nodiscard]] auto LocalName(std::string_view qualified) -> std::string_view;

[[nodiscard]] auto DescribeParseFailure(pugi::xml_parse_result const& result) -> std::string;

} // namespace IV::Svg::Detail
