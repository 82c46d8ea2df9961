#include <iconvault/parse/SelectionJsonParser.hpp>

#include "log/TaggedLogger.hpp"
#include "utils/StringUtils.hpp"

#include <nlohmann/json.hpp>

#include <array>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <limits>
#include <utility>

namespace IV::Parse {

namespace {

using json = nlohmann::json;

struct SplitName {
    std::string              primary;
    std::vector<std::string> aliases;
};

auto decode(std::string_view bytes) -> Expected<json> {
    auto document = json::parse(bytes.begin(), bytes.end(), nullptr, false);
    if (document.is_discarded()) {
        return std::unexpected(Error{Error::Code::MalformedJson, "selection.json is not valid JSON"});
    }
    if (!document.is_object()) {
        return std::unexpected(Error{Error::Code::MalformedJson, "selection.json root must be an object"});
    }
    return Expected<json>{std::in_place, std::move(document)};
}

auto member(json const& object, char const* key) -> json const* {
    if (!object.is_object()) {
        return nullptr;
    }
    auto it = object.find(key);
    if (it == object.end()) {
        return nullptr;
    }
    return &*it;
}

auto split_name(std::string_view raw) -> SplitName {
    SplitName result;
    auto      tokens = Utils::split(raw, ',');
    result.primary   = std::string{Utils::trim(tokens.front())};
    for (std::size_t i = 1; i < tokens.size(); ++i) {
        auto alias = Utils::trim(tokens[i]);
        if (!alias.empty()) {
            result.aliases.emplace_back(alias);
        }
    }
    return result;
}

auto icon_name(json const& entry) -> std::optional<SplitName> {
    auto const* properties = member(entry, "properties");
    auto const* name       = properties != nullptr ? member(*properties, "name") : nullptr;
    if (name == nullptr || !name->is_string()) {
        return std::nullopt;
    }
    auto split = split_name(name->get_ref<std::string const&>());
    if (split.primary.empty()) {
        return std::nullopt;
    }
    return split;
}

auto class_prefix(json const& document) -> std::string {
    auto const* preferences = member(document, "preferences");
    auto const* font        = preferences != nullptr ? member(*preferences, "fontPref") : nullptr;
    auto const* prefix      = font != nullptr ? member(*font, "prefix") : nullptr;
    if (prefix != nullptr && prefix->is_string()) {
        return prefix->get<std::string>();
    }
    return std::string{kDefaultClassPrefix};
}

auto unicode_hex(json const& code) -> std::optional<std::string> {
    std::uint64_t value = 0;
    if (code.is_number_unsigned()) {
        value = code.get<std::uint64_t>();
    } else if (code.is_number_integer()) {
        auto const signed_value = code.get<std::int64_t>();
        if (signed_value < 0) {
            return std::nullopt;
        }
        value = static_cast<std::uint64_t>(signed_value);
    } else if (code.is_number_float()) {
        auto const real = code.get<double>();
        if (!std::isfinite(real) || real < 0.0 || std::floor(real) != real
            || real >= static_cast<double>(std::numeric_limits<std::uint64_t>::max())) {
            return std::nullopt;
        }
        value = static_cast<std::uint64_t>(real);
    } else {
        return std::nullopt;
    }
    std::array<char, 24> buffer{};
    auto result = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value, 16);
    return std::string(buffer.data(), result.ptr);
}

auto icons_of(json const& document) -> json const* {
    auto const* icons = member(document, "icons");
    if (icons == nullptr || !icons->is_array()) {
        return nullptr;
    }
    return icons;
}

auto build_catalog(json const& document) -> IconCatalog {
    IconCatalog catalog;
    auto const* icons = icons_of(document);
    if (icons == nullptr) {
        return catalog;
    }
    auto const prefix = class_prefix(document);
    for (auto const& entry : *icons) {
        auto name = icon_name(entry);
        if (!name) {
            continue;
        }
        Icon icon{};
        icon.css_class = prefix + name->primary;
        icon.name      = std::move(name->primary);
        icon.aliases   = std::move(name->aliases);
        if (auto const* code = member(*member(entry, "properties"), "code")) {
            icon.unicode = unicode_hex(*code);
        }
        if (auto const* body = member(entry, "icon")) {
            if (auto const* tags = member(*body, "tags"); tags != nullptr && tags->is_array()) {
                for (auto const& tag : *tags) {
                    if (tag.is_string()) {
                        icon.tags.push_back(tag.get<std::string>());
                    }
                }
            }
        }
        catalog.push_back(std::move(icon));
    }
    return catalog;
}

auto scalar_text(json const& value) -> std::optional<std::string> {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_number()) {
        if (value.is_number_float()) {
            return Utils::formatNumber(value.get<double>());
        }
        return value.dump();
    }
    if (value.is_boolean()) {
        return value.get<bool>() ? std::string{"true"} : std::string{"false"};
    }
    return std::nullopt;
}

auto path_attributes(json const& attrs) -> std::vector<PathAttributes> {
    std::vector<PathAttributes> out;
    if (!attrs.is_array()) {
        return out;
    }
    for (auto const& entry : attrs) {
        PathAttributes attributes;
        if (entry.is_object()) {
            for (auto const& [key, value] : entry.items()) {
                if (auto text = scalar_text(value)) {
                    attributes.emplace_back(key, std::move(*text));
                }
            }
        }
        out.push_back(std::move(attributes));
    }
    return out;
}

auto build_paths(json const& document) -> PathSpecMap {
    PathSpecMap specs;
    auto const* icons = icons_of(document);
    if (icons == nullptr) {
        return specs;
    }
    double grid = kDefaultGrid;
    if (auto const* height = member(document, "height"); height != nullptr && height->is_number()) {
        grid = height->get<double>();
    }
    for (auto const& entry : *icons) {
        auto        name  = icon_name(entry);
        auto const* body  = member(entry, "icon");
        auto const* paths = body != nullptr ? member(*body, "paths") : nullptr;
        if (!name || paths == nullptr || !paths->is_array()) {
            continue;
        }
        PathSpec spec;
        spec.grid  = grid;
        spec.width = grid;
        for (auto const& path : *paths) {
            if (path.is_string()) {
                spec.paths.push_back(path.get<std::string>());
            }
        }
        if (auto const* width = member(*body, "width"); width != nullptr && width->is_number()) {
            spec.width = width->get<double>();
        }
        if (auto const* attrs = member(*body, "attrs")) {
            spec.attrs = path_attributes(*attrs);
        }
        specs.assign(std::move(name->primary), std::move(spec));
    }
    return specs;
}

} // namespace

auto ParseSelectionJson(std::string_view bytes) -> Expected<IconCatalog> {
    auto document = decode(bytes);
    if (!document) {
        return std::unexpected(document.error());
    }
    return build_catalog(*document);
}

auto ExtractPathSpecs(std::string_view bytes) -> Expected<PathSpecMap> {
    auto document = decode(bytes);
    if (!document) {
        return std::unexpected(document.error());
    }
    return build_paths(*document);
}

auto ParseSelection(std::string_view bytes) -> Expected<Selection> {
    auto document = decode(bytes);
    if (!document) {
        return std::unexpected(document.error());
    }
    Selection selection{build_catalog(*document), build_paths(*document)};
    iv_log("selection.json: " + std::to_string(selection.catalog.size()) + " icons, "
               + std::to_string(selection.paths.size()) + " path sets",
           "Parser");
    return selection;
}

} // namespace IV::Parse
