#include <iconvault/catalog/Icon.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>

namespace IV {

namespace {

using json = nlohmann::json;

auto string_array(json const& value) -> std::vector<std::string> {
    std::vector<std::string> out;
    if (!value.is_array()) {
        return out;
    }
    for (auto const& entry : value) {
        if (entry.is_string()) {
            out.push_back(entry.get<std::string>());
        }
    }
    return out;
}

auto optional_string(json const& object, char const* key) -> std::optional<std::string> {
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

} // namespace

void PathSpecMap::assign(std::string name, PathSpec spec) {
    auto it = std::find_if(entries_.begin(), entries_.end(), [&](NamedPathSpec const& entry) {
        return entry.name == name;
    });
    if (it != entries_.end()) {
        it->spec = std::move(spec);
        return;
    }
    entries_.push_back(NamedPathSpec{std::move(name), std::move(spec)});
}

auto PathSpecMap::find(std::string_view name) const -> PathSpec const* {
    for (auto const& entry : entries_) {
        if (entry.name == name) {
            return &entry.spec;
        }
    }
    return nullptr;
}

auto stripIconPrefix(std::string_view name) -> std::string_view {
    if (name.starts_with(kSpriteIdPrefix)) {
        name.remove_prefix(kSpriteIdPrefix.size());
    }
    return name;
}

auto findIcon(IconCatalog const& catalog, std::string_view name) -> Icon const* {
    auto const clean = stripIconPrefix(name);
    for (auto const& icon : catalog) {
        if (icon.name == clean) {
            return &icon;
        }
    }
    return nullptr;
}

auto iconExists(IconCatalog const& catalog, std::string_view name) -> bool {
    return findIcon(catalog, name) != nullptr;
}

auto catalogToJson(IconCatalog const& catalog) -> nlohmann::json {
    json entries = json::array();
    for (auto const& icon : catalog) {
        json entry{{"name", icon.name},
                   {"class", icon.css_class},
                   {"tags", icon.tags},
                   {"aliases", icon.aliases}};
        if (icon.unicode) {
            entry["unicode"] = *icon.unicode;
        }
        if (icon.symbol_id) {
            entry["id"] = *icon.symbol_id;
        }
        if (icon.view_box) {
            entry["viewBox"] = *icon.view_box;
        }
        entries.push_back(std::move(entry));
    }
    return entries;
}

auto catalogFromJson(nlohmann::json const& value) -> IconCatalog {
    IconCatalog catalog;
    if (!value.is_array()) {
        return catalog;
    }
    for (auto const& entry : value) {
        if (!entry.is_object()) {
            continue;
        }
        auto name = optional_string(entry, "name");
        if (!name) {
            continue;
        }
        Icon icon{};
        icon.name      = std::move(*name);
        icon.css_class = optional_string(entry, "class").value_or(std::string{kSpriteIdPrefix} + icon.name);
        icon.unicode   = optional_string(entry, "unicode");
        if (auto it = entry.find("tags"); it != entry.end()) {
            icon.tags = string_array(*it);
        }
        if (auto it = entry.find("aliases"); it != entry.end()) {
            icon.aliases = string_array(*it);
        }
        icon.symbol_id = optional_string(entry, "id");
        icon.view_box  = optional_string(entry, "viewBox");
        catalog.push_back(std::move(icon));
    }
    return catalog;
}

} // namespace IV
